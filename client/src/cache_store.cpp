#include "dshare/client/cache_store.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace dshare::client
{

    CacheStore::CacheStore(std::filesystem::path state_path, Logger logger)
        : state_path_(std::move(state_path)),
          logger_(std::move(logger))
    {
        load();
    }

    std::filesystem::path CacheStore::default_state_path()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "DShare" / "uploads.json";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".dshare" / "uploads.json";
        }
        return std::filesystem::path(".dshare") / "uploads.json";
    }

    std::optional<CacheEntry> CacheStore::get(const std::string &key) const
    {
        std::lock_guard lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void CacheStore::put(const std::string &key, const CacheEntry &entry)
    {
        std::lock_guard lock(mutex_);
        entries_[key] = entry;
        save();
    }

    void CacheStore::clear(const std::string &key)
    {
        std::lock_guard lock(mutex_);
        if (entries_.erase(key) > 0)
        {
            save();
        }
    }

    void CacheStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            logger_.log("cache", "cannot open ", state_path_.string(), ", starting empty");
            return;
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            logger_.log("cache", "ignoring corrupt ", state_path_.string(), ": ", ex.what());
            return;
        }
        if (!json.is_object())
        {
            return;
        }
        for (const auto &[key, item] : json.items())
        {
            if (!item.is_object())
            {
                continue;
            }
            CacheEntry entry;
            entry.upload_id = item.value("upload_id", std::string{});
            entry.chunk_size = item.value("chunk_size", 0ULL);
            if (!entry.upload_id.empty() && entry.chunk_size > 0)
            {
                entries_.emplace(key, std::move(entry));
            }
        }
    }

    void CacheStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[key, entry] : entries_)
        {
            json[key] = {{"upload_id", entry.upload_id}, {"chunk_size", entry.chunk_size}};
        }

        auto temp_path = state_path_;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot write upload cache " + temp_path.string());
            }
            out << json.dump(2);
            if (!out)
            {
                throw std::runtime_error("Failed writing upload cache " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, state_path_, ec);
        if (ec)
        {
            throw std::runtime_error("Cannot replace upload cache " + state_path_.string() + ": " + ec.message());
        }
    }

} // namespace dshare::client
