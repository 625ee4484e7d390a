#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "dshare/client/logger.hpp"
#include "dshare/client/transfer_types.hpp"

namespace dshare::client
{

    class CacheStore
    {
    public:
        CacheStore(std::filesystem::path state_path, Logger logger);

        static std::filesystem::path default_state_path();

        std::optional<CacheEntry> get(const std::string &key) const;
        void put(const std::string &key, const CacheEntry &entry);
        void clear(const std::string &key);

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

    private:
        void load();
        void save() const;

        std::filesystem::path state_path_;
        Logger logger_;
        mutable std::mutex mutex_;
        std::map<std::string, CacheEntry> entries_;
    };

} // namespace dshare::client
