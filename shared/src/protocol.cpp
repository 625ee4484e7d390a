#include "dshare/protocol.hpp"

#include <cmath>
#include <stdexcept>

namespace dshare::protocol
{

    namespace
    {

        // 2^63, the first double past the int64 range.
        constexpr double kInt64Limit = 9223372036854775808.0;

        // Keeps only the numeric members of a JSON array, as the server may hand back loosely typed lists.
        // Floats that cannot be a chunk index are dropped before conversion.
        std::vector<std::int64_t> numeric_items(const nlohmann::json &array)
        {
            std::vector<std::int64_t> items;
            if (!array.is_array())
            {
                return items;
            }
            items.reserve(array.size());
            for (const auto &item : array)
            {
                if (item.is_number_integer())
                {
                    items.push_back(item.get<std::int64_t>());
                }
                else if (item.is_number_float())
                {
                    const auto value = item.get<double>();
                    if (std::isfinite(value) && value >= 0.0 && value < kInt64Limit)
                    {
                        items.push_back(static_cast<std::int64_t>(value));
                    }
                }
            }
            return items;
        }

        std::optional<std::uint64_t> optional_unsigned(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || !it->is_number_integer() || it->get<std::int64_t>() <= 0)
            {
                return std::nullopt;
            }
            return it->get<std::uint64_t>();
        }

        std::string string_or_empty(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return {};
            }
            if (it->is_string())
            {
                return it->get<std::string>();
            }
            return it->dump();
        }

    } // namespace

    std::uint64_t chunk_count(std::uint64_t size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk_size must be positive");
        }
        return size / chunk_size + (size % chunk_size == 0 ? 0 : 1);
    }

    std::uint64_t chunk_byte_size(std::uint64_t size, std::uint64_t index, std::uint64_t chunk_size)
    {
        if (chunk_size == 0 || index >= chunk_count(size, chunk_size))
        {
            return 0;
        }
        const auto start = index * chunk_size;
        const auto remaining = size - start;
        return remaining < chunk_size ? remaining : chunk_size;
    }

    void to_json(nlohmann::json &json, const UploadStartRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"size", request.size},
            {"chunk_size", request.chunk_size},
            {"content_type", request.content_type},
        };
        if (request.upload_id)
        {
            json["upload_id"] = *request.upload_id;
        }
    }

    void from_json(const nlohmann::json &json, UploadStartRequest &request)
    {
        request.filename = json.value("filename", std::string{});
        request.size = json.value("size", 0ULL);
        request.chunk_size = json.value("chunk_size", 0ULL);
        request.content_type = json.value("content_type", std::string{});
        if (json.contains("upload_id") && json["upload_id"].is_string())
        {
            request.upload_id = json["upload_id"].get<std::string>();
        }
        else
        {
            request.upload_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const UploadStartResponse &response)
    {
        json = {
            {"status", response.status},
            {"upload_id", response.upload_id},
            {"received_chunks", response.received_chunks},
        };
        if (response.chunk_size)
        {
            json["chunk_size"] = *response.chunk_size;
        }
        if (response.total_chunks)
        {
            json["total_chunks"] = *response.total_chunks;
        }
    }

    void from_json(const nlohmann::json &json, UploadStartResponse &response)
    {
        response.status = string_or_empty(json, "status");
        response.upload_id = string_or_empty(json, "upload_id");
        response.chunk_size = optional_unsigned(json, "chunk_size");
        response.total_chunks = optional_unsigned(json, "total_chunks");
        response.received_chunks = numeric_items(json.value("received_chunks", nlohmann::json::array()));
    }

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadCompleteRequest &request)
    {
        request.upload_id = json.value("upload_id", std::string{});
    }

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response)
    {
        json = {{"status", response.status}};
        if (response.missing_chunks)
        {
            json["missing_chunks"] = *response.missing_chunks;
        }
    }

    void from_json(const nlohmann::json &json, UploadCompleteResponse &response)
    {
        response.status = string_or_empty(json, "status");
        const auto it = json.find("missing_chunks");
        if (it != json.end() && it->is_array())
        {
            response.missing_chunks = numeric_items(*it);
        }
        else
        {
            response.missing_chunks.reset();
        }
    }

    void to_json(nlohmann::json &json, const SharedText &shared)
    {
        json = {{"text", shared.text}};
    }

    void from_json(const nlohmann::json &json, SharedText &shared)
    {
        const auto it = json.find("text");
        shared.text = it != json.end() && it->is_string() ? it->get<std::string>() : std::string{};
    }

    void to_json(nlohmann::json &json, const StatusReply &reply)
    {
        json = {{"status", reply.status}};
    }

    void from_json(const nlohmann::json &json, StatusReply &reply)
    {
        reply.status = string_or_empty(json, "status");
    }

} // namespace dshare::protocol
