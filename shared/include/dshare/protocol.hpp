/**
 * DShare - Upload session wire schema and serialization helpers.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace dshare::protocol
{

    inline constexpr std::string_view kUploadStartPath = "/api/upload/start/";
    inline constexpr std::string_view kUploadChunkPath = "/api/upload/chunk/";
    inline constexpr std::string_view kUploadCompletePath = "/api/upload/complete/";
    inline constexpr std::string_view kShareUploadPath = "/upload/";
    inline constexpr std::string_view kShareDownloadPath = "/download/";
    inline constexpr std::string_view kShareTextPath = "/api/share/text/";
    inline constexpr std::string_view kShareClearPath = "/api/share/clear/";

    inline constexpr std::string_view kStatusOk = "ok";

    // ceil(size / chunk_size); chunk_size must be non-zero.
    std::uint64_t chunk_count(std::uint64_t size, std::uint64_t chunk_size);

    // Length of chunk `index`, 0 when the chunk starts past the end of the file.
    std::uint64_t chunk_byte_size(std::uint64_t size, std::uint64_t index, std::uint64_t chunk_size);

    struct UploadStartRequest
    {
        std::string filename;
        std::uint64_t size{};
        std::uint64_t chunk_size{};
        std::string content_type;
        std::optional<std::string> upload_id{};
    };

    void to_json(nlohmann::json &json, const UploadStartRequest &request);
    void from_json(const nlohmann::json &json, UploadStartRequest &request);

    struct UploadStartResponse
    {
        std::string status;
        std::string upload_id;
        std::optional<std::uint64_t> chunk_size{};
        std::optional<std::uint64_t> total_chunks{};
        std::vector<std::int64_t> received_chunks;
    };

    void to_json(nlohmann::json &json, const UploadStartResponse &response);
    void from_json(const nlohmann::json &json, UploadStartResponse &response);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::uint64_t index{};
        std::string filename;
        std::vector<std::byte> data;
    };

    struct UploadCompleteRequest
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadCompleteRequest &request);
    void from_json(const nlohmann::json &json, UploadCompleteRequest &request);

    // Body of a completion reply. A 409 reply lists the chunks the server still lacks.
    struct UploadCompleteResponse
    {
        std::string status;
        std::optional<std::vector<std::int64_t>> missing_chunks{};
    };

    void to_json(nlohmann::json &json, const UploadCompleteResponse &response);
    void from_json(const nlohmann::json &json, UploadCompleteResponse &response);

    // Reply of the shared-text endpoint; a missing or null text reads as empty.
    struct SharedText
    {
        std::string text;
    };

    void to_json(nlohmann::json &json, const SharedText &shared);
    void from_json(const nlohmann::json &json, SharedText &shared);

    struct StatusReply
    {
        std::string status;

        bool ok() const { return status == kStatusOk; }
    };

    void to_json(nlohmann::json &json, const StatusReply &reply);
    void from_json(const nlohmann::json &json, StatusReply &reply);

} // namespace dshare::protocol
