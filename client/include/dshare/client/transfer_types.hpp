#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace dshare::client
{

    struct FileDescriptor
    {
        std::filesystem::path path;
        std::uint64_t size{};
        std::int64_t modified_ms{};

        // Stable key over (path, size, modification time); any change means a new file.
        std::string identity_key() const;
    };

    // Throws TransferError(InvalidFile) for missing, non-regular or empty files.
    FileDescriptor describe_file(const std::filesystem::path &path);

    struct UploadSession
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::set<std::uint64_t> received_chunks;
    };

    struct CacheEntry
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
    };

} // namespace dshare::client
