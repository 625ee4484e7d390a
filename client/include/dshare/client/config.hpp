#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dshare::client
{

    inline constexpr std::uint64_t kDefaultChunkSize = 8 * 1024 * 1024;
    inline constexpr std::size_t kDefaultMaxParallel = 3;

    struct ClientConfig
    {
        std::string base_url;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> state_path;
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::size_t max_parallel{kDefaultMaxParallel};
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds io_timeout{15};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace dshare::client
