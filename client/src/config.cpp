#include "dshare/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace dshare::client
{

    namespace
    {

        const char *require_value(int &index, int argc, char *argv[], const std::string &flag, const char *what)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires " + what);
            }
            return argv[index++];
        }

        std::uint64_t parse_positive(const std::string &flag, const std::string &text)
        {
            std::size_t consumed = 0;
            unsigned long long value = 0;
            try
            {
                value = std::stoull(text, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(flag + " expects a positive number, got '" + text + "'");
            }
            if (consumed != text.size() || value == 0)
            {
                throw std::runtime_error(flag + " expects a positive number, got '" + text + "'");
            }
            return static_cast<std::uint64_t>(value);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Usage: dshare_client <http://host:port[/prefix]> [--log <file>] [--state <file>] "
                                     "[--chunk-size <bytes>] [--max-parallel <n>] [--connect-timeout <s>] "
                                     "[--io-timeout <s>]");
        }

        ClientConfig config;
        int index = 1;
        config.base_url = argv[index++];
        if (config.base_url.rfind("http://", 0) != 0)
        {
            throw std::runtime_error("Expected server URL of the form http://host:port");
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg, "a file path"));
            }
            else if (arg == "--state")
            {
                config.state_path = std::filesystem::path(require_value(index, argc, argv, arg, "a file path"));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_positive(arg, require_value(index, argc, argv, arg, "a value (bytes)"));
            }
            else if (arg == "--max-parallel")
            {
                config.max_parallel = static_cast<std::size_t>(
                    parse_positive(arg, require_value(index, argc, argv, arg, "a value")));
            }
            else if (arg == "--connect-timeout")
            {
                config.connect_timeout = std::chrono::seconds(
                    parse_positive(arg, require_value(index, argc, argv, arg, "a value (seconds)")));
            }
            else if (arg == "--io-timeout")
            {
                config.io_timeout = std::chrono::seconds(
                    parse_positive(arg, require_value(index, argc, argv, arg, "a value (seconds)")));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace dshare::client
