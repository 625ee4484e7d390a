#include "dshare/client/session.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

#include "dshare/error_codes.hpp"

namespace dshare::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    CommandLine parse_command_line(const std::string &line)
    {
        CommandLine parsed;
        const auto text = trim(line);
        const auto tokens = split_tokens(text);
        if (tokens.empty())
        {
            return parsed;
        }
        parsed.command = to_upper(tokens[0]);
        parsed.args.assign(tokens.begin() + 1, tokens.end());

        const auto word_end = text.find_first_of(" \t");
        if (word_end != std::string::npos)
        {
            const auto rest_begin = text.find_first_not_of(" \t", word_end);
            if (rest_begin != std::string::npos)
            {
                parsed.remainder = text.substr(rest_begin);
            }
        }
        return parsed;
    }

    ConsoleNotifier::ConsoleNotifier(Logger logger) : logger_(std::move(logger)) {}

    void ConsoleNotifier::notify(const std::string &message)
    {
        std::cout << "\n[notice] " << message << std::endl;
        logger_.log("notice", message);
    }

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          remote_(http::parse_url(config_.base_url),
                  HttpTimeouts{.connect = config_.connect_timeout, .io = config_.io_timeout}, logger_),
          cache_(config_.state_path.value_or(CacheStore::default_state_path()), logger_),
          notifier_(logger_),
          orchestrator_(remote_, cache_, notifier_, logger_, make_upload_options(config_)) {}

    ClientSession::~ClientSession()
    {
        orchestrator_.shutdown();
        if (upload_.valid())
        {
            upload_.wait();
        }
    }

    UploadOptions ClientSession::make_upload_options(const ClientConfig &config)
    {
        UploadOptions options;
        options.chunk_size = config.chunk_size;
        options.content_type = "application/octet-stream";
        options.scheduler.max_parallel = config.max_parallel;
        return options;
    }

    int ClientSession::run()
    {
        try
        {
            std::cout << "Connected to " << config_.base_url << " (resume state: " << cache_.state_path().string()
                      << ")" << std::endl;
            logger_.log("info", "session started for ", config_.base_url);
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            collect_finished_upload(false);
            std::cout << "dshare> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            const auto parsed = parse_command_line(line);
            if (parsed.command.empty())
            {
                continue;
            }
            logger_.log("cmd", trim(line));

            const auto &command = parsed.command;
            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(parsed))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                }
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: " << to_string(ErrorCode::InternalError) << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }
        }
    }

    bool ClientSession::dispatch(const CommandLine &line)
    {
        const auto &command = line.command;
        const auto &args = line.args;
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "PAUSE")
        {
            return handle_pause();
        }
        if (command == "RESUME")
        {
            return handle_resume();
        }
        if (command == "STATUS")
        {
            return handle_status();
        }
        if (command == "WAIT")
        {
            return handle_wait();
        }
        if (command == "TEXT")
        {
            return handle_text(line.remainder);
        }
        if (command == "GETTEXT")
        {
            return handle_get_text();
        }
        if (command == "CLEAR")
        {
            return handle_clear();
        }
        if (command == "DOWNLOAD")
        {
            return handle_download(args);
        }
        return false;
    }

    void ClientSession::print_help() const
    {
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                      Show this help" << std::endl;
        std::cout << "  EXIT                      Cancel any running upload and exit" << std::endl;
        std::cout << "  UPLOAD <path>             Upload a file in the background (resumes if interrupted)"
                  << std::endl;
        std::cout << "  PAUSE                     Stop starting new chunks" << std::endl;
        std::cout << "  RESUME                    Continue a paused upload" << std::endl;
        std::cout << "  STATUS                    Show upload state and progress" << std::endl;
        std::cout << "  WAIT                      Block until the running upload finishes" << std::endl;
        std::cout << "  TEXT <text...>            Share a text snippet" << std::endl;
        std::cout << "  GETTEXT                   Print the currently shared text" << std::endl;
        std::cout << "  DOWNLOAD [dir]            Save the currently shared file" << std::endl;
        std::cout << "  CLEAR                     Remove the shared text and file" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --log <file>              Append structured logs to file\n";
        std::cout << "  --state <file>            Resume state file (default ~/.dshare/uploads.json)\n";
        std::cout << "  --chunk-size <bytes>      Chunk size for new uploads\n";
        std::cout << "  --max-parallel <n>        Concurrent chunk uploads\n";
        std::cout << "  --connect-timeout <s>     Connect timeout per request\n";
        std::cout << "  --io-timeout <s>          Send/receive timeout per request\n";
    }

    void ClientSession::print_outcome(const UploadOutcome &outcome) const
    {
        if (outcome.ok())
        {
            std::cout << "OK upload " << outcome.upload_id << " (" << outcome.total_bytes << " bytes)" << std::endl;
            return;
        }
        std::cout << "ERROR: " << to_string(outcome.code) << std::endl;
        if (!outcome.message.empty())
        {
            std::cout << outcome.message << std::endl;
        }
        if (!outcome.upload_id.empty() && outcome.code != ErrorCode::Busy)
        {
            std::cout << outcome.received.size() << " chunks stored (" << outcome.uploaded_bytes << "/"
                      << outcome.total_bytes << " bytes); UPLOAD the same file again to resume" << std::endl;
        }
    }

} // namespace dshare::client
