#pragma once

#include <atomic>
#include <future>
#include <string>
#include <vector>

#include "dshare/client/cache_store.hpp"
#include "dshare/client/config.hpp"
#include "dshare/client/http_remote_store.hpp"
#include "dshare/client/logger.hpp"
#include "dshare/client/orchestrator.hpp"

namespace dshare::client
{

    struct CommandLine
    {
        std::string command;
        std::vector<std::string> args;
        // Everything after the command word, with its inner whitespace intact.
        std::string remainder;
    };

    // Splits a shell line into an upper-cased command word and its arguments. Empty lines give an empty command.
    CommandLine parse_command_line(const std::string &line);

    class ConsoleNotifier : public CompletionNotifier
    {
    public:
        explicit ConsoleNotifier(Logger logger);
        void notify(const std::string &message) override;

    private:
        Logger logger_;
    };

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);
        ~ClientSession();

        int run();

    private:
        void interactive_shell();
        bool dispatch(const CommandLine &line);

        bool handle_upload(const std::vector<std::string> &args);
        bool handle_pause();
        bool handle_resume();
        bool handle_status();
        bool handle_wait();
        bool handle_text(const std::string &text);
        bool handle_get_text();
        bool handle_clear();
        bool handle_download(const std::vector<std::string> &args);

        void collect_finished_upload(bool block);
        void print_outcome(const UploadOutcome &outcome) const;
        void print_help() const;
        static UploadOptions make_upload_options(const ClientConfig &config);

        ClientConfig config_;
        Logger logger_;
        HttpRemoteStore remote_;
        CacheStore cache_;
        ConsoleNotifier notifier_;
        Orchestrator orchestrator_;
        std::future<UploadOutcome> upload_;
        std::atomic<double> progress_{0.0};
    };

} // namespace dshare::client
