#include "dshare/client/session.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>

#include "dshare/error_codes.hpp"

namespace dshare::client
{

    namespace
    {
        // A reply with a status means the server was reached but refused or garbled the request.
        ErrorCode classify(const RemoteError &error)
        {
            return error.http_status() ? ErrorCode::ProtocolError : ErrorCode::TransportError;
        }
    } // namespace

    bool ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "Usage: UPLOAD <path>" << std::endl;
            return true;
        }
        collect_finished_upload(false);
        if (upload_.valid())
        {
            std::cout << "ERROR: " << to_string(ErrorCode::Busy) << std::endl;
            std::cout << "Another upload is in progress" << std::endl;
            return true;
        }

        const std::filesystem::path path(args[0]);
        progress_.store(0.0);
        upload_ = std::async(std::launch::async, [this, path]
                             { return orchestrator_.start(path, [this](double fraction)
                                                          { progress_.store(fraction); }); });
        std::cout << "OK upload started: " << path.string() << std::endl;
        return true;
    }

    bool ClientSession::handle_pause()
    {
        if (!orchestrator_.pause())
        {
            std::cout << "No upload is running" << std::endl;
            return true;
        }
        std::cout << "OK paused" << std::endl;
        return true;
    }

    bool ClientSession::handle_resume()
    {
        if (!orchestrator_.resume())
        {
            std::cout << "No upload is running" << std::endl;
            return true;
        }
        std::cout << "OK resumed" << std::endl;
        return true;
    }

    bool ClientSession::handle_status()
    {
        const auto state = orchestrator_.state();
        std::cout << "state: " << to_string(state);
        if (state != UploadState::Idle)
        {
            std::cout << std::fixed << std::setprecision(1) << "  progress: " << progress_.load() * 100.0 << "%";
            if (orchestrator_.paused())
            {
                std::cout << "  (paused)";
            }
        }
        std::cout << std::endl;
        return true;
    }

    bool ClientSession::handle_wait()
    {
        if (!upload_.valid())
        {
            std::cout << "No upload is running" << std::endl;
            return true;
        }
        collect_finished_upload(true);
        return true;
    }

    bool ClientSession::handle_text(const std::string &text)
    {
        if (text.empty())
        {
            std::cout << "Usage: TEXT <text...>" << std::endl;
            return true;
        }
        try
        {
            remote_.share_text(text);
        }
        catch (const RemoteError &ex)
        {
            std::cout << "ERROR: " << to_string(classify(ex)) << std::endl;
            std::cout << ex.what() << std::endl;
            logger_.log("share", "text failed: ", ex.what());
            return true;
        }
        std::cout << "OK" << std::endl;
        return true;
    }

    bool ClientSession::handle_get_text()
    {
        try
        {
            const auto text = remote_.fetch_shared_text();
            if (text.empty())
            {
                std::cout << "(no shared text)" << std::endl;
            }
            else
            {
                std::cout << text << std::endl;
            }
        }
        catch (const RemoteError &ex)
        {
            std::cout << "ERROR: " << to_string(classify(ex)) << std::endl;
            std::cout << ex.what() << std::endl;
            logger_.log("share", "get text failed: ", ex.what());
        }
        return true;
    }

    bool ClientSession::handle_clear()
    {
        try
        {
            remote_.clear_share();
        }
        catch (const RemoteError &ex)
        {
            std::cout << "ERROR: " << to_string(classify(ex)) << std::endl;
            std::cout << ex.what() << std::endl;
            logger_.log("share", "clear failed: ", ex.what());
            return true;
        }
        std::cout << "OK cleared" << std::endl;
        return true;
    }

    bool ClientSession::handle_download(const std::vector<std::string> &args)
    {
        if (args.size() > 1)
        {
            std::cout << "Usage: DOWNLOAD [dir]" << std::endl;
            return true;
        }
        const auto directory =
            args.empty() ? std::filesystem::current_path() : std::filesystem::path(args[0]);
        try
        {
            const auto saved = remote_.download_shared(directory);
            std::cout << "OK saved " << saved.string() << std::endl;
        }
        catch (const RemoteError &ex)
        {
            std::cout << "ERROR: " << to_string(classify(ex)) << std::endl;
            std::cout << ex.what() << std::endl;
            logger_.log("share", "download failed: ", ex.what());
        }
        return true;
    }

    void ClientSession::collect_finished_upload(bool block)
    {
        if (!upload_.valid())
        {
            return;
        }
        if (!block && upload_.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        {
            return;
        }
        print_outcome(upload_.get());
    }

} // namespace dshare::client
