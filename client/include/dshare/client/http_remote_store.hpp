#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "dshare/client/logger.hpp"
#include "dshare/client/remote_store.hpp"
#include "dshare/http.hpp"

namespace dshare::client
{

    struct HttpTimeouts
    {
        std::chrono::milliseconds connect{std::chrono::seconds{10}};
        // A transfer that moves no bytes for this long is abandoned.
        std::chrono::milliseconds io{std::chrono::seconds{15}};
    };

    // RemoteStore over HTTP using one libcurl easy handle per request. Also speaks the share endpoints used by
    // the shell for text snippets, downloads and clearing the share.
    class HttpRemoteStore : public RemoteStore
    {
    public:
        HttpRemoteStore(http::Url base, HttpTimeouts timeouts, Logger logger);

        protocol::UploadStartResponse start_upload(const protocol::UploadStartRequest &request) override;
        void upload_chunk(const protocol::UploadChunkRequest &request) override;
        CompletionReply complete_upload(const protocol::UploadCompleteRequest &request) override;

        void share_text(const std::string &text);
        std::string fetch_shared_text();
        void clear_share();

        // Saves the currently shared file into `directory` and returns the written path.
        std::filesystem::path download_shared(const std::filesystem::path &directory);

    private:
        http::Response get(std::string_view target);
        http::Response post_json(std::string_view target, const nlohmann::json &body);
        http::Response post_form(std::string_view target, const http::Form &form);
        static nlohmann::json parse_body(const http::Response &response);

        http::Url base_;
        HttpTimeouts timeouts_;
        Logger logger_;
    };

} // namespace dshare::client
