#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "dshare/protocol.hpp"

namespace dshare::client
{

    // Transport or server failure of a single request. Retried by RetryPolicy.
    class RemoteError : public std::runtime_error
    {
    public:
        explicit RemoteError(const std::string &message, std::optional<int> http_status = std::nullopt)
            : std::runtime_error(message), http_status_(http_status) {}

        const std::optional<int> &http_status() const noexcept { return http_status_; }

    private:
        std::optional<int> http_status_;
    };

    struct CompletionReply
    {
        int http_status{};
        protocol::UploadCompleteResponse body;
    };

    // The three upload endpoints of the remote store.
    class RemoteStore
    {
    public:
        virtual ~RemoteStore() = default;

        // Throws RemoteError unless the server answered 2xx with a decodable body.
        virtual protocol::UploadStartResponse start_upload(const protocol::UploadStartRequest &request) = 0;

        // Throws RemoteError unless the server answered 2xx.
        virtual void upload_chunk(const protocol::UploadChunkRequest &request) = 0;

        // Returns whatever the server answered; only transport failures throw. Interpreting the status is
        // left to the caller because a 409 carries the list of missing chunks.
        virtual CompletionReply complete_upload(const protocol::UploadCompleteRequest &request) = 0;
    };

} // namespace dshare::client
