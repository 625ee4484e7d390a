#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "dshare/client/logger.hpp"
#include "dshare/client/remote_store.hpp"
#include "dshare/client/retry_policy.hpp"
#include "dshare/client/transfer_types.hpp"

namespace dshare::client
{

    class SessionNegotiator
    {
    public:
        SessionNegotiator(RemoteStore &store, RetryPolicy &retry, Logger logger);

        // Opens a new upload session or rejoins the one named by `resume_token`. Throws
        // TransferError(NegotiationFailed) once retries are exhausted.
        UploadSession start(const std::string &filename, std::uint64_t size, std::uint64_t chunk_size,
                            const std::string &content_type, const std::optional<CacheEntry> &resume_token);

    private:
        UploadSession to_session(const protocol::UploadStartResponse &response, std::uint64_t size,
                                 std::uint64_t requested_chunk_size);

        RemoteStore &store_;
        RetryPolicy &retry_;
        Logger logger_;
    };

} // namespace dshare::client
