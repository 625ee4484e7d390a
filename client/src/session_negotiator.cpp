#include "dshare/client/session_negotiator.hpp"

#include <utility>

#include "dshare/error_codes.hpp"
#include "dshare/protocol.hpp"

namespace dshare::client
{

    SessionNegotiator::SessionNegotiator(RemoteStore &store, RetryPolicy &retry, Logger logger)
        : store_(store),
          retry_(retry),
          logger_(std::move(logger)) {}

    UploadSession SessionNegotiator::start(const std::string &filename, std::uint64_t size, std::uint64_t chunk_size,
                                           const std::string &content_type,
                                           const std::optional<CacheEntry> &resume_token)
    {
        protocol::UploadStartRequest request{
            .filename = filename,
            .size = size,
            .chunk_size = chunk_size,
            .content_type = content_type,
            .upload_id = std::nullopt,
        };
        if (resume_token)
        {
            // Rejoining only works with the chunk size the session was opened with.
            request.upload_id = resume_token->upload_id;
            request.chunk_size = resume_token->chunk_size;
            logger_.log("negotiate", "resuming ", resume_token->upload_id, " for ", filename);
        }

        protocol::UploadStartResponse response;
        try
        {
            response = retry_.run("upload start", [&]
                                  {
                auto reply = store_.start_upload(request);
                if (reply.status != protocol::kStatusOk || reply.upload_id.empty())
                {
                    throw RemoteError("upload start rejected (status '" + reply.status + "')");
                }
                return reply; });
        }
        catch (const std::exception &ex)
        {
            throw TransferError(ErrorCode::NegotiationFailed, std::string("Upload start failed: ") + ex.what());
        }

        auto session = to_session(response, size, request.chunk_size);
        if (resume_token && session.upload_id != resume_token->upload_id)
        {
            logger_.log("negotiate", "server replaced stale session ", resume_token->upload_id, " with ",
                        session.upload_id);
        }
        logger_.log("negotiate", "session ", session.upload_id, " chunk_size=", session.chunk_size,
                    " total_chunks=", session.total_chunks, " received=", session.received_chunks.size());
        return session;
    }

    UploadSession SessionNegotiator::to_session(const protocol::UploadStartResponse &response, std::uint64_t size,
                                                std::uint64_t requested_chunk_size)
    {
        UploadSession session;
        session.upload_id = response.upload_id;
        session.chunk_size = response.chunk_size.value_or(requested_chunk_size);
        const auto expected_chunks = protocol::chunk_count(size, session.chunk_size);
        session.total_chunks = response.total_chunks.value_or(expected_chunks);
        if (session.total_chunks != expected_chunks)
        {
            throw TransferError(ErrorCode::NegotiationFailed,
                                "Server reported " + std::to_string(session.total_chunks) + " chunks, expected " +
                                    std::to_string(expected_chunks));
        }
        for (const auto index : response.received_chunks)
        {
            if (index >= 0 && static_cast<std::uint64_t>(index) < session.total_chunks)
            {
                session.received_chunks.insert(static_cast<std::uint64_t>(index));
            }
        }
        return session;
    }

} // namespace dshare::client
