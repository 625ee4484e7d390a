#include "dshare/client/finalizer.hpp"

#include <fstream>
#include <string>
#include <utility>

#include "dshare/client/chunk_scheduler.hpp"
#include "dshare/error_codes.hpp"
#include "dshare/protocol.hpp"

namespace dshare::client
{

    namespace
    {
        constexpr int kConflict = 409;

        bool is_success(int status)
        {
            return status >= 200 && status < 300;
        }
    } // namespace

    Finalizer::Finalizer(RemoteStore &store, RetryPolicy &retry, Logger logger)
        : store_(store),
          retry_(retry),
          logger_(std::move(logger)) {}

    void Finalizer::complete(const FileDescriptor &file, const UploadSession &session, TransferState &state,
                             ProgressReporter &progress)
    {
        CompletionReply reply;
        try
        {
            reply = request_completion(session.upload_id, true);
        }
        catch (const TransferError &)
        {
            throw;
        }
        catch (const std::exception &ex)
        {
            throw TransferError(ErrorCode::CompletionFailed, std::string("Upload completion failed: ") + ex.what());
        }
        if (is_success(reply.http_status))
        {
            logger_.log("finalize", session.upload_id, " completed");
            return;
        }

        const auto &missing = *reply.body.missing_chunks;
        logger_.log("finalize", session.upload_id, " server reports ", missing.size(), " missing chunks");
        try
        {
            recover(file, session, state, progress, missing);
            request_completion(session.upload_id, false);
        }
        catch (const TransferError &ex)
        {
            if (ex.code() == ErrorCode::Cancelled || ex.code() == ErrorCode::RecoveryFailed)
            {
                throw;
            }
            throw TransferError(ErrorCode::RecoveryFailed, std::string("Recovery failed: ") + ex.what(),
                                ex.chunk_index());
        }
        catch (const std::exception &ex)
        {
            throw TransferError(ErrorCode::RecoveryFailed, std::string("Recovery failed: ") + ex.what());
        }
        logger_.log("finalize", session.upload_id, " completed after recovery");
    }

    CompletionReply Finalizer::request_completion(const std::string &upload_id, bool accept_conflict)
    {
        const protocol::UploadCompleteRequest request{.upload_id = upload_id};
        return retry_.run("upload complete", [&]
                          {
            auto reply = store_.complete_upload(request);
            if (is_success(reply.http_status))
            {
                return reply;
            }
            if (reply.http_status == kConflict && reply.body.missing_chunks)
            {
                if (accept_conflict)
                {
                    return reply;
                }
                throw TransferError(ErrorCode::RecoveryFailed,
                                    "Server still reports " + std::to_string(reply.body.missing_chunks->size()) +
                                        " missing chunks after recovery");
            }
            throw RemoteError("upload complete rejected", reply.http_status); });
    }

    void Finalizer::recover(const FileDescriptor &file, const UploadSession &session, TransferState &state,
                            ProgressReporter &progress, const std::vector<std::int64_t> &missing)
    {
        std::ifstream in(file.path, std::ios::binary);
        if (!in.is_open())
        {
            throw TransferError(ErrorCode::RecoveryFailed, "Cannot reopen " + file.path.string());
        }
        const auto filename = file.path.filename().string();
        for (const auto raw_index : missing)
        {
            if (raw_index < 0 || static_cast<std::uint64_t>(raw_index) >= session.total_chunks)
            {
                continue;
            }
            const auto index = static_cast<std::uint64_t>(raw_index);
            if (!state.gate().wait_while_paused())
            {
                throw TransferError(ErrorCode::Cancelled, "Upload cancelled during recovery");
            }
            protocol::UploadChunkRequest request{
                .upload_id = session.upload_id,
                .index = index,
                .filename = filename,
                .data = read_chunk(in, file.size, index, session.chunk_size),
            };
            try
            {
                retry_.run("recovery chunk " + std::to_string(index), [&]
                           { store_.upload_chunk(request); });
            }
            catch (const std::exception &ex)
            {
                throw TransferError(ErrorCode::RecoveryFailed,
                                    "Recovery of chunk " + std::to_string(index) + " failed: " + ex.what(), index);
            }
            state.mark_received(index);
            progress.publish(state.uploaded_bytes(), file.size);
        }
    }

} // namespace dshare::client
