#include "dshare/client/orchestrator.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include "dshare/client/finalizer.hpp"
#include "dshare/client/session_negotiator.hpp"
#include "dshare/client/transfer_types.hpp"

namespace dshare::client
{

    namespace
    {
        struct UploadStateMapping
        {
            UploadState state;
            std::string_view label;
        };

        constexpr std::array<UploadStateMapping, 6> kStateMappings{{
            {UploadState::Idle, "idle"},
            {UploadState::Negotiating, "negotiating"},
            {UploadState::Transferring, "transferring"},
            {UploadState::Finalizing, "finalizing"},
            {UploadState::Complete, "complete"},
            {UploadState::Failed, "failed"},
        }};
    } // namespace

    std::string_view to_string(UploadState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    Orchestrator::Orchestrator(RemoteStore &store, CacheStore &cache, CompletionNotifier &notifier, Logger logger,
                               UploadOptions options)
        : store_(store),
          cache_(cache),
          notifier_(notifier),
          logger_(std::move(logger)),
          options_(std::move(options)) {}

    UploadOutcome Orchestrator::start(const std::filesystem::path &path, ProgressCallback on_progress)
    {
        auto expected = UploadState::Idle;
        if (!state_.compare_exchange_strong(expected, UploadState::Negotiating))
        {
            logger_.log("upload", "rejected ", path.string(), ": upload already ", to_string(expected));
            UploadOutcome busy;
            busy.code = ErrorCode::Busy;
            busy.message = "Another upload is in progress";
            return busy;
        }

        auto outcome = run_upload(path, std::move(on_progress));
        state_.store(outcome.ok() ? UploadState::Complete : UploadState::Failed);
        logger_.log("upload", path.string(), " finished: ", to_string(outcome.code),
                    outcome.message.empty() ? "" : " - ", outcome.message);
        deactivate();
        state_.store(UploadState::Idle);
        return outcome;
    }

    UploadOutcome Orchestrator::run_upload(const std::filesystem::path &path, ProgressCallback on_progress)
    {
        UploadOutcome outcome;
        std::shared_ptr<TransferState> transfer;
        try
        {
            if (shutting_down_.load())
            {
                throw TransferError(ErrorCode::Cancelled, "Client is shutting down");
            }
            const auto file = describe_file(path);
            outcome.total_bytes = file.size;
            const auto key = file.identity_key();
            const auto cached = cache_.get(key);

            RetryPolicy retry(options_.retry, logger_);
            SessionNegotiator negotiator(store_, retry, logger_);
            const auto session = negotiator.start(file.path.filename().string(), file.size, options_.chunk_size,
                                                  options_.content_type, cached);
            outcome.upload_id = session.upload_id;
            persist_resume_token(key, session);

            transfer = std::make_shared<TransferState>(file.size, session);
            activate(transfer);
            ProgressReporter progress(std::move(on_progress));
            progress.publish(transfer->uploaded_bytes(), file.size);

            state_.store(UploadState::Transferring);
            ChunkScheduler scheduler(store_, retry, logger_, options_.scheduler);
            scheduler.run(file, session, *transfer, progress);

            if (transfer->gate().released())
            {
                throw TransferError(ErrorCode::Cancelled, "Upload cancelled before completion");
            }
            state_.store(UploadState::Finalizing);
            Finalizer finalizer(store_, retry, logger_);
            finalizer.complete(file, session, *transfer, progress);

            forget_resume_token(key);
            notifier_.notify("Upload complete.");
        }
        catch (const TransferError &ex)
        {
            outcome.code = ex.code();
            outcome.message = ex.what();
            outcome.failed_chunk = ex.chunk_index();
        }
        catch (const std::exception &ex)
        {
            outcome.code = ErrorCode::InternalError;
            outcome.message = ex.what();
        }

        if (transfer)
        {
            outcome.received = transfer->received();
            outcome.uploaded_bytes = transfer->uploaded_bytes();
        }
        return outcome;
    }

    bool Orchestrator::pause()
    {
        std::lock_guard lock(active_mutex_);
        if (!active_)
        {
            return false;
        }
        active_->gate().pause();
        logger_.log("upload", "paused");
        return true;
    }

    bool Orchestrator::resume()
    {
        std::lock_guard lock(active_mutex_);
        if (!active_)
        {
            return false;
        }
        active_->gate().resume();
        logger_.log("upload", "resumed");
        return true;
    }

    bool Orchestrator::paused() const
    {
        std::lock_guard lock(active_mutex_);
        return active_ && active_->gate().paused();
    }

    void Orchestrator::shutdown()
    {
        shutting_down_.store(true);
        std::lock_guard lock(active_mutex_);
        if (active_)
        {
            active_->gate().release();
        }
    }

    void Orchestrator::activate(const std::shared_ptr<TransferState> &transfer)
    {
        std::lock_guard lock(active_mutex_);
        active_ = transfer;
        if (shutting_down_.load())
        {
            active_->gate().release();
        }
    }

    void Orchestrator::deactivate()
    {
        std::lock_guard lock(active_mutex_);
        active_.reset();
    }

    void Orchestrator::persist_resume_token(const std::string &key, const UploadSession &session)
    {
        try
        {
            cache_.put(key, CacheEntry{.upload_id = session.upload_id, .chunk_size = session.chunk_size});
        }
        catch (const std::runtime_error &ex)
        {
            logger_.log("cache", "could not persist resume token: ", ex.what());
        }
    }

    void Orchestrator::forget_resume_token(const std::string &key)
    {
        try
        {
            cache_.clear(key);
        }
        catch (const std::runtime_error &ex)
        {
            logger_.log("cache", "could not clear resume token: ", ex.what());
        }
    }

} // namespace dshare::client
