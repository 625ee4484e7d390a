#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dshare/client/cache_store.hpp"
#include "dshare/client/chunk_scheduler.hpp"
#include "dshare/client/logger.hpp"
#include "dshare/client/progress_reporter.hpp"
#include "dshare/client/remote_store.hpp"
#include "dshare/client/retry_policy.hpp"
#include "dshare/client/transfer_state.hpp"
#include "dshare/error_codes.hpp"

namespace dshare::client
{

    enum class UploadState : std::uint8_t
    {
        Idle,
        Negotiating,
        Transferring,
        Finalizing,
        Complete,
        Failed
    };

    std::string_view to_string(UploadState state) noexcept;

    struct UploadOptions
    {
        std::uint64_t chunk_size{8 * 1024 * 1024};
        std::string content_type;
        SchedulerOptions scheduler{};
        RetryOptions retry{};
    };

    struct UploadOutcome
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        std::optional<std::uint64_t> failed_chunk;
        std::string upload_id;
        std::vector<std::uint64_t> received;
        std::uint64_t uploaded_bytes{};
        std::uint64_t total_bytes{};

        bool ok() const noexcept { return code == ErrorCode::Ok; }
    };

    class CompletionNotifier
    {
    public:
        virtual ~CompletionNotifier() = default;
        virtual void notify(const std::string &message) = 0;
    };

    // Drives one upload at a time through negotiation, chunk transfer and finalization.
    class Orchestrator
    {
    public:
        Orchestrator(RemoteStore &store, CacheStore &cache, CompletionNotifier &notifier, Logger logger,
                     UploadOptions options);

        // Blocks until the upload terminates. Returns ErrorCode::Busy at once if another upload is active.
        UploadOutcome start(const std::filesystem::path &path, ProgressCallback on_progress = {});

        // Toggle the active transfer's gate; false when no transfer is active.
        bool pause();
        bool resume();
        bool paused() const;

        // Releases the active transfer (it ends as Cancelled at the next chunk boundary) and refuses new ones.
        void shutdown();

        UploadState state() const noexcept { return state_.load(); }

    private:
        UploadOutcome run_upload(const std::filesystem::path &path, ProgressCallback on_progress);
        void activate(const std::shared_ptr<TransferState> &transfer);
        void deactivate();
        void persist_resume_token(const std::string &key, const UploadSession &session);
        void forget_resume_token(const std::string &key);

        RemoteStore &store_;
        CacheStore &cache_;
        CompletionNotifier &notifier_;
        Logger logger_;
        UploadOptions options_;

        std::atomic<UploadState> state_{UploadState::Idle};
        std::atomic<bool> shutting_down_{false};
        mutable std::mutex active_mutex_;
        std::shared_ptr<TransferState> active_;
    };

} // namespace dshare::client
