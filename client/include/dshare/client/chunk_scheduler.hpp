#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

#include "dshare/client/logger.hpp"
#include "dshare/client/progress_reporter.hpp"
#include "dshare/client/remote_store.hpp"
#include "dshare/client/retry_policy.hpp"
#include "dshare/client/transfer_state.hpp"
#include "dshare/client/transfer_types.hpp"

namespace dshare::client
{

    struct SchedulerOptions
    {
        std::size_t max_parallel{3};
        // 0 means std::thread::hardware_concurrency().
        unsigned cpu_count{0};
    };

    // clamp(1, min(max_parallel, cpu_count / 2), pending); 0 when nothing is pending.
    std::size_t worker_count(std::size_t max_parallel, unsigned cpu_count, std::size_t pending);

    // Positioned read of chunk `index`. Throws TransferError(InvalidFile) on a short read.
    std::vector<std::byte> read_chunk(std::istream &in, std::uint64_t file_size, std::uint64_t index,
                                      std::uint64_t chunk_size);

    class ChunkScheduler
    {
    public:
        ChunkScheduler(RemoteStore &store, RetryPolicy &retry, Logger logger, SchedulerOptions options);

        // Uploads every chunk not yet in `state` with a bounded pool of workers. The first worker to exhaust
        // its retries stops the others from claiming further chunks; chunks already in flight still finish.
        // Throws TransferError(ChunkUploadFailed) with the failing index, or TransferError(Cancelled) when
        // the transfer's gate was released.
        void run(const FileDescriptor &file, const UploadSession &session, TransferState &state,
                 ProgressReporter &progress);

    private:
        struct Run;

        void worker_loop(Run &run);

        RemoteStore &store_;
        RetryPolicy &retry_;
        Logger logger_;
        SchedulerOptions options_;
    };

} // namespace dshare::client
