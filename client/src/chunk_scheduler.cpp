#include "dshare/client/chunk_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "dshare/error_codes.hpp"
#include "dshare/protocol.hpp"

namespace dshare::client
{

    struct ChunkScheduler::Run
    {
        Run(const FileDescriptor &file_ref, const UploadSession &session_ref, TransferState &state_ref,
            ProgressReporter &progress_ref, std::vector<std::uint64_t> pending_chunks)
            : file(file_ref),
              session(session_ref),
              state(state_ref),
              progress(progress_ref),
              pending(std::move(pending_chunks)) {}

        void fail(ErrorCode code, std::optional<std::uint64_t> index, const std::string &message)
        {
            {
                std::lock_guard lock(failure_mutex);
                if (!failure_code)
                {
                    failure_code = code;
                    failed_index = index;
                    failure_message = message;
                }
            }
            stop.store(true);
            // Paused siblings must not hold up the join of a run that has already failed.
            state.gate().release();
        }

        const FileDescriptor &file;
        const UploadSession &session;
        TransferState &state;
        ProgressReporter &progress;
        const std::vector<std::uint64_t> pending;

        std::atomic<std::size_t> cursor{0};
        std::atomic<bool> stop{false};

        std::mutex failure_mutex;
        std::optional<ErrorCode> failure_code;
        std::optional<std::uint64_t> failed_index;
        std::string failure_message;
    };

    std::size_t worker_count(std::size_t max_parallel, unsigned cpu_count, std::size_t pending)
    {
        if (pending == 0)
        {
            return 0;
        }
        const std::size_t base = std::max<std::size_t>(1, std::min<std::size_t>(max_parallel, cpu_count / 2));
        return std::min(base, pending);
    }

    std::vector<std::byte> read_chunk(std::istream &in, std::uint64_t file_size, std::uint64_t index,
                                      std::uint64_t chunk_size)
    {
        const auto length = protocol::chunk_byte_size(file_size, index, chunk_size);
        if (length == 0)
        {
            throw TransferError(ErrorCode::InvalidFile, "Chunk " + std::to_string(index) + " lies past the end of the file",
                                index);
        }
        std::vector<std::byte> data(static_cast<std::size_t>(length));
        in.clear();
        in.seekg(static_cast<std::streamoff>(index * chunk_size));
        in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(in.gcount()) != length)
        {
            throw TransferError(ErrorCode::InvalidFile,
                                "Short read for chunk " + std::to_string(index) + "; file changed during upload", index);
        }
        return data;
    }

    ChunkScheduler::ChunkScheduler(RemoteStore &store, RetryPolicy &retry, Logger logger, SchedulerOptions options)
        : store_(store),
          retry_(retry),
          logger_(std::move(logger)),
          options_(options) {}

    void ChunkScheduler::run(const FileDescriptor &file, const UploadSession &session, TransferState &state,
                             ProgressReporter &progress)
    {
        auto pending = state.pending();
        const unsigned cpus = options_.cpu_count != 0 ? options_.cpu_count : std::thread::hardware_concurrency();
        const auto workers = worker_count(options_.max_parallel, cpus, pending.size());
        logger_.log("schedule", session.upload_id, ": ", pending.size(), " of ", session.total_chunks,
                    " chunks pending, ", workers, " workers");

        Run run(file, session, state, progress, std::move(pending));
        std::vector<std::thread> threads;
        threads.reserve(workers);
        try
        {
            for (std::size_t i = 0; i < workers; ++i)
            {
                threads.emplace_back([this, &run]
                                     { worker_loop(run); });
            }
        }
        catch (const std::system_error &ex)
        {
            run.fail(ErrorCode::InternalError, std::nullopt, std::string("Cannot start upload worker: ") + ex.what());
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        if (run.failure_code)
        {
            logger_.log("schedule", session.upload_id, ": ", run.failure_message);
            throw TransferError(*run.failure_code, run.failure_message, run.failed_index);
        }
        if (!state.pending().empty())
        {
            if (state.gate().released())
            {
                throw TransferError(ErrorCode::Cancelled, "Upload cancelled");
            }
            throw TransferError(ErrorCode::InternalError, "Workers finished with chunks still pending");
        }
    }

    void ChunkScheduler::worker_loop(Run &run)
    {
        std::ifstream in(run.file.path, std::ios::binary);
        if (!in.is_open())
        {
            run.fail(ErrorCode::InvalidFile, std::nullopt, "Cannot open " + run.file.path.string());
            return;
        }

        const auto filename = run.file.path.filename().string();
        while (!run.stop.load())
        {
            const auto slot = run.cursor.fetch_add(1);
            if (slot >= run.pending.size())
            {
                return;
            }
            const auto index = run.pending[slot];
            if (!run.state.gate().wait_while_paused() || run.stop.load())
            {
                return;
            }

            try
            {
                protocol::UploadChunkRequest request{
                    .upload_id = run.session.upload_id,
                    .index = index,
                    .filename = filename,
                    .data = read_chunk(in, run.file.size, index, run.session.chunk_size),
                };
                retry_.run("chunk " + std::to_string(index), [&]
                           { store_.upload_chunk(request); });
            }
            catch (const TransferError &ex)
            {
                run.fail(ex.code(), index, ex.what());
                return;
            }
            catch (const std::exception &ex)
            {
                run.fail(ErrorCode::ChunkUploadFailed, index,
                         "Chunk " + std::to_string(index) + " failed: " + ex.what());
                return;
            }

            run.state.mark_received(index);
            run.progress.publish(run.state.uploaded_bytes(), run.file.size);
        }
    }

} // namespace dshare::client
