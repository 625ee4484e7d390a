#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "dshare/client/cache_store.hpp"
#include "dshare/client/logger.hpp"
#include "dshare/client/orchestrator.hpp"
#include "dshare/client/session_negotiator.hpp"
#include "dshare/client/transfer_types.hpp"
#include "dshare/crypto.hpp"
#include "dshare/error_codes.hpp"

#include "fake_remote_store.hpp"

using namespace dshare;
using namespace dshare::client;
using dshare::testing::FakeRemoteStore;

namespace
{

    struct ScratchDir
    {
        ScratchDir() : path(std::filesystem::temp_directory_path() / ("dshare_engine_" + crypto::random_token(6)))
        {
            std::filesystem::create_directories(path);
        }

        ~ScratchDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }

        std::filesystem::path path;
    };

    std::string write_file(const std::filesystem::path &path, std::size_t size)
    {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            content[i] = static_cast<char>('a' + (i * 7 + i / 13) % 26);
        }
        std::ofstream out(path, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return content;
    }

    class RecordingNotifier : public CompletionNotifier
    {
    public:
        void notify(const std::string &message) override
        {
            std::lock_guard lock(mutex_);
            messages_.push_back(message);
        }

        std::vector<std::string> messages() const
        {
            std::lock_guard lock(mutex_);
            return messages_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<std::string> messages_;
    };

    class ProgressLog
    {
    public:
        ProgressCallback callback()
        {
            return [this](double fraction)
            {
                std::lock_guard lock(mutex_);
                values_.push_back(fraction);
            };
        }

        std::vector<double> values() const
        {
            std::lock_guard lock(mutex_);
            return values_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<double> values_;
    };

    UploadOptions small_chunks(std::uint64_t chunk_size, std::size_t max_parallel = 3)
    {
        UploadOptions options;
        options.chunk_size = chunk_size;
        options.content_type = "application/octet-stream";
        options.scheduler = SchedulerOptions{.max_parallel = max_parallel, .cpu_count = 8};
        options.retry = RetryOptions{.attempts = 4, .base_delay = std::chrono::milliseconds(1)};
        return options;
    }

    // Everything one upload scenario needs, wired the way the shell wires it.
    struct Harness
    {
        explicit Harness(UploadOptions options)
            : logger(std::nullopt),
              cache(scratch.path / "state" / "uploads.json", logger),
              orchestrator(remote, cache, notifier, logger, std::move(options)) {}

        std::string resume_key(const std::filesystem::path &file) const
        {
            return describe_file(file).identity_key();
        }

        ScratchDir scratch;
        Logger logger;
        FakeRemoteStore remote;
        CacheStore cache;
        RecordingNotifier notifier;
        Orchestrator orchestrator;
    };

    template <typename Predicate>
    bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return predicate();
    }

    void test_full_upload()
    {
        Harness h(small_chunks(4000));
        const auto file = h.scratch.path / "movie.bin";
        const auto content = write_file(file, 10'000);
        ProgressLog progress;

        const auto outcome = h.orchestrator.start(file, progress.callback());
        assert(outcome.ok());
        assert(outcome.total_bytes == 10'000);
        assert(outcome.uploaded_bytes == 10'000);
        assert((outcome.received == std::vector<std::uint64_t>{0, 1, 2}));
        assert(h.remote.completed.contains(outcome.upload_id));
        assert(h.remote.assembled(outcome.upload_id) == content);
        assert(h.remote.uploads.at(outcome.upload_id).filename == "movie.bin");
        assert(h.remote.complete_calls == 1);
        assert(!h.cache.get(h.resume_key(file)).has_value());
        assert((h.notifier.messages() == std::vector<std::string>{"Upload complete."}));
        assert(h.orchestrator.state() == UploadState::Idle);

        const auto values = progress.values();
        assert(!values.empty());
        assert(std::is_sorted(values.begin(), values.end()));
        assert(values.back() == 1.0);
    }

    void test_resume_skips_received_chunks()
    {
        // New uploads would use 8 MiB; a resumed session keeps the chunk size it was opened with.
        Harness h(small_chunks(8 * 1024 * 1024));
        const auto file = h.scratch.path / "resume.bin";
        const auto content = write_file(file, 12'000);
        const protocol::UploadStartRequest shape{.filename = "resume.bin", .size = 12'000, .chunk_size = 4000};
        h.remote.seed("up-old", shape, content, {0, 1});
        h.cache.put(h.resume_key(file), CacheEntry{.upload_id = "up-old", .chunk_size = 4000});
        ProgressLog progress;

        const auto outcome = h.orchestrator.start(file, progress.callback());
        assert(outcome.ok());
        assert(outcome.upload_id == "up-old");
        assert((h.remote.chunk_calls == std::vector<std::uint64_t>{2}));
        assert(h.remote.start_requests.size() == 1);
        assert(h.remote.start_requests[0].upload_id == std::optional<std::string>("up-old"));
        assert(h.remote.start_requests[0].chunk_size == 4000);
        assert(h.remote.assembled("up-old") == content);

        const auto values = progress.values();
        assert(values.size() == 2);
        assert(values.front() == 8000.0 / 12000.0);
        assert(values.back() == 1.0);
    }

    void test_chunk_failure_keeps_resume_token()
    {
        Harness h(small_chunks(4000));
        const auto file = h.scratch.path / "flaky.bin";
        write_file(file, 12'000);
        h.remote.failures[1] = 100;

        const auto outcome = h.orchestrator.start(file);
        assert(outcome.code == ErrorCode::ChunkUploadFailed);
        assert(outcome.failed_chunk == std::optional<std::uint64_t>(1));
        assert(h.remote.calls_for(1) == 4);
        assert(std::find(outcome.received.begin(), outcome.received.end(), 1) == outcome.received.end());
        assert(h.remote.complete_calls == 0);
        assert(h.notifier.messages().empty());

        const auto token = h.cache.get(h.resume_key(file));
        assert(token.has_value());
        assert(token->upload_id == outcome.upload_id);
        assert(token->chunk_size == 4000);
        assert(h.orchestrator.state() == UploadState::Idle);
    }

    void test_transient_failure_is_retried()
    {
        Harness h(small_chunks(4000));
        const auto file = h.scratch.path / "transient.bin";
        const auto content = write_file(file, 12'000);
        h.remote.failures[2] = 3;

        const auto outcome = h.orchestrator.start(file);
        assert(outcome.ok());
        assert(h.remote.calls_for(2) == 4);
        assert(h.remote.assembled(outcome.upload_id) == content);
    }

    void test_conflict_recovery_uploads_missing_only()
    {
        Harness h(small_chunks(1000));
        const auto file = h.scratch.path / "ten.bin";
        const auto content = write_file(file, 10'000);
        h.remote.scripted_conflicts.push_back({3, 7, 42, -1});

        const auto outcome = h.orchestrator.start(file);
        assert(outcome.ok());
        assert(h.remote.complete_calls == 2);
        assert(h.remote.chunk_calls.size() == 12);
        assert(h.remote.calls_for(3) == 2);
        assert(h.remote.calls_for(7) == 2);
        assert(h.remote.calls_for(0) == 1);
        assert(h.remote.assembled(outcome.upload_id) == content);
        assert(!h.cache.get(h.resume_key(file)).has_value());

        // The missing chunks are re-sent between the rejected and the accepted completion.
        const auto events = h.remote.events();
        const auto rejected = std::find(events.begin(), events.end(), "complete:409");
        const auto accepted = std::find(events.begin(), events.end(), "complete:200");
        assert(rejected != events.end());
        assert(accepted == events.end() - 1);
        assert((std::vector<std::string>(rejected + 1, accepted) == std::vector<std::string>{"chunk:3", "chunk:7"}));
    }

    void test_second_conflict_is_terminal()
    {
        Harness h(small_chunks(1000));
        const auto file = h.scratch.path / "stubborn.bin";
        write_file(file, 10'000);
        h.remote.scripted_conflicts.push_back({3, 7});
        h.remote.scripted_conflicts.push_back({3});

        const auto outcome = h.orchestrator.start(file);
        assert(outcome.code == ErrorCode::RecoveryFailed);
        assert(h.remote.complete_calls == 2);
        assert(h.cache.get(h.resume_key(file)).has_value());
        assert(h.notifier.messages().empty());
    }

    void test_concurrency_is_bounded()
    {
        for (const std::size_t limit : {std::size_t{1}, std::size_t{2}, std::size_t{3}})
        {
            Harness h(small_chunks(500, limit));
            const auto file = h.scratch.path / "wide.bin";
            write_file(file, 6000);
            h.remote.chunk_delay = std::chrono::milliseconds(10);

            const auto outcome = h.orchestrator.start(file);
            assert(outcome.ok());
            assert(h.remote.chunk_calls.size() == 12);
            assert(h.remote.max_in_flight.load() >= 1);
            assert(static_cast<std::size_t>(h.remote.max_in_flight.load()) <= limit);
        }
    }

    void test_pause_holds_new_chunks()
    {
        Harness h(small_chunks(1000, 1));
        const auto file = h.scratch.path / "pause.bin";
        const auto content = write_file(file, 4000);
        h.remote.on_chunk = [&h](std::uint64_t index)
        {
            if (index == 0)
            {
                h.orchestrator.pause();
            }
        };
        ProgressLog progress;

        auto pending = std::async(std::launch::async, [&h, &file, &progress]
                                  { return h.orchestrator.start(file, progress.callback()); });
        assert(wait_until([&h]
                          { return h.remote.calls_for(0) == 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(h.orchestrator.paused());
        assert(h.remote.chunk_calls.size() == 1);
        assert(h.orchestrator.state() == UploadState::Transferring);

        // The chunk already in flight when the pause landed still finishes and counts.
        assert((h.remote.events() == std::vector<std::string>{"start", "chunk:0"}));
        assert(wait_until([&progress]
                          {
            const auto values = progress.values();
            return !values.empty() && values.back() == 0.25; }));

        assert(h.orchestrator.resume());
        const auto outcome = pending.get();
        assert(outcome.ok());
        assert(h.remote.assembled(outcome.upload_id) == content);
        assert(!h.orchestrator.pause());
    }

    void test_second_start_is_busy()
    {
        Harness h(small_chunks(1000, 1));
        const auto file = h.scratch.path / "busy.bin";
        write_file(file, 3000);
        h.remote.on_chunk = [&h](std::uint64_t index)
        {
            if (index == 0)
            {
                h.orchestrator.pause();
            }
        };

        auto first = std::async(std::launch::async, [&h, &file]
                                { return h.orchestrator.start(file); });
        assert(wait_until([&h]
                          { return h.orchestrator.paused(); }));

        const auto rejected = h.orchestrator.start(file);
        assert(rejected.code == ErrorCode::Busy);
        assert(h.remote.start_requests.size() == 1);

        h.orchestrator.resume();
        assert(first.get().ok());
        assert(h.orchestrator.state() == UploadState::Idle);
    }

    void test_failure_stops_new_claims()
    {
        auto options = small_chunks(1000, 2);
        options.retry.attempts = 1;
        Harness h(options);
        const auto file = h.scratch.path / "cascade.bin";
        write_file(file, 10'000);
        h.remote.failures[0] = 100;
        h.remote.on_chunk = [](std::uint64_t index)
        {
            if (index == 1)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        };

        const auto outcome = h.orchestrator.start(file);
        assert(outcome.code == ErrorCode::ChunkUploadFailed);
        assert(outcome.failed_chunk == std::optional<std::uint64_t>(0));
        assert(h.remote.calls_for(0) == 1);
        assert(h.remote.chunk_calls.size() <= 2);
        for (const auto index : h.remote.chunk_calls)
        {
            assert(index < 2);
        }
    }

    void test_negotiation_retries_and_replaces_stale_token()
    {
        Harness h(small_chunks(4000));
        const auto file = h.scratch.path / "stale.bin";
        const auto content = write_file(file, 9000);
        h.cache.put(h.resume_key(file), CacheEntry{.upload_id = "up-gone", .chunk_size = 4000});
        h.remote.start_failures = 2;

        const auto outcome = h.orchestrator.start(file);
        assert(outcome.ok());
        assert(h.remote.start_requests.size() == 3);
        assert(h.remote.start_requests.back().upload_id == std::optional<std::string>("up-gone"));
        assert(outcome.upload_id != "up-gone");
        assert(h.remote.assembled(outcome.upload_id) == content);
    }

    void test_negotiation_failures()
    {
        {
            Harness h(small_chunks(4000));
            const auto file = h.scratch.path / "down.bin";
            write_file(file, 9000);
            h.remote.start_failures = 10;

            const auto outcome = h.orchestrator.start(file);
            assert(outcome.code == ErrorCode::NegotiationFailed);
            assert(h.remote.start_requests.size() == 4);
            assert(h.remote.chunk_calls.empty());
            assert(!h.cache.get(h.resume_key(file)).has_value());
        }
        {
            Harness h(small_chunks(4000));
            const auto file = h.scratch.path / "mismatch.bin";
            write_file(file, 9000);
            h.remote.reported_total_chunks = 99;

            const auto outcome = h.orchestrator.start(file);
            assert(outcome.code == ErrorCode::NegotiationFailed);
            assert(h.remote.chunk_calls.empty());
        }
    }

    void test_negotiation_is_idempotent()
    {
        FakeRemoteStore remote;
        Logger logger(std::nullopt);
        RetryPolicy retry(RetryOptions{.attempts = 2, .base_delay = std::chrono::milliseconds(1)}, logger);
        SessionNegotiator negotiator(remote, retry, logger);
        const std::string content(10'000, 'x');
        const protocol::UploadStartRequest shape{.filename = "same.bin", .size = 10'000, .chunk_size = 4000};
        remote.seed("up-same", shape, content, {0});
        const CacheEntry token{.upload_id = "up-same", .chunk_size = 4000};

        const auto first = negotiator.start("same.bin", 10'000, 8 * 1024 * 1024, "", token);
        remote.upload_chunk(protocol::UploadChunkRequest{
            .upload_id = "up-same",
            .index = 2,
            .filename = "same.bin",
            .data = std::vector<std::byte>(2000, std::byte{'x'}),
        });
        const auto second = negotiator.start("same.bin", 10'000, 8 * 1024 * 1024, "", token);

        assert(first.upload_id == "up-same");
        assert(second.upload_id == first.upload_id);
        assert(first.chunk_size == 4000);
        assert(first.total_chunks == 3);
        assert(second.total_chunks == first.total_chunks);
        assert(std::includes(second.received_chunks.begin(), second.received_chunks.end(),
                             first.received_chunks.begin(), first.received_chunks.end()));
        assert((second.received_chunks == std::set<std::uint64_t>{0, 2}));
    }

    void test_invalid_files_are_rejected()
    {
        Harness h(small_chunks(4000));
        const auto empty = h.scratch.path / "empty.bin";
        write_file(empty, 0);

        assert(h.orchestrator.start(empty).code == ErrorCode::InvalidFile);
        assert(h.orchestrator.start(h.scratch.path / "missing.bin").code == ErrorCode::InvalidFile);
        assert(h.orchestrator.start(h.scratch.path).code == ErrorCode::InvalidFile);
        assert(h.remote.start_requests.empty());
        assert(h.orchestrator.state() == UploadState::Idle);
    }

    void test_shutdown_cancels()
    {
        Harness h(small_chunks(1000, 1));
        const auto file = h.scratch.path / "late.bin";
        write_file(file, 5000);
        h.remote.on_chunk = [&h](std::uint64_t index)
        {
            if (index == 0)
            {
                h.orchestrator.pause();
            }
        };

        auto running = std::async(std::launch::async, [&h, &file]
                                  { return h.orchestrator.start(file); });
        assert(wait_until([&h]
                          { return h.orchestrator.paused(); }));
        h.orchestrator.shutdown();

        const auto outcome = running.get();
        assert(outcome.code == ErrorCode::Cancelled);
        assert(h.remote.complete_calls == 0);
        assert(h.cache.get(h.resume_key(file)).has_value());
        assert(h.orchestrator.start(file).code == ErrorCode::Cancelled);
    }

} // namespace

void run_upload_engine_tests()
{
    test_full_upload();
    test_resume_skips_received_chunks();
    test_chunk_failure_keeps_resume_token();
    test_transient_failure_is_retried();
    test_conflict_recovery_uploads_missing_only();
    test_second_conflict_is_terminal();
    test_concurrency_is_bounded();
    test_pause_holds_new_chunks();
    test_second_start_is_busy();
    test_failure_stops_new_claims();
    test_negotiation_retries_and_replaces_stale_token();
    test_negotiation_failures();
    test_negotiation_is_idempotent();
    test_invalid_files_are_rejected();
    test_shutdown_cancels();
}
