#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "dshare/client/remote_store.hpp"
#include "dshare/protocol.hpp"

namespace dshare::testing
{

    // In-memory stand-in for the upload endpoints. Keeps chunk payloads so tests can rebuild the file, and
    // lets a test inject chunk failures, scripted 409 replies and per-chunk latency.
    class FakeRemoteStore : public client::RemoteStore
    {
    public:
        struct Upload
        {
            std::string filename;
            std::uint64_t size{};
            std::uint64_t chunk_size{};
            std::uint64_t total_chunks{};
            std::map<std::uint64_t, std::vector<std::byte>> chunks;
        };

        protocol::UploadStartResponse start_upload(const protocol::UploadStartRequest &request) override
        {
            std::lock_guard lock(mutex_);
            start_requests.push_back(request);
            events_.push_back("start");
            if (start_failures > 0)
            {
                --start_failures;
                throw client::RemoteError("start unavailable", 503);
            }

            std::string id;
            if (request.upload_id && uploads.contains(*request.upload_id))
            {
                id = *request.upload_id;
            }
            else
            {
                id = "up-" + std::to_string(++next_id_);
                uploads[id] = Upload{
                    .filename = request.filename,
                    .size = request.size,
                    .chunk_size = request.chunk_size,
                    .total_chunks = protocol::chunk_count(request.size, request.chunk_size),
                };
            }

            const auto &upload = uploads.at(id);
            protocol::UploadStartResponse response{
                .status = std::string(protocol::kStatusOk),
                .upload_id = id,
                .chunk_size = upload.chunk_size,
                .total_chunks = reported_total_chunks.value_or(upload.total_chunks),
            };
            for (const auto &entry : upload.chunks)
            {
                response.received_chunks.push_back(static_cast<std::int64_t>(entry.first));
            }
            return response;
        }

        void upload_chunk(const protocol::UploadChunkRequest &request) override
        {
            const auto now = ++in_flight_;
            auto peak = max_in_flight.load();
            while (now > peak && !max_in_flight.compare_exchange_weak(peak, now))
            {
            }
            if (on_chunk)
            {
                on_chunk(request.index);
            }
            if (chunk_delay.count() > 0)
            {
                std::this_thread::sleep_for(chunk_delay);
            }

            std::unique_lock lock(mutex_);
            chunk_calls.push_back(request.index);
            const auto failure = failures.find(request.index);
            if (failure != failures.end() && failure->second > 0)
            {
                --failure->second;
                lock.unlock();
                --in_flight_;
                throw client::RemoteError("injected failure for chunk " + std::to_string(request.index), 500);
            }
            const auto upload = uploads.find(request.upload_id);
            if (upload == uploads.end())
            {
                lock.unlock();
                --in_flight_;
                throw client::RemoteError("unknown upload " + request.upload_id, 404);
            }
            upload->second.chunks[request.index] = request.data;
            events_.push_back("chunk:" + std::to_string(request.index));
            lock.unlock();
            --in_flight_;
        }

        client::CompletionReply complete_upload(const protocol::UploadCompleteRequest &request) override
        {
            std::lock_guard lock(mutex_);
            ++complete_calls;
            auto &upload = uploads.at(request.upload_id);
            if (!scripted_conflicts.empty())
            {
                events_.push_back("complete:409");
                auto missing = scripted_conflicts.front();
                scripted_conflicts.pop_front();
                for (const auto index : missing)
                {
                    if (index >= 0)
                    {
                        upload.chunks.erase(static_cast<std::uint64_t>(index));
                    }
                }
                return conflict(std::move(missing));
            }

            std::vector<std::int64_t> missing;
            for (std::uint64_t index = 0; index < upload.total_chunks; ++index)
            {
                if (!upload.chunks.contains(index))
                {
                    missing.push_back(static_cast<std::int64_t>(index));
                }
            }
            if (!missing.empty())
            {
                events_.push_back("complete:409");
                return conflict(std::move(missing));
            }
            events_.push_back("complete:200");
            completed.insert(request.upload_id);
            return client::CompletionReply{
                .http_status = 200,
                .body = protocol::UploadCompleteResponse{.status = std::string(protocol::kStatusOk)},
            };
        }

        // Concatenated payload of a finished upload.
        std::string assembled(const std::string &upload_id) const
        {
            std::lock_guard lock(mutex_);
            std::string out;
            for (const auto &[index, data] : uploads.at(upload_id).chunks)
            {
                out.append(reinterpret_cast<const char *>(data.data()), data.size());
            }
            return out;
        }

        // Server-side effects in the order they happened: "start", "chunk:<index>" once a chunk is stored,
        // and "complete:<status>".
        std::vector<std::string> events() const
        {
            std::lock_guard lock(mutex_);
            return events_;
        }

        std::size_t calls_for(std::uint64_t index) const
        {
            std::lock_guard lock(mutex_);
            return static_cast<std::size_t>(std::count(chunk_calls.begin(), chunk_calls.end(), index));
        }

        // Seeds a server-side session that already holds `indices`, as if a previous run had uploaded them.
        void seed(const std::string &upload_id, const protocol::UploadStartRequest &shape,
                  const std::string &content, const std::vector<std::uint64_t> &indices)
        {
            std::lock_guard lock(mutex_);
            Upload upload{
                .filename = shape.filename,
                .size = shape.size,
                .chunk_size = shape.chunk_size,
                .total_chunks = protocol::chunk_count(shape.size, shape.chunk_size),
            };
            for (const auto index : indices)
            {
                const auto begin = index * shape.chunk_size;
                const auto length = protocol::chunk_byte_size(shape.size, index, shape.chunk_size);
                const auto *bytes = reinterpret_cast<const std::byte *>(content.data() + begin);
                upload.chunks[index] = std::vector<std::byte>(bytes, bytes + length);
            }
            uploads[upload_id] = std::move(upload);
        }

        std::map<std::string, Upload> uploads;
        std::vector<protocol::UploadStartRequest> start_requests;
        std::vector<std::uint64_t> chunk_calls;
        std::map<std::uint64_t, int> failures;
        std::deque<std::vector<std::int64_t>> scripted_conflicts;
        std::optional<std::uint64_t> reported_total_chunks;
        std::set<std::string> completed;
        int start_failures{0};
        int complete_calls{0};

        std::chrono::milliseconds chunk_delay{0};
        std::function<void(std::uint64_t)> on_chunk;
        std::atomic<int> max_in_flight{0};

    private:
        static client::CompletionReply conflict(std::vector<std::int64_t> missing)
        {
            return client::CompletionReply{
                .http_status = 409,
                .body = protocol::UploadCompleteResponse{.status = "fail", .missing_chunks = std::move(missing)},
            };
        }

        mutable std::mutex mutex_;
        std::vector<std::string> events_;
        std::atomic<int> in_flight_{0};
        int next_id_{0};
    };

} // namespace dshare::testing
