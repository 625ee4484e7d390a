#pragma once

#include <cstdint>
#include <mutex>
#include <set>
#include <vector>

#include "dshare/client/pause_gate.hpp"
#include "dshare/client/transfer_types.hpp"

namespace dshare::client
{

    // In-memory bookkeeping of one active upload. The received set and the byte counter move together under
    // one lock so that uploaded_bytes() always equals the summed length of the received chunks.
    class TransferState
    {
    public:
        TransferState(std::uint64_t file_size, const UploadSession &session);

        TransferState(const TransferState &) = delete;
        TransferState &operator=(const TransferState &) = delete;

        // Records a chunk as received; returns the number of bytes added (0 when it was already present).
        std::uint64_t mark_received(std::uint64_t index);

        bool contains(std::uint64_t index) const;
        std::vector<std::uint64_t> received() const;
        std::vector<std::uint64_t> pending() const;
        std::uint64_t uploaded_bytes() const;

        std::uint64_t file_size() const noexcept { return file_size_; }
        std::uint64_t chunk_size() const noexcept { return chunk_size_; }
        std::uint64_t total_chunks() const noexcept { return total_chunks_; }

        PauseGate &gate() noexcept { return gate_; }

    private:
        const std::uint64_t file_size_;
        const std::uint64_t chunk_size_;
        const std::uint64_t total_chunks_;

        mutable std::mutex mutex_;
        std::set<std::uint64_t> received_;
        std::uint64_t uploaded_bytes_{0};

        PauseGate gate_;
    };

} // namespace dshare::client
