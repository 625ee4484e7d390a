#include "dshare/client/transfer_state.hpp"

#include "dshare/protocol.hpp"

namespace dshare::client
{

    TransferState::TransferState(std::uint64_t file_size, const UploadSession &session)
        : file_size_(file_size),
          chunk_size_(session.chunk_size),
          total_chunks_(session.total_chunks)
    {
        for (const auto index : session.received_chunks)
        {
            mark_received(index);
        }
    }

    std::uint64_t TransferState::mark_received(std::uint64_t index)
    {
        if (index >= total_chunks_)
        {
            return 0;
        }
        std::lock_guard lock(mutex_);
        if (!received_.insert(index).second)
        {
            return 0;
        }
        const auto length = protocol::chunk_byte_size(file_size_, index, chunk_size_);
        uploaded_bytes_ += length;
        return length;
    }

    bool TransferState::contains(std::uint64_t index) const
    {
        std::lock_guard lock(mutex_);
        return received_.contains(index);
    }

    std::vector<std::uint64_t> TransferState::received() const
    {
        std::lock_guard lock(mutex_);
        return {received_.begin(), received_.end()};
    }

    std::vector<std::uint64_t> TransferState::pending() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::uint64_t> result;
        for (std::uint64_t index = 0; index < total_chunks_; ++index)
        {
            if (!received_.contains(index))
            {
                result.push_back(index);
            }
        }
        return result;
    }

    std::uint64_t TransferState::uploaded_bytes() const
    {
        std::lock_guard lock(mutex_);
        return uploaded_bytes_;
    }

} // namespace dshare::client
