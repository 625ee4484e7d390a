/**
 * DShare - Error codes and the exception type raised by the upload engine.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dshare
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidFile = 1,
        NegotiationFailed = 2,
        ChunkUploadFailed = 3,
        CompletionFailed = 4,
        RecoveryFailed = 5,
        Busy = 6,
        Cancelled = 7,
        TransportError = 8,
        ProtocolError = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, const std::string &message,
                      std::optional<std::uint64_t> chunk_index = std::nullopt);

        ErrorCode code() const noexcept { return code_; }
        const std::optional<std::uint64_t> &chunk_index() const noexcept { return chunk_index_; }

    private:
        ErrorCode code_;
        std::optional<std::uint64_t> chunk_index_;
    };

} // namespace dshare
