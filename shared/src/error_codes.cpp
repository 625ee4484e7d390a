#include "dshare/error_codes.hpp"

#include <array>

namespace dshare
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidFile, "invalid_file"},
            {ErrorCode::NegotiationFailed, "negotiation_failed"},
            {ErrorCode::ChunkUploadFailed, "chunk_upload_failed"},
            {ErrorCode::CompletionFailed, "completion_failed"},
            {ErrorCode::RecoveryFailed, "recovery_failed"},
            {ErrorCode::Busy, "busy"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::TransportError, "transport_error"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    TransferError::TransferError(ErrorCode code, const std::string &message, std::optional<std::uint64_t> chunk_index)
        : std::runtime_error(message),
          code_(code),
          chunk_index_(chunk_index)
    {
    }

} // namespace dshare
