#include "dshare/client/transfer_types.hpp"

#include <chrono>
#include <system_error>

#include "dshare/crypto.hpp"
#include "dshare/error_codes.hpp"

namespace dshare::client
{

    std::string FileDescriptor::identity_key() const
    {
        return "dshare-upload:" + crypto::encode_base64_url(path.generic_string()) + ":" + std::to_string(size) + ":" +
               std::to_string(modified_ms);
    }

    FileDescriptor describe_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        absolute = absolute.lexically_normal();

        if (!std::filesystem::is_regular_file(absolute, ec))
        {
            throw TransferError(ErrorCode::InvalidFile, "Not a regular file: " + absolute.string());
        }
        const auto size = std::filesystem::file_size(absolute, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::InvalidFile, "Cannot stat " + absolute.string() + ": " + ec.message());
        }
        if (size == 0)
        {
            throw TransferError(ErrorCode::InvalidFile, "File is empty: " + absolute.string());
        }
        const auto modified = std::filesystem::last_write_time(absolute, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::InvalidFile, "Cannot stat " + absolute.string() + ": " + ec.message());
        }

        FileDescriptor file;
        file.path = absolute;
        file.size = static_cast<std::uint64_t>(size);
        file.modified_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(modified.time_since_epoch()).count();
        return file;
    }

} // namespace dshare::client
