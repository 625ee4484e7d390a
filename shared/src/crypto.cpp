#include "dshare/crypto.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace dshare::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string encode_base64_url(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        constexpr int kVariant = sodium_base64_VARIANT_URLSAFE;
        std::string encoded(sodium_base64_ENCODED_LEN(data.size(), kVariant), '\0');
        if (sodium_bin2base64(encoded.data(), encoded.size(), reinterpret_cast<const unsigned char *>(data.data()),
                              data.size(), kVariant) == nullptr)
        {
            throw std::runtime_error("sodium_bin2base64 failed");
        }
        // The encoded length includes the terminating NUL.
        encoded.resize(encoded.size() - 1);
        return encoded;
    }

    std::string encode_base64_url(std::string_view text)
    {
        return encode_base64_url(std::as_bytes(std::span(text.data(), text.size())));
    }

    std::string random_token(std::size_t bytes)
    {
        ensure_initialized_once();
        std::vector<unsigned char> raw(bytes);
        randombytes_buf(raw.data(), raw.size());
        std::string hex(bytes * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
        hex.resize(bytes * 2);
        return hex;
    }

} // namespace dshare::crypto
