/**
 * DShare - Encoding and randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace dshare::crypto
{

    void ensure_sodium_init();

    // URL-safe base64 with padding.
    std::string encode_base64_url(std::span<const std::byte> data);

    std::string encode_base64_url(std::string_view text);

    // Hex string of `bytes` random bytes.
    std::string random_token(std::size_t bytes = 16);

} // namespace dshare::crypto
