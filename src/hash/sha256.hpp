#pragma once

#include <openssl/sha.h>

#include <array>
#include <cstdint>
#include <optional>

class SHA256 {
   public:
    using result_type = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

    // std::nullopt when the digest context could not be set up
    static std::optional<result_type> compute(const uint8_t* data,
                                              std::size_t length);
};
