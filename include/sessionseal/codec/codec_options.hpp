#pragma once

#include "sessionseal/core/constants.hpp"
#include "sessionseal/crypto/hmac.hpp"
#include "sessionseal/interfaces/i_block_cipher.hpp"
#include "sessionseal/interfaces/i_serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace sessionseal::codec {

using TimeSource = std::function<int64_t()>;

/**
 * @brief Tunables of a SecureCodec; every field has a usable default
 *
 * - block_key: empty disables encryption; 16/24/32 bytes select AES-128/192/256
 * - block_cipher: a ready cipher, takes precedence over block_key
 * - max_length, max_age: 0 disables the bound
 * - serializer: null selects the JSON serializer
 * - time_source: null selects the system clock (Unix seconds)
 */
struct CodecOptions {
    crypto::HashFunction hash_function = crypto::HashFunction::Sha256;
    std::vector<uint8_t> block_key;
    std::shared_ptr<const interfaces::IBlockCipher> block_cipher;
    size_t max_length = CodecConstants::DEFAULT_MAX_LENGTH;
    int64_t max_age = CookieConstants::DEFAULT_MAX_AGE;
    int64_t min_age = CodecConstants::DEFAULT_MIN_AGE;
    std::shared_ptr<const interfaces::ISerializer> serializer;
    TimeSource time_source;
};

} // namespace sessionseal::codec
