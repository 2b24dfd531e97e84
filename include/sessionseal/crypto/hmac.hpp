#pragma once

#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace sessionseal::crypto {

enum class HashFunction : uint8_t {
    Sha1,
    Sha224,
    Sha256,
    Sha384,
    Sha512
};

[[nodiscard]] std::string_view DigestName(HashFunction hash_function) noexcept;

[[nodiscard]] size_t DigestSize(HashFunction hash_function) noexcept;

/**
 * @brief Keyed message authentication (RFC 2104) via OpenSSL EVP_MAC
 */
class Hmac {
public:
    /**
     * @brief Compute HMAC(key, data) with the selected digest
     *
     * @return Ok(mac) of DigestSize(hash_function) bytes, or CryptoFailure
     */
    static Result<std::vector<uint8_t>, SessionFailure> Compute(
        HashFunction hash_function,
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

private:
    Hmac() = delete;
};

} // namespace sessionseal::crypto
