#pragma once

#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sessionseal::crypto {

/**
 * @brief Padded URL-safe base64 (RFC 4648 section 5) via libsodium
 *
 * Decoding is strict: the whole input must be consumed, padding is
 * required and no characters are ignored.
 */
class Base64Url {
public:
    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> Decode(std::string_view encoded);

private:
    Base64Url() = delete;
};

/**
 * @brief RFC 4648 base32, standard alphabet, without padding
 */
class Base32 {
public:
    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

private:
    Base32() = delete;
};

} // namespace sessionseal::crypto
