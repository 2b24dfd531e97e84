#include "sessionseal/crypto/base_encoding.hpp"
#include "sessionseal/core/constants.hpp"

#include <sodium.h>

namespace sessionseal::crypto {

namespace {
    constexpr std::string_view BASE32_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    constexpr int BASE64_VARIANT = sodium_base64_VARIANT_URLSAFE;
}

std::string Base64Url::Encode(std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), BASE64_VARIANT);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), encoded_len, data.data(), data.size(), BASE64_VARIANT);
    // encoded_len counts the terminating NUL
    out.resize(encoded_len - 1);
    return out;
}

Result<std::vector<uint8_t>, SodiumFailure> Base64Url::Decode(std::string_view encoded) {
    if (encoded.empty()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Ok({});
    }
    std::vector<uint8_t> out(encoded.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    if (sodium_base642bin(out.data(), out.size(),
                          encoded.data(), encoded.size(),
                          nullptr, &bin_len, nullptr,
                          BASE64_VARIANT) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("illegal base64 data"));
    }
    out.resize(bin_len);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(out));
}

std::string Base32::Encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);
    uint32_t buffer = 0;
    int bits = 0;
    for (const uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(BASE32_ALPHABET[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

} // namespace sessionseal::crypto
