#pragma once

#include "sessionseal/codec/codec_options.hpp"
#include "sessionseal/crypto/secure_memory_handle.hpp"
#include "sessionseal/interfaces/i_codec.hpp"

#include <optional>
#include <span>

namespace sessionseal::codec {

/**
 * @brief Authenticated (and optionally encrypted) session value codec
 *
 * Token layout, before the outer base64url step:
 *
 *     timestamp '|' base64url(payload) '|' mac
 *
 * where mac = HMAC(hash_key, name '|' timestamp '|' base64url(payload)) and
 * payload is the serialized value, or IV || CTR(serialized value) when a
 * block cipher is configured.
 *
 * Construction never fails; a configuration error (empty hash key, bad
 * block key) is kept and returned by every Encode and Decode.
 */
class SecureCodec final : public interfaces::ICodec {
public:
    explicit SecureCodec(std::span<const uint8_t> hash_key, CodecOptions options = {});

    [[nodiscard]] Result<std::string, SessionFailure> Encode(
        std::string_view name,
        const google::protobuf::Message& value) const override;

    [[nodiscard]] Result<Unit, SessionFailure> Decode(
        std::string_view name,
        std::string_view token,
        google::protobuf::Message& destination) const override;

    [[nodiscard]] const std::optional<SessionFailure>& ConfigurationError() const noexcept {
        return config_error_;
    }

    [[nodiscard]] bool IsEncrypting() const noexcept { return block_cipher_ != nullptr; }

private:
    [[nodiscard]] int64_t Now() const;

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> ComputeMac(
        std::string_view message) const;

    [[nodiscard]] Result<Unit, SessionFailure> VerifyMac(
        std::string_view message,
        std::span<const uint8_t> mac) const;

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> Encrypt(
        std::vector<uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> Decrypt(
        std::vector<uint8_t> payload) const;

    crypto::SecureMemoryHandle hash_key_;
    crypto::HashFunction hash_function_;
    std::shared_ptr<const interfaces::IBlockCipher> block_cipher_;
    size_t max_length_;
    int64_t max_age_;
    int64_t min_age_;
    std::shared_ptr<const interfaces::ISerializer> serializer_;
    TimeSource time_source_;
    std::optional<SessionFailure> config_error_;
};

} // namespace sessionseal::codec
