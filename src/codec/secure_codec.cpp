#include "sessionseal/codec/secure_codec.hpp"
#include "sessionseal/crypto/aes_block_cipher.hpp"
#include "sessionseal/crypto/base_encoding.hpp"
#include "sessionseal/crypto/ctr_stream.hpp"
#include "sessionseal/crypto/sodium_interop.hpp"
#include "sessionseal/serialization/json_serializer.hpp"
#include "sessionseal/debug/session_logger.hpp"
#include "sessionseal/core/format.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <string>

namespace sessionseal::codec {

using crypto::Base64Url;
using crypto::SodiumInterop;

namespace {
    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    std::optional<int64_t> ParseTimestamp(std::string_view text) {
        int64_t value = 0;
        const char* first = text.data();
        const char* last = text.data() + text.size();
        if (!text.empty() && text.front() == '+') {
            ++first;
            if (first != last && *first == '-') {
                return std::nullopt;
            }
        }
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last || first == last) {
            return std::nullopt;
        }
        return value;
    }
}

SecureCodec::SecureCodec(std::span<const uint8_t> hash_key, CodecOptions options)
    : hash_function_(options.hash_function)
    , block_cipher_(std::move(options.block_cipher))
    , max_length_(options.max_length)
    , max_age_(options.max_age)
    , min_age_(options.min_age)
    , serializer_(std::move(options.serializer))
    , time_source_(std::move(options.time_source)) {

    if (!serializer_) {
        serializer_ = std::make_shared<serialization::JsonSerializer>();
    }

    if (hash_key.empty()) {
        config_error_ = SessionFailure::HashKeyNotSet();
        return;
    }

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        config_error_ = SessionFailure::FromSodiumFailure(init.UnwrapErr());
        return;
    }

    auto key_result = crypto::SecureMemoryHandle::FromBytes(hash_key);
    if (key_result.IsErr()) {
        config_error_ = SessionFailure::FromSodiumFailure(key_result.UnwrapErr());
        return;
    }
    hash_key_ = std::move(key_result).Unwrap();

    if (!block_cipher_ && !options.block_key.empty()) {
        auto cipher_result = crypto::AesBlockCipher::Create(options.block_key);
        auto wipe = SodiumInterop::SecureWipe(options.block_key);
        (void)wipe;
        if (cipher_result.IsErr()) {
            config_error_ = std::move(cipher_result).UnwrapErr();
            return;
        }
        block_cipher_ = std::move(cipher_result).Unwrap();
    }
}

int64_t SecureCodec::Now() const {
    if (time_source_) {
        return time_source_();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Result<std::vector<uint8_t>, SessionFailure> SecureCodec::ComputeMac(
    std::string_view message) const {

    auto mac_result = hash_key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto::Hmac::Compute(hash_function_, key, AsBytes(message));
    });
    if (mac_result.IsErr()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::FromSodiumFailure(mac_result.UnwrapErr()));
    }
    return std::move(mac_result).Unwrap();
}

Result<Unit, SessionFailure> SecureCodec::VerifyMac(
    std::string_view message,
    std::span<const uint8_t> mac) const {

    auto expected_result = ComputeMac(message);
    if (expected_result.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(expected_result).UnwrapErr());
    }
    const auto& expected = expected_result.Unwrap();

    auto equal_result = SodiumInterop::ConstantTimeEquals(mac, expected);
    if (equal_result.IsErr()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::FromSodiumFailure(equal_result.UnwrapErr()));
    }
    if (!equal_result.Unwrap()) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::HmacInvalid());
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SessionFailure> SecureCodec::Encrypt(
    std::vector<uint8_t> plaintext) const {

    const size_t block_size = block_cipher_->BlockSize();
    std::vector<uint8_t> output(block_size + plaintext.size());
    std::span<uint8_t> iv(output.data(), block_size);

    if (auto fill = SodiumInterop::FillRandom(iv); fill.IsErr()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::GeneratingIv(fill.UnwrapErr().message));
    }

    std::copy(plaintext.begin(), plaintext.end(), output.begin() + static_cast<std::ptrdiff_t>(block_size));
    auto wipe = SodiumInterop::SecureWipe(plaintext);
    (void)wipe;

    std::span<uint8_t> body(output.data() + block_size, output.size() - block_size);
    auto xor_result = crypto::CtrStream::XorKeyStream(*block_cipher_, iv, body);
    if (xor_result.IsErr()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            std::move(xor_result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, SessionFailure> SecureCodec::Decrypt(
    std::vector<uint8_t> payload) const {

    const size_t block_size = block_cipher_->BlockSize();
    if (payload.size() < block_size) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::DecryptionFailed(std::string(ErrorMessages::CIPHERTEXT_TOO_SHORT)));
    }

    std::vector<uint8_t> iv(payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(block_size));
    std::vector<uint8_t> data(payload.begin() + static_cast<std::ptrdiff_t>(block_size), payload.end());

    auto xor_result = crypto::CtrStream::XorKeyStream(*block_cipher_, iv, data);
    if (xor_result.IsErr()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::DecryptionFailed(xor_result.UnwrapErr().message));
    }
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(data));
}

Result<std::string, SessionFailure> SecureCodec::Encode(
    std::string_view name,
    const google::protobuf::Message& value) const {

    if (config_error_) {
        return Result<std::string, SessionFailure>::Err(*config_error_);
    }

    auto serialized = serializer_->Serialize(value);
    if (serialized.IsErr()) {
        return Result<std::string, SessionFailure>::Err(std::move(serialized).UnwrapErr());
    }
    std::vector<uint8_t> payload = std::move(serialized).Unwrap();

    if (block_cipher_) {
        auto encrypted = Encrypt(std::move(payload));
        if (encrypted.IsErr()) {
            return Result<std::string, SessionFailure>::Err(std::move(encrypted).UnwrapErr());
        }
        payload = std::move(encrypted).Unwrap();
    }

    // name|timestamp|payload is authenticated; name| is not transmitted
    std::string body = compat::format("{}|{}|{}", name, Now(), Base64Url::Encode(payload));
    auto mac = ComputeMac(body);
    if (mac.IsErr()) {
        return Result<std::string, SessionFailure>::Err(std::move(mac).UnwrapErr());
    }
    body.push_back(Constants::TOKEN_SEPARATOR);
    const auto& mac_bytes = mac.Unwrap();
    body.append(mac_bytes.begin(), mac_bytes.end());
    body.erase(0, name.size() + 1);

    std::string token = Base64Url::Encode(AsBytes(body));

    if (max_length_ != 0 && token.size() > max_length_) {
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::EncodedLengthTooLong(token.size(), max_length_));
    }

    debug::LogTokenEncoded(name, token.size(), block_cipher_ != nullptr);
    return Result<std::string, SessionFailure>::Ok(std::move(token));
}

Result<Unit, SessionFailure> SecureCodec::Decode(
    std::string_view name,
    std::string_view token,
    google::protobuf::Message& destination) const {

    if (config_error_) {
        return Result<Unit, SessionFailure>::Err(*config_error_);
    }

    if (max_length_ != 0 && token.size() > max_length_) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::EncodedLengthTooLong(token.size(), max_length_));
    }

    auto outer = Base64Url::Decode(token);
    if (outer.IsErr()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::HmacInvalid(std::string(ErrorMessages::MALFORMED_TOKEN)));
    }
    const auto& decoded = outer.Unwrap();
    const std::string_view body(reinterpret_cast<const char*>(decoded.data()), decoded.size());

    // The MAC is raw bytes and may itself contain separators.
    const size_t first = body.find(Constants::TOKEN_SEPARATOR);
    const size_t second = first == std::string_view::npos
        ? std::string_view::npos
        : body.find(Constants::TOKEN_SEPARATOR, first + 1);
    if (second == std::string_view::npos) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::HmacInvalid(std::string(ErrorMessages::MALFORMED_TOKEN)));
    }
    const std::string_view timestamp_part = body.substr(0, first);
    const std::string_view payload_part = body.substr(first + 1, second - first - 1);
    const std::string_view mac_part = body.substr(second + 1);

    std::string authenticated;
    authenticated.reserve(name.size() + 1 + second);
    authenticated.append(name);
    authenticated.push_back(Constants::TOKEN_SEPARATOR);
    authenticated.append(body.substr(0, second));
    if (auto verified = VerifyMac(authenticated, AsBytes(mac_part)); verified.IsErr()) {
        return verified;
    }

    const auto timestamp = ParseTimestamp(timestamp_part);
    if (!timestamp) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::TimestampInvalid());
    }
    const int64_t now = Now();
    if (min_age_ != 0 && *timestamp > now - min_age_) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::TimestampTooNew());
    }
    if (max_age_ != 0 && *timestamp < now - max_age_) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::TimestampExpired());
    }

    auto inner = Base64Url::Decode(payload_part);
    if (inner.IsErr()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::HmacInvalid(std::string(ErrorMessages::MALFORMED_PAYLOAD)));
    }
    std::vector<uint8_t> payload = std::move(inner).Unwrap();

    if (block_cipher_) {
        auto decrypted = Decrypt(std::move(payload));
        if (decrypted.IsErr()) {
            return Result<Unit, SessionFailure>::Err(std::move(decrypted).UnwrapErr());
        }
        payload = std::move(decrypted).Unwrap();
    }

    return serializer_->Deserialize(payload, destination);
}

} // namespace sessionseal::codec
