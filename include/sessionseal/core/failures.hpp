#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
namespace sessionseal {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    InvalidOperation
};
enum class SessionFailureType {
    HashKeyNotSet,
    CreatingBlockCipher,
    InvalidConfiguration,
    NoCodecs,
    SerializeFailed,
    DeserializeFailed,
    HmacInvalid,
    TimestampInvalid,
    TimestampTooNew,
    TimestampExpired,
    EncodedLengthTooLong,
    GeneratingIv,
    DecryptionFailed,
    CryptoFailure,
    AllCodecsFailed,
    NoResponseWriter,
    InvalidSessionType,
    Backend,
    Cancelled
};
enum class FailureKind : uint8_t {
    Config,
    Serialization,
    Integrity,
    Freshness,
    Length,
    Crypto,
    Backend,
    Usage,
    Aggregate
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Failure raised by the session codec, codec set, stores and manager.
 *
 * A failure may carry causes: wrapping failures keep the underlying library
 * failure, and AllCodecsFailed keeps one cause per rejected codec in
 * rotation order. Is() and HasKind() look through causes recursively.
 */
class SessionFailure {
public:
    SessionFailureType type;
    std::string message;
    std::vector<SessionFailure> causes;
    SessionFailure(const SessionFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    SessionFailure(const SessionFailureType t, std::string msg, std::vector<SessionFailure> inner)
        : type(t), message(std::move(msg)), causes(std::move(inner)) {}

    [[nodiscard]] FailureKind Kind() const noexcept;
    [[nodiscard]] bool Is(SessionFailureType wanted) const noexcept;
    [[nodiscard]] bool HasKind(FailureKind wanted) const noexcept;
    [[nodiscard]] std::string Describe() const;

    static SessionFailure HashKeyNotSet() {
        return {SessionFailureType::HashKeyNotSet, "the hash key is not set for the codec"};
    }
    static SessionFailure CreatingBlockCipher(std::string detail) {
        return {SessionFailureType::CreatingBlockCipher, "failed to create block cipher: " + std::move(detail)};
    }
    static SessionFailure InvalidConfiguration(std::string msg) {
        return {SessionFailureType::InvalidConfiguration, std::move(msg)};
    }
    static SessionFailure NoCodecs() {
        return {SessionFailureType::NoCodecs, "no codecs were provided"};
    }
    static SessionFailure SerializeFailed(std::string detail) {
        return {SessionFailureType::SerializeFailed, "the value cannot be serialized: " + std::move(detail)};
    }
    static SessionFailure DeserializeFailed(std::string detail) {
        return {SessionFailureType::DeserializeFailed, "the value cannot be deserialized: " + std::move(detail)};
    }
    static SessionFailure HmacInvalid(std::string detail = "the value cannot be validated") {
        return {SessionFailureType::HmacInvalid, std::move(detail)};
    }
    static SessionFailure TimestampInvalid() {
        return {SessionFailureType::TimestampInvalid, "the timestamp is invalid"};
    }
    static SessionFailure TimestampTooNew() {
        return {SessionFailureType::TimestampTooNew, "the timestamp is too new"};
    }
    static SessionFailure TimestampExpired() {
        return {SessionFailureType::TimestampExpired, "the timestamp has expired"};
    }
    static SessionFailure EncodedLengthTooLong(size_t length, size_t limit) {
        return {SessionFailureType::EncodedLengthTooLong,
                "the encoded value is too long: " + std::to_string(length) +
                " > " + std::to_string(limit)};
    }
    static SessionFailure GeneratingIv(std::string detail) {
        return {SessionFailureType::GeneratingIv, "error generating the random iv: " + std::move(detail)};
    }
    static SessionFailure DecryptionFailed(std::string detail = "the value cannot be decrypted") {
        return {SessionFailureType::DecryptionFailed, std::move(detail)};
    }
    static SessionFailure CryptoFailure(std::string msg) {
        return {SessionFailureType::CryptoFailure, std::move(msg)};
    }
    static SessionFailure AllCodecsFailed(std::vector<SessionFailure> rejections);
    static SessionFailure NoResponseWriter() {
        return {SessionFailureType::NoResponseWriter, "no response writer was provided"};
    }
    static SessionFailure InvalidSessionType(std::string detail = "the session type is incorrect") {
        return {SessionFailureType::InvalidSessionType, std::move(detail)};
    }
    static SessionFailure Backend(std::string msg) {
        return {SessionFailureType::Backend, std::move(msg)};
    }
    static SessionFailure Backend(std::string msg, std::vector<SessionFailure> inner) {
        return {SessionFailureType::Backend, std::move(msg), std::move(inner)};
    }
    static SessionFailure Cancelled(std::string msg = "the request was cancelled") {
        return {SessionFailureType::Cancelled, std::move(msg)};
    }
    static SessionFailure FromSodiumFailure(const SodiumFailure& sf) {
        return CryptoFailure(sf.message);
    }
};

[[nodiscard]] std::string_view ToString(FailureKind kind) noexcept;
}
