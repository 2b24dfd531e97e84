#include "sessionseal/core/failures.hpp"

namespace sessionseal {

FailureKind SessionFailure::Kind() const noexcept {
    switch (type) {
        case SessionFailureType::HashKeyNotSet:
        case SessionFailureType::CreatingBlockCipher:
        case SessionFailureType::InvalidConfiguration:
        case SessionFailureType::NoCodecs:
            return FailureKind::Config;
        case SessionFailureType::SerializeFailed:
        case SessionFailureType::DeserializeFailed:
            return FailureKind::Serialization;
        case SessionFailureType::HmacInvalid:
        case SessionFailureType::TimestampInvalid:
        case SessionFailureType::DecryptionFailed:
            return FailureKind::Integrity;
        case SessionFailureType::TimestampTooNew:
        case SessionFailureType::TimestampExpired:
            return FailureKind::Freshness;
        case SessionFailureType::EncodedLengthTooLong:
            return FailureKind::Length;
        case SessionFailureType::GeneratingIv:
        case SessionFailureType::CryptoFailure:
            return FailureKind::Crypto;
        case SessionFailureType::Backend:
        case SessionFailureType::Cancelled:
            return FailureKind::Backend;
        case SessionFailureType::NoResponseWriter:
        case SessionFailureType::InvalidSessionType:
            return FailureKind::Usage;
        case SessionFailureType::AllCodecsFailed:
            return FailureKind::Aggregate;
    }
    return FailureKind::Aggregate;
}

bool SessionFailure::Is(const SessionFailureType wanted) const noexcept {
    if (type == wanted) {
        return true;
    }
    for (const auto& cause : causes) {
        if (cause.Is(wanted)) {
            return true;
        }
    }
    return false;
}

bool SessionFailure::HasKind(const FailureKind wanted) const noexcept {
    if (Kind() == wanted) {
        return true;
    }
    for (const auto& cause : causes) {
        if (cause.HasKind(wanted)) {
            return true;
        }
    }
    return false;
}

std::string SessionFailure::Describe() const {
    std::string description = message;
    if (type == SessionFailureType::AllCodecsFailed) {
        for (size_t i = 0; i < causes.size(); ++i) {
            description += "\n  codec[" + std::to_string(i) + "]: " + causes[i].Describe();
        }
    } else if (!causes.empty()) {
        description += " (caused by: ";
        for (size_t i = 0; i < causes.size(); ++i) {
            if (i > 0) {
                description += "; ";
            }
            description += causes[i].Describe();
        }
        description += ")";
    }
    return description;
}

SessionFailure SessionFailure::AllCodecsFailed(std::vector<SessionFailure> rejections) {
    std::string msg = "all " + std::to_string(rejections.size()) + " codecs rejected the value";
    return {SessionFailureType::AllCodecsFailed, std::move(msg), std::move(rejections)};
}

std::string_view ToString(const FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::Config: return "config";
        case FailureKind::Serialization: return "serialization";
        case FailureKind::Integrity: return "integrity";
        case FailureKind::Freshness: return "freshness";
        case FailureKind::Length: return "length";
        case FailureKind::Crypto: return "crypto";
        case FailureKind::Backend: return "backend";
        case FailureKind::Usage: return "usage";
        case FailureKind::Aggregate: return "aggregate";
    }
    return "unknown";
}

}
