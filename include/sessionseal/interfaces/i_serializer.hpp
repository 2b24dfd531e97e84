#pragma once
#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"
#include <google/protobuf/message.h>
#include <cstdint>
#include <span>
#include <vector>
namespace sessionseal::interfaces {
/**
 * @brief Turns a session value into bytes and back.
 *
 * Deserialize(Serialize(v)) must reproduce v. Failures are reported as
 * SerializeFailed / DeserializeFailed; implementations never throw.
 */
class ISerializer {
public:
    virtual ~ISerializer() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, SessionFailure> Serialize(
        const google::protobuf::Message& value) const = 0;
    [[nodiscard]] virtual Result<Unit, SessionFailure> Deserialize(
        std::span<const uint8_t> data,
        google::protobuf::Message& destination) const = 0;
};
}
