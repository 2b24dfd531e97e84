#pragma once
#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"
#include <google/protobuf/message.h>
#include <string>
#include <string_view>
namespace sessionseal::interfaces {
/**
 * @brief Turns a named session value into an authenticated token and back.
 *
 * The name is bound into the token's MAC but is not part of the token.
 */
class ICodec {
public:
    virtual ~ICodec() = default;
    [[nodiscard]] virtual Result<std::string, SessionFailure> Encode(
        std::string_view name,
        const google::protobuf::Message& value) const = 0;
    [[nodiscard]] virtual Result<Unit, SessionFailure> Decode(
        std::string_view name,
        std::string_view token,
        google::protobuf::Message& destination) const = 0;
};
}
