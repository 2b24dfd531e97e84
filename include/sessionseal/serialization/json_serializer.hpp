#pragma once

#include "sessionseal/interfaces/i_serializer.hpp"

namespace sessionseal::serialization {

/**
 * @brief Human-inspectable serializer using the protobuf JSON mapping
 *
 * Output is compact; unknown fields are ignored when parsing.
 */
class JsonSerializer final : public interfaces::ISerializer {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> Serialize(
        const google::protobuf::Message& value) const override;

    [[nodiscard]] Result<Unit, SessionFailure> Deserialize(
        std::span<const uint8_t> data,
        google::protobuf::Message& destination) const override;
};

} // namespace sessionseal::serialization
