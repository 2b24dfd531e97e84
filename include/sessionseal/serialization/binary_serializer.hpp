#pragma once

#include "sessionseal/interfaces/i_serializer.hpp"

#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>

namespace sessionseal::serialization {

/**
 * @brief Compact serializer wrapping the value in google.protobuf.Any
 *
 * The envelope names the packed type. Only registered types are accepted
 * on the way back in; decoding an unregistered type, or a type other than
 * the destination's, is a DeserializeFailed. StringValue is registered by
 * default. Registration is thread-safe.
 */
class BinarySerializer final : public interfaces::ISerializer {
public:
    BinarySerializer();

    template<typename T>
    void Register() {
        static_assert(std::is_base_of_v<google::protobuf::Message, T>,
                      "BinarySerializer can only register protobuf messages");
        RegisterTypeName(std::string(T::descriptor()->full_name()));
    }

    void RegisterTypeName(std::string full_name);

    [[nodiscard]] bool IsRegistered(std::string_view full_name) const;

    [[nodiscard]] Result<std::vector<uint8_t>, SessionFailure> Serialize(
        const google::protobuf::Message& value) const override;

    [[nodiscard]] Result<Unit, SessionFailure> Deserialize(
        std::span<const uint8_t> data,
        google::protobuf::Message& destination) const override;

private:
    mutable std::shared_mutex lock_;
    std::unordered_set<std::string> registered_;
};

} // namespace sessionseal::serialization
