#include "sessionseal/serialization/binary_serializer.hpp"
#include "sessionseal/core/format.hpp"

#include <google/protobuf/any.pb.h>
#include <google/protobuf/wrappers.pb.h>
#include <mutex>

namespace sessionseal::serialization {

namespace {
    std::string_view TypeNameFromUrl(std::string_view type_url) {
        const auto slash = type_url.rfind('/');
        if (slash == std::string_view::npos) {
            return type_url;
        }
        return type_url.substr(slash + 1);
    }
}

BinarySerializer::BinarySerializer() {
    Register<google::protobuf::StringValue>();
}

void BinarySerializer::RegisterTypeName(std::string full_name) {
    std::unique_lock guard(lock_);
    registered_.insert(std::move(full_name));
}

bool BinarySerializer::IsRegistered(std::string_view full_name) const {
    std::shared_lock guard(lock_);
    return registered_.contains(std::string(full_name));
}

Result<std::vector<uint8_t>, SessionFailure> BinarySerializer::Serialize(
    const google::protobuf::Message& value) const {

    google::protobuf::Any envelope;
    if (!envelope.PackFrom(value)) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::SerializeFailed(
                compat::format("cannot pack {}", std::string(value.GetTypeName()))));
    }

    std::string output;
    if (!envelope.SerializeToString(&output)) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::SerializeFailed("Any envelope serialization failed"));
    }
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

Result<Unit, SessionFailure> BinarySerializer::Deserialize(
    std::span<const uint8_t> data,
    google::protobuf::Message& destination) const {

    google::protobuf::Any envelope;
    if (!envelope.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::DeserializeFailed("malformed Any envelope"));
    }

    const std::string type_name(TypeNameFromUrl(envelope.type_url()));
    if (!IsRegistered(type_name)) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::DeserializeFailed(
                compat::format("type not registered: \"{}\"", type_name)));
    }

    const std::string wanted(destination.GetDescriptor()->full_name());
    if (type_name != wanted) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::DeserializeFailed(
                compat::format("type mismatch: got {}, want {}", type_name, wanted)));
    }

    if (!envelope.UnpackTo(&destination)) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::DeserializeFailed(
                compat::format("cannot unpack {}", type_name)));
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

} // namespace sessionseal::serialization
