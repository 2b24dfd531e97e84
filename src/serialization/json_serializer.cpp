#include "sessionseal/serialization/json_serializer.hpp"

#include <google/protobuf/util/json_util.h>
#include <string>

namespace sessionseal::serialization {

Result<std::vector<uint8_t>, SessionFailure> JsonSerializer::Serialize(
    const google::protobuf::Message& value) const {

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = false;
    options.preserve_proto_field_names = false;

    std::string output;
    const auto status = google::protobuf::util::MessageToJsonString(value, &output, options);
    if (!status.ok()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::SerializeFailed(std::string(status.ToString())));
    }
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

Result<Unit, SessionFailure> JsonSerializer::Deserialize(
    std::span<const uint8_t> data,
    google::protobuf::Message& destination) const {

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    const std::string input(data.begin(), data.end());
    destination.Clear();
    const auto status = google::protobuf::util::JsonStringToMessage(input, &destination, options);
    if (!status.ok()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::DeserializeFailed(std::string(status.ToString())));
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

} // namespace sessionseal::serialization
