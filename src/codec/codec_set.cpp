#include "sessionseal/codec/codec_set.hpp"
#include "sessionseal/debug/session_logger.hpp"

namespace sessionseal::codec {

CodecSet::CodecSet(std::vector<std::shared_ptr<const interfaces::ICodec>> codecs)
    : codecs_(std::move(codecs)) {}

CodecSet::CodecSet(std::initializer_list<std::shared_ptr<const interfaces::ICodec>> codecs)
    : codecs_(codecs) {}

Result<std::string, SessionFailure> CodecSet::Encode(
    std::string_view name,
    const google::protobuf::Message& value) const {

    if (codecs_.empty() || !codecs_.front()) {
        return Result<std::string, SessionFailure>::Err(SessionFailure::NoCodecs());
    }
    return codecs_.front()->Encode(name, value);
}

Result<Unit, SessionFailure> CodecSet::Decode(
    std::string_view name,
    std::string_view token,
    google::protobuf::Message& destination) const {

    if (codecs_.empty()) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::NoCodecs());
    }

    std::vector<SessionFailure> rejections;
    rejections.reserve(codecs_.size());
    for (size_t i = 0; i < codecs_.size(); ++i) {
        if (!codecs_[i]) {
            rejections.push_back(SessionFailure::NoCodecs());
            continue;
        }
        auto result = codecs_[i]->Decode(name, token, destination);
        if (result.IsOk()) {
            debug::LogCodecAccepted(i, name);
            return result;
        }
        debug::LogCodecRejected(i, name, result.UnwrapErr().message);
        rejections.push_back(std::move(result).UnwrapErr());
    }
    return Result<Unit, SessionFailure>::Err(
        SessionFailure::AllCodecsFailed(std::move(rejections)));
}

} // namespace sessionseal::codec
