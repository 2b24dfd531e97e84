#pragma once

#include "sessionseal/interfaces/i_codec.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <vector>

namespace sessionseal::codec {

/**
 * @brief Ordered codecs supporting key rotation
 *
 * Encode always uses the first codec. Decode tries each codec in order
 * and stops at the first that accepts the token; if none does, the result
 * is AllCodecsFailed carrying every rejection in order.
 */
class CodecSet {
public:
    CodecSet() = default;
    explicit CodecSet(std::vector<std::shared_ptr<const interfaces::ICodec>> codecs);
    CodecSet(std::initializer_list<std::shared_ptr<const interfaces::ICodec>> codecs);

    [[nodiscard]] Result<std::string, SessionFailure> Encode(
        std::string_view name,
        const google::protobuf::Message& value) const;

    [[nodiscard]] Result<Unit, SessionFailure> Decode(
        std::string_view name,
        std::string_view token,
        google::protobuf::Message& destination) const;

    [[nodiscard]] bool Empty() const noexcept { return codecs_.empty(); }
    [[nodiscard]] size_t Size() const noexcept { return codecs_.size(); }

private:
    std::vector<std::shared_ptr<const interfaces::ICodec>> codecs_;
};

} // namespace sessionseal::codec
