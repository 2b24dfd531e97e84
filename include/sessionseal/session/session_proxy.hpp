#pragma once

#include "sessionseal/codec/codec_set.hpp"
#include "sessionseal/http/cookie_options.hpp"
#include "sessionseal/interfaces/i_http_exchange.hpp"

#include <google/protobuf/message.h>
#include <string>
#include <string_view>

namespace sessionseal::session {

/**
 * @brief Per-call bridge between a session store and the codec/HTTP layers
 *
 * Holds the session id, a non-owning pointer to the live value, the codec
 * set and the cookie attributes. Request and writer may be null; operations
 * that need the writer fail with NoResponseWriter. A proxy never outlives
 * the request it was built for.
 */
class SessionProxy {
public:
    SessionProxy(
        http::CookieOptions options,
        codec::CodecSet codecs,
        google::protobuf::Message* values,
        const interfaces::IRequest* request = nullptr,
        interfaces::IResponseWriter* writer = nullptr);

    /**
     * @brief Decode a token into @p destination using every codec in turn
     */
    [[nodiscard]] Result<Unit, SessionFailure> Decode(
        std::string_view data,
        google::protobuf::Message& destination) const;

    /**
     * @brief Encode @p source with the current (first) codec
     */
    [[nodiscard]] Result<std::string, SessionFailure> Encode(
        const google::protobuf::Message& source) const;

    [[nodiscard]] Result<Unit, SessionFailure> DecodeValues(std::string_view data);
    [[nodiscard]] Result<std::string, SessionFailure> EncodeValues() const;

    /**
     * @brief Write @p value as the session cookie
     *
     * Positive max-age sets Expires to now + max-age; negative max-age
     * writes an empty, already expired cookie; zero leaves Expires unset.
     */
    [[nodiscard]] Result<Unit, SessionFailure> Save(std::string value) const;

    /**
     * @brief Write an empty, already expired cookie regardless of max-age
     */
    [[nodiscard]] Result<Unit, SessionFailure> Delete() const;

    [[nodiscard]] bool IsExpired() const noexcept { return options_.max_age < 0; }
    [[nodiscard]] int MaxAge() const noexcept { return options_.max_age; }

    [[nodiscard]] const std::string& Name() const noexcept { return options_.name; }
    [[nodiscard]] const http::CookieOptions& Options() const noexcept { return options_; }
    [[nodiscard]] const interfaces::IRequest* Request() const noexcept { return request_; }

    [[nodiscard]] google::protobuf::Message* Values() const noexcept { return values_; }

    std::string id;
    bool is_new = false;

private:
    [[nodiscard]] http::Cookie BaseCookie() const;

    http::CookieOptions options_;
    codec::CodecSet codecs_;
    google::protobuf::Message* values_;
    const interfaces::IRequest* request_;
    interfaces::IResponseWriter* writer_;
};

} // namespace sessionseal::session
