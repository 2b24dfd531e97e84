#include "sessionseal/session/session_proxy.hpp"
#include "sessionseal/core/constants.hpp"

#include <chrono>

namespace sessionseal::session {

SessionProxy::SessionProxy(
    http::CookieOptions options,
    codec::CodecSet codecs,
    google::protobuf::Message* values,
    const interfaces::IRequest* request,
    interfaces::IResponseWriter* writer)
    : options_(std::move(options))
    , codecs_(std::move(codecs))
    , values_(values)
    , request_(request)
    , writer_(writer) {}

Result<Unit, SessionFailure> SessionProxy::Decode(
    std::string_view data,
    google::protobuf::Message& destination) const {
    return codecs_.Decode(options_.name, data, destination);
}

Result<std::string, SessionFailure> SessionProxy::Encode(
    const google::protobuf::Message& source) const {
    return codecs_.Encode(options_.name, source);
}

Result<Unit, SessionFailure> SessionProxy::DecodeValues(std::string_view data) {
    if (values_ == nullptr) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::InvalidSessionType(std::string(ErrorMessages::MISSING_VALUE_SLOT)));
    }
    return Decode(data, *values_);
}

Result<std::string, SessionFailure> SessionProxy::EncodeValues() const {
    if (values_ == nullptr) {
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::InvalidSessionType(std::string(ErrorMessages::MISSING_VALUE_SLOT)));
    }
    return Encode(*values_);
}

http::Cookie SessionProxy::BaseCookie() const {
    http::Cookie cookie;
    cookie.name = options_.name;
    cookie.path = options_.path;
    cookie.domain = options_.domain;
    cookie.max_age = options_.max_age;
    cookie.secure = options_.secure;
    cookie.http_only = options_.http_only;
    cookie.partitioned = options_.partitioned;
    cookie.same_site = options_.same_site;
    return cookie;
}

Result<Unit, SessionFailure> SessionProxy::Save(std::string value) const {
    if (writer_ == nullptr) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::NoResponseWriter());
    }

    http::Cookie cookie = BaseCookie();
    cookie.value = std::move(value);

    if (options_.max_age > 0) {
        cookie.expires = std::chrono::system_clock::now() + std::chrono::seconds(options_.max_age);
    } else if (options_.max_age < 0) {
        cookie.expires = std::chrono::system_clock::time_point(
            std::chrono::seconds(CookieConstants::EXPIRED_UNIX_SECONDS));
        cookie.value.clear();
    }

    writer_->SetCookie(cookie);
    return Result<Unit, SessionFailure>::Ok(unit);
}

Result<Unit, SessionFailure> SessionProxy::Delete() const {
    if (writer_ == nullptr) {
        return Result<Unit, SessionFailure>::Err(SessionFailure::NoResponseWriter());
    }

    http::Cookie cookie = BaseCookie();
    cookie.max_age = -1;
    cookie.expires = std::chrono::system_clock::time_point(
        std::chrono::seconds(CookieConstants::EXPIRED_UNIX_SECONDS));

    writer_->SetCookie(cookie);
    return Result<Unit, SessionFailure>::Ok(unit);
}

} // namespace sessionseal::session
