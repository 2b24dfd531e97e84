#include "sessionseal/store/cookie_store.hpp"

namespace sessionseal::store {

Result<Unit, SessionFailure> CookieStore::Get(
    const http::RequestContext& ctx,
    session::SessionProxy& proxy,
    std::string_view cookie_value) {

    if (auto check = ctx.Check(); check.IsErr()) {
        return check;
    }
    return proxy.DecodeValues(cookie_value);
}

Result<Unit, SessionFailure> CookieStore::New(
    const http::RequestContext&,
    session::SessionProxy&) {
    return Result<Unit, SessionFailure>::Ok(unit);
}

Result<Unit, SessionFailure> CookieStore::Save(
    const http::RequestContext& ctx,
    session::SessionProxy& proxy) {

    if (auto check = ctx.Check(); check.IsErr()) {
        return check;
    }
    auto encoded = proxy.EncodeValues();
    if (encoded.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(encoded).UnwrapErr());
    }
    return proxy.Save(std::move(encoded).Unwrap());
}

} // namespace sessionseal::store
