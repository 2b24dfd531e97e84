#pragma once

#include "sessionseal/interfaces/i_session_store.hpp"

namespace sessionseal::store {

/**
 * @brief Keeps the whole session value inside the cookie
 */
class CookieStore final : public interfaces::ISessionStore {
public:
    [[nodiscard]] Result<Unit, SessionFailure> Get(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy,
        std::string_view cookie_value) override;

    [[nodiscard]] Result<Unit, SessionFailure> New(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy) override;

    [[nodiscard]] Result<Unit, SessionFailure> Save(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy) override;
};

} // namespace sessionseal::store
