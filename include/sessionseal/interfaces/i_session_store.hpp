#pragma once
#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"
#include "sessionseal/http/request_context.hpp"
#include "sessionseal/session/session_proxy.hpp"
#include <string_view>
namespace sessionseal::interfaces {
/**
 * @brief Backend deciding where the authoritative session bytes live.
 *
 * Get runs only when the request carries the session cookie, New only when
 * it does not. Save writes the outbound representation; a non-positive
 * max-age on the proxy means delete.
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;
    [[nodiscard]] virtual Result<Unit, SessionFailure> Get(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy,
        std::string_view cookie_value) = 0;
    [[nodiscard]] virtual Result<Unit, SessionFailure> New(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy) = 0;
    [[nodiscard]] virtual Result<Unit, SessionFailure> Save(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy) = 0;
};
}
