#pragma once
#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"
#include "sessionseal/http/request_context.hpp"
#include "sessionseal/interfaces/i_http_exchange.hpp"
namespace sessionseal::interfaces {
/**
 * @brief Type-erased session as kept by the per-request registry.
 */
class IRegistrySession {
public:
    virtual ~IRegistrySession() = default;
    [[nodiscard]] virtual Result<Unit, SessionFailure> Save(
        IResponseWriter& writer,
        const http::RequestContext& ctx) = 0;
};
}
