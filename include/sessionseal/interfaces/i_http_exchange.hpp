#pragma once
#include "sessionseal/http/cookie.hpp"
#include <optional>
#include <string>
#include <string_view>
namespace sessionseal::interfaces {
/**
 * @brief Read side of the HTTP exchange: cookies of the incoming request.
 */
class IRequest {
public:
    virtual ~IRequest() = default;
    [[nodiscard]] virtual std::optional<std::string> Cookie(std::string_view name) const = 0;
};
/**
 * @brief Write side of the HTTP exchange: Set-Cookie on the response.
 */
class IResponseWriter {
public:
    virtual ~IResponseWriter() = default;
    virtual void SetCookie(const http::Cookie& cookie) = 0;
};
}
