#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sessionseal::http {

enum class SameSite : uint8_t {
    Default,
    Lax,
    Strict,
    None
};

[[nodiscard]] std::string_view ToString(SameSite same_site) noexcept;

/**
 * @brief An outbound cookie as written into a Set-Cookie header
 *
 * max_age follows the HTTP convention: positive is a lifetime in seconds,
 * negative deletes the cookie now (rendered as Max-Age=0), zero omits the
 * attribute and yields a browser-session cookie.
 */
struct Cookie {
    std::string name;
    std::string value;
    std::string path;
    std::string domain;
    std::optional<std::chrono::system_clock::time_point> expires;
    int max_age = 0;
    bool secure = false;
    bool http_only = false;
    bool partitioned = false;
    SameSite same_site = SameSite::Default;

    [[nodiscard]] std::string ToSetCookieHeader() const;
};

/**
 * @brief Render a time point as an IMF-fixdate, e.g. "Thu, 01 Jan 1970 00:00:01 GMT"
 */
[[nodiscard]] std::string FormatHttpDate(std::chrono::system_clock::time_point when);

} // namespace sessionseal::http
