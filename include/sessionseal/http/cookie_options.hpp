#pragma once

#include "sessionseal/http/cookie.hpp"
#include "sessionseal/core/constants.hpp"

#include <string>

namespace sessionseal::http {

/**
 * @brief Attributes of the cookie a session is written to
 *
 * Defaults(): path "/", no domain, 30 day max-age, HttpOnly, SameSite=Lax.
 * The name is always supplied by the caller.
 */
struct CookieOptions {
    std::string name;
    std::string path = std::string(CookieConstants::DEFAULT_PATH);
    std::string domain = std::string(CookieConstants::DEFAULT_DOMAIN);
    int max_age = CookieConstants::DEFAULT_MAX_AGE;
    bool secure = CookieConstants::DEFAULT_SECURE;
    bool http_only = CookieConstants::DEFAULT_HTTP_ONLY;
    bool partitioned = CookieConstants::DEFAULT_PARTITIONED;
    SameSite same_site = SameSite::Lax;

    static CookieOptions Defaults() { return {}; }

    static CookieOptions Named(std::string cookie_name) {
        CookieOptions options;
        options.name = std::move(cookie_name);
        return options;
    }
};

} // namespace sessionseal::http
