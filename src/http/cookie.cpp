#include "sessionseal/http/cookie.hpp"
#include "sessionseal/core/format.hpp"

#include <array>
#include <ctime>

namespace sessionseal::http {

namespace {
    constexpr std::array<std::string_view, 7> WEEKDAYS = {
        "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    constexpr std::array<std::string_view, 12> MONTHS = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
}

std::string_view ToString(const SameSite same_site) noexcept {
    switch (same_site) {
        case SameSite::Lax:
            return "Lax";
        case SameSite::Strict:
            return "Strict";
        case SameSite::None:
            return "None";
        case SameSite::Default:
            break;
    }
    return "";
}

std::string FormatHttpDate(const std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return compat::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT",
        WEEKDAYS[static_cast<size_t>(utc.tm_wday)],
        utc.tm_mday,
        MONTHS[static_cast<size_t>(utc.tm_mon)],
        utc.tm_year + 1900,
        utc.tm_hour,
        utc.tm_min,
        utc.tm_sec);
}

std::string Cookie::ToSetCookieHeader() const {
    std::string header = compat::format("{}={}", name, value);
    if (!path.empty()) {
        header += compat::format("; Path={}", path);
    }
    if (!domain.empty()) {
        header += compat::format("; Domain={}", domain);
    }
    if (expires) {
        header += compat::format("; Expires={}", FormatHttpDate(*expires));
    }
    if (max_age > 0) {
        header += compat::format("; Max-Age={}", max_age);
    } else if (max_age < 0) {
        header += "; Max-Age=0";
    }
    if (http_only) {
        header += "; HttpOnly";
    }
    if (secure) {
        header += "; Secure";
    }
    if (same_site != SameSite::Default) {
        header += compat::format("; SameSite={}", ToString(same_site));
    }
    if (partitioned) {
        header += "; Partitioned";
    }
    return header;
}

} // namespace sessionseal::http
