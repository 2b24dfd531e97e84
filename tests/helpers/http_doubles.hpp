#pragma once
#include "sessionseal/interfaces/i_http_exchange.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sessionseal::test_helpers {

class InMemoryRequest : public interfaces::IRequest {
public:
    InMemoryRequest() = default;

    void SetCookie(std::string name, std::string value) {
        cookies_.insert_or_assign(std::move(name), std::move(value));
    }

    [[nodiscard]] std::optional<std::string> Cookie(std::string_view name) const override {
        const auto it = cookies_.find(name);
        if (it == cookies_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, std::string, std::less<>> cookies_;
};

class RecordingResponseWriter : public interfaces::IResponseWriter {
public:
    void SetCookie(const http::Cookie& cookie) override {
        cookies.push_back(cookie);
    }

    [[nodiscard]] const http::Cookie& Last() const {
        return cookies.back();
    }

    /// Carry the last cookie of every name into a fresh request, as a browser
    /// would; expired cookies are dropped.
    [[nodiscard]] InMemoryRequest NextRequest() const {
        std::map<std::string, std::optional<std::string>> jar;
        for (const auto& cookie : cookies) {
            if (cookie.max_age < 0) {
                jar[cookie.name] = std::nullopt;
            } else {
                jar[cookie.name] = cookie.value;
            }
        }
        InMemoryRequest request;
        for (const auto& [name, value] : jar) {
            if (value) {
                request.SetCookie(name, *value);
            }
        }
        return request;
    }

    std::vector<http::Cookie> cookies;
};

}
