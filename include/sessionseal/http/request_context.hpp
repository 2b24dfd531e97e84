#pragma once

#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"

#include <chrono>
#include <optional>
#include <stop_token>

namespace sessionseal::http {

/**
 * @brief Request-lifetime cancellation carried into store operations
 *
 * A default-constructed context is never cancelled.
 */
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    RequestContext() = default;

    explicit RequestContext(std::stop_token stop_token,
                            std::optional<Clock::time_point> deadline = std::nullopt)
        : stop_token_(std::move(stop_token))
        , deadline_(deadline) {}

    static RequestContext WithTimeout(Clock::duration timeout, std::stop_token stop_token = {}) {
        return RequestContext(std::move(stop_token), Clock::now() + timeout);
    }

    [[nodiscard]] bool IsCancelled() const noexcept {
        if (stop_token_.stop_requested()) {
            return true;
        }
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    /**
     * @return Ok, or Cancelled naming whether the deadline passed
     */
    [[nodiscard]] Result<Unit, SessionFailure> Check() const {
        if (stop_token_.stop_requested()) {
            return Result<Unit, SessionFailure>::Err(SessionFailure::Cancelled());
        }
        if (deadline_.has_value() && Clock::now() >= *deadline_) {
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Cancelled("the request deadline was exceeded"));
        }
        return Result<Unit, SessionFailure>::Ok(unit);
    }

    [[nodiscard]] const std::optional<Clock::time_point>& Deadline() const noexcept {
        return deadline_;
    }

private:
    std::stop_token stop_token_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace sessionseal::http
