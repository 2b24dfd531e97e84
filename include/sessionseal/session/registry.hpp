#pragma once

#include "sessionseal/interfaces/i_registry_session.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace sessionseal::session {

/**
 * @brief Sessions loaded during one request, keyed by cookie name
 *
 * Owned by the request handler and passed to every SessionManager::Get of
 * that request, so each named session is decoded at most once. Not
 * thread-safe; a request is handled by one thread at a time.
 */
class Registry {
public:
    [[nodiscard]] std::shared_ptr<interfaces::IRegistrySession> Find(std::string_view name) const;

    void Set(std::string name, std::shared_ptr<interfaces::IRegistrySession> session);

    /**
     * @brief Save every registered session
     *
     * All sessions are attempted. Failures are collected into one Backend
     * failure with a cause per session, in name order.
     */
    [[nodiscard]] Result<Unit, SessionFailure> SaveAll(
        interfaces::IResponseWriter& writer,
        const http::RequestContext& ctx) const;

    [[nodiscard]] size_t Size() const noexcept { return sessions_.size(); }

private:
    std::map<std::string, std::shared_ptr<interfaces::IRegistrySession>, std::less<>> sessions_;
};

} // namespace sessionseal::session
