#include "sessionseal/session/registry.hpp"
#include "sessionseal/debug/session_logger.hpp"
#include "sessionseal/core/format.hpp"

#include <vector>

namespace sessionseal::session {

std::shared_ptr<interfaces::IRegistrySession> Registry::Find(std::string_view name) const {
    const auto it = sessions_.find(name);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

void Registry::Set(std::string name, std::shared_ptr<interfaces::IRegistrySession> session) {
    sessions_.insert_or_assign(std::move(name), std::move(session));
}

Result<Unit, SessionFailure> Registry::SaveAll(
    interfaces::IResponseWriter& writer,
    const http::RequestContext& ctx) const {

    SESSIONSEAL_LOG_SECTION("REGISTRY", "SaveAll");
    SESSIONSEAL_LOG_VALUE("REGISTRY", "SaveAll", "sessions", sessions_.size());
    std::vector<SessionFailure> failures;
    for (const auto& [name, session] : sessions_) {
        if (!session) {
            continue;
        }
        auto saved = session->Save(writer, ctx);
        if (saved.IsErr()) {
            SESSIONSEAL_LOG_FAILURE("REGISTRY", "save", saved.UnwrapErr());
            failures.push_back(SessionFailure::Backend(
                compat::format("registry: error while saving session: \"{}\"", name),
                {std::move(saved).UnwrapErr()}));
        }
    }

    if (failures.empty()) {
        return Result<Unit, SessionFailure>::Ok(unit);
    }
    const size_t count = failures.size();
    return Result<Unit, SessionFailure>::Err(SessionFailure::Backend(
        compat::format("registry: {} of {} sessions failed to save", count, sessions_.size()),
        std::move(failures)));
}

} // namespace sessionseal::session
