#pragma once

#include "sessionseal/interfaces/i_registry_session.hpp"
#include "sessionseal/http/cookie_options.hpp"

#include <google/protobuf/message.h>
#include <string>
#include <type_traits>

namespace sessionseal::session {

template<typename T>
class SessionManager;

/**
 * @brief Typed view of one named session for the current request
 *
 * Created by SessionManager<T>::Get. The value is owned by the session;
 * changes are written back only by Save or Delete. Include
 * session_manager.hpp to use Save and Delete.
 */
template<typename T>
class Session final : public interfaces::IRegistrySession {
    static_assert(std::is_base_of_v<google::protobuf::Message, T>,
                  "Session values must be a protobuf message");
public:
    Session(T values, bool is_new, std::string id,
            http::CookieOptions options, const SessionManager<T>* manager)
        : values_(std::move(values))
        , is_new_(is_new)
        , id_(std::move(id))
        , options_(std::move(options))
        , manager_(manager) {}

    [[nodiscard]] T& Values() noexcept { return values_; }
    [[nodiscard]] const T& Values() const noexcept { return values_; }

    [[nodiscard]] bool IsNew() const noexcept { return is_new_; }
    [[nodiscard]] const std::string& Id() const noexcept { return id_; }
    [[nodiscard]] const http::CookieOptions& Options() const noexcept { return options_; }

    /// Delete the session on the next save.
    void Expire() noexcept { options_.max_age = -1; }

    /// Keep the session for the browser session only ("remember me" off).
    void DoNotPersist() noexcept { options_.max_age = 0; }

    void Persist(const int max_age) noexcept { options_.max_age = max_age; }

    [[nodiscard]] Result<Unit, SessionFailure> Save(
        interfaces::IResponseWriter& writer,
        const http::RequestContext& ctx) override;

    /**
     * @brief Expire the session and save it, removing any stored record
     */
    [[nodiscard]] Result<Unit, SessionFailure> Delete(
        interfaces::IResponseWriter& writer,
        const http::RequestContext& ctx);

private:
    friend class SessionManager<T>;

    T values_;
    bool is_new_;
    std::string id_;
    http::CookieOptions options_;
    const SessionManager<T>* manager_;
};

} // namespace sessionseal::session
