#pragma once

#include "sessionseal/session/session.hpp"
#include "sessionseal/session/registry.hpp"
#include "sessionseal/session/session_proxy.hpp"
#include "sessionseal/interfaces/i_session_store.hpp"
#include "sessionseal/codec/codec_set.hpp"
#include "sessionseal/core/format.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace sessionseal::session {

/**
 * @brief Loads and saves sessions of value type T under one cookie name
 *
 * The manager is long-lived and shared between requests; the registry is
 * per request. The store decides where the value lives.
 *
 * Sessions returned by Get keep a pointer back to their manager, so the
 * manager must outlive every Registry holding its sessions. It is neither
 * copyable nor movable.
 *
 * Example:
 * @code
 * SessionManager<Profile> profiles(
 *     http::CookieOptions::Named("profile"), store, codecs);
 * Registry registry;
 * auto session = profiles.Get(registry, request, ctx);
 * if (session.IsOk()) {
 *     session.Unwrap()->Values().set_name("Ada");
 *     auto saved = registry.SaveAll(writer, ctx);
 * }
 * @endcode
 */
template<typename T>
class SessionManager {
    static_assert(std::is_base_of_v<google::protobuf::Message, T>,
                  "Session values must be a protobuf message");
public:
    /// Seeds the value of a session before the store loads it.
    /// A value decoded from an existing cookie replaces the seeded one.
    using Initializer = std::function<void(T&)>;

    SessionManager(
        http::CookieOptions options,
        std::shared_ptr<interfaces::ISessionStore> store,
        codec::CodecSet codecs,
        Initializer initializer = {})
        : options_(std::move(options))
        , store_(std::move(store))
        , codecs_(std::move(codecs))
        , initializer_(std::move(initializer)) {}

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Return the request's session, loading it on first use
     *
     * A session already registered under this name but with another value
     * type is InvalidSessionType. Store failures are returned unchanged and
     * nothing is registered.
     */
    [[nodiscard]] Result<std::shared_ptr<Session<T>>, SessionFailure> Get(
        Registry& registry,
        const interfaces::IRequest& request,
        const http::RequestContext& ctx) const {

        using ResultType = Result<std::shared_ptr<Session<T>>, SessionFailure>;

        if (auto existing = registry.Find(options_.name)) {
            if (auto typed = std::dynamic_pointer_cast<Session<T>>(existing)) {
                return ResultType::Ok(std::move(typed));
            }
            return ResultType::Err(SessionFailure::InvalidSessionType(
                compat::format("session \"{}\" is registered with a different value type",
                    options_.name)));
        }

        T values;
        if (initializer_) {
            initializer_(values);
        }
        SessionProxy proxy(options_, codecs_, &values, &request, nullptr);

        Result<Unit, SessionFailure> loaded = Result<Unit, SessionFailure>::Ok(unit);
        if (const auto cookie = request.Cookie(options_.name)) {
            loaded = store_->Get(ctx, proxy, *cookie);
        } else {
            proxy.is_new = true;
            loaded = store_->New(ctx, proxy);
        }
        if (loaded.IsErr()) {
            return ResultType::Err(std::move(loaded).UnwrapErr());
        }

        auto session = std::make_shared<Session<T>>(
            std::move(values), proxy.is_new, proxy.id, options_, this);
        registry.Set(options_.name, session);
        return ResultType::Ok(std::move(session));
    }

    /**
     * @brief Hand the session to the store; a newly assigned id is kept
     */
    [[nodiscard]] Result<Unit, SessionFailure> Save(
        interfaces::IResponseWriter& writer,
        const http::RequestContext& ctx,
        Session<T>& session) const {

        SessionProxy proxy(session.options_, codecs_, &session.values_, nullptr, &writer);
        proxy.id = session.id_;
        proxy.is_new = session.is_new_;

        auto saved = store_->Save(ctx, proxy);
        if (saved.IsOk()) {
            session.id_ = std::move(proxy.id);
        }
        return saved;
    }

    [[nodiscard]] const http::CookieOptions& Options() const noexcept { return options_; }

private:
    http::CookieOptions options_;
    std::shared_ptr<interfaces::ISessionStore> store_;
    codec::CodecSet codecs_;
    Initializer initializer_;
};

template<typename T>
Result<Unit, SessionFailure> Session<T>::Save(
    interfaces::IResponseWriter& writer,
    const http::RequestContext& ctx) {
    if (manager_ == nullptr) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::InvalidSessionType("the session is not bound to a manager"));
    }
    return manager_->Save(writer, ctx, *this);
}

template<typename T>
Result<Unit, SessionFailure> Session<T>::Delete(
    interfaces::IResponseWriter& writer,
    const http::RequestContext& ctx) {
    Expire();
    return Save(writer, ctx);
}

} // namespace sessionseal::session
