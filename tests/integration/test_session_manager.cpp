#include <catch2/catch_test_macros.hpp>
#include "sessionseal/codec/secure_codec.hpp"
#include "sessionseal/session/flash.hpp"
#include "sessionseal/session/session_manager.hpp"
#include "sessionseal/store/cookie_store.hpp"
#include "sessionseal/store/file_system_store.hpp"
#include "test/session_data.pb.h"
#include "helpers/http_doubles.hpp"
#include "helpers/test_support.hpp"

#include <type_traits>
using namespace sessionseal;
using namespace sessionseal::codec;
using session::Registry;
using session::SessionManager;
using test_helpers::Bytes;
using test_helpers::InMemoryRequest;
using test_helpers::RecordingResponseWriter;
using test_helpers::TempDirectory;

namespace {
    CodecSet Codecs() {
        CodecOptions options;
        options.block_key = Bytes("0123456789abcdef0123456789abcdef");
        return CodecSet({std::make_shared<SecureCodec>(Bytes("manager-hash-key"), options)});
    }

    /// Store whose Save always fails with a backend error.
    class UnwritableStore final : public interfaces::ISessionStore {
    public:
        [[nodiscard]] Result<Unit, SessionFailure> Get(
            const http::RequestContext&, session::SessionProxy&, std::string_view) override {
            return Result<Unit, SessionFailure>::Ok(unit);
        }
        [[nodiscard]] Result<Unit, SessionFailure> New(
            const http::RequestContext&, session::SessionProxy&) override {
            return Result<Unit, SessionFailure>::Ok(unit);
        }
        [[nodiscard]] Result<Unit, SessionFailure> Save(
            const http::RequestContext&, session::SessionProxy&) override {
            return Result<Unit, SessionFailure>::Err(SessionFailure::Backend("disk full"));
        }
    };
}

TEST_CASE("SessionManager - New and existing sessions", "[manager]") {
    auto store = std::make_shared<store::CookieStore>();
    SessionManager<test::UserProfile> manager(http::CookieOptions::Named("profile"), store, Codecs());
    const http::RequestContext ctx;

    RecordingResponseWriter writer;
    {
        Registry registry;
        InMemoryRequest request;
        auto session = manager.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        REQUIRE(session.Unwrap()->IsNew());
        REQUIRE(registry.Size() == 1);

        auto again = manager.Get(registry, request, ctx);
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap() == session.Unwrap());

        session.Unwrap()->Values().set_user_id("u-1");
        session.Unwrap()->Values().set_login_count(1);
        REQUIRE(session.Unwrap()->Save(writer, ctx).IsOk());
    }
    REQUIRE(writer.cookies.size() == 1);
    REQUIRE(writer.Last().http_only);
    REQUIRE(writer.Last().path == "/");
    REQUIRE(writer.Last().max_age == 2592000);

    {
        Registry registry;
        auto request = writer.NextRequest();
        auto session = manager.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        REQUIRE_FALSE(session.Unwrap()->IsNew());
        REQUIRE(session.Unwrap()->Values().user_id() == "u-1");
        REQUIRE(session.Unwrap()->Values().login_count() == 1);
    }
}

TEST_CASE("SessionManager - Value type is checked per cookie name", "[manager]") {
    auto store = std::make_shared<store::CookieStore>();
    SessionManager<test::UserProfile> profiles(http::CookieOptions::Named("shared"), store, Codecs());
    SessionManager<test::SessionData> data(http::CookieOptions::Named("shared"), store, Codecs());
    const http::RequestContext ctx;

    Registry registry;
    InMemoryRequest request;
    REQUIRE(profiles.Get(registry, request, ctx).IsOk());

    auto mismatched = data.Get(registry, request, ctx);
    REQUIRE(mismatched.IsErr());
    REQUIRE(mismatched.UnwrapErr().type == SessionFailureType::InvalidSessionType);
    REQUIRE(mismatched.UnwrapErr().message.find("shared") != std::string::npos);
}

TEST_CASE("SessionManager - Cookie lifetime controls", "[manager]") {
    auto store = std::make_shared<store::CookieStore>();
    SessionManager<test::SessionData> manager(http::CookieOptions::Named("sid"), store, Codecs());
    const http::RequestContext ctx;
    Registry registry;
    InMemoryRequest request;
    auto session = manager.Get(registry, request, ctx);
    REQUIRE(session.IsOk());
    RecordingResponseWriter writer;

    SECTION("DoNotPersist writes a browser-session cookie") {
        session.Unwrap()->DoNotPersist();
        REQUIRE(session.Unwrap()->Save(writer, ctx).IsOk());
        REQUIRE(writer.Last().max_age == 0);
        REQUIRE_FALSE(writer.Last().expires.has_value());
        REQUIRE_FALSE(writer.Last().value.empty());
    }
    SECTION("Delete expires the cookie") {
        session.Unwrap()->Values().set_value("bye");
        REQUIRE(session.Unwrap()->Delete(writer, ctx).IsOk());
        REQUIRE(writer.Last().value.empty());
        REQUIRE(writer.Last().max_age < 0);
        REQUIRE(writer.Last().ToSetCookieHeader().find("Max-Age=0") != std::string::npos);
    }
    SECTION("Manager options are not changed by a session") {
        session.Unwrap()->Persist(60);
        REQUIRE(session.Unwrap()->Save(writer, ctx).IsOk());
        REQUIRE(writer.Last().max_age == 60);
        REQUIRE(manager.Options().max_age == 2592000);
    }
}

TEST_CASE("SessionManager - Registry saves every session", "[manager][registry]") {
    const http::RequestContext ctx;
    auto cookies = std::make_shared<store::CookieStore>();
    auto broken = std::make_shared<UnwritableStore>();
    SessionManager<test::SessionData> good(http::CookieOptions::Named("a-good"), cookies, Codecs());
    SessionManager<test::SessionData> bad(http::CookieOptions::Named("b-bad"), broken, Codecs());
    SessionManager<test::SessionData> also_bad(http::CookieOptions::Named("c-bad"), broken, Codecs());

    Registry registry;
    InMemoryRequest request;
    REQUIRE(good.Get(registry, request, ctx).IsOk());
    REQUIRE(bad.Get(registry, request, ctx).IsOk());
    REQUIRE(also_bad.Get(registry, request, ctx).IsOk());

    RecordingResponseWriter writer;
    auto saved = registry.SaveAll(writer, ctx);
    REQUIRE(saved.IsErr());
    const auto& failure = saved.UnwrapErr();
    REQUIRE(failure.type == SessionFailureType::Backend);
    REQUIRE(failure.message == "registry: 2 of 3 sessions failed to save");
    REQUIRE(failure.causes.size() == 2);
    REQUIRE(failure.causes[0].message.find("\"b-bad\"") != std::string::npos);
    REQUIRE(failure.causes[1].message.find("\"c-bad\"") != std::string::npos);
    REQUIRE(failure.Describe().find("disk full") != std::string::npos);

    REQUIRE(writer.cookies.size() == 1);
    REQUIRE(writer.Last().name == "a-good");
}

TEST_CASE("SessionManager - Store failures are not registered", "[manager]") {
    auto store = std::make_shared<store::CookieStore>();
    SessionManager<test::SessionData> manager(http::CookieOptions::Named("sid"), store, Codecs());
    const http::RequestContext ctx;

    Registry registry;
    InMemoryRequest request;
    request.SetCookie("sid", "garbage");
    auto session = manager.Get(registry, request, ctx);
    REQUIRE(session.IsErr());
    REQUIRE(session.UnwrapErr().type == SessionFailureType::AllCodecsFailed);
    REQUIRE(registry.Size() == 0);
}

TEST_CASE("SessionManager - File store keeps one record per session", "[manager][filesystem]") {
    TempDirectory dir;
    auto store = std::make_shared<store::FileSystemStore>(dir.Path(), 0);
    SessionManager<test::UserProfile> manager(http::CookieOptions::Named("profile"), store, Codecs());
    const http::RequestContext ctx;

    Registry registry;
    InMemoryRequest request;
    auto session = manager.Get(registry, request, ctx);
    REQUIRE(session.IsOk());
    REQUIRE(session.Unwrap()->Id().empty());

    RecordingResponseWriter writer;
    REQUIRE(session.Unwrap()->Save(writer, ctx).IsOk());
    const std::string id = session.Unwrap()->Id();
    REQUIRE_FALSE(id.empty());

    session.Unwrap()->Values().set_display_name("changed");
    REQUIRE(session.Unwrap()->Save(writer, ctx).IsOk());
    REQUIRE(session.Unwrap()->Id() == id);
    REQUIRE(dir.FileCount() == 1);
}

TEST_CASE("SessionManager - Flash messages across requests", "[manager][flash]") {
    auto store = std::make_shared<store::CookieStore>();
    SessionManager<test::UserProfile> manager(http::CookieOptions::Named("profile"), store, Codecs());
    const http::RequestContext ctx;

    RecordingResponseWriter writer;
    {
        Registry registry;
        InMemoryRequest request;
        auto session = manager.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        auto& values = session.Unwrap()->Values();
        auto flash = session::Flash::FromState(values.flash());
        flash.Add("notice", "Profile saved");
        *values.mutable_flash() = flash.ExportState();
        REQUIRE(registry.SaveAll(writer, ctx).IsOk());
    }
    {
        Registry registry;
        auto request = writer.NextRequest();
        auto session = manager.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        auto& values = session.Unwrap()->Values();
        auto flash = session::Flash::FromState(values.flash());
        REQUIRE(flash.Get("notice") == "Profile saved");
        *values.mutable_flash() = flash.ExportState();
        REQUIRE(registry.SaveAll(writer, ctx).IsOk());
    }
    {
        Registry registry;
        auto request = writer.NextRequest();
        auto session = manager.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        auto flash = session::Flash::FromState(session.Unwrap()->Values().flash());
        REQUIRE(flash.Get("notice").empty());
    }
}

TEST_CASE("SessionManager - Initializer seeds only new sessions", "[manager]") {
    auto store = std::make_shared<store::CookieStore>();
    int calls = 0;
    SessionManager<test::UserProfile> manager(
        http::CookieOptions::Named("profile"), store, Codecs(),
        [&calls](test::UserProfile& profile) {
            ++calls;
            profile.add_roles("guest");
        });
    const http::RequestContext ctx;

    RecordingResponseWriter writer;
    {
        Registry registry;
        InMemoryRequest request;
        auto session = manager.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        REQUIRE(session.Unwrap()->IsNew());
        REQUIRE(session.Unwrap()->Values().roles_size() == 1);
        REQUIRE(session.Unwrap()->Values().roles(0) == "guest");

        session.Unwrap()->Values().clear_roles();
        session.Unwrap()->Values().add_roles("admin");
        REQUIRE(session.Unwrap()->Save(writer, ctx).IsOk());
    }
    REQUIRE(calls == 1);

    {
        Registry registry;
        auto request = writer.NextRequest();
        auto session = manager.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        REQUIRE_FALSE(session.Unwrap()->IsNew());
        REQUIRE(session.Unwrap()->Values().roles_size() == 1);
        REQUIRE(session.Unwrap()->Values().roles(0) == "admin");
    }
    REQUIRE(calls == 2);
}

TEST_CASE("SessionManager - Managers stay in place", "[manager]") {
    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<SessionManager<test::SessionData>>);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<SessionManager<test::SessionData>>);
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<SessionManager<test::SessionData>>);
}
