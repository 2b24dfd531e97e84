#include <catch2/catch_test_macros.hpp>
#include "sessionseal/codec/secure_codec.hpp"
#include "sessionseal/session/session_proxy.hpp"
#include "sessionseal/store/cookie_store.hpp"
#include "test/session_data.pb.h"
#include "helpers/http_doubles.hpp"
#include "helpers/test_support.hpp"
#include <stop_token>
using namespace sessionseal;
using namespace sessionseal::codec;
using session::SessionProxy;
using test_helpers::Bytes;
using test_helpers::RecordingResponseWriter;

namespace {
    CodecSet Codecs() {
        CodecOptions options;
        options.block_key = Bytes("0123456789abcdef");
        return CodecSet({std::make_shared<SecureCodec>(Bytes("cookie-store-hash-key"), options)});
    }
}

TEST_CASE("CookieStore - Value travels inside the cookie", "[store][cookie]") {
    store::CookieStore store;
    const http::RequestContext ctx;
    auto options = http::CookieOptions::Named("prefs");
    const auto codecs = Codecs();

    test::UserProfile saved;
    saved.set_user_id("u-7");
    saved.set_display_name("Grace");
    saved.set_login_count(3);
    saved.add_roles("editor");

    RecordingResponseWriter writer;
    SessionProxy save_proxy(options, codecs, &saved, nullptr, &writer);
    REQUIRE(store.Save(ctx, save_proxy).IsOk());
    REQUIRE(writer.cookies.size() == 1);
    REQUIRE(writer.Last().name == "prefs");
    REQUIRE(save_proxy.id.empty());

    test::UserProfile loaded;
    SessionProxy load_proxy(options, codecs, &loaded);
    REQUIRE(store.Get(ctx, load_proxy, writer.Last().value).IsOk());
    REQUIRE(loaded.user_id() == "u-7");
    REQUIRE(loaded.display_name() == "Grace");
    REQUIRE(loaded.login_count() == 3);
    REQUIRE(loaded.roles_size() == 1);
}

TEST_CASE("CookieStore - Failures surface unchanged", "[store][cookie]") {
    store::CookieStore store;
    const http::RequestContext ctx;
    auto options = http::CookieOptions::Named("prefs");
    test::UserProfile value;

    SECTION("New leaves the default value") {
        SessionProxy proxy(options, Codecs(), &value);
        REQUIRE(store.New(ctx, proxy).IsOk());
        REQUIRE(value.user_id().empty());
    }
    SECTION("Tampered cookie is an integrity failure, not a new session") {
        SessionProxy proxy(options, Codecs(), &value);
        auto result = store.Get(ctx, proxy, "bm90LWEtdG9rZW4=");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().HasKind(FailureKind::Integrity));
    }
    SECTION("Save without a response writer") {
        SessionProxy proxy(options, Codecs(), &value);
        auto result = store.Save(ctx, proxy);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::NoResponseWriter);
    }
    SECTION("Cancelled request") {
        std::stop_source source;
        source.request_stop();
        const http::RequestContext cancelled(source.get_token());
        RecordingResponseWriter writer;
        SessionProxy proxy(options, Codecs(), &value, nullptr, &writer);
        auto saved = store.Save(cancelled, proxy);
        REQUIRE(saved.IsErr());
        REQUIRE(saved.UnwrapErr().type == SessionFailureType::Cancelled);
        REQUIRE(writer.cookies.empty());
        auto loaded = store.Get(cancelled, proxy, "anything");
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == SessionFailureType::Cancelled);
    }
    SECTION("Value too large for a cookie") {
        CodecOptions small;
        small.max_length = 64;
        CodecSet codecs({std::make_shared<SecureCodec>(Bytes("cookie-store-hash-key"), small)});
        value.set_display_name(std::string(200, 'x'));
        RecordingResponseWriter writer;
        SessionProxy proxy(options, codecs, &value, nullptr, &writer);
        auto result = store.Save(ctx, proxy);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SessionFailureType::EncodedLengthTooLong);
        REQUIRE(writer.cookies.empty());
    }
    SECTION("Negative max-age writes an expired empty cookie") {
        options.max_age = -1;
        RecordingResponseWriter writer;
        value.set_user_id("gone");
        SessionProxy proxy(options, Codecs(), &value, nullptr, &writer);
        REQUIRE(store.Save(ctx, proxy).IsOk());
        REQUIRE(writer.Last().value.empty());
        REQUIRE(writer.Last().max_age < 0);
    }
}
