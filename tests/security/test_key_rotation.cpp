#include <catch2/catch_test_macros.hpp>
#include "sessionseal/codec/codec_set.hpp"
#include "sessionseal/codec/secure_codec.hpp"
#include "sessionseal/session/session_manager.hpp"
#include "sessionseal/store/cookie_store.hpp"
#include "test/session_data.pb.h"
#include "helpers/http_doubles.hpp"
#include "helpers/test_support.hpp"
using namespace sessionseal;
using namespace sessionseal::codec;
using test_helpers::Bytes;
using test_helpers::InMemoryRequest;
using test_helpers::RecordingResponseWriter;
using test_helpers::ScriptedClock;

namespace {
    constexpr int64_t START = 1700000000;

    std::shared_ptr<SecureCodec> MakeCodec(std::string_view hash_key, std::string_view block_key,
                                           const ScriptedClock& clock, int64_t max_age = 0) {
        CodecOptions options;
        options.block_key = Bytes(block_key);
        options.time_source = clock.Source();
        options.max_age = max_age;
        return std::make_shared<SecureCodec>(Bytes(hash_key), options);
    }

    using ProfileManager = session::SessionManager<test::UserProfile>;
}

TEST_CASE("Key rotation - Cookies migrate to the new key on save", "[security][rotation]") {
    ScriptedClock clock(START);
    auto store = std::make_shared<store::CookieStore>();
    auto old_codec = MakeCodec("old-hash-key", "0123456789abcdef", clock);
    auto new_codec = MakeCodec("new-hash-key", "fedcba9876543210fedcba9876543210", clock);
    const http::RequestContext ctx;

    // Issued before the rotation.
    ProfileManager before(http::CookieOptions::Named("profile"), store, CodecSet({old_codec}));
    RecordingResponseWriter first_response;
    {
        session::Registry registry;
        InMemoryRequest request;
        auto session = before.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        session.Unwrap()->Values().set_user_id("u-42");
        REQUIRE(registry.SaveAll(first_response, ctx).IsOk());
    }
    const std::string issued_before = first_response.Last().value;

    // New key prepended, old key kept for decoding.
    ProfileManager during(http::CookieOptions::Named("profile"), store, CodecSet({new_codec, old_codec}));
    RecordingResponseWriter second_response;
    {
        session::Registry registry;
        auto request = first_response.NextRequest();
        auto session = during.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        REQUIRE_FALSE(session.Unwrap()->IsNew());
        REQUIRE(session.Unwrap()->Values().user_id() == "u-42");
        REQUIRE(registry.SaveAll(second_response, ctx).IsOk());
    }
    const std::string issued_during = second_response.Last().value;
    REQUIRE(issued_during != issued_before);

    test::UserProfile probe;
    REQUIRE(new_codec->Decode("profile", issued_during, probe).IsOk());
    REQUIRE(old_codec->Decode("profile", issued_during, probe).IsErr());

    // Old key retired.
    ProfileManager after(http::CookieOptions::Named("profile"), store, CodecSet({new_codec}));
    SECTION("A migrated cookie is still accepted") {
        session::Registry registry;
        auto request = second_response.NextRequest();
        auto session = after.Get(registry, request, ctx);
        REQUIRE(session.IsOk());
        REQUIRE(session.Unwrap()->Values().user_id() == "u-42");
    }
    SECTION("A cookie that never migrated is rejected as an integrity failure") {
        session::Registry registry;
        auto request = first_response.NextRequest();
        auto session = after.Get(registry, request, ctx);
        REQUIRE(session.IsErr());
        const auto& failure = session.UnwrapErr();
        REQUIRE(failure.type == SessionFailureType::AllCodecsFailed);
        REQUIRE(failure.causes.size() == 1);
        REQUIRE(failure.HasKind(FailureKind::Integrity));
        REQUIRE(registry.Size() == 0);
    }
}

TEST_CASE("Key rotation - Each rotation key keeps its own freshness window", "[security][rotation]") {
    ScriptedClock clock(START);
    auto old_codec = MakeCodec("old-hash-key", "", clock, 60);
    auto new_codec = MakeCodec("new-hash-key", "", clock, 3600);
    CodecSet codecs({new_codec, old_codec});

    test::SessionData value;
    value.set_value("rotating");
    auto old_token = old_codec->Encode("session-name", value);
    REQUIRE(old_token.IsOk());

    clock.Advance(61);
    test::SessionData decoded;
    auto result = codecs.Decode("session-name", old_token.Unwrap(), decoded);
    REQUIRE(result.IsErr());
    const auto& failure = result.UnwrapErr();
    REQUIRE(failure.causes.size() == 2);
    REQUIRE(failure.causes[0].type == SessionFailureType::HmacInvalid);
    REQUIRE(failure.causes[1].type == SessionFailureType::TimestampExpired);
    REQUIRE(failure.Is(SessionFailureType::TimestampExpired));
    REQUIRE(failure.Describe().find("codec[1]") != std::string::npos);
}

TEST_CASE("Key rotation - Misconfigured generation does not mask a valid one", "[security][rotation]") {
    ScriptedClock clock(START);
    auto broken = std::make_shared<SecureCodec>(Bytes("broken"), [] {
        CodecOptions options;
        options.block_key = Bytes("short");
        return options;
    }());
    auto valid = MakeCodec("valid-hash-key", "", clock);
    REQUIRE(broken->ConfigurationError().has_value());

    test::SessionData value;
    value.set_value("still readable");
    auto token = valid->Encode("session-name", value);
    REQUIRE(token.IsOk());

    CodecSet codecs({broken, valid});
    test::SessionData decoded;
    REQUIRE(codecs.Decode("session-name", token.Unwrap(), decoded).IsOk());
    REQUIRE(decoded.value() == "still readable");

    auto encoded = codecs.Encode("session-name", value);
    REQUIRE(encoded.IsErr());
    REQUIRE(encoded.UnwrapErr().type == SessionFailureType::CreatingBlockCipher);
}
