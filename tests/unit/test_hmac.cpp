#include <catch2/catch_test_macros.hpp>
#include "sessionseal/crypto/hmac.hpp"
#include "sessionseal/crypto/sodium_interop.hpp"
#include "helpers/test_support.hpp"
#include <string>
using namespace sessionseal;
using namespace sessionseal::crypto;
using test_helpers::Bytes;

namespace {
    std::vector<uint8_t> Hex(std::string_view hex) {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        return std::move(SodiumInterop::HexToBytes(hex)).Unwrap();
    }
}

TEST_CASE("Hmac - RFC 4231 test case 1", "[hmac][crypto]") {
    const std::vector<uint8_t> key(20, 0x0b);
    const auto data = Bytes("Hi There");

    SECTION("HMAC-SHA256") {
        auto mac = Hmac::Compute(HashFunction::Sha256, key, data);
        REQUIRE(mac.IsOk());
        REQUIRE(mac.Unwrap() == Hex("b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7"));
    }
    SECTION("HMAC-SHA512") {
        auto mac = Hmac::Compute(HashFunction::Sha512, key, data);
        REQUIRE(mac.IsOk());
        REQUIRE(mac.Unwrap() == Hex(
            "87aa7cdea5ef619d4ff0b4241a1d6cb02379f4e2ce4ec2787ad0b30545e17cde"
            "daa833b7d6b8a702038b274eaea3f4e4be9d914eeb61f1702e696c203a126854"));
    }
}

TEST_CASE("Hmac - Digest selection", "[hmac][crypto]") {
    const auto key = Bytes("hash-key");
    const auto data = Bytes("session-name|1700000000|payload");

    for (auto fn : {HashFunction::Sha1, HashFunction::Sha224, HashFunction::Sha256,
                    HashFunction::Sha384, HashFunction::Sha512}) {
        auto mac = Hmac::Compute(fn, key, data);
        REQUIRE(mac.IsOk());
        REQUIRE(mac.Unwrap().size() == DigestSize(fn));
    }

    SECTION("Empty key is a configuration failure") {
        auto mac = Hmac::Compute(HashFunction::Sha256, {}, data);
        REQUIRE(mac.IsErr());
        REQUIRE(mac.UnwrapErr().type == SessionFailureType::HashKeyNotSet);
    }
    SECTION("Different keys give different MACs") {
        auto a = Hmac::Compute(HashFunction::Sha256, Bytes("key-a"), data);
        auto b = Hmac::Compute(HashFunction::Sha256, Bytes("key-b"), data);
        REQUIRE(a.Unwrap() != b.Unwrap());
    }
}
