#include <catch2/catch_test_macros.hpp>
#include "sessionseal/crypto/sodium_interop.hpp"
#include "sessionseal/crypto/secure_memory_handle.hpp"
#include <algorithm>
using namespace sessionseal;
using namespace sessionseal::crypto;

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap());
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
}

TEST_CASE("SodiumInterop - Random bytes", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto first = SodiumInterop::GetRandomBytes(32);
    auto second = SodiumInterop::GetRandomBytes(32);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap().size() == 32);
    REQUIRE(first.Unwrap() != second.Unwrap());

    std::vector<uint8_t> buffer(64, 0);
    REQUIRE(SodiumInterop::FillRandom(buffer).IsOk());
    REQUIRE(std::any_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b != 0; }));
}

TEST_CASE("SodiumInterop - Hex decoding", "[sodium][config]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Mixed case hex decodes") {
        auto result = SodiumInterop::HexToBytes("00ff7Fa0");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == std::vector<uint8_t>{0x00, 0xff, 0x7f, 0xa0});
    }
    SECTION("Odd length is rejected") {
        REQUIRE(SodiumInterop::HexToBytes("abc").IsErr());
    }
    SECTION("Non-hex characters are rejected") {
        REQUIRE(SodiumInterop::HexToBytes("zz").IsErr());
    }
}

TEST_CASE("SecureMemoryHandle - Holds key material", "[sodium][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key = {9, 8, 7, 6, 5, 4, 3, 2};

    SECTION("FromBytes copies and reads back") {
        auto handle = SecureMemoryHandle::FromBytes(key);
        REQUIRE(handle.IsOk());
        auto bytes = handle.Unwrap().ReadBytes(key.size());
        REQUIRE(bytes.IsOk());
        REQUIRE(bytes.Unwrap() == key);
    }
    SECTION("WithReadAccess exposes the guarded bytes") {
        auto handle = std::move(SecureMemoryHandle::FromBytes(key)).Unwrap();
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            int total = 0;
            for (auto b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.IsOk());
        REQUIRE(sum.Unwrap() == 44);
    }
    SECTION("Moved-from handle is invalid") {
        auto handle = std::move(SecureMemoryHandle::FromBytes(key)).Unwrap();
        SecureMemoryHandle moved = std::move(handle);
        REQUIRE(handle.IsInvalid());
        REQUIRE_FALSE(moved.IsInvalid());
        REQUIRE(handle.ReadBytes(1).IsErr());
    }
    SECTION("Zero size allocation fails") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
    SECTION("Oversized write fails") {
        auto handle = std::move(SecureMemoryHandle::Allocate(4)).Unwrap();
        REQUIRE(handle.Write(key).IsErr());
    }
}
