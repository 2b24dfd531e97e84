#include "sessionseal/crypto/sodium_interop.hpp"

#include <string>

namespace sessionseal::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        if (sodium_init() < SodiumConstants::SUCCESS) {
            initialized_.store(false, std::memory_order_release);
        } else {
            initialized_.store(true, std::memory_order_release);
        }
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        volatile uint8_t* vbuf = buffer.data();
        for (size_t i = 0; i < buffer.size(); ++i) {
            vbuf[i] = 0;
        }
    } else {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    const int result = sodium_memcmp(a.data(), b.data(), a.size());
    return Result<bool, SodiumFailure>::Ok(result == SodiumConstants::SUCCESS);
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Random buffer of " + std::to_string(buffer.size()) + " bytes requested"));
    }
    randombytes_buf(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    auto fill_result = FillRandom(buffer);
    if (fill_result.IsErr()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            std::move(fill_result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(buffer));
}

// ============================================================================
// Encoding
// ============================================================================

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::HexToBytes(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                "Hex string has odd length " + std::to_string(hex.size())));
    }
    std::vector<uint8_t> bytes(hex.size() / 2);
    size_t bin_len = 0;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, nullptr) != SodiumConstants::SUCCESS ||
        bin_len != bytes.size()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("String is not valid hex"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(bytes));
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace sessionseal::crypto
