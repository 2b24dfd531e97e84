#pragma once

#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"
#include "sessionseal/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

namespace sessionseal::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Initialization, secure memory, constant-time comparison, randomness and
 * hex decoding. Every method that depends on libsodium state reports a
 * failure instead of silently falling back when the library is not
 * initialized.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Fill a buffer from the libsodium CSPRNG
     *
     * @return Err if libsodium is not initialized; the buffer is left untouched
     */
    static Result<Unit, SodiumFailure> FillRandom(std::span<uint8_t> buffer);

    static Result<std::vector<uint8_t>, SodiumFailure> GetRandomBytes(size_t size);

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief Decode a hex string (upper or lower case, no separators)
     */
    static Result<std::vector<uint8_t>, SodiumFailure> HexToBytes(std::string_view hex);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace sessionseal::crypto
