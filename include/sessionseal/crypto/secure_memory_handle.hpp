#pragma once

#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace sessionseal::crypto {

/**
 * @brief RAII wrapper for libsodium secure memory holding key material
 *
 * Memory comes from sodium_malloc: guard pages on both sides, locked in RAM
 * and zeroed on free. Move-only.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::FromBytes(hash_key);
 * if (handle.IsOk()) {
 *     auto key = std::move(handle).Unwrap();
 *     key.WithReadAccess([&](std::span<const uint8_t> k) { ... });
 * }
 * @endcode
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate a handle sized to @p data and copy it in
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Execute a function with read-only access to the secure memory
     *
     * Avoids copying key material out of the guarded region.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace sessionseal::crypto
