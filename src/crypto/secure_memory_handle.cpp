#include "sessionseal/crypto/secure_memory_handle.hpp"
#include "sessionseal/crypto/sodium_interop.hpp"
#include "sessionseal/core/constants.hpp"

#include <cstring>
#include <string>

namespace sessionseal::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                "Cannot allocate zero-sized secure memory"));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                std::string(ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY) +
                std::to_string(size) + " bytes"));
    }

    return Result<SecureMemoryHandle, SodiumFailure>::Ok(
        SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto handle_result = Allocate(data.size());
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(data);
    if (write_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            std::move(write_result).UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        if (ptr_ != nullptr) {
            SodiumInterop::FreeSecure(ptr_);
        }
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::string(ErrorMessages::DATA_EXCEEDS_BUFFER) +
                " (data: " + std::to_string(data.size()) +
                ", buffer: " + std::to_string(size_) + ")"));
    }

    if (!data.empty()) {
        std::memcpy(ptr_, data.data(), data.size());
    }
    if (data.size() < size_) {
        std::memset(
            static_cast<uint8_t*>(ptr_) + data.size(),
            0,
            size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "Requested size exceeds allocated size"));
    }

    std::vector<uint8_t> result(size);
    if (size > 0) {
        std::memcpy(result.data(), ptr_, size);
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(result));
}

} // namespace sessionseal::crypto
