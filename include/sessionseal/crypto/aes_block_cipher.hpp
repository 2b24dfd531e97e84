#pragma once

#include "sessionseal/interfaces/i_block_cipher.hpp"
#include "sessionseal/crypto/secure_memory_handle.hpp"

#include <memory>
#include <span>

namespace sessionseal::crypto {

/**
 * @brief AES block cipher over OpenSSL, key size selects AES-128/192/256
 *
 * The key is kept in a SecureMemoryHandle for the lifetime of the cipher.
 */
class AesBlockCipher final : public interfaces::IBlockCipher {
public:
    /**
     * @param key 16, 24 or 32 bytes
     * @return Ok(cipher), or CreatingBlockCipher for any other key size
     */
    static Result<std::shared_ptr<AesBlockCipher>, SessionFailure> Create(
        std::span<const uint8_t> key);

    [[nodiscard]] size_t BlockSize() const noexcept override;

    [[nodiscard]] Result<Unit, SessionFailure> EncryptBlocks(
        std::span<const uint8_t> src,
        std::span<uint8_t> dst) const override;

    [[nodiscard]] size_t KeySize() const noexcept { return key_.Size(); }

    explicit AesBlockCipher(SecureMemoryHandle key) noexcept;

private:
    SecureMemoryHandle key_;
};

} // namespace sessionseal::crypto
