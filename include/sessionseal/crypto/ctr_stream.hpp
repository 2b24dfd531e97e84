#pragma once

#include "sessionseal/interfaces/i_block_cipher.hpp"

#include <cstdint>
#include <span>

namespace sessionseal::crypto {

/**
 * @brief Counter-mode keystream over any IBlockCipher
 *
 * The counter starts at the IV and is incremented as one big-endian integer
 * spanning the whole block, wrapping at the top. Encryption and decryption
 * are the same operation.
 */
class CtrStream {
public:
    /**
     * @param iv exactly cipher.BlockSize() bytes
     * @param data transformed in place
     */
    static Result<Unit, SessionFailure> XorKeyStream(
        const interfaces::IBlockCipher& cipher,
        std::span<const uint8_t> iv,
        std::span<uint8_t> data);

private:
    CtrStream() = delete;
};

} // namespace sessionseal::crypto
