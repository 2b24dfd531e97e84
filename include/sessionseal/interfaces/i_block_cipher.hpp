#pragma once
#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
namespace sessionseal::interfaces {
/**
 * @brief Raw block cipher used as the keystream source for counter mode.
 *
 * EncryptBlocks encrypts src as a sequence of independent blocks into dst;
 * both spans must have the same size, a multiple of BlockSize().
 */
class IBlockCipher {
public:
    virtual ~IBlockCipher() = default;
    [[nodiscard]] virtual size_t BlockSize() const noexcept = 0;
    [[nodiscard]] virtual Result<Unit, SessionFailure> EncryptBlocks(
        std::span<const uint8_t> src,
        std::span<uint8_t> dst) const = 0;
};
}
