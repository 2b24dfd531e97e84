#include "sessionseal/crypto/ctr_stream.hpp"
#include "sessionseal/crypto/sodium_interop.hpp"
#include "sessionseal/core/format.hpp"

#include <algorithm>
#include <vector>

namespace sessionseal::crypto {

namespace {
    // Batch of counter blocks encrypted per cipher call.
    constexpr size_t BLOCKS_PER_BATCH = 32;

    void IncrementCounter(std::span<uint8_t> counter) {
        for (size_t i = counter.size(); i > 0; --i) {
            if (++counter[i - 1] != 0) {
                return;
            }
        }
    }
}

Result<Unit, SessionFailure> CtrStream::XorKeyStream(
    const interfaces::IBlockCipher& cipher,
    std::span<const uint8_t> iv,
    std::span<uint8_t> data) {

    const size_t block_size = cipher.BlockSize();
    if (block_size == 0 || iv.size() != block_size) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("CTR IV length {} does not match block size {}",
                    iv.size(), block_size)));
    }

    std::vector<uint8_t> counter(iv.begin(), iv.end());
    std::vector<uint8_t> counters;
    std::vector<uint8_t> keystream;

    size_t offset = 0;
    while (offset < data.size()) {
        const size_t remaining = data.size() - offset;
        const size_t blocks = std::min(BLOCKS_PER_BATCH, (remaining + block_size - 1) / block_size);

        counters.resize(blocks * block_size);
        keystream.resize(blocks * block_size);
        for (size_t b = 0; b < blocks; ++b) {
            std::copy(counter.begin(), counter.end(), counters.begin() + static_cast<std::ptrdiff_t>(b * block_size));
            IncrementCounter(counter);
        }

        auto encrypt_result = cipher.EncryptBlocks(counters, keystream);
        if (encrypt_result.IsErr()) {
            auto wipe = SodiumInterop::SecureWipe(keystream);
            (void)wipe;
            return encrypt_result;
        }

        const size_t chunk = std::min(remaining, keystream.size());
        for (size_t i = 0; i < chunk; ++i) {
            data[offset + i] ^= keystream[i];
        }
        offset += chunk;
    }

    if (!keystream.empty()) {
        auto wipe = SodiumInterop::SecureWipe(keystream);
        (void)wipe;
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}

} // namespace sessionseal::crypto
