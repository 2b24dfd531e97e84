#pragma once

#include "sessionseal/codec/codec_options.hpp"
#include "sessionseal/codec/codec_set.hpp"
#include "sessionseal/core/constants.hpp"
#include "sessionseal/core/result.hpp"
#include "sessionseal/core/failures.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sessionseal::configuration {

/// One generation of codec keys. An empty block key disables encryption.
struct KeyGeneration {
    std::vector<uint8_t> hash_key;
    std::vector<uint8_t> block_key;
};

/// Rotation-ordered codec keys loaded from the environment
///
/// Variables, hex encoded, n = 0, 1, ...:
/// - `<PREFIX>_HASH_KEY_<n>`  required for every generation
/// - `<PREFIX>_BLOCK_KEY_<n>` optional, 16/24/32 bytes
///
/// Loading stops at the first missing hash key. Generation 0 is the
/// current key and encodes; later generations only decode.
///
/// @example
/// ```cpp
/// auto ring = KeyRingConfig::FromEnvironment();
/// if (ring.IsOk()) {
///     auto codecs = ring.Unwrap().BuildCodecSet({});
/// }
/// ```
class KeyRingConfig {
public:
    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

    static Result<KeyRingConfig, SessionFailure> FromEnvironment(
        std::string_view prefix = ConfigConstants::DEFAULT_ENV_PREFIX);

    static Result<KeyRingConfig, SessionFailure> FromLookup(
        std::string_view prefix,
        const EnvironmentLookup& lookup);

    /**
     * @brief One SecureCodec per generation, sharing @p base_options
     *
     * The block key of each generation replaces base_options.block_key.
     */
    [[nodiscard]] codec::CodecSet BuildCodecSet(const codec::CodecOptions& base_options) const;

    [[nodiscard]] const std::vector<KeyGeneration>& Generations() const noexcept {
        return generations_;
    }

private:
    explicit KeyRingConfig(std::vector<KeyGeneration> generations)
        : generations_(std::move(generations)) {}

    std::vector<KeyGeneration> generations_;
};

} // namespace sessionseal::configuration
