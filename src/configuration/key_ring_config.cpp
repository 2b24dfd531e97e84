#include "sessionseal/configuration/key_ring_config.hpp"
#include "sessionseal/codec/secure_codec.hpp"
#include "sessionseal/crypto/sodium_interop.hpp"
#include "sessionseal/core/format.hpp"
#include "sessionseal/debug/session_logger.hpp"

#include <cstdlib>
#include <memory>

namespace sessionseal::configuration {

namespace {
    Result<std::vector<uint8_t>, SessionFailure> DecodeKey(
        const std::string& variable,
        const std::string& hex) {
        auto bytes = crypto::SodiumInterop::HexToBytes(hex);
        if (bytes.IsErr()) {
            return Result<std::vector<uint8_t>, SessionFailure>::Err(
                SessionFailure::InvalidConfiguration(
                    compat::format("{}: {}", variable, bytes.UnwrapErr().message)));
        }
        return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(bytes).Unwrap());
    }

    bool IsValidBlockKeySize(const size_t size) {
        return size == Constants::AES_128_KEY_SIZE ||
               size == Constants::AES_192_KEY_SIZE ||
               size == Constants::AES_256_KEY_SIZE;
    }
}

Result<KeyRingConfig, SessionFailure> KeyRingConfig::FromEnvironment(std::string_view prefix) {
    return FromLookup(prefix, [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

Result<KeyRingConfig, SessionFailure> KeyRingConfig::FromLookup(
    std::string_view prefix,
    const EnvironmentLookup& lookup) {

    std::vector<KeyGeneration> generations;
    for (size_t n = 0; n < ConfigConstants::MAX_ROTATION_KEYS; ++n) {
        const std::string hash_var = compat::format("{}{}{}", prefix, ConfigConstants::HASH_KEY_SUFFIX, n);
        const std::string block_var = compat::format("{}{}{}", prefix, ConfigConstants::BLOCK_KEY_SUFFIX, n);

        const auto hash_hex = lookup(hash_var);
        if (!hash_hex) {
            break;
        }

        KeyGeneration generation;
        auto hash_key = DecodeKey(hash_var, *hash_hex);
        if (hash_key.IsErr()) {
            return Result<KeyRingConfig, SessionFailure>::Err(std::move(hash_key).UnwrapErr());
        }
        generation.hash_key = std::move(hash_key).Unwrap();
        if (generation.hash_key.empty()) {
            return Result<KeyRingConfig, SessionFailure>::Err(
                SessionFailure::InvalidConfiguration(compat::format("{} is empty", hash_var)));
        }

        if (const auto block_hex = lookup(block_var); block_hex && !block_hex->empty()) {
            auto block_key = DecodeKey(block_var, *block_hex);
            if (block_key.IsErr()) {
                return Result<KeyRingConfig, SessionFailure>::Err(std::move(block_key).UnwrapErr());
            }
            generation.block_key = std::move(block_key).Unwrap();
            if (!IsValidBlockKeySize(generation.block_key.size())) {
                return Result<KeyRingConfig, SessionFailure>::Err(
                    SessionFailure::InvalidConfiguration(
                        compat::format("{} must be 16, 24 or 32 bytes, got {}",
                            block_var, generation.block_key.size())));
            }
        }

        generations.push_back(std::move(generation));
    }
    SESSIONSEAL_LOG_VALUE("KEY_RING", "load", "generations", generations.size());

    if (generations.empty()) {
        return Result<KeyRingConfig, SessionFailure>::Err(
            SessionFailure::InvalidConfiguration(
                compat::format("{}{}0 is not set", prefix, ConfigConstants::HASH_KEY_SUFFIX)));
    }
    return Result<KeyRingConfig, SessionFailure>::Ok(KeyRingConfig(std::move(generations)));
}

codec::CodecSet KeyRingConfig::BuildCodecSet(const codec::CodecOptions& base_options) const {
    std::vector<std::shared_ptr<const interfaces::ICodec>> codecs;
    codecs.reserve(generations_.size());
    for (const auto& generation : generations_) {
        codec::CodecOptions options = base_options;
        options.block_key = generation.block_key;
        codecs.push_back(std::make_shared<codec::SecureCodec>(generation.hash_key, std::move(options)));
    }
    return codec::CodecSet(std::move(codecs));
}

} // namespace sessionseal::configuration
