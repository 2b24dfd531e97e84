#include "sessionseal/crypto/hmac.hpp"
#include "sessionseal/core/constants.hpp"
#include "sessionseal/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace sessionseal::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_MAC_Deleter {
        void operator()(EVP_MAC* mac) const {
            if (mac) {
                EVP_MAC_free(mac);
            }
        }
    };
    struct EVP_MAC_CTX_Deleter {
        void operator()(EVP_MAC_CTX* ctx) const {
            if (ctx) {
                EVP_MAC_CTX_free(ctx);
            }
        }
    };
    using EVP_MAC_ptr = std::unique_ptr<EVP_MAC, EVP_MAC_Deleter>;
    using EVP_MAC_CTX_ptr = std::unique_ptr<EVP_MAC_CTX, EVP_MAC_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}

std::string_view DigestName(const HashFunction hash_function) noexcept {
    switch (hash_function) {
        case HashFunction::Sha1:
            return "SHA1";
        case HashFunction::Sha224:
            return "SHA224";
        case HashFunction::Sha256:
            return "SHA256";
        case HashFunction::Sha384:
            return "SHA384";
        case HashFunction::Sha512:
            return "SHA512";
    }
    return "SHA256";
}

size_t DigestSize(const HashFunction hash_function) noexcept {
    switch (hash_function) {
        case HashFunction::Sha1:
            return 20;
        case HashFunction::Sha224:
            return 28;
        case HashFunction::Sha256:
            return 32;
        case HashFunction::Sha384:
            return 48;
        case HashFunction::Sha512:
            return 64;
    }
    return 32;
}

Result<std::vector<uint8_t>, SessionFailure> Hmac::Compute(
    const HashFunction hash_function,
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {

    if (key.empty()) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::HashKeyNotSet());
    }

    EVP_MAC_ptr mac(EVP_MAC_fetch(nullptr, OpenSSL::ALGORITHM_HMAC.data(), nullptr));
    if (!mac) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("Failed to fetch HMAC: {}", GetOpenSSLError())));
    }

    EVP_MAC_CTX_ptr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("Failed to create HMAC context: {}", GetOpenSSLError())));
    }

    const std::string digest(DigestName(hash_function));
    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OpenSSL::PARAM_DIGEST.data(), const_cast<char*>(digest.c_str()), 0);
    params[1] = OSSL_PARAM_construct_end();

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("Failed to initialize HMAC-{}: {}", digest, GetOpenSSLError())));
    }

    if (!data.empty() &&
        EVP_MAC_update(ctx.get(), data.data(), data.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("HMAC update failed: {}", GetOpenSSLError())));
    }

    std::vector<uint8_t> output(DigestSize(hash_function));
    size_t out_len = 0;
    if (EVP_MAC_final(ctx.get(), output.data(), &out_len, output.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("HMAC finalization failed: {}", GetOpenSSLError())));
    }
    output.resize(out_len);
    return Result<std::vector<uint8_t>, SessionFailure>::Ok(std::move(output));
}

} // namespace sessionseal::crypto
