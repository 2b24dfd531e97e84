#include "sessionseal/crypto/aes_block_cipher.hpp"
#include "sessionseal/crypto/sodium_interop.hpp"
#include "sessionseal/core/constants.hpp"
#include "sessionseal/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>
namespace sessionseal::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    const EVP_CIPHER* SelectCipher(const size_t key_size) {
        switch (key_size) {
            case Constants::AES_128_KEY_SIZE:
                return EVP_aes_128_ecb();
            case Constants::AES_192_KEY_SIZE:
                return EVP_aes_192_ecb();
            case Constants::AES_256_KEY_SIZE:
                return EVP_aes_256_ecb();
            default:
                return nullptr;
        }
    }
}
AesBlockCipher::AesBlockCipher(SecureMemoryHandle key) noexcept
    : key_(std::move(key)) {}
Result<std::shared_ptr<AesBlockCipher>, SessionFailure>
AesBlockCipher::Create(std::span<const uint8_t> key) {
    if (SelectCipher(key.size()) == nullptr) {
        return Result<std::shared_ptr<AesBlockCipher>, SessionFailure>::Err(
            SessionFailure::CreatingBlockCipher(
                compat::format("crypto/aes: invalid key size {}", key.size())));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::shared_ptr<AesBlockCipher>, SessionFailure>::Err(
            SessionFailure::CreatingBlockCipher(init.UnwrapErr().message));
    }
    auto handle_result = SecureMemoryHandle::FromBytes(key);
    if (handle_result.IsErr()) {
        return Result<std::shared_ptr<AesBlockCipher>, SessionFailure>::Err(
            SessionFailure::CreatingBlockCipher(handle_result.UnwrapErr().message));
    }
    return Result<std::shared_ptr<AesBlockCipher>, SessionFailure>::Ok(
        std::make_shared<AesBlockCipher>(std::move(handle_result).Unwrap()));
}
size_t AesBlockCipher::BlockSize() const noexcept {
    return Constants::AES_BLOCK_SIZE;
}
Result<Unit, SessionFailure> AesBlockCipher::EncryptBlocks(
    std::span<const uint8_t> src,
    std::span<uint8_t> dst) const {
    if (src.size() != dst.size() || src.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("AES input must be whole blocks of equal size, got {} -> {}",
                    src.size(), dst.size())));
    }
    if (src.empty()) {
        return Result<Unit, SessionFailure>::Ok(unit);
    }
    const EVP_CIPHER* cipher = SelectCipher(key_.Size());
    if (cipher == nullptr) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure("AES key handle is not usable"));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    auto init_result = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, key.data(), nullptr);
    });
    if (init_result.IsErr()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    if (init_result.Unwrap() != OpenSSL::SUCCESS) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("Failed to initialize AES: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != OpenSSL::SUCCESS) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("Failed to disable padding: {}", GetOpenSSLError())));
    }
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), dst.data(), &out_len,
                          src.data(), static_cast<int>(src.size())) != OpenSSL::SUCCESS) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("AES block encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), dst.data() + out_len, &final_len) != OpenSSL::SUCCESS ||
        static_cast<size_t>(out_len + final_len) != src.size()) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::CryptoFailure(
                compat::format("AES block finalization failed: {}", GetOpenSSLError())));
    }
    return Result<Unit, SessionFailure>::Ok(unit);
}
}
