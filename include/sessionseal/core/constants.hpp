#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace sessionseal {
struct Constants {
    static constexpr size_t AES_BLOCK_SIZE = 16;
    static constexpr size_t AES_128_KEY_SIZE = 16;
    static constexpr size_t AES_192_KEY_SIZE = 24;
    static constexpr size_t AES_256_KEY_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr char TOKEN_SEPARATOR = '|';
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HMAC = "HMAC";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct CodecConstants {
    static constexpr size_t DEFAULT_MAX_LENGTH = 4096;
    static constexpr int64_t DEFAULT_MIN_AGE = 0;
    static constexpr size_t UNLIMITED_LENGTH = 0;
    static constexpr int64_t UNLIMITED_AGE = 0;
};
struct CookieConstants {
    static constexpr int DEFAULT_MAX_AGE = 86400 * 30;
    static constexpr std::string_view DEFAULT_PATH = "/";
    static constexpr std::string_view DEFAULT_DOMAIN = "";
    static constexpr bool DEFAULT_SECURE = false;
    static constexpr bool DEFAULT_HTTP_ONLY = true;
    static constexpr bool DEFAULT_PARTITIONED = false;
    static constexpr int64_t EXPIRED_UNIX_SECONDS = 1;
};
struct StoreConstants {
    static constexpr std::string_view SESSION_FILE_PREFIX = "session_";
    static constexpr size_t SESSION_ID_RANDOM_BYTES = 32;
};
struct ConfigConstants {
    static constexpr std::string_view DEFAULT_ENV_PREFIX = "SESSIONSEAL";
    static constexpr std::string_view HASH_KEY_SUFFIX = "_HASH_KEY_";
    static constexpr std::string_view BLOCK_KEY_SUFFIX = "_BLOCK_KEY_";
    static constexpr size_t MAX_ROTATION_KEYS = 16;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view MALFORMED_TOKEN = "the value is not a well-formed token";
    static constexpr std::string_view MALFORMED_PAYLOAD = "the payload is not valid base64";
    static constexpr std::string_view CIPHERTEXT_TOO_SHORT = "ciphertext is shorter than the cipher block size";
    static constexpr std::string_view MISSING_VALUE_SLOT = "the session proxy has no value slot";
};
}
