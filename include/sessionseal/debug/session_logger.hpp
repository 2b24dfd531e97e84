#pragma once

/**
 * @file session_logger.hpp
 * @brief Debug logging for the codec pipeline, codec rotation and stores.
 *
 * Enable via CMake: -DSESSIONSEAL_DEBUG_SESSIONS=ON
 *
 * Only names, sizes, rotation indices and failure messages are printed.
 * Key material and session values are never passed to these macros.
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace sessionseal::debug {

#ifdef SESSIONSEAL_DEBUG_SESSIONS

#define SESSIONSEAL_LOG_MSG(component, operation, message) \
    do { \
        fprintf(stdout, "[SESSIONSEAL-DEBUG] %s %s %s\n", \
            component, \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define SESSIONSEAL_LOG_VALUE(component, operation, name, value) \
    do { \
        fprintf(stdout, "[SESSIONSEAL-DEBUG] %s %s %s: %s\n", \
            component, \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SESSIONSEAL_LOG_FAILURE(component, operation, failure) \
    do { \
        fprintf(stdout, "[SESSIONSEAL-DEBUG] %s %s failed: %s\n", \
            component, \
            operation, \
            (failure).Describe().c_str()); \
        fflush(stdout); \
    } while(0)

#define SESSIONSEAL_LOG_SECTION(component, section_name) \
    do { \
        fprintf(stdout, "[SESSIONSEAL-DEBUG] %s ========== %s ==========\n", \
            component, \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogCodecRejected(size_t index, std::string_view name, const std::string& reason) {
    fprintf(stdout, "[SESSIONSEAL-DEBUG] CODEC_SET decode codec[%zu] rejected '%.*s': %s\n",
        index, static_cast<int>(name.size()), name.data(), reason.c_str());
    fflush(stdout);
}

inline void LogCodecAccepted(size_t index, std::string_view name) {
    fprintf(stdout, "[SESSIONSEAL-DEBUG] CODEC_SET decode codec[%zu] accepted '%.*s'%s\n",
        index, static_cast<int>(name.size()), name.data(),
        index > 0 ? " (rotation key)" : "");
    fflush(stdout);
}

inline void LogTokenEncoded(std::string_view name, size_t token_size, bool encrypted) {
    fprintf(stdout, "[SESSIONSEAL-DEBUG] CODEC encode '%.*s': %zu bytes%s\n",
        static_cast<int>(name.size()), name.data(), token_size,
        encrypted ? " (encrypted)" : "");
    fflush(stdout);
}

inline void LogStoreRecord(const char* operation, const std::string& path, size_t size) {
    fprintf(stdout, "[SESSIONSEAL-DEBUG] FS_STORE %s %s (%zu bytes)\n",
        operation, path.c_str(), size);
    fflush(stdout);
}

#else // !SESSIONSEAL_DEBUG_SESSIONS

#define SESSIONSEAL_LOG_MSG(component, operation, message) ((void)0)
#define SESSIONSEAL_LOG_VALUE(component, operation, name, value) ((void)0)
#define SESSIONSEAL_LOG_FAILURE(component, operation, failure) ((void)0)
#define SESSIONSEAL_LOG_SECTION(component, section_name) ((void)0)

inline void LogCodecRejected(size_t, std::string_view, const std::string&) {}
inline void LogCodecAccepted(size_t, std::string_view) {}
inline void LogTokenEncoded(std::string_view, size_t, bool) {}
inline void LogStoreRecord(const char*, const std::string&, size_t) {}

#endif // SESSIONSEAL_DEBUG_SESSIONS

} // namespace sessionseal::debug
