#pragma once

#include "sessionseal/interfaces/i_session_store.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace sessionseal::store {

/**
 * @brief Keeps session values in files, the cookie carries only the id
 *
 * Each record is the codec-encoded value stored at
 * <root>/session_<id>, where id is 32 random bytes in unpadded base32.
 * The cookie holds the codec-encoded id. Record reads, writes and deletes
 * are serialized by one process-wide lock.
 */
class FileSystemStore final : public interfaces::ISessionStore {
public:
    /**
     * @param max_file_size upper bound for a record in bytes, 0 for none
     */
    FileSystemStore(std::filesystem::path root, size_t max_file_size);

    [[nodiscard]] Result<Unit, SessionFailure> Get(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy,
        std::string_view cookie_value) override;

    [[nodiscard]] Result<Unit, SessionFailure> New(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy) override;

    /**
     * A non-positive max-age removes the record and expires the cookie.
     */
    [[nodiscard]] Result<Unit, SessionFailure> Save(
        const http::RequestContext& ctx,
        session::SessionProxy& proxy) override;

    [[nodiscard]] Result<std::filesystem::path, SessionFailure> RecordPath(
        std::string_view id) const;

    [[nodiscard]] static Result<std::string, SessionFailure> GenerateId();

private:
    [[nodiscard]] Result<std::string, SessionFailure> ReadRecord(
        const std::filesystem::path& path) const;

    [[nodiscard]] Result<Unit, SessionFailure> WriteRecord(
        const std::filesystem::path& path,
        std::string_view data) const;

    [[nodiscard]] Result<Unit, SessionFailure> DeleteRecord(
        const std::filesystem::path& path) const;

    std::filesystem::path root_;
    size_t max_file_size_;
};

} // namespace sessionseal::store
