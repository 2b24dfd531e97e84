#include "sessionseal/store/file_system_store.hpp"
#include "sessionseal/crypto/base_encoding.hpp"
#include "sessionseal/crypto/sodium_interop.hpp"
#include "sessionseal/debug/session_logger.hpp"
#include "sessionseal/core/constants.hpp"
#include "sessionseal/core/format.hpp"

#include <google/protobuf/wrappers.pb.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/stat.h>
#include <unistd.h>

namespace sessionseal::store {

namespace {
    std::mutex& RecordMutex() {
        static std::mutex mutex;
        return mutex;
    }

    bool IsValidId(std::string_view id) {
        if (id.empty()) {
            return false;
        }
        for (const char c : id) {
            const bool upper = c >= 'A' && c <= 'Z';
            const bool digit = c >= '2' && c <= '7';
            if (!upper && !digit) {
                return false;
            }
        }
        return true;
    }

    std::string ErrnoMessage(const char* operation, const std::filesystem::path& path, int error) {
        return compat::format("{} {}: {}", operation, path.string(), std::strerror(error));
    }
}

FileSystemStore::FileSystemStore(std::filesystem::path root, const size_t max_file_size)
    : root_(std::move(root))
    , max_file_size_(max_file_size) {}

Result<std::string, SessionFailure> FileSystemStore::GenerateId() {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto bytes = crypto::SodiumInterop::GetRandomBytes(StoreConstants::SESSION_ID_RANDOM_BYTES);
    if (bytes.IsErr()) {
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::FromSodiumFailure(bytes.UnwrapErr()));
    }
    return Result<std::string, SessionFailure>::Ok(crypto::Base32::Encode(bytes.Unwrap()));
}

Result<std::filesystem::path, SessionFailure> FileSystemStore::RecordPath(std::string_view id) const {
    if (!IsValidId(id)) {
        return Result<std::filesystem::path, SessionFailure>::Err(
            SessionFailure::Backend(compat::format("invalid session id \"{}\"", id)));
    }
    std::string file_name(StoreConstants::SESSION_FILE_PREFIX);
    file_name.append(id);
    return Result<std::filesystem::path, SessionFailure>::Ok(
        (root_ / file_name).lexically_normal());
}

Result<Unit, SessionFailure> FileSystemStore::Get(
    const http::RequestContext& ctx,
    session::SessionProxy& proxy,
    std::string_view cookie_value) {

    if (auto check = ctx.Check(); check.IsErr()) {
        return check;
    }

    google::protobuf::StringValue id;
    if (auto decoded = proxy.Decode(cookie_value, id); decoded.IsErr()) {
        return decoded;
    }
    proxy.id = id.value();

    auto path = RecordPath(proxy.id);
    if (path.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(path).UnwrapErr());
    }

    auto data = ReadRecord(path.Unwrap());
    if (data.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(data).UnwrapErr());
    }
    return proxy.DecodeValues(data.Unwrap());
}

Result<Unit, SessionFailure> FileSystemStore::New(
    const http::RequestContext&,
    session::SessionProxy&) {
    return Result<Unit, SessionFailure>::Ok(unit);
}

Result<Unit, SessionFailure> FileSystemStore::Save(
    const http::RequestContext& ctx,
    session::SessionProxy& proxy) {

    if (auto check = ctx.Check(); check.IsErr()) {
        return check;
    }

    if (proxy.MaxAge() <= 0) {
        if (!proxy.id.empty()) {
            auto path = RecordPath(proxy.id);
            if (path.IsErr()) {
                return Result<Unit, SessionFailure>::Err(std::move(path).UnwrapErr());
            }
            if (auto deleted = DeleteRecord(path.Unwrap()); deleted.IsErr()) {
                return deleted;
            }
        }
        return proxy.Delete();
    }

    if (proxy.id.empty()) {
        auto generated = GenerateId();
        if (generated.IsErr()) {
            return Result<Unit, SessionFailure>::Err(std::move(generated).UnwrapErr());
        }
        proxy.id = std::move(generated).Unwrap();
    }

    auto path = RecordPath(proxy.id);
    if (path.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(path).UnwrapErr());
    }

    auto record = proxy.EncodeValues();
    if (record.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(record).UnwrapErr());
    }
    if (auto written = WriteRecord(path.Unwrap(), record.Unwrap()); written.IsErr()) {
        return written;
    }

    google::protobuf::StringValue id;
    id.set_value(proxy.id);
    auto encoded_id = proxy.Encode(id);
    if (encoded_id.IsErr()) {
        return Result<Unit, SessionFailure>::Err(std::move(encoded_id).UnwrapErr());
    }
    return proxy.Save(std::move(encoded_id).Unwrap());
}

Result<std::string, SessionFailure> FileSystemStore::ReadRecord(
    const std::filesystem::path& path) const {

    std::lock_guard guard(RecordMutex());
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::Backend(ErrnoMessage("open", path, errno)));
    }

    struct stat info {};
    if (::fstat(fd, &info) != 0) {
        const int error = errno;
        ::close(fd);
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::Backend(ErrnoMessage("stat", path, error)));
    }
    const auto size = static_cast<size_t>(info.st_size);
    if (max_file_size_ > 0 && size > max_file_size_) {
        SESSIONSEAL_LOG_MSG("FS_STORE", "read", "record exceeds max file size");
        ::close(fd);
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::EncodedLengthTooLong(size, max_file_size_));
    }

    std::string data(size, '\0');
    size_t total = 0;
    while (total < data.size()) {
        const ssize_t n = ::read(fd, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            ::close(fd);
            return Result<std::string, SessionFailure>::Err(
                SessionFailure::Backend(ErrnoMessage("read", path, error)));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    data.resize(total);

    if (::close(fd) != 0) {
        return Result<std::string, SessionFailure>::Err(
            SessionFailure::Backend(ErrnoMessage("close", path, errno)));
    }
    debug::LogStoreRecord("read", path.string(), data.size());
    return Result<std::string, SessionFailure>::Ok(std::move(data));
}

Result<Unit, SessionFailure> FileSystemStore::WriteRecord(
    const std::filesystem::path& path,
    std::string_view data) const {

    if (max_file_size_ > 0 && data.size() > max_file_size_) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::EncodedLengthTooLong(data.size(), max_file_size_));
    }

    std::lock_guard guard(RecordMutex());
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::Backend(ErrnoMessage("open", path, errno)));
    }

    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            ::close(fd);
            return Result<Unit, SessionFailure>::Err(
                SessionFailure::Backend(ErrnoMessage("write", path, error)));
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::Backend(ErrnoMessage("close", path, errno)));
    }
    debug::LogStoreRecord("write", path.string(), data.size());
    return Result<Unit, SessionFailure>::Ok(unit);
}

Result<Unit, SessionFailure> FileSystemStore::DeleteRecord(
    const std::filesystem::path& path) const {

    std::lock_guard guard(RecordMutex());
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Result<Unit, SessionFailure>::Err(
            SessionFailure::Backend(
                compat::format("remove {}: {}", path.string(), ec.message())));
    }
    debug::LogStoreRecord("delete", path.string(), 0);
    return Result<Unit, SessionFailure>::Ok(unit);
}

} // namespace sessionseal::store
