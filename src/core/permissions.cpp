#include "permissions.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

Result<PermissionCheck> check_permissions(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            return Result<PermissionCheck>::Err(ErrorKind::NotFound,
                fmt::format("{} does not exist", path.string()));
        }
        return Result<PermissionCheck>::Err(ErrorKind::IoError,
            fmt::format("Could not stat {}: {}", path.string(), std::strerror(err)));
    }

    PermissionCheck check;
    check.ok = (st.st_mode & GROUP_OTHER_MASK) == 0;
    check.current_mode = file_mode_string(st.st_mode);
    return Result<PermissionCheck>::Ok(check);
}

// ── FileHandle ──────────────────────────────────────────────

FileHandle::~FileHandle() {
    if (fd_ >= 0) ::close(fd_);
}

FileHandle::FileHandle(FileHandle&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<void> FileHandle::write_all(const std::string& data) {
    if (fd_ < 0) {
        return Result<void>::Err(ErrorKind::IoError, "write on closed file");
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(ErrorKind::IoError, std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void>::Ok();
}

Result<void> FileHandle::close() {
    if (fd_ < 0) return Result<void>::Ok();

    int fd = fd_;
    fd_ = -1;
    if (::fsync(fd) != 0 && errno != EINVAL) {
        int err = errno;
        ::close(fd);
        return Result<void>::Err(ErrorKind::IoError, std::strerror(err));
    }
    if (::close(fd) != 0) {
        return Result<void>::Err(ErrorKind::IoError, std::strerror(errno));
    }
    return Result<void>::Ok();
}

// ── secure_create ───────────────────────────────────────────

ErrorKind error_kind_from_errno(int err) {
    switch (err) {
        case EEXIST:
            return ErrorKind::AlreadyExists;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::PermissionDenied;
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::PathNotFound;
        default:
            return ErrorKind::IoError;
    }
}

Result<FileHandle> secure_create(const fs::path& path) {
    // O_EXCL: the loser of a creation race gets EEXIST, never a truncation.
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                    static_cast<mode_t>(ZULIPRC_MODE));
    if (fd < 0) {
        int err = errno;
        return Result<FileHandle>::Err(error_kind_from_errno(err),
            fmt::format("{}: {}", path.string(), std::strerror(err)));
    }

    FileHandle handle(fd);

    // The umask can only have narrowed the bits; restore exactly 0600.
    if (::fchmod(fd, static_cast<mode_t>(ZULIPRC_MODE)) != 0) {
        int err = errno;
        handle = FileHandle();
        ::unlink(path.c_str());
        return Result<FileHandle>::Err(error_kind_from_errno(err),
            fmt::format("{}: {}", path.string(), std::strerror(err)));
    }

    return Result<FileHandle>::Ok(std::move(handle));
}
