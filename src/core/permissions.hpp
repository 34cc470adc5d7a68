#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

struct PermissionCheck {
    bool ok = false;            // true iff no group/other bits are set
    std::string current_mode;   // e.g. "-rw-r--r--"
};

// Stat the file and report whether it is private to its owner.
// A missing file yields ErrorKind::NotFound.
Result<PermissionCheck> check_permissions(const std::filesystem::path& path);

// Owns a file descriptor opened by secure_create(). Closes on destruction.
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle();

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    bool valid() const { return fd_ >= 0; }

    // Write the whole buffer, retrying short writes.
    Result<void> write_all(const std::string& data);

    // Flush to disk and close. Safe to call on an invalid handle.
    Result<void> close();

private:
    int fd_ = -1;
};

// open()/fchmod() errno to the failure kinds below.
ErrorKind error_kind_from_errno(int err);

// Create the file exclusively with owner-only read/write bits set at open().
// Fails with AlreadyExists, PermissionDenied, PathNotFound or IoError.
// Nothing is left on disk when it fails.
Result<FileHandle> secure_create(const std::filesystem::path& path);
