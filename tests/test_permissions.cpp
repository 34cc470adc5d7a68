#include "test_helpers.hpp"
#include <core/permissions.hpp>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>

class PermissionsTest : public TempDirTest {};

TEST_F(PermissionsTest, OwnerOnlyIsOk) {
    auto path = write_file("zuliprc", "[api]", 0600);

    auto check = check_permissions(path);
    ASSERT_TRUE(check.is_ok());
    EXPECT_TRUE(check.value.ok);
    EXPECT_EQ(check.value.current_mode, "-rw-------");
}

TEST_F(PermissionsTest, OwnerReadOnlyIsOk) {
    auto path = write_file("zuliprc", "[api]", 0400);

    auto check = check_permissions(path);
    ASSERT_TRUE(check.is_ok());
    EXPECT_TRUE(check.value.ok);
}

TEST_F(PermissionsTest, MissingFileIsNotFound) {
    auto check = check_permissions(test_dir / "absent");
    EXPECT_TRUE(check.is_err());
    EXPECT_EQ(check.kind, ErrorKind::NotFound);
}

TEST_F(PermissionsTest, SecureCreateThenCheckIsOk) {
    auto path = test_dir / "zuliprc";

    auto created = secure_create(path);
    ASSERT_TRUE(created.is_ok()) << created.error;

    auto check = check_permissions(path);
    ASSERT_TRUE(check.is_ok());
    EXPECT_TRUE(check.value.ok);
    EXPECT_EQ(mode_of(path), 0600u);
}

TEST_F(PermissionsTest, SecureCreateIgnoresPermissiveUmask) {
    mode_t old = umask(0);
    auto created = secure_create(test_dir / "zuliprc");
    umask(old);

    ASSERT_TRUE(created.is_ok()) << created.error;
    EXPECT_EQ(mode_of(test_dir / "zuliprc"), 0600u);
}

TEST_F(PermissionsTest, SecureCreateExistingIsAlreadyExists) {
    auto path = write_file("zuliprc", "original contents", 0600);

    auto created = secure_create(path);
    EXPECT_TRUE(created.is_err());
    EXPECT_EQ(created.kind, ErrorKind::AlreadyExists);
    EXPECT_FALSE(created.value.valid());
    EXPECT_EQ(read_file(path), "original contents");
}

TEST_F(PermissionsTest, SecureCreateMissingDirectoryIsPathNotFound) {
    auto created = secure_create(test_dir / "no" / "such" / "zuliprc");
    EXPECT_TRUE(created.is_err());
    EXPECT_EQ(created.kind, ErrorKind::PathNotFound);
}

TEST_F(PermissionsTest, SecureCreateUnwritableDirectoryIsPermissionDenied) {
    auto locked = test_dir / "locked";
    fs::create_directories(locked);
    chmod(locked.c_str(), 0500);
    if (access(locked.c_str(), W_OK) == 0) {
        chmod(locked.c_str(), 0700);
        GTEST_SKIP() << "Directory still writable (running as root?)";
    }

    auto created = secure_create(locked / "zuliprc");
    chmod(locked.c_str(), 0700);

    EXPECT_TRUE(created.is_err());
    EXPECT_EQ(created.kind, ErrorKind::PermissionDenied);
}

TEST(ErrnoMapping, CreateFailureKinds) {
    EXPECT_EQ(error_kind_from_errno(EEXIST), ErrorKind::AlreadyExists);

    EXPECT_EQ(error_kind_from_errno(EACCES), ErrorKind::PermissionDenied);
    EXPECT_EQ(error_kind_from_errno(EPERM), ErrorKind::PermissionDenied);
    EXPECT_EQ(error_kind_from_errno(EROFS), ErrorKind::PermissionDenied);

    EXPECT_EQ(error_kind_from_errno(ENOENT), ErrorKind::PathNotFound);
    EXPECT_EQ(error_kind_from_errno(ENOTDIR), ErrorKind::PathNotFound);

    EXPECT_EQ(error_kind_from_errno(ENOSPC), ErrorKind::IoError);
    EXPECT_EQ(error_kind_from_errno(EIO), ErrorKind::IoError);
}

TEST_F(PermissionsTest, FileHandleWritesAndCloses) {
    auto path = test_dir / "zuliprc";
    auto created = secure_create(path);
    ASSERT_TRUE(created.is_ok());

    FileHandle file = std::move(created.value);
    EXPECT_TRUE(file.valid());
    EXPECT_TRUE(file.write_all("hello").is_ok());
    EXPECT_TRUE(file.close().is_ok());
    EXPECT_FALSE(file.valid());
    EXPECT_EQ(read_file(path), "hello");

    // Closed handles refuse writes, close again is harmless
    EXPECT_TRUE(file.write_all("more").is_err());
    EXPECT_TRUE(file.close().is_ok());
}

// ── Any group/other bit is a violation ─────────────────────

class OpenPermissionsTest : public TempDirTest,
                            public ::testing::WithParamInterface<mode_t> {};

TEST_P(OpenPermissionsTest, GroupOrOtherBitsAreRejected) {
    mode_t mode = 0600 | GetParam();
    auto path = write_file("zuliprc", "[api]", mode);

    auto check = check_permissions(path);
    ASSERT_TRUE(check.is_ok());
    EXPECT_FALSE(check.value.ok);
    EXPECT_EQ(check.value.current_mode.size(), 10u);
}

INSTANTIATE_TEST_SUITE_P(AllGroupOtherModes, OpenPermissionsTest,
    ::testing::Values(077, 070, 007, 066, 060, 006, 055, 050, 005,
                      044, 040, 004, 033, 030, 003, 022, 020, 002,
                      011, 010, 001));
