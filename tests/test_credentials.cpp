#include "test_helpers.hpp"
#include <core/credentials.hpp>
#include <core/utils.hpp>
#include <sys/stat.h>
#include <sys/resource.h>
#include <csignal>

class CredentialsTest : public TempDirTest {};

TEST_F(CredentialsTest, RenderLayout) {
    CredentialRecord record{"alice@example.org", "abc123", "https://chat.example.org"};
    EXPECT_EQ(CredentialStore::render(record),
              "[api]\nemail=alice@example.org\nkey=abc123\nsite=https://chat.example.org");
}

TEST_F(CredentialsTest, CreateWritesOwnerOnlyFile) {
    auto path = test_dir / "zuliprc";
    CredentialRecord record{"alice", "k3y", "https://chat.example.org"};

    auto created = CredentialStore::create(path, record);
    ASSERT_TRUE(created.is_ok()) << created.error;

    EXPECT_EQ(read_file(path), "[api]\nemail=alice\nkey=k3y\nsite=https://chat.example.org");
    EXPECT_EQ(mode_of(path) & 077, 0u);
}

TEST_F(CredentialsTest, CreateThenLoad) {
    auto path = test_dir / "zuliprc";
    CredentialRecord record{"alice@example.org", "abc123", "https://chat.example.org"};
    ASSERT_TRUE(CredentialStore::create(path, record).is_ok());

    auto loaded = CredentialStore::load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.credentials.login_id, "alice@example.org");
    EXPECT_EQ(loaded.value.credentials.api_key, "abc123");
    EXPECT_EQ(loaded.value.credentials.server_url, "https://chat.example.org");
    EXPECT_TRUE(loaded.value.zterm.empty());
}

TEST_F(CredentialsTest, CreateNeverOverwrites) {
    auto path = write_file("zuliprc", "[api]\nemail=old\n");

    auto created = CredentialStore::create(path, {"new", "key", "https://x.org"});
    EXPECT_TRUE(created.is_err());
    EXPECT_EQ(created.kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(created.error, "zuliprc already exists at " + path.string());
    EXPECT_EQ(read_file(path), "[api]\nemail=old\n");
}

TEST_F(CredentialsTest, CreateInMissingDirectory) {
    auto path = test_dir / "missing" / "zuliprc";

    auto created = CredentialStore::create(path, {"a", "b", "c"});
    EXPECT_TRUE(created.is_err());
    EXPECT_EQ(created.kind, ErrorKind::PathNotFound);
    EXPECT_EQ(created.error, "PathNotFound: zuliprc could not be created at " + path.string());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CredentialsTest, FailedWriteLeavesNoFile) {
    CredentialRecord record{"alice@example.org", "secretkey", "https://chat.example.org"};

    // A file size limit cuts the write short (EFBIG once SIGXFSZ is ignored)
    for (rlim_t limit : {rlim_t(0), rlim_t(8), rlim_t(38)}) {
        auto path = test_dir / ("zuliprc_" + std::to_string(limit));

        struct rlimit saved;
        ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &saved), 0);
        auto old_handler = std::signal(SIGXFSZ, SIG_IGN);
        struct rlimit low = saved;
        low.rlim_cur = limit;
        ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &low), 0);

        auto created = CredentialStore::create(path, record);

        setrlimit(RLIMIT_FSIZE, &saved);
        std::signal(SIGXFSZ, old_handler);

        EXPECT_TRUE(created.is_err()) << "limit " << limit;
        EXPECT_EQ(created.kind, ErrorKind::IoError);
        EXPECT_EQ(created.error, "IoError: zuliprc could not be created at " + path.string());
        EXPECT_FALSE(fs::exists(path)) << "limit " << limit;
        EXPECT_EQ(CredentialStore::load(path).kind, ErrorKind::NotFound);
    }
}

TEST(CreateFailureMessage, PerKind) {
    fs::path path = "/home/alice/zuliprc";
    EXPECT_EQ(create_failure_message(ErrorKind::AlreadyExists, path),
              "zuliprc already exists at /home/alice/zuliprc");
    EXPECT_EQ(create_failure_message(ErrorKind::PermissionDenied, path),
              "PermissionDenied: zuliprc could not be created at /home/alice/zuliprc");
    EXPECT_EQ(create_failure_message(ErrorKind::PathNotFound, path),
              "PathNotFound: zuliprc could not be created at /home/alice/zuliprc");
    EXPECT_EQ(create_failure_message(ErrorKind::IoError, path),
              "IoError: zuliprc could not be created at /home/alice/zuliprc");
}

TEST_F(CredentialsTest, LoadMissingIsNotFound) {
    auto loaded = CredentialStore::load(test_dir / "zuliprc");
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::NotFound);
}

TEST_F(CredentialsTest, LoadApiSectionOnly) {
    auto path = write_file("zuliprc", "[api]\n");

    auto loaded = CredentialStore::load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.credentials.login_id, "");
    EXPECT_EQ(loaded.value.credentials.api_key, "");
    EXPECT_EQ(loaded.value.credentials.server_url, "");
}

TEST_F(CredentialsTest, LoadReadsZtermSection) {
    auto path = write_file("zuliprc",
        "[api]\n"
        "email=bob@example.org\n"
        "key=xyz\n"
        "site=https://chat.example.org\n"
        "\n"
        "[zterm]\n"
        "theme=gruvbox\n"
        "autohide=autohide\n"
        "color-depth=16\n");

    auto loaded = CredentialStore::load(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.credentials.login_id, "bob@example.org");
    ASSERT_EQ(loaded.value.zterm.size(), 3u);
    EXPECT_EQ(loaded.value.zterm.at("theme"), "gruvbox");
    EXPECT_EQ(loaded.value.zterm.at("autohide"), "autohide");
    EXPECT_EQ(loaded.value.zterm.at("color-depth"), "16");
}

TEST_F(CredentialsTest, LoadWithoutApiSectionIsMalformed) {
    auto path = write_file("zuliprc", "[zterm]\ntheme=zt_dark\n");

    auto loaded = CredentialStore::load(path);
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::Malformed);
}

TEST_F(CredentialsTest, LoadGarbageIsMalformed) {
    auto path = write_file("zuliprc", "this is not a config file\n");

    auto loaded = CredentialStore::load(path);
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::Malformed);
}

TEST_F(CredentialsTest, LoadRejectsGroupReadable) {
    auto path = write_file("zuliprc", "[api]\nkey=secret\n", 0640);

    auto loaded = CredentialStore::load(path);
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::InsecurePermissions);
    EXPECT_EQ(loaded.value.insecure_mode, "-rw-r-----");
    EXPECT_EQ(loaded.value.credentials.api_key, "");
}

TEST_F(CredentialsTest, LoadRejectsBeforeParsing) {
    // Contents would be Malformed; the permission failure must win
    auto path = write_file("zuliprc", "garbage", 0666);

    auto loaded = CredentialStore::load(path);
    EXPECT_EQ(loaded.kind, ErrorKind::InsecurePermissions);
    EXPECT_EQ(loaded.value.insecure_mode, "-rw-rw-rw-");
}

// ── parse_ini ───────────────────────────────────────────────

TEST(ParseIni, CommentsAndSeparators) {
    auto parsed = parse_ini(
        "# leading comment\n"
        "[api]\n"
        "; another comment\n"
        "email = alice@example.org\n"
        "site: https://chat.example.org\n");

    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    EXPECT_EQ(parsed.value["api"]["email"], "alice@example.org");
    EXPECT_EQ(parsed.value["api"]["site"], "https://chat.example.org");
}

TEST(ParseIni, ValueMayContainSeparators) {
    auto parsed = parse_ini("[api]\nsite=https://chat.example.org:8443\n");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value["api"]["site"], "https://chat.example.org:8443");
}

TEST(ParseIni, EmptySectionIsKept) {
    auto parsed = parse_ini("[api]\n[zterm]\n");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value.count("api"), 1u);
    EXPECT_EQ(parsed.value.count("zterm"), 1u);
}

TEST(ParseIni, KeyOutsideSection) {
    auto parsed = parse_ini("email=alice\n[api]\n");
    EXPECT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.kind, ErrorKind::Malformed);
}

TEST(ParseIni, BadSectionHeader) {
    auto parsed = parse_ini("[api\nemail=alice\n");
    EXPECT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.kind, ErrorKind::Malformed);
}
