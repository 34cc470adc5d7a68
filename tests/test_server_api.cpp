#include <gtest/gtest.h>
#include <net/server_api.hpp>

TEST(ServerSettings, ParsesFlags) {
    auto caps = parse_server_settings(
        R"({"result": "success", "email_auth_enabled": true,)"
        R"( "require_email_format_usernames": false, "realm_name": "Example"})");

    ASSERT_TRUE(caps.is_ok()) << caps.error;
    EXPECT_TRUE(caps.value.email_auth_enabled);
    EXPECT_FALSE(caps.value.require_email_format_usernames);
}

TEST(ServerSettings, MissingFieldsAreFalse) {
    auto caps = parse_server_settings(R"({"result": "success", "msg": ""})");

    ASSERT_TRUE(caps.is_ok()) << caps.error;
    EXPECT_FALSE(caps.value.email_auth_enabled);
    EXPECT_FALSE(caps.value.require_email_format_usernames);
}

TEST(ServerSettings, NonObjectBody) {
    auto caps = parse_server_settings("[1, 2, 3]");
    EXPECT_TRUE(caps.is_err());
    EXPECT_EQ(caps.kind, ErrorKind::ConnectionFailure);
}

TEST(ServerSettings, UnparsableBody) {
    auto caps = parse_server_settings("{\"email_auth_enabled\": [");
    EXPECT_TRUE(caps.is_err());
    EXPECT_EQ(caps.kind, ErrorKind::ConnectionFailure);
}

TEST(ApiKey, ParsesKey) {
    auto key = parse_api_key(
        R"({"result": "success", "msg": "", "api_key": "aBcD1234", "email": "alice@example.org"})");

    ASSERT_TRUE(key.is_ok()) << key.error;
    EXPECT_EQ(key.value, "aBcD1234");
}

TEST(ApiKey, MissingKey) {
    auto key = parse_api_key(R"({"result": "success", "msg": ""})");
    EXPECT_TRUE(key.is_err());
    EXPECT_EQ(key.kind, ErrorKind::ConnectionFailure);
}

TEST(VerifyCredentials, EmptySiteFailsWithoutNetwork) {
    ZulipServerApi api;
    auto verified = api.verify_credentials({"alice@example.org", "key", ""});

    EXPECT_TRUE(verified.is_err());
    EXPECT_EQ(verified.kind, ErrorKind::ConnectionFailure);
    EXPECT_EQ(verified.error, "no site given in zuliprc");
}
