#include "util/Redactor.hpp"
#include <gtest/gtest.h>

using namespace ads_mcp;

TEST(RedactorTest, ReplacesConfiguredSecrets) {
    Redactor redactor({"dev-token-1234", "s3cr3t-value"});
    EXPECT_EQ(redactor.redact("token dev-token-1234 and s3cr3t-value twice s3cr3t-value"),
              "token [REDACTED] and [REDACTED] twice [REDACTED]");
}

TEST(RedactorTest, IgnoresShortSecrets) {
    Redactor redactor;
    redactor.add_secret("");
    redactor.add_secret("abc");
    EXPECT_EQ(redactor.redact("abc is fine"), "abc is fine");
}

TEST(RedactorTest, MasksBearerTokens) {
    Redactor redactor;
    EXPECT_EQ(redactor.redact("Authorization: Bearer abc.DEF-123"),
              "Authorization: Bearer [REDACTED]");
}

TEST(RedactorTest, MasksOAuthTokenShapes) {
    Redactor redactor;
    EXPECT_EQ(redactor.redact("access ya29.a0AfH6SMB and refresh 1//0gLx-abc"),
              "access [REDACTED] and refresh [REDACTED]");
}

TEST(RedactorTest, MasksJsonCredentialMembers) {
    Redactor redactor;
    std::string body = R"({"error":"invalid_grant","client_secret":"hunter2","refresh_token":"rt"})";
    EXPECT_EQ(redactor.redact(body),
              R"({"error":"invalid_grant","client_secret":"[REDACTED]","refresh_token":"[REDACTED]"})");
}

TEST(RedactorTest, LeavesOrdinaryTextAlone) {
    Redactor redactor({"not-present-here"});
    std::string text = "Error executing tool search: Invalid customer id: abc";
    EXPECT_EQ(redactor.redact(text), text);
}

TEST(RedactorTest, HandlesVeryLongTokenRuns) {
    Redactor redactor;
    std::string token(400000, 'a');

    EXPECT_EQ(redactor.redact("name ya29." + token + " end"), "name [REDACTED] end");
    EXPECT_EQ(redactor.redact("1//" + token), "[REDACTED]");
    EXPECT_EQ(redactor.redact("Bearer " + token), "Bearer [REDACTED]");
    EXPECT_EQ(redactor.redact(R"({"access_token": ")" + token + R"("})"),
              R"({"access_token": "[REDACTED]"})");
}

TEST(RedactorTest, MasksBearerRegardlessOfCase) {
    Redactor redactor;
    EXPECT_EQ(redactor.redact("authorization: bearer\tabc123"), "authorization: bearer\t[REDACTED]");
    EXPECT_EQ(redactor.redact("Bearer "), "Bearer ");
}

TEST(RedactorTest, IncompleteShapesAreLeftAlone) {
    Redactor redactor;
    EXPECT_EQ(redactor.redact("ya29. and 1// alone"), "ya29. and 1// alone");
    EXPECT_EQ(redactor.redact(R"({"client_secret": 5})"), R"({"client_secret": 5})");
    EXPECT_EQ(redactor.redact(R"({"client_secret":"open)"), R"({"client_secret":"open)");
}

TEST(RedactorTest, Truncate) {
    EXPECT_EQ(Redactor::truncate("short", 10), "short");
    EXPECT_EQ(Redactor::truncate("abcdefgh", 3), "abc... (truncated)");
}
