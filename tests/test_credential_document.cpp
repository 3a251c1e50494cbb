#include <gtest/gtest.h>
#include "core/auth/CredentialDocument.hpp"

using namespace keyrotor::core::auth;

TEST(CredentialDocumentTest, ParsesFullDocument) {
    auto creds = parseCredentialText(R"({
        "claudeAiOauth": {
            "accessToken": "sk-ant-oat01-abcdef",
            "refreshToken": "sk-ant-ort01-zyx",
            "expiresAt": 1700000000000,
            "scopes": ["user:inference", "user:profile"],
            "email": "dev@example.com",
            "subscriptionType": "max",
            "rateLimitTier": "default_claude_max_20x"
        }
    })", "test");

    ASSERT_TRUE(creds.hasToken());
    EXPECT_EQ(*creds.token, "sk-ant-oat01-abcdef");
    EXPECT_EQ(*creds.refreshToken, "sk-ant-ort01-zyx");
    EXPECT_EQ(*creds.expiresAt, 1700000000000);
    ASSERT_TRUE(creds.scopes.has_value());
    EXPECT_EQ(creds.scopes->size(), 2u);
    EXPECT_EQ(*creds.email, "dev@example.com");
    EXPECT_EQ(*creds.subscriptionType, "max");
    EXPECT_EQ(*creds.rateLimitTier, "default_claude_max_20x");
    EXPECT_FALSE(creds.hasError());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::None);
}

TEST(CredentialDocumentTest, EmptyTextIsNotFound) {
    auto creds = parseCredentialText("  \n", "test");
    EXPECT_FALSE(creds.hasToken());
    EXPECT_FALSE(creds.hasError());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::NotFound);
}

TEST(CredentialDocumentTest, InvalidJsonIsMalformedWithoutError) {
    auto creds = parseCredentialText("{not json", "test");
    EXPECT_FALSE(creds.hasToken());
    EXPECT_FALSE(creds.hasError());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::MalformedData);
}

TEST(CredentialDocumentTest, WrongFieldTypesAreMalformed) {
    EXPECT_EQ(parseCredentialText(R"({"claudeAiOauth": "token"})", "t").errorKind,
              CredentialErrorKind::MalformedData);
    EXPECT_EQ(parseCredentialText(R"({"claudeAiOauth": {"accessToken": 42}})", "t").errorKind,
              CredentialErrorKind::MalformedData);
    EXPECT_EQ(parseCredentialText(R"({"claudeAiOauth": {"expiresAt": "soon"}})", "t").errorKind,
              CredentialErrorKind::MalformedData);
    EXPECT_EQ(parseCredentialText(R"({"claudeAiOauth": {"scopes": "a b"}})", "t").errorKind,
              CredentialErrorKind::MalformedData);
    EXPECT_EQ(parseCredentialText(R"({"email": 7})", "t").errorKind,
              CredentialErrorKind::MalformedData);
    EXPECT_EQ(parseCredentialText("[1, 2]", "t").errorKind,
              CredentialErrorKind::MalformedData);
}

TEST(CredentialDocumentTest, EmailFallbacks) {
    auto legacy = parseCredentialText(
        R"({"claudeAiOauth": {"accessToken": "sk-ant-x", "emailAddress": "old@example.com"}})", "t");
    EXPECT_EQ(legacy.email.value_or(""), "old@example.com");

    auto topLevel = parseCredentialText(
        R"({"claudeAiOauth": {"accessToken": "sk-ant-x"}, "email": "top@example.com"})", "t");
    EXPECT_EQ(topLevel.email.value_or(""), "top@example.com");

    auto preferred = parseCredentialText(
        R"({"claudeAiOauth": {"accessToken": "sk-ant-x", "email": "a@example.com",
            "emailAddress": "b@example.com"}, "email": "c@example.com"})", "t");
    EXPECT_EQ(preferred.email.value_or(""), "a@example.com");
}

TEST(CredentialDocumentTest, RejectsTokenWithoutProviderPrefix) {
    auto creds = parseCredentialText(
        R"({"claudeAiOauth": {"accessToken": "ghp_notours", "email": "dev@example.com"}})", "t");
    EXPECT_FALSE(creds.hasToken());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::MalformedData);
    EXPECT_EQ(creds.email.value_or(""), "dev@example.com");
}

TEST(CredentialDocumentTest, MissingTokenIsNotFound) {
    auto creds = parseCredentialText(R"({"email": "dev@example.com"})", "t");
    EXPECT_FALSE(creds.hasToken());
    EXPECT_EQ(creds.errorKind, CredentialErrorKind::NotFound);
    EXPECT_EQ(creds.email.value_or(""), "dev@example.com");
}

TEST(CredentialDocumentTest, NonPositiveExpiryIsDropped) {
    auto creds = parseCredentialText(
        R"({"claudeAiOauth": {"accessToken": "sk-ant-x", "expiresAt": 0}})", "t");
    EXPECT_TRUE(creds.hasToken());
    EXPECT_FALSE(creds.expiresAt.has_value());
}

TEST(CredentialDocumentTest, SerializeCarriesIdentityFromExisting) {
    FullOAuthCredentials existing;
    existing.email = "dev@example.com";
    existing.subscriptionType = "pro";
    existing.rateLimitTier = "tier-1";
    existing.scopes = std::vector<std::string>{"user:inference"};

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.refreshToken = "sk-ant-rt";
    update.expiresAt = 1234;

    json doc = serializeCredentialDocument(update, existing);
    const json& oauth = doc["claudeAiOauth"];

    EXPECT_EQ(oauth["accessToken"], "sk-ant-new");
    EXPECT_EQ(oauth["refreshToken"], "sk-ant-rt");
    EXPECT_EQ(oauth["expiresAt"], 1234);
    EXPECT_EQ(oauth["scopes"], json::array({"user:inference"}));
    EXPECT_EQ(oauth["email"], "dev@example.com");
    EXPECT_EQ(oauth["emailAddress"], "dev@example.com");
    EXPECT_EQ(oauth["subscriptionType"], "pro");
    EXPECT_EQ(oauth["rateLimitTier"], "tier-1");
    EXPECT_EQ(doc["email"], "dev@example.com");
}

TEST(CredentialDocumentTest, SerializeScopePrecedence) {
    FullOAuthCredentials existing;
    existing.scopes = std::vector<std::string>{"old"};

    TokenUpdate update;
    update.accessToken = "sk-ant-new";
    update.scopes = std::vector<std::string>{"new"};
    EXPECT_EQ(serializeCredentialDocument(update, existing)["claudeAiOauth"]["scopes"], json::array({"new"}));

    update.scopes.reset();
    EXPECT_EQ(serializeCredentialDocument(update, existing)["claudeAiOauth"]["scopes"], json::array({"old"}));

    json bare = serializeCredentialDocument(update, FullOAuthCredentials{});
    EXPECT_TRUE(bare["claudeAiOauth"]["scopes"].is_array());
    EXPECT_TRUE(bare["claudeAiOauth"]["scopes"].empty());
    EXPECT_FALSE(bare["claudeAiOauth"].contains("email"));
    EXPECT_FALSE(bare.contains("email"));
}

TEST(CredentialDocumentTest, TokenFingerprint) {
    EXPECT_EQ(tokenFingerprint(std::nullopt), "null");
    EXPECT_EQ(tokenFingerprint(std::string()), "null");
    EXPECT_EQ(tokenFingerprint(std::string("sk-ant-abc123")), "sk-a...23");
    EXPECT_EQ(tokenFingerprint(std::string("sk-ant-REDACTED")), "sk-ant-o...wxyz");
}

TEST(CredentialDocumentTest, TokenFormat) {
    EXPECT_TRUE(isValidTokenFormat("sk-ant-oat01-x"));
    EXPECT_FALSE(isValidTokenFormat("sk-other"));
    EXPECT_FALSE(isValidTokenFormat(""));
}
