#pragma once

/**
 * CredentialDocument.hpp
 *
 * Schema of the stored OAuth credential JSON and its legacy variants:
 *
 *   {"claudeAiOauth": {"accessToken", "refreshToken", "expiresAt", "scopes",
 *                      "email" | "emailAddress", "subscriptionType", "rateLimitTier"},
 *    "email": ...}
 *
 * Older writers put the email under emailAddress or only at the top level.
 */

#include "Credentials.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace keyrotor::core::auth {

using json = nlohmann::json;

/**
 * Normalized credential document (all fields optional)
 */
struct CredentialDocument {
    std::optional<std::string> accessToken;
    std::optional<std::string> refreshToken;
    std::optional<int64_t> expiresAt;
    std::optional<std::vector<std::string>> scopes;
    std::optional<std::string> email;
    std::optional<std::string> subscriptionType;
    std::optional<std::string> rateLimitTier;
};

/**
 * Token prefix issued by the provider
 */
inline constexpr const char* TOKEN_PREFIX = "sk-ant-";

/**
 * Validate a parsed document and fold legacy shapes into CredentialDocument
 * @param data Parsed JSON
 * @return Normalized document, nullopt if the shape is not acceptable
 */
std::optional<CredentialDocument> normalizeCredentialDocument(const json& data);

/**
 * Parse raw helper output or file content into credentials.
 * Empty input means "not found"; malformed input is logged and yields empty
 * credentials tagged MalformedData. Never throws.
 *
 * @param text Raw JSON text
 * @param source Location label for log messages
 */
FullOAuthCredentials parseCredentialText(const std::string& text, const std::string& source);

/**
 * Build the document to store after a refresh. Identity and plan fields
 * (email, subscriptionType, rateLimitTier) are carried over from existing.
 * Scopes: update's, else existing's, else [].
 */
json serializeCredentialDocument(const TokenUpdate& update, const FullOAuthCredentials& existing);

bool isValidTokenFormat(const std::string& token);

/**
 * Log-safe token fingerprint: "sk-ant-o...wxyz", "null" when absent
 */
std::string tokenFingerprint(const std::optional<std::string>& token);

} // namespace keyrotor::core::auth
