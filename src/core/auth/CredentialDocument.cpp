/**
 * CredentialDocument.cpp
 */

#include "CredentialDocument.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace keyrotor::core::auth {

using utils::JsonUtils;

namespace {

constexpr const char* OAUTH_KEY = "claudeAiOauth";

bool hasValidFieldTypes(const json& oauth) {
    return JsonUtils::isAbsentOr(oauth, "accessToken", json::value_t::string) &&
           JsonUtils::isAbsentOr(oauth, "refreshToken", json::value_t::string) &&
           JsonUtils::isAbsentOr(oauth, "email", json::value_t::string) &&
           JsonUtils::isAbsentOr(oauth, "emailAddress", json::value_t::string) &&
           JsonUtils::isAbsentOr(oauth, "expiresAt", json::value_t::number_integer) &&
           JsonUtils::isAbsentOr(oauth, "scopes", json::value_t::array);
}

} // namespace

std::optional<CredentialDocument> normalizeCredentialDocument(const json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }

    if (!JsonUtils::isAbsentOr(data, "email", json::value_t::string)) {
        return std::nullopt;
    }

    CredentialDocument doc;

    if (data.contains(OAUTH_KEY)) {
        const json& oauth = data[OAUTH_KEY];
        if (!oauth.is_object() || !hasValidFieldTypes(oauth)) {
            return std::nullopt;
        }

        doc.accessToken = JsonUtils::optString(oauth, "accessToken");
        doc.refreshToken = JsonUtils::optString(oauth, "refreshToken");
        doc.expiresAt = JsonUtils::optLong(oauth, "expiresAt");
        doc.scopes = JsonUtils::optStringArray(oauth, "scopes");
        doc.subscriptionType = JsonUtils::optString(oauth, "subscriptionType");
        doc.rateLimitTier = JsonUtils::optString(oauth, "rateLimitTier");

        doc.email = JsonUtils::optString(oauth, "email");
        if (!doc.email) doc.email = JsonUtils::optString(oauth, "emailAddress");
    }

    if (!doc.email) {
        doc.email = JsonUtils::optString(data, "email");
    }

    // A zero timestamp carries no information
    if (doc.expiresAt && *doc.expiresAt <= 0) {
        doc.expiresAt.reset();
    }

    return doc;
}

FullOAuthCredentials parseCredentialText(const std::string& text, const std::string& source) {
    FullOAuthCredentials result;

    if (utils::StringUtils::isBlank(text)) {
        result.errorKind = CredentialErrorKind::NotFound;
        return result;
    }

    auto parsed = JsonUtils::parse(text);
    if (!parsed) {
        Logger::instance().warn("Failed to parse credential JSON for {}", source);
        result.errorKind = CredentialErrorKind::MalformedData;
        return result;
    }

    auto doc = normalizeCredentialDocument(*parsed);
    if (!doc) {
        Logger::instance().warn("Invalid credential data structure for {}", source);
        result.errorKind = CredentialErrorKind::MalformedData;
        return result;
    }

    result.token = doc->accessToken;
    result.email = doc->email;
    result.refreshToken = doc->refreshToken;
    result.expiresAt = doc->expiresAt;
    result.scopes = doc->scopes;
    result.subscriptionType = doc->subscriptionType;
    result.rateLimitTier = doc->rateLimitTier;

    if (result.token && !isValidTokenFormat(*result.token)) {
        Logger::instance().warn("Invalid token format for {}", source);
        result.token.reset();
        result.errorKind = CredentialErrorKind::MalformedData;
    } else if (!result.token) {
        result.errorKind = CredentialErrorKind::NotFound;
    }

    return result;
}

json serializeCredentialDocument(const TokenUpdate& update, const FullOAuthCredentials& existing) {
    json oauth = {
        {"accessToken", update.accessToken},
        {"refreshToken", update.refreshToken},
        {"expiresAt", update.expiresAt}
    };

    if (update.scopes) {
        oauth["scopes"] = *update.scopes;
    } else if (existing.scopes) {
        oauth["scopes"] = *existing.scopes;
    } else {
        oauth["scopes"] = json::array();
    }

    if (existing.email) {
        oauth["email"] = *existing.email;
        oauth["emailAddress"] = *existing.email;
    }
    if (existing.subscriptionType) {
        oauth["subscriptionType"] = *existing.subscriptionType;
    }
    if (existing.rateLimitTier) {
        oauth["rateLimitTier"] = *existing.rateLimitTier;
    }

    json document = {{OAUTH_KEY, oauth}};
    if (existing.email) {
        document["email"] = *existing.email;
    }
    return document;
}

bool isValidTokenFormat(const std::string& token) {
    return utils::StringUtils::startsWith(token, TOKEN_PREFIX);
}

std::string tokenFingerprint(const std::optional<std::string>& token) {
    if (!token || token->empty()) return "null";
    const std::string& t = *token;
    if (t.size() <= 16) {
        return t.substr(0, 4) + "..." + t.substr(t.size() >= 2 ? t.size() - 2 : 0);
    }
    return t.substr(0, 8) + "..." + t.substr(t.size() - 4);
}

} // namespace keyrotor::core::auth
