/**
 * CredentialFileBackend.cpp
 */

#include "CredentialFileBackend.hpp"
#include "CredentialDocument.hpp"
#include "CredentialLocator.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

namespace keyrotor::core::auth {

using utils::FileUtils;

FullOAuthCredentials CredentialFileBackend::read(const std::string& configDir) {
    auto path = CredentialLocator::credentialsFilePath(configDir);
    if (!CredentialLocator::isValidCredentialsPath(path)) {
        Logger::instance().error("Refusing to read credentials from invalid path {}", path.string());
        return FullOAuthCredentials::failure(CredentialErrorKind::MalformedData,
                                             "Invalid credentials path");
    }

    if (!FileUtils::fileExists(path)) {
        FullOAuthCredentials notFound;
        notFound.errorKind = CredentialErrorKind::NotFound;
        return notFound;
    }

    auto content = FileUtils::readFile(path);
    if (!content) {
        Logger::instance().warn("Cannot read credentials file {}", path.string());
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Failed to read credentials file");
    }

    return parseCredentialText(*content, "file:" + path.string());
}

UpdateResult CredentialFileBackend::write(const std::string& configDir, const std::string& document) {
    auto path = CredentialLocator::credentialsFilePath(configDir);
    if (!CredentialLocator::isValidCredentialsPath(path)) {
        return UpdateResult::failure(CredentialErrorKind::MalformedData, "Invalid credentials path");
    }

    std::string error;
    if (!FileUtils::createPrivateDirectories(path.parent_path(), &error)) {
        Logger::instance().error("Cannot create {}: {}", path.parent_path().string(), error);
        return UpdateResult::failure(CredentialErrorKind::PersistenceFailure,
                                     "Failed to create credentials directory: " + error);
    }

    if (!FileUtils::writeFileSecure(path, document, &error)) {
        Logger::instance().error("Cannot write {}: {}", path.string(), error);
        return UpdateResult::failure(CredentialErrorKind::PersistenceFailure,
                                     "Failed to write credentials file: " + error);
    }

    return UpdateResult::ok();
}

} // namespace keyrotor::core::auth
