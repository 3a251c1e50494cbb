/**
 * KeychainBackend.cpp
 */

#include "KeychainBackend.hpp"
#include "CredentialDocument.hpp"
#include "CredentialLocator.hpp"
#include "../Logger.hpp"
#include "../../utils/PlatformUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace keyrotor::core::auth {

using utils::ProcessRequest;
using utils::ProcessResult;
using utils::StringUtils;

KeychainBackend::KeychainBackend(utils::ProcessRunner& runner, ExecutableResolver resolver,
                                 Milliseconds timeout)
    : m_runner(runner)
    , m_resolver(std::move(resolver))
    , m_timeout(timeout) {
}

FullOAuthCredentials KeychainBackend::read(const std::string& configDir) {
    std::string service = CredentialLocator::keychainServiceName(configDir);
    if (!CredentialLocator::isValidTargetName(service)) {
        Logger::instance().error("Refusing keychain lookup for invalid service name");
        return FullOAuthCredentials::failure(CredentialErrorKind::MalformedData,
                                             "Invalid keychain service name");
    }

    auto security = m_resolver("security");
    if (!security) {
        Logger::instance().debug("security executable not found, keychain unavailable");
        FullOAuthCredentials result;
        result.errorKind = CredentialErrorKind::ToolMissing;
        return result;
    }

    ProcessRequest request;
    request.program = security->string();
    request.args = {"find-generic-password", "-s", service, "-w"};
    request.timeout = m_timeout;

    ProcessResult result = m_runner.run(request);

    if (result.timedOut) {
        Logger::instance().warn("Keychain lookup for {} timed out", service);
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Keychain access timed out");
    }
    if (!result.launched) {
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Failed to run security: " + result.error);
    }
    if (result.exitCode == EXIT_ITEM_NOT_FOUND) {
        FullOAuthCredentials notFound;
        notFound.errorKind = CredentialErrorKind::NotFound;
        return notFound;
    }
    if (result.exitCode != 0) {
        std::string detail = StringUtils::trim(result.stderrText);
        Logger::instance().warn("Keychain lookup for {} failed ({}): {}", service, result.exitCode, detail);
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Keychain access failed: " + detail);
    }

    return parseCredentialText(StringUtils::trim(result.stdoutText), "keychain:" + service);
}

UpdateResult KeychainBackend::write(const std::string& configDir, const std::string& document) {
    std::string service = CredentialLocator::keychainServiceName(configDir);
    if (!CredentialLocator::isValidTargetName(service)) {
        return UpdateResult::failure(CredentialErrorKind::MalformedData, "Invalid keychain service name");
    }

    auto security = m_resolver("security");
    if (!security) {
        return UpdateResult::failure(CredentialErrorKind::ToolMissing, "security executable not found");
    }

    // No existing item is the common case, so the delete result is not checked
    ProcessRequest removal;
    removal.program = security->string();
    removal.args = {"delete-generic-password", "-s", service};
    removal.timeout = m_timeout;
    m_runner.run(removal);

    ProcessRequest add;
    add.program = security->string();
    add.args = {"add-generic-password", "-s", service,
                "-a", utils::PlatformUtils::getUsername(), "-w", document};
    add.timeout = m_timeout;

    ProcessResult result = m_runner.run(add);
    if (result.timedOut) {
        return UpdateResult::failure(CredentialErrorKind::AccessDenied, "Keychain update timed out");
    }
    if (!result.succeeded()) {
        std::string detail = result.launched ? StringUtils::trim(result.stderrText) : result.error;
        Logger::instance().error("Keychain update for {} failed: {}", service, detail);
        return UpdateResult::failure(CredentialErrorKind::AccessDenied, "Keychain update failed: " + detail);
    }

    return UpdateResult::ok();
}

} // namespace keyrotor::core::auth
