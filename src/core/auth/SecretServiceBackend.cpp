/**
 * SecretServiceBackend.cpp
 */

#include "SecretServiceBackend.hpp"
#include "CredentialDocument.hpp"
#include "CredentialLocator.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

namespace keyrotor::core::auth {

using utils::ProcessRequest;
using utils::ProcessResult;
using utils::StringUtils;

SecretServiceBackend::SecretServiceBackend(utils::ProcessRunner& runner, ExecutableResolver resolver,
                                           Milliseconds timeout)
    : m_runner(runner)
    , m_resolver(std::move(resolver))
    , m_timeout(timeout) {
}

FullOAuthCredentials SecretServiceBackend::read(const std::string& configDir) {
    auto secretTool = m_resolver("secret-tool");
    if (!secretTool) {
        Logger::instance().debug("secret-tool not installed");
        FullOAuthCredentials result;
        result.errorKind = CredentialErrorKind::ToolMissing;
        return result;
    }

    std::string attribute = CredentialLocator::secretServiceAttribute(configDir);

    ProcessRequest request;
    request.program = secretTool->string();
    request.args = {"lookup", "application", attribute};
    request.timeout = m_timeout;

    ProcessResult result = m_runner.run(request);

    if (result.timedOut) {
        Logger::instance().warn("Secret Service lookup for {} timed out", attribute);
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Secret Service access timed out");
    }
    if (!result.launched) {
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Failed to run secret-tool: " + result.error);
    }
    if (result.exitCode != 0) {
        // secret-tool exits non-zero silently when nothing matches
        std::string detail = StringUtils::trim(result.stderrText);
        if (detail.empty()) {
            FullOAuthCredentials notFound;
            notFound.errorKind = CredentialErrorKind::NotFound;
            return notFound;
        }
        Logger::instance().warn("Secret Service lookup for {} failed: {}", attribute, detail);
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Secret Service access failed: " + detail);
    }

    return parseCredentialText(StringUtils::trim(result.stdoutText), "secret-service:" + attribute);
}

UpdateResult SecretServiceBackend::write(const std::string& configDir, const std::string& document) {
    auto secretTool = m_resolver("secret-tool");
    if (!secretTool) {
        return UpdateResult::failure(CredentialErrorKind::ToolMissing, "secret-tool not installed");
    }

    std::string attribute = CredentialLocator::secretServiceAttribute(configDir);

    // The secret is read from stdin so it never appears in the process list
    ProcessRequest request;
    request.program = secretTool->string();
    request.args = {"store", "--label=" + CredentialLocator::keychainServiceName(configDir),
                    "application", attribute};
    request.stdinData = document;
    request.timeout = m_timeout;

    ProcessResult result = m_runner.run(request);
    if (result.timedOut) {
        return UpdateResult::failure(CredentialErrorKind::AccessDenied, "Secret Service store timed out");
    }
    if (!result.succeeded()) {
        std::string detail = result.launched ? StringUtils::trim(result.stderrText) : result.error;
        Logger::instance().warn("Secret Service store for {} failed: {}", attribute, detail);
        return UpdateResult::failure(CredentialErrorKind::AccessDenied,
                                     "Secret Service store failed: " + detail);
    }

    return UpdateResult::ok();
}

} // namespace keyrotor::core::auth
