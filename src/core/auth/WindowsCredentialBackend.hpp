#pragma once

/**
 * WindowsCredentialBackend.hpp
 *
 * Windows Credential Manager generic credentials, accessed through
 * advapi32 CredRead/CredWrite from a PowerShell helper.
 */

#include "CredentialBackend.hpp"
#include "../Clock.hpp"
#include "../../utils/ProcessRunner.hpp"

namespace keyrotor::core::auth {

class WindowsCredentialBackend : public CredentialBackend {
public:
    WindowsCredentialBackend(utils::ProcessRunner& runner, ExecutableResolver resolver,
                             Milliseconds timeout = Milliseconds(10000));

    std::string name() const override { return "credential-manager"; }

    FullOAuthCredentials read(const std::string& configDir) override;
    UpdateResult write(const std::string& configDir, const std::string& document) override;

    /**
     * Script printing the credential blob for target, or an empty line
     */
    static std::string buildReadScript(const std::string& target);

    /**
     * Script storing a base64-encoded document and printing SUCCESS
     */
    static std::string buildWriteScript(const std::string& target, const std::string& base64Document);

private:
    utils::ProcessResult runScript(const std::string& program, const std::string& script);

    utils::ProcessRunner& m_runner;
    ExecutableResolver m_resolver;
    Milliseconds m_timeout;
};

} // namespace keyrotor::core::auth
