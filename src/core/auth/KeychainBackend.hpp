#pragma once

/**
 * KeychainBackend.hpp
 *
 * macOS login keychain, driven through /usr/bin/security generic-password
 * commands.
 */

#include "CredentialBackend.hpp"
#include "../Clock.hpp"
#include "../../utils/ProcessRunner.hpp"

namespace keyrotor::core::auth {

class KeychainBackend : public CredentialBackend {
public:
    /** security exits with this code when no item matches */
    static constexpr int EXIT_ITEM_NOT_FOUND = 44;

    KeychainBackend(utils::ProcessRunner& runner, ExecutableResolver resolver,
                    Milliseconds timeout = Milliseconds(5000));

    std::string name() const override { return "keychain"; }

    FullOAuthCredentials read(const std::string& configDir) override;

    /**
     * Delete any existing item for the service, then add the new one under
     * the current OS user
     */
    UpdateResult write(const std::string& configDir, const std::string& document) override;

private:
    utils::ProcessRunner& m_runner;
    ExecutableResolver m_resolver;
    Milliseconds m_timeout;
};

} // namespace keyrotor::core::auth
