#pragma once

/**
 * SecretServiceBackend.hpp
 *
 * Linux Secret Service (GNOME Keyring, KWallet) through the secret-tool CLI.
 * Items are keyed by the "application" attribute.
 */

#include "CredentialBackend.hpp"
#include "../Clock.hpp"
#include "../../utils/ProcessRunner.hpp"

namespace keyrotor::core::auth {

class SecretServiceBackend : public CredentialBackend {
public:
    SecretServiceBackend(utils::ProcessRunner& runner, ExecutableResolver resolver,
                         Milliseconds timeout = Milliseconds(5000));

    std::string name() const override { return "secret-service"; }

    FullOAuthCredentials read(const std::string& configDir) override;
    UpdateResult write(const std::string& configDir, const std::string& document) override;

private:
    utils::ProcessRunner& m_runner;
    ExecutableResolver m_resolver;
    Milliseconds m_timeout;
};

} // namespace keyrotor::core::auth
