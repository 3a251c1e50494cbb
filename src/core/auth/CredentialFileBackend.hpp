#pragma once

/**
 * CredentialFileBackend.hpp
 *
 * Plain JSON document at <configDir>/.credentials.json, owner-only.
 */

#include "CredentialBackend.hpp"

namespace keyrotor::core::auth {

class CredentialFileBackend : public CredentialBackend {
public:
    std::string name() const override { return "file"; }

    FullOAuthCredentials read(const std::string& configDir) override;

    /**
     * Writes with mode 0600, creating missing directories with mode 0700
     */
    UpdateResult write(const std::string& configDir, const std::string& document) override;
};

} // namespace keyrotor::core::auth
