#pragma once

/**
 * CredentialStore.hpp
 *
 * Reads and writes OAuth credentials in the platform's secret store:
 * - macOS: login keychain
 * - Linux: Secret Service, falling back to ~/.claude/.credentials.json
 * - Windows: credentials file plus Credential Manager, file preferred
 *
 * Results are cached per storage location.
 */

#include "CredentialBackend.hpp"
#include "CredentialCache.hpp"
#include "Credentials.hpp"
#include "../Clock.hpp"
#include "../../utils/PlatformUtils.hpp"
#include "../../utils/ProcessRunner.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace keyrotor::core {
class Config;
}

namespace keyrotor::core::auth {

class CredentialFileBackend;
class KeychainBackend;
class SecretServiceBackend;
class WindowsCredentialBackend;

struct CredentialStoreOptions {
    std::chrono::seconds cacheTtl{300};
    std::chrono::seconds errorCacheTtl{10};
    Milliseconds macosTimeout{5000};
    Milliseconds linuxTimeout{5000};
    Milliseconds windowsTimeout{10000};

    /**
     * Read the "credentials" section
     */
    static CredentialStoreOptions fromConfig(const Config& config);
};

class CredentialStore {
public:
    /**
     * @param runner Executes platform helpers
     * @param clock Time source for cache ages
     * @param options TTLs and helper timeouts
     * @param os Platform whose storage rules apply
     * @param resolver Locates helper executables
     */
    CredentialStore(utils::ProcessRunner& runner,
                    const Clock& clock,
                    CredentialStoreOptions options = {},
                    utils::OS os = utils::PlatformUtils::getOS(),
                    ExecutableResolver resolver = defaultExecutableResolver());
    ~CredentialStore();

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    /**
     * Token and email for an account
     * @param configDir Account config directory, empty for the default profile
     * @param forceRefresh Bypass the cache
     */
    PlatformCredentials getCredentials(const std::string& configDir, bool forceRefresh = false);

    /**
     * Everything needed to refresh the account's token
     */
    FullOAuthCredentials getFullCredentials(const std::string& configDir, bool forceRefresh = false);

    /**
     * Store a new token pair. email, subscriptionType and rateLimitTier are
     * carried over from the stored document. The account's cache entry is
     * dropped whatever the outcome.
     */
    UpdateResult updateCredentials(const std::string& configDir, const TokenUpdate& update);

    void clearCache();
    void clearCache(const std::string& configDir);

    /**
     * Cache key for an account: "macos:{service}", "linux:{path}", "windows:{target}"
     */
    std::string cacheKey(const std::string& configDir) const;

    utils::OS platform() const { return m_os; }

private:
    FullOAuthCredentials readFromPlatform(const std::string& configDir);
    FullOAuthCredentials readLinux(const std::string& configDir);
    FullOAuthCredentials readWindows(const std::string& configDir);

    UpdateResult writeToPlatform(const std::string& configDir, const std::string& document);
    UpdateResult writeLinux(const std::string& configDir, const std::string& document);
    UpdateResult writeWindows(const std::string& configDir, const std::string& document);

    utils::OS m_os;
    CredentialCache m_cache;

    std::unique_ptr<KeychainBackend> m_keychain;
    std::unique_ptr<SecretServiceBackend> m_secretService;
    std::unique_ptr<CredentialFileBackend> m_file;
    std::unique_ptr<WindowsCredentialBackend> m_credentialManager;
};

} // namespace keyrotor::core::auth
