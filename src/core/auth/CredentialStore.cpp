/**
 * CredentialStore.cpp
 */

#include "CredentialStore.hpp"
#include "CredentialDocument.hpp"
#include "CredentialFileBackend.hpp"
#include "CredentialLocator.hpp"
#include "KeychainBackend.hpp"
#include "SecretServiceBackend.hpp"
#include "WindowsCredentialBackend.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

namespace keyrotor::core::auth {

using utils::OS;

CredentialStoreOptions CredentialStoreOptions::fromConfig(const Config& config) {
    CredentialStoreOptions options;
    options.cacheTtl = std::chrono::seconds(config.get<int64_t>("credentials.cacheTtlSeconds", 300));
    options.errorCacheTtl = std::chrono::seconds(config.get<int64_t>("credentials.errorCacheTtlSeconds", 10));
    options.macosTimeout = Milliseconds(config.get<int64_t>("credentials.macosTimeoutMs", 5000));
    options.linuxTimeout = Milliseconds(config.get<int64_t>("credentials.linuxTimeoutMs", 5000));
    options.windowsTimeout = Milliseconds(config.get<int64_t>("credentials.windowsTimeoutMs", 10000));
    return options;
}

CredentialStore::CredentialStore(utils::ProcessRunner& runner,
                                 const Clock& clock,
                                 CredentialStoreOptions options,
                                 OS os,
                                 ExecutableResolver resolver)
    : m_os(os)
    , m_cache(clock, options.cacheTtl, options.errorCacheTtl)
    , m_keychain(std::make_unique<KeychainBackend>(runner, resolver, options.macosTimeout))
    , m_secretService(std::make_unique<SecretServiceBackend>(runner, resolver, options.linuxTimeout))
    , m_file(std::make_unique<CredentialFileBackend>())
    , m_credentialManager(std::make_unique<WindowsCredentialBackend>(runner, resolver, options.windowsTimeout)) {
}

CredentialStore::~CredentialStore() = default;

std::string CredentialStore::cacheKey(const std::string& configDir) const {
    switch (m_os) {
        case OS::macOS:
            return "macos:" + CredentialLocator::keychainServiceName(configDir);
        case OS::Windows:
            return "windows:" + CredentialLocator::keychainServiceName(configDir);
        default:
            return "linux:" + CredentialLocator::credentialsFilePath(configDir).string();
    }
}

// -- Reads --

PlatformCredentials CredentialStore::getCredentials(const std::string& configDir, bool forceRefresh) {
    return getFullCredentials(configDir, forceRefresh).basic();
}

FullOAuthCredentials CredentialStore::getFullCredentials(const std::string& configDir, bool forceRefresh) {
    std::string key = cacheKey(configDir);

    if (!forceRefresh) {
        if (auto cached = m_cache.get(key)) {
            return *cached;
        }
    }

    FullOAuthCredentials credentials = readFromPlatform(configDir);

    Logger::instance().debug("Credentials for {}: token={}, email={}{}",
                             key,
                             tokenFingerprint(credentials.token),
                             credentials.email.value_or("null"),
                             credentials.hasError() ? ", error=" + *credentials.error : "");

    m_cache.put(key, credentials);
    return credentials;
}

FullOAuthCredentials CredentialStore::readFromPlatform(const std::string& configDir) {
    switch (m_os) {
        case OS::macOS:
            return m_keychain->read(configDir);
        case OS::Windows:
            return readWindows(configDir);
        case OS::Linux:
            return readLinux(configDir);
        default:
            return m_file->read(configDir);
    }
}

FullOAuthCredentials CredentialStore::readLinux(const std::string& configDir) {
    FullOAuthCredentials fromSecretService = m_secretService->read(configDir);
    if (fromSecretService.hasToken()) {
        return fromSecretService;
    }

    FullOAuthCredentials fromFile = m_file->read(configDir);
    if (fromFile.hasToken()) {
        return fromFile;
    }

    // A locked keyring is more useful to report than an absent file
    if (fromSecretService.hasError() && fromFile.errorKind == CredentialErrorKind::NotFound) {
        return fromSecretService;
    }
    return fromFile;
}

FullOAuthCredentials CredentialStore::readWindows(const std::string& configDir) {
    FullOAuthCredentials fromFile = m_file->read(configDir);
    FullOAuthCredentials fromManager = m_credentialManager->read(configDir);

    if (fromFile.hasToken()) {
        if (fromManager.hasToken() && *fromManager.token != *fromFile.token) {
            Logger::instance().debug("Credentials file and Credential Manager disagree, using file");
        }
        return fromFile;
    }
    if (fromManager.hasToken()) {
        return fromManager;
    }
    return fromFile;
}

// -- Writes --

UpdateResult CredentialStore::updateCredentials(const std::string& configDir, const TokenUpdate& update) {
    if (update.accessToken.empty()) {
        return UpdateResult::failure(CredentialErrorKind::MalformedData, "Missing access token");
    }

    FullOAuthCredentials existing = getFullCredentials(configDir, true);
    std::string document = serializeCredentialDocument(update, existing).dump();

    UpdateResult result = writeToPlatform(configDir, document);
    clearCache(configDir);

    if (result.success) {
        Logger::instance().info("Stored refreshed credentials for {} (token={})",
                                cacheKey(configDir), tokenFingerprint(update.accessToken));
    } else {
        Logger::instance().error("Failed to store credentials for {}: {}",
                                 cacheKey(configDir), result.error.value_or("unknown error"));
    }
    return result;
}

UpdateResult CredentialStore::writeToPlatform(const std::string& configDir, const std::string& document) {
    switch (m_os) {
        case OS::macOS:
            return m_keychain->write(configDir, document);
        case OS::Windows:
            return writeWindows(configDir, document);
        case OS::Linux:
            return writeLinux(configDir, document);
        default:
            return m_file->write(configDir, document);
    }
}

UpdateResult CredentialStore::writeLinux(const std::string& configDir, const std::string& document) {
    UpdateResult stored = m_secretService->write(configDir, document);
    if (stored.success) {
        return stored;
    }

    Logger::instance().debug("Secret Service write unavailable ({}), using credentials file",
                             stored.error.value_or(toString(stored.errorKind)));
    return m_file->write(configDir, document);
}

UpdateResult CredentialStore::writeWindows(const std::string& configDir, const std::string& document) {
    UpdateResult fileResult = m_file->write(configDir, document);
    if (!fileResult.success) {
        return fileResult;
    }

    UpdateResult managerResult = m_credentialManager->write(configDir, document);
    if (!managerResult.success) {
        Logger::instance().warn("Credential Manager not updated, credentials file is current: {}",
                                managerResult.error.value_or("unknown error"));
    }
    return fileResult;
}

// -- Cache --

void CredentialStore::clearCache() {
    m_cache.clear();
}

void CredentialStore::clearCache(const std::string& configDir) {
    m_cache.erase(cacheKey(configDir));
}

} // namespace keyrotor::core::auth
