#pragma once

/**
 * Application.hpp
 *
 * Owns the rotation engine's services and their lifecycle.
 * Services are built from Config on initialize() and handed out by reference.
 */

#include "Clock.hpp"
#include "../models/Account.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace keyrotor::utils {
class HttpClient;
class ProcessRunner;
}

namespace keyrotor::core::auth {
class CredentialStore;
class TokenRefresher;
}

namespace keyrotor::core::rotation {
class OperationRegistry;
class ProfileScorer;
class SwapCoordinator;
struct AutoSwitchSettings;
}

namespace keyrotor::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

class Application {
public:
    using ActivateHandler = std::function<bool(const models::Account& account)>;

    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Build all services from the current configuration
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Drop cached credentials, listeners and tracked operations
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }
    bool isRunning() const { return m_state.load() == AppState::Ready; }

    auth::CredentialStore& credentialStore() { return *m_credentialStore; }
    auth::TokenRefresher& tokenRefresher() { return *m_tokenRefresher; }
    rotation::OperationRegistry& operationRegistry() { return *m_operationRegistry; }
    rotation::ProfileScorer& profileScorer() { return *m_profileScorer; }
    rotation::SwapCoordinator& swapCoordinator() { return *m_swapCoordinator; }

    rotation::AutoSwitchSettings autoSwitchSettings() const;
    std::vector<std::string> priorityOrder() const;

    /**
     * Called by proactive swaps to make the chosen account active
     */
    void setActivateHandler(ActivateHandler handler);

    void onStateChange(std::function<void(AppState)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "KeyRotor"; }

    /**
     * <appdata>/KeyRotor
     */
    static std::filesystem::path getDataDirectory();
    static std::filesystem::path getConfigPath();

private:
    void setState(AppState state);
    bool activate(const models::Account& account);

    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    std::mutex m_activateMutex;
    ActivateHandler m_activateHandler;

    SystemClock m_clock;
    std::unique_ptr<utils::ProcessRunner> m_processRunner;
    std::unique_ptr<utils::HttpClient> m_httpClient;

    std::unique_ptr<auth::CredentialStore> m_credentialStore;
    std::unique_ptr<auth::TokenRefresher> m_tokenRefresher;
    std::unique_ptr<rotation::OperationRegistry> m_operationRegistry;
    std::unique_ptr<rotation::ProfileScorer> m_profileScorer;
    std::unique_ptr<rotation::SwapCoordinator> m_swapCoordinator;
};

} // namespace keyrotor::core
