/**
 * Application.cpp
 *
 * Service wiring for the rotation engine.
 */

#include "Application.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "auth/CredentialStore.hpp"
#include "auth/TokenRefresher.hpp"
#include "rotation/OperationRegistry.hpp"
#include "rotation/ProfileScorer.hpp"
#include "rotation/SwapCoordinator.hpp"
#include "../utils/HttpClient.hpp"
#include "../utils/PlatformUtils.hpp"
#include "../utils/ProcessRunner.hpp"

#include <chrono>

namespace keyrotor::core {

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    auto startTime = std::chrono::steady_clock::now();

    try {
        const Config& config = Config::instance();

        utils::CurlGlobalInit::init();
        m_processRunner = std::make_unique<utils::SystemProcessRunner>();
        m_httpClient = std::make_unique<utils::HttpClient>();

        m_credentialStore = std::make_unique<auth::CredentialStore>(
            *m_processRunner, m_clock, auth::CredentialStoreOptions::fromConfig(config));
        m_tokenRefresher = std::make_unique<auth::TokenRefresher>(
            *m_credentialStore, *m_httpClient, m_clock, auth::TokenRefresherOptions::fromConfig(config));

        m_operationRegistry = std::make_unique<rotation::OperationRegistry>(m_clock);
        m_profileScorer = std::make_unique<rotation::ProfileScorer>(m_clock);
        m_swapCoordinator = std::make_unique<rotation::SwapCoordinator>(
            *m_profileScorer, *m_operationRegistry,
            [this](const models::Account& account) { return activate(account); });

    } catch (const std::exception& e) {
        Logger::instance().error("Service initialization error: {}", e.what());
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("{} {} ready on {} in {}ms", getName(), getVersion(),
                            utils::PlatformUtils::getOSName(m_credentialStore->platform()),
                            duration.count());

    setState(AppState::Ready);
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down...");

    if (m_swapCoordinator) {
        m_swapCoordinator->swapCompleted.clear();
        m_swapCoordinator->swapFailed.clear();
        m_swapCoordinator->operationsMigrated.clear();
    }
    if (m_operationRegistry) {
        m_operationRegistry->operationRegistered.clear();
        m_operationRegistry->operationUnregistered.clear();
        m_operationRegistry->operationRestarted.clear();
        m_operationRegistry->operationsRestarted.clear();
        m_operationRegistry->operationProfileUpdated.clear();
        m_operationRegistry->clear();
    }
    if (m_credentialStore) {
        m_credentialStore->clearCache();
    }

    // Reverse construction order
    m_swapCoordinator.reset();
    m_profileScorer.reset();
    m_operationRegistry.reset();
    m_tokenRefresher.reset();
    m_credentialStore.reset();
    m_httpClient.reset();
    m_processRunner.reset();

    utils::CurlGlobalInit::cleanup();
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

rotation::AutoSwitchSettings Application::autoSwitchSettings() const {
    return rotation::AutoSwitchSettings::fromConfig(Config::instance());
}

std::vector<std::string> Application::priorityOrder() const {
    return Config::instance().get<std::vector<std::string>>("autoSwitch.priorityOrder", {});
}

void Application::setActivateHandler(ActivateHandler handler) {
    std::lock_guard<std::mutex> lock(m_activateMutex);
    m_activateHandler = std::move(handler);
}

bool Application::activate(const models::Account& account) {
    ActivateHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_activateMutex);
        handler = m_activateHandler;
    }

    if (!handler) {
        Logger::instance().info("Active account is now {}", models::unifiedAccountId(account));
        return true;
    }
    return handler(account);
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            Logger::instance().error("State callback error: {}", e.what());
        }
    }
}

std::filesystem::path Application::getDataDirectory() {
    return utils::PlatformUtils::getAppDataDirectory() / getName();
}

std::filesystem::path Application::getConfigPath() {
    return getDataDirectory() / "config.json";
}

} // namespace keyrotor::core
