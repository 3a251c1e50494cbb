/**
 * KeyRotor - OAuth credential and account rotation engine
 *
 * Command line entry point.
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/auth/CredentialDocument.hpp"
#include "core/auth/CredentialStore.hpp"
#include "core/auth/TokenRefresher.hpp"
#include "core/rotation/ProfileScorer.hpp"
#include "core/rotation/SwapCoordinator.hpp"
#include "models/AccountPool.hpp"
#include "utils/FileUtils.hpp"
#include "utils/JsonUtils.hpp"
#include "utils/PlatformUtils.hpp"

namespace fs = std::filesystem;

using keyrotor::core::Application;
using keyrotor::core::Config;
using keyrotor::core::Logger;

void printUsage(const char* program) {
    std::cout << "KeyRotor - OAuth credential and account rotation\n"
              << "\nUsage: " << program << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  status [configDir]     Show the stored token for an account\n"
              << "  ensure [configDir]     Refresh the token if it is near expiry\n"
              << "  refresh [configDir]    Refresh the token unconditionally\n"
              << "  clear-cache            Drop cached credential reads\n"
              << "  select <pool.json>     Choose the best account from a pool snapshot\n"
              << "  swap <pool.json> <id> [session|weekly]\n"
              << "                         Move off account <id> onto the best alternative\n"
              << "\nOptions:\n"
              << "  -c, --config <path>    Config file (default: " << Application::getConfigPath().string() << ")\n"
              << "  -d, --debug            Enable debug logging\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << std::endl;
}

/**
 * Load the config file, writing defaults when it does not exist yet
 */
void loadConfiguration(const fs::path& configPath) {
    auto& config = Config::instance();

    if (keyrotor::utils::FileUtils::fileExists(configPath)) {
        if (config.load(configPath.string())) {
            KR_LOG_DEBUG("Configuration loaded from {}", configPath.string());
        } else {
            KR_LOG_WARN("Using default configuration");
            config.setDefaults();
        }
        return;
    }

    config.setDefaults();
    if (config.save(configPath.string())) {
        KR_LOG_INFO("Default configuration created at {}", configPath.string());
    }
}

std::string displayName(const std::string& configDir) {
    return configDir.empty() ? "default profile" : configDir;
}

// -- Commands --

int runStatus(Application& app, const std::string& configDir) {
    auto credentials = app.credentialStore().getFullCredentials(configDir, true);

    std::cout << "Account:    " << displayName(configDir) << "\n"
              << "Token:      " << keyrotor::core::auth::tokenFingerprint(credentials.token) << "\n"
              << "Email:      " << credentials.email.value_or("unknown") << "\n"
              << "Expires in: " << app.tokenRefresher().formatTimeRemaining(credentials.expiresAt) << "\n";
    if (credentials.subscriptionType) {
        std::cout << "Plan:       " << *credentials.subscriptionType << "\n";
    }
    if (credentials.hasError()) {
        std::cout << "Error:      " << *credentials.error << "\n";
        return 1;
    }
    return credentials.hasToken() ? 0 : 1;
}

int printRefreshResult(const keyrotor::core::auth::RefreshResult& result) {
    std::cout << "Token:      " << keyrotor::core::auth::tokenFingerprint(result.token) << "\n"
              << "Refreshed:  " << (result.wasRefreshed ? "yes" : "no") << "\n";
    if (result.error) {
        std::cout << "Error:      " << *result.error << "\n";
    }
    if (result.needsReauthentication()) {
        std::cout << "Please log in again for this account.\n";
        return 2;
    }
    return result.token ? 0 : 1;
}

int runSelect(Application& app, const std::string& poolPath) {
    auto document = keyrotor::utils::JsonUtils::parseFile(poolPath);
    if (!document) {
        KR_LOG_ERROR("Cannot read account pool from {}", poolPath);
        return 1;
    }

    auto pool = keyrotor::models::AccountPool::fromJson(*document);
    auto settings = app.autoSwitchSettings();
    auto priority = pool.priorityOrder.empty() ? app.priorityOrder() : pool.priorityOrder;

    auto& scorer = app.profileScorer();
    auto best = scorer.selectBestAccount(pool.accounts, settings, pool.exclude, priority);

    keyrotor::utils::json output = {
        {"selected", nullptr},
        {"ranking", keyrotor::utils::json::array()}
    };
    for (const auto& account : scorer.sortedByAvailability(pool.accounts, settings, priority)) {
        output["ranking"].push_back(keyrotor::models::toJson(scorer.toUnified(account, settings)));
    }
    if (best) {
        output["selected"] = keyrotor::models::unifiedAccountId(*best);
    }

    std::cout << output.dump(2) << std::endl;
    return best ? 0 : 1;
}

int runSwap(Application& app, const std::string& poolPath, const std::string& currentId,
            const std::string& limit) {
    auto document = keyrotor::utils::JsonUtils::parseFile(poolPath);
    if (!document) {
        KR_LOG_ERROR("Cannot read account pool from {}", poolPath);
        return 1;
    }

    auto pool = keyrotor::models::AccountPool::fromJson(*document);
    auto priority = pool.priorityOrder.empty() ? app.priorityOrder() : pool.priorityOrder;
    auto limitType = limit == "weekly" ? keyrotor::models::RateLimitType::Weekly
                                       : keyrotor::models::RateLimitType::Session;

    auto outcome = app.swapCoordinator().performProactiveSwap(
        currentId, limitType, pool.accounts, app.autoSwitchSettings(), priority);

    keyrotor::utils::json output = {
        {"swapped", outcome.swapped},
        {"target", nullptr},
        {"operationsRestarted", outcome.operationsRestarted}
    };
    if (outcome.target) {
        output["target"] = keyrotor::models::unifiedAccountId(*outcome.target);
    }
    if (!outcome.failureReason.empty()) {
        output["reason"] = outcome.failureReason;
    }

    std::cout << output.dump(2) << std::endl;
    return outcome.swapped ? 0 : 1;
}

int runCommand(Application& app, const std::string& command, const std::vector<std::string>& args) {
    std::string firstArg = args.empty() ? "" : args.front();

    if (command == "status") {
        return runStatus(app, firstArg);
    }
    if (command == "ensure") {
        return printRefreshResult(app.tokenRefresher().ensureValidToken(firstArg));
    }
    if (command == "refresh") {
        return printRefreshResult(app.tokenRefresher().reactiveRefresh(firstArg));
    }
    if (command == "clear-cache") {
        app.credentialStore().clearCache();
        std::cout << "Credential cache cleared\n";
        return 0;
    }
    if (command == "select") {
        if (firstArg.empty()) {
            std::cerr << "select requires a pool file\n";
            return 64;
        }
        return runSelect(app, firstArg);
    }
    if (command == "swap") {
        if (args.size() < 2) {
            std::cerr << "swap requires a pool file and the current account id\n";
            return 64;
        }
        return runSwap(app, args[0], args[1], args.size() > 2 ? args[2] : "session");
    }

    std::cerr << "Unknown command: " << command << "\n";
    return 64;
}

int main(int argc, char* argv[]) {
    bool debugMode = false;
    fs::path configPath = Application::getConfigPath();
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a path\n";
                return 64;
            }
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 64;
    }

    auto& logger = Logger::instance();
    auto& config = Config::instance();

    loadConfiguration(configPath);

    auto level = debugMode ? keyrotor::core::LogLevel::Debug
                           : keyrotor::core::parseLogLevel(config.get<std::string>("logging.level", "info"));
    std::string logDir = config.get<std::string>("logging.directory", "");
    logger.initialize(level, logDir);

    keyrotor::utils::PlatformUtils::installTerminationHandlers();

    try {
        auto app = std::make_unique<Application>();
        if (!app->initialize()) {
            logger.critical("Failed to initialize {}", Application::getName());
            return 1;
        }

        int exitCode = runCommand(*app, command, args);

        app->shutdown();
        return exitCode;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
