/**
 * PlatformUtils.cpp
 *
 * Cross-platform system utilities.
 */

#include "PlatformUtils.hpp"

#include <csignal>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <lmcons.h>
#else
#include <unistd.h>
#include <pwd.h>
#endif

namespace keyrotor::utils {

namespace {

void terminationHandler(int signal) {
    std::_Exit(128 + signal);
}

} // namespace

OS PlatformUtils::getOS() {
#ifdef _WIN32
    return OS::Windows;
#elif defined(__APPLE__)
    return OS::macOS;
#elif defined(__linux__)
    return OS::Linux;
#else
    return OS::Unknown;
#endif
}

std::string PlatformUtils::getOSName(OS os) {
    switch (os) {
        case OS::Windows: return "Windows";
        case OS::macOS: return "macOS";
        case OS::Linux: return "Linux";
        default: return "Unknown";
    }
}

std::string PlatformUtils::getUsername() {
#ifdef _WIN32
    char buf[UNLEN + 1];
    DWORD size = sizeof(buf);
    if (GetUserNameA(buf, &size)) {
        return buf;
    }
    auto user = getEnv("USERNAME");
    return user ? *user : "unknown";
#else
    if (auto user = getEnv("USER")) {
        return *user;
    }
    if (const passwd* pw = getpwuid(getuid())) {
        return pw->pw_name;
    }
    return "unknown";
#endif
}

std::optional<std::string> PlatformUtils::getEnv(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val && *val) return std::string(val);
    return std::nullopt;
}

// -- Paths --

std::filesystem::path PlatformUtils::getHomeDirectory() {
    auto home = getEnv("HOME");
    if (!home) home = getEnv("USERPROFILE");
    return home ? std::filesystem::path(*home) : std::filesystem::current_path();
}

std::filesystem::path PlatformUtils::getAppDataDirectory() {
#ifdef _WIN32
    auto appData = getEnv("APPDATA");
    return appData ? std::filesystem::path(*appData) : getHomeDirectory();
#elif defined(__APPLE__)
    return getHomeDirectory() / "Library" / "Application Support";
#else
    if (auto xdg = getEnv("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg);
    }
    return getHomeDirectory() / ".local" / "share";
#endif
}

std::string PlatformUtils::expandHomePath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    return getHomeDirectory().string() + path.substr(1);
}

std::optional<std::filesystem::path> PlatformUtils::findExecutable(
    const std::vector<std::filesystem::path>& candidates) {
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> PlatformUtils::findInPath(const std::string& name) {
    auto pathEnv = getEnv("PATH");
    if (!pathEnv) {
        return std::nullopt;
    }

#ifdef _WIN32
    const char separator = ';';
#else
    const char separator = ':';
#endif

    std::vector<std::filesystem::path> candidates;
    size_t start = 0;
    while (start <= pathEnv->size()) {
        size_t end = pathEnv->find(separator, start);
        if (end == std::string::npos) end = pathEnv->size();
        std::string dir = pathEnv->substr(start, end - start);
        if (!dir.empty()) {
            candidates.push_back(std::filesystem::path(dir) / name);
        }
        start = end + 1;
    }

    return findExecutable(candidates);
}

void PlatformUtils::installTerminationHandlers() {
    std::signal(SIGINT, terminationHandler);
    std::signal(SIGTERM, terminationHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, terminationHandler);
#endif
}

} // namespace keyrotor::utils
