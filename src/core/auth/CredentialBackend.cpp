/**
 * CredentialBackend.cpp
 */

#include "CredentialBackend.hpp"
#include "../../utils/PlatformUtils.hpp"

#include <vector>

namespace keyrotor::core::auth {

namespace fs = std::filesystem;
using utils::PlatformUtils;

namespace {

std::vector<fs::path> powershellCandidates() {
    std::vector<fs::path> candidates;

    std::string programFiles = PlatformUtils::getEnv("ProgramFiles").value_or("C:\\Program Files");
    candidates.push_back(fs::path(programFiles) / "PowerShell" / "7" / "pwsh.exe");

    candidates.push_back(PlatformUtils::getHomeDirectory() / "AppData" / "Local" /
                         "Microsoft" / "WindowsApps" / "pwsh.exe");

    std::string systemRoot = PlatformUtils::getEnv("SystemRoot").value_or("C:\\Windows");
    candidates.push_back(fs::path(systemRoot) / "System32" / "WindowsPowerShell" /
                         "v1.0" / "powershell.exe");
    return candidates;
}

} // namespace

ExecutableResolver defaultExecutableResolver() {
    return [](const std::string& tool) -> std::optional<fs::path> {
        if (tool == "security") {
            return PlatformUtils::findExecutable({"/usr/bin/security", "/bin/security"});
        }
        if (tool == "secret-tool") {
            auto found = PlatformUtils::findExecutable({
                "/usr/bin/secret-tool", "/bin/secret-tool", "/usr/local/bin/secret-tool"});
            return found ? found : PlatformUtils::findInPath("secret-tool");
        }
        if (tool == "powershell") {
            auto found = PlatformUtils::findExecutable(powershellCandidates());
            if (!found) found = PlatformUtils::findInPath("pwsh.exe");
            if (!found) found = PlatformUtils::findInPath("powershell.exe");
            return found;
        }
        return std::nullopt;
    };
}

} // namespace keyrotor::core::auth
