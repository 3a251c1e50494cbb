// KeyRotor - Process Runner
// Runs helper programs with an argument vector and a hard timeout

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace keyrotor::utils {

/**
 * @brief Outcome of a helper program invocation
 */
struct ProcessResult {
    bool launched{false};      // false when the program could not be started
    bool timedOut{false};      // killed after exceeding the timeout
    int exitCode{-1};
    std::string stdoutText;
    std::string stderrText;
    std::string error;         // launch or wait failure description

    bool succeeded() const { return launched && !timedOut && exitCode == 0; }
};

/**
 * @brief Process invocation request
 *
 * Arguments are passed to the program verbatim; no shell is involved.
 */
struct ProcessRequest {
    std::string program;
    std::vector<std::string> args;
    std::string stdinData;
    std::chrono::milliseconds timeout{5000};
};

/**
 * @brief Abstract helper-program executor
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessRequest& request) = 0;
};

/**
 * @brief Runs real child processes (fork/execv on POSIX, CreateProcessW on Windows)
 */
class SystemProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessRequest& request) override;

    /**
     * @brief Quote one argument for a Windows command line (CommandLineToArgvW rules)
     */
    static std::string quoteWindowsArgument(const std::string& arg);
};

} // namespace keyrotor::utils
