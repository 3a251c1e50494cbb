/**
 * ProcessRunner.cpp
 *
 * Child process execution with captured output and a hard timeout.
 */

#include "ProcessRunner.hpp"

#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#include <thread>
#else
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace keyrotor::utils {

std::string SystemProcessRunner::quoteWindowsArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }

    std::string quoted = "\"";
    for (auto it = arg.begin(); ; ++it) {
        size_t backslashes = 0;
        while (it != arg.end() && *it == '\\') {
            ++it;
            ++backslashes;
        }

        if (it == arg.end()) {
            // Double trailing backslashes so the closing quote stays a quote
            quoted.append(backslashes * 2, '\\');
            break;
        }

        if (*it == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted.push_back('"');
        } else {
            quoted.append(backslashes, '\\');
            quoted.push_back(*it);
        }
    }
    quoted.push_back('"');
    return quoted;
}

#ifdef _WIN32

namespace {

std::wstring toWide(const std::string& str) {
    if (str.empty()) return std::wstring();
    int size = MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.size()), nullptr, 0);
    std::wstring result(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.size()), result.data(), size);
    return result;
}

std::string lastErrorMessage(const char* what) {
    return std::string(what) + " failed (error " + std::to_string(GetLastError()) + ")";
}

void drainPipe(HANDLE pipe, std::string* out) {
    char buffer[4096];
    DWORD bytesRead = 0;
    while (ReadFile(pipe, buffer, sizeof(buffer), &bytesRead, nullptr) && bytesRead > 0) {
        out->append(buffer, bytesRead);
    }
}

} // namespace

ProcessResult SystemProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;

    SECURITY_ATTRIBUTES sa = { sizeof(sa), nullptr, TRUE };
    HANDLE stdinRead = nullptr, stdinWrite = nullptr;
    HANDLE stdoutRead = nullptr, stdoutWrite = nullptr;
    HANDLE stderrRead = nullptr, stderrWrite = nullptr;

    if (!CreatePipe(&stdinRead, &stdinWrite, &sa, 0) ||
        !CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0) ||
        !CreatePipe(&stderrRead, &stderrWrite, &sa, 0)) {
        result.error = lastErrorMessage("CreatePipe");
        for (HANDLE h : {stdinRead, stdinWrite, stdoutRead, stdoutWrite, stderrRead, stderrWrite}) {
            if (h) CloseHandle(h);
        }
        return result;
    }

    // Parent ends must not leak into the child
    SetHandleInformation(stdinWrite, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderrRead, HANDLE_FLAG_INHERIT, 0);

    std::string cmdLine = quoteWindowsArgument(request.program);
    for (const auto& arg : request.args) {
        cmdLine += " " + quoteWindowsArgument(arg);
    }
    std::wstring wideCmdLine = toWide(cmdLine);
    std::wstring wideProgram = toWide(request.program);

    STARTUPINFOW si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = stderrWrite;

    PROCESS_INFORMATION pi = {};
    BOOL created = CreateProcessW(wideProgram.c_str(), wideCmdLine.data(),
        nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);

    CloseHandle(stdinRead);
    CloseHandle(stdoutWrite);
    CloseHandle(stderrWrite);

    if (!created) {
        result.error = lastErrorMessage("CreateProcessW");
        CloseHandle(stdinWrite);
        CloseHandle(stdoutRead);
        CloseHandle(stderrRead);
        return result;
    }

    result.launched = true;
    CloseHandle(pi.hThread);

    std::thread stdoutReader(drainPipe, stdoutRead, &result.stdoutText);
    std::thread stderrReader(drainPipe, stderrRead, &result.stderrText);

    if (!request.stdinData.empty()) {
        DWORD written = 0;
        WriteFile(stdinWrite, request.stdinData.data(),
                  static_cast<DWORD>(request.stdinData.size()), &written, nullptr);
    }
    CloseHandle(stdinWrite);

    DWORD waitResult = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(request.timeout.count()));
    if (waitResult == WAIT_TIMEOUT) {
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, 2000);
        result.timedOut = true;
        result.error = "timed out after " + std::to_string(request.timeout.count()) + "ms";
    }

    stdoutReader.join();
    stderrReader.join();

    DWORD exitCode = 1;
    if (GetExitCodeProcess(pi.hProcess, &exitCode)) {
        result.exitCode = static_cast<int>(exitCode);
    }

    CloseHandle(pi.hProcess);
    CloseHandle(stdoutRead);
    CloseHandle(stderrRead);
    return result;
}

#else // POSIX

namespace {

/**
 * Pipe pair that closes whatever ends are still open
 */
struct Pipe {
    int fds[2]{-1, -1};

    bool open() {
        if (::pipe(fds) != 0) return false;
        for (int fd : fds) {
            ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
        return true;
    }

    void closeRead() { closeFd(fds[0]); }
    void closeWrite() { closeFd(fds[1]); }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

private:
    static void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

/**
 * Blocks SIGPIPE for the calling thread while a child is being fed stdin,
 * and discards one that became pending because the child closed early.
 */
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&m_pipeSet);
        sigaddset(&m_pipeSet, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &m_pipeSet, &m_oldSet);
    }

    ~ScopedSigpipeBlock() {
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE)) {
            int sig = 0;
            sigwait(&m_pipeSet, &sig);
        }
        pthread_sigmask(SIG_SETMASK, &m_oldSet, nullptr);
    }

    /**
     * Give a forked child the caller's original mask before it execs
     */
    void restoreInChild() const {
        pthread_sigmask(SIG_SETMASK, &m_oldSet, nullptr);
    }

private:
    sigset_t m_pipeSet;
    sigset_t m_oldSet;
};

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcessResult SystemProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;

    Pipe inPipe, outPipe, errPipe, execPipe;
    if (!inPipe.open() || !outPipe.open() || !errPipe.open() || !execPipe.open()) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(request.program.c_str()));
    for (const auto& arg : request.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ScopedSigpipeBlock sigpipeGuard;

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child process
        ::dup2(inPipe.fds[0], STDIN_FILENO);
        ::dup2(outPipe.fds[1], STDOUT_FILENO);
        ::dup2(errPipe.fds[1], STDERR_FILENO);
        sigpipeGuard.restoreInChild();
        ::execv(request.program.c_str(), argv.data());

        int err = errno;
        ssize_t ignored = ::write(execPipe.fds[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    inPipe.closeRead();
    outPipe.closeWrite();
    errPipe.closeWrite();
    execPipe.closeWrite();

    // execv succeeded iff the CLOEXEC pipe closes without data
    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe.fds[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        ::waitpid(pid, nullptr, 0);
        result.error = std::string("cannot execute ") + request.program + ": " + std::strerror(execErrno);
        return result;
    }

    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    size_t stdinOffset = 0;

    if (request.stdinData.empty()) {
        inPipe.closeWrite();
    } else {
        ::fcntl(inPipe.fds[1], F_SETFL, ::fcntl(inPipe.fds[1], F_GETFL) | O_NONBLOCK);
    }

    char buffer[4096];
    while (outPipe.fds[0] >= 0 || errPipe.fds[0] >= 0 || inPipe.fds[1] >= 0) {
        int timeoutMs = remainingMs(deadline);
        if (timeoutMs == 0) {
            result.timedOut = true;
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        if (outPipe.fds[0] >= 0) fds[count++] = {outPipe.fds[0], POLLIN, 0};
        if (errPipe.fds[0] >= 0) fds[count++] = {errPipe.fds[0], POLLIN, 0};
        if (inPipe.fds[1] >= 0) fds[count++] = {inPipe.fds[1], POLLOUT, 0};

        int ready = ::poll(fds, count, timeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;

            if (fds[i].fd == inPipe.fds[1]) {
                ssize_t written = ::write(inPipe.fds[1],
                    request.stdinData.data() + stdinOffset,
                    request.stdinData.size() - stdinOffset);
                if (written > 0) {
                    stdinOffset += static_cast<size_t>(written);
                }
                if ((written < 0 && errno != EAGAIN && errno != EINTR) ||
                    stdinOffset >= request.stdinData.size()) {
                    inPipe.closeWrite();
                }
                continue;
            }

            ssize_t bytes = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (bytes > 0) {
                std::string& target = (fds[i].fd == outPipe.fds[0]) ? result.stdoutText : result.stderrText;
                target.append(buffer, static_cast<size_t>(bytes));
            } else if (bytes == 0 || (errno != EAGAIN && errno != EINTR)) {
                if (fds[i].fd == outPipe.fds[0]) {
                    outPipe.closeRead();
                } else {
                    errPipe.closeRead();
                }
            }
        }
    }

    int status = 0;
    if (!result.timedOut) {
        // Output is closed; give the child the remaining timeout to exit
        while (true) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                result.exitCode = decodeStatus(status);
                return result;
            }
            if (waited < 0 && errno != EINTR) {
                result.error = std::string("waitpid failed: ") + std::strerror(errno);
                return result;
            }
            if (remainingMs(deadline) == 0) {
                result.timedOut = true;
                break;
            }
            ::usleep(10 * 1000);
        }
    }

    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
    result.exitCode = decodeStatus(status);
    result.error = "timed out after " + std::to_string(request.timeout.count()) + "ms";
    return result;
}

#endif

} // namespace keyrotor::utils
