/*
 * command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Bounded subprocess execution for the fallback probes

**************************************************/

#include "command.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"
#include "airmon/utils/string.hpp"

namespace airmon::system {

auto formatCommand(const std::vector<std::string>& argv) -> std::string {
    return utils::joinStrings(argv, " ");
}

#ifdef _WIN32
namespace {

auto quoteArgument(const std::string& arg) -> std::string {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

auto ProcessCommandRunner::run(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout)
    -> CommandResult {
    if (argv.empty()) {
        THROW_INVALID_ARGUMENT("Empty command line");
    }
    const std::string command = formatCommand(argv);
    spdlog::debug("Running '{}' (timeout {} ms)", command, timeout.count());

    SECURITY_ATTRIBUTES saAttr;
    saAttr.nLength = sizeof(SECURITY_ATTRIBUTES);
    saAttr.bInheritHandle = TRUE;
    saAttr.lpSecurityDescriptor = nullptr;

    HANDLE stdoutRead = nullptr;
    HANDLE stdoutWrite = nullptr;
    if (!CreatePipe(&stdoutRead, &stdoutWrite, &saAttr, 0)) {
        THROW_COMMAND_ERROR("Failed to create stdout pipe for '", command,
                            "': error ", GetLastError());
    }
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA siStartInfo;
    ZeroMemory(&siStartInfo, sizeof(STARTUPINFOA));
    siStartInfo.cb = sizeof(STARTUPINFOA);
    siStartInfo.hStdOutput = stdoutWrite;
    siStartInfo.hStdError = nullptr;
    siStartInfo.hStdInput = nullptr;
    siStartInfo.dwFlags |= STARTF_USESTDHANDLES;

    std::string cmdLine;
    for (const auto& arg : argv) {
        if (!cmdLine.empty()) {
            cmdLine += ' ';
        }
        cmdLine += quoteArgument(arg);
    }

    PROCESS_INFORMATION procInfo;
    ZeroMemory(&procInfo, sizeof(PROCESS_INFORMATION));
    if (!CreateProcessA(nullptr, cmdLine.data(), nullptr, nullptr, TRUE,
                        CREATE_NO_WINDOW, nullptr, nullptr, &siStartInfo,
                        &procInfo)) {
        DWORD error = GetLastError();
        CloseHandle(stdoutRead);
        CloseHandle(stdoutWrite);
        THROW_COMMAND_ERROR("Failed to start '", command, "': error ", error);
    }
    CloseHandle(stdoutWrite);
    CloseHandle(procInfo.hThread);

    CommandResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    bool finished = false;
    while (!finished) {
        DWORD available = 0;
        while (PeekNamedPipe(stdoutRead, nullptr, 0, nullptr, &available,
                             nullptr) &&
               available > 0) {
            DWORD bytesRead = 0;
            if (!ReadFile(stdoutRead, buffer.data(),
                          static_cast<DWORD>(buffer.size()), &bytesRead,
                          nullptr) ||
                bytesRead == 0) {
                break;
            }
            result.output.append(buffer.data(), bytesRead);
        }

        finished = WaitForSingleObject(procInfo.hProcess, 50) == WAIT_OBJECT_0;
        if (!finished && std::chrono::steady_clock::now() >= deadline) {
            TerminateProcess(procInfo.hProcess, 1);
            WaitForSingleObject(procInfo.hProcess, INFINITE);
            CloseHandle(procInfo.hProcess);
            CloseHandle(stdoutRead);
            THROW_COMMAND_TIMEOUT("Command '", command, "' timed out after ",
                                  timeout.count(), " ms");
        }
    }

    DWORD bytesRead = 0;
    while (ReadFile(stdoutRead, buffer.data(), static_cast<DWORD>(buffer.size()),
                    &bytesRead, nullptr) &&
           bytesRead > 0) {
        result.output.append(buffer.data(), bytesRead);
    }

    DWORD exitCode = 0;
    GetExitCodeProcess(procInfo.hProcess, &exitCode);
    result.exitCode = static_cast<int>(exitCode);
    CloseHandle(procInfo.hProcess);
    CloseHandle(stdoutRead);

    spdlog::debug("'{}' exited with {}", command, result.exitCode);
    return result;
}

#else
namespace {

void closeFd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

auto makePipe(int fds[2]) -> bool {
    if (pipe(fds) == -1) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

auto decodeStatus(int status) -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

auto ProcessCommandRunner::run(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout)
    -> CommandResult {
    if (argv.empty()) {
        THROW_INVALID_ARGUMENT("Empty command line");
    }
    const std::string command = formatCommand(argv);
    spdlog::debug("Running '{}' (timeout {} ms)", command, timeout.count());

    int stdoutPipe[2] = {-1, -1};
    int errorPipe[2] = {-1, -1};
    if (!makePipe(stdoutPipe)) {
        THROW_COMMAND_ERROR("Failed to create stdout pipe for '", command,
                            "': ", strerror(errno));
    }
    if (!makePipe(errorPipe)) {
        int err = errno;
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        THROW_COMMAND_ERROR("Failed to create exec status pipe for '", command,
                            "': ", strerror(err));
    }

    std::vector<char*> execArgs;
    execArgs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        execArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    execArgs.push_back(nullptr);

    pid_t childPid = fork();
    if (childPid == -1) {
        int err = errno;
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(errorPipe[0]);
        closeFd(errorPipe[1]);
        THROW_COMMAND_ERROR("Failed to fork for '", command,
                            "': ", strerror(err));
    }

    if (childPid == 0) {
        // Only async-signal-safe calls from here on.
        int nullFd = ::open("/dev/null", O_RDWR);
        if (dup2(stdoutPipe[1], STDOUT_FILENO) == -1 ||
            (nullFd != -1 && (dup2(nullFd, STDIN_FILENO) == -1 ||
                              dup2(nullFd, STDERR_FILENO) == -1))) {
            int err = errno;
            (void)!::write(errorPipe[1], &err, sizeof(err));
            _exit(127);
        }
        execvp(execArgs[0], execArgs.data());
        int err = errno;
        (void)!::write(errorPipe[1], &err, sizeof(err));
        _exit(127);
    }

    closeFd(stdoutPipe[1]);
    closeFd(errorPipe[1]);

    // The status pipe is close-on-exec: EOF means exec succeeded.
    int execErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(errorPipe[0], &execErrno, sizeof(execErrno));
    } while (n == -1 && errno == EINTR);
    closeFd(errorPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        waitpid(childPid, &status, 0);
        closeFd(stdoutPipe[0]);
        THROW_COMMAND_ERROR("Failed to execute '", command,
                            "': ", strerror(execErrno));
    }

    CommandResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    bool timedOut = false;

    while (stdoutPipe[0] != -1) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }
        pollfd pfd = {stdoutPipe[0], POLLIN, 0};
        int pollResult = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (pollResult == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("poll() failed while reading '{}': {}", command,
                         strerror(errno));
            break;
        }
        if (pollResult == 0) {
            continue;
        }
        ssize_t bytesRead = ::read(stdoutPipe[0], buffer.data(), buffer.size());
        if (bytesRead > 0) {
            result.output.append(buffer.data(),
                                 static_cast<size_t>(bytesRead));
        } else if (bytesRead == 0 || errno != EINTR) {
            closeFd(stdoutPipe[0]);
        }
    }
    closeFd(stdoutPipe[0]);

    int status = 0;
    while (!timedOut) {
        pid_t waited = waitpid(childPid, &status, WNOHANG);
        if (waited == childPid) {
            result.exitCode = decodeStatus(status);
            spdlog::debug("'{}' exited with {}", command, result.exitCode);
            return result;
        }
        if (waited == -1 && errno != EINTR) {
            THROW_COMMAND_ERROR("waitpid failed for '", command,
                                "': ", strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            break;
        }
        usleep(10000);
    }

    ::kill(childPid, SIGKILL);
    waitpid(childPid, &status, 0);
    THROW_COMMAND_TIMEOUT("Command '", command, "' timed out after ",
                          timeout.count(), " ms");
}
#endif

}  // namespace airmon::system
