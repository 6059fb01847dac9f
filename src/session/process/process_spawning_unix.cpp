/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tandem::session {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

[[noreturn]] void failInChild(int errorFd) {
    int err = errno;
    auto unused = ::write(errorFd, &err, sizeof(err));
    (void)unused;
    _exit(127);
}

}  // namespace

Result<SpawnedChild> ProcessSpawner::spawn(
    const std::string& executable, const std::vector<std::string>& arguments,
    const std::filesystem::path& workingDirectory) {

    // Everything the child touches is prepared before fork
    std::vector<std::string> argvStorage;
    argvStorage.reserve(arguments.size() + 1);
    argvStorage.push_back(executable);
    argvStorage.insert(argvStorage.end(), arguments.begin(), arguments.end());
    std::vector<char*> argv;
    argv.reserve(argvStorage.size() + 1);
    for (auto& arg : argvStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    std::string workDir = workingDirectory.string();

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(execPipe, O_CLOEXEC) != 0) {
        spdlog::error("ProcessSpawner: pipe creation failed: {}",
                      std::strerror(errno));
        for (int* fds : {outPipe, errPipe, execPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return std::unexpected(SessionError::SpawnFailed);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::error("ProcessSpawner: fork failed: {}", std::strerror(errno));
        for (int* fds : {outPipe, errPipe, execPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        return std::unexpected(SessionError::SpawnFailed);
    }

    if (pid == 0) {
        // Child process
        ::setpgid(0, 0);

        int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            if (devNull != STDIN_FILENO) {
                ::close(devNull);
            }
        }
        if (::dup2(outPipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(errPipe[1], STDERR_FILENO) < 0) {
            failInChild(execPipe[1]);
        }
        if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
            failInChild(execPipe[1]);
        }

        ::execvp(argv[0], argv.data());

        // If we get here, exec failed
        failInChild(execPipe[1]);
    }

    // Parent process; also set the group here to close the race with exec
    ::setpgid(pid, pid);

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        spdlog::error("ProcessSpawner: cannot start '{}': {}", executable,
                      std::strerror(childErrno));
        reap(pid);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        return std::unexpected(SessionError::SpawnFailed);
    }

    spdlog::debug("ProcessSpawner: spawned '{}' with PID {}", executable, pid);
    return SpawnedChild{static_cast<int>(pid), outPipe[0], errPipe[0]};
}

std::optional<ExitStatus> ProcessSpawner::peekExit(int processId) {
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(processId), &info,
                      WEXITED | WNOHANG | WNOWAIT);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        // ECHILD: somebody else reaped it; the status is lost
        return errno == ECHILD ? std::optional<ExitStatus>{ExitStatus{}}
                               : std::nullopt;
    }
    if (info.si_pid != processId) {
        return std::nullopt;
    }

    ExitStatus status;
    if (info.si_code == CLD_EXITED) {
        status.exitCode = info.si_status;
    } else {
        status.signal = info.si_status;
    }
    return status;
}

void ProcessSpawner::reap(int processId) {
    int status;
    while (::waitpid(processId, &status, 0) < 0 && errno == EINTR) {
    }
}

Result<void> ProcessSpawner::signalProcess(int processId, int signal) {
    if (processId <= 0) {
        return std::unexpected(SessionError::TerminationFailed);
    }
    if (::kill(-processId, signal) == 0) {
        return {};
    }
    if (errno == ESRCH && ::kill(processId, signal) == 0) {
        return {};
    }
    if (errno == ESRCH) {
        spdlog::debug("ProcessSpawner: process {} already gone", processId);
        return {};
    }
    spdlog::error("ProcessSpawner: kill({}, {}) failed: {}", processId, signal,
                  std::strerror(errno));
    return std::unexpected(SessionError::TerminationFailed);
}

bool ProcessSpawner::isProcessRunning(int processId) {
    if (processId <= 0) {
        return false;
    }
    return ::kill(processId, 0) == 0 || errno == EPERM;
}

}  // namespace tandem::session

#endif  // !_WIN32
