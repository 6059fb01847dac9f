/*
 * child_process.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "child_process.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace tandem::session {

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr auto kDrainWindow = std::chrono::milliseconds{250};
constexpr size_t kReadChunk = 4096;

void setNonBlocking(int fd) {
    if (fd < 0) {
        return;
    }
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

}  // namespace

ChildProcess::ChildProcess(std::string label, SpawnedChild child)
    : label_(std::move(label)),
      processId_(child.processId),
      stdoutFd_(child.stdoutFd),
      stderrFd_(child.stderrFd) {
    setNonBlocking(stdoutFd_);
    setNonBlocking(stderrFd_);
}

ChildProcess::~ChildProcess() {
    if (supervisor_.joinable()) {
        if (supervisor_.get_id() == std::this_thread::get_id()) {
            // Last reference dropped by the supervisor itself on its way out
            supervisor_.detach();
        } else {
            shutdownRequested_ = true;
            supervisor_.join();
        }
    }
    for (int fd : {stdoutFd_, stderrFd_}) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
}

void ChildProcess::start(ExitCallback onExit) {
    supervisor_ = std::thread([self = shared_from_this(),
                               callback = std::move(onExit)]() mutable {
        self->supervise(std::move(callback));
    });
}

bool ChildProcess::isAlive() const {
    std::lock_guard lock(mutex_);
    return !status_.has_value();
}

Result<void> ChildProcess::sendSignal(int signal) {
    std::lock_guard lock(mutex_);
    if (reaped_) {
        // The pid may already belong to someone else
        return {};
    }
    return ProcessSpawner::signalProcess(processId_, signal);
}

bool ChildProcess::waitForExit(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return exitCv_.wait_for(lock, timeout, [this] { return status_.has_value(); });
}

std::optional<int> ChildProcess::exitCode() const {
    std::lock_guard lock(mutex_);
    if (!status_) {
        return std::nullopt;
    }
    return status_->exitCode;
}

std::optional<ExitStatus> ChildProcess::exitStatus() const {
    std::lock_guard lock(mutex_);
    return status_;
}

void ChildProcess::shutdown() {
    shutdownRequested_ = true;
    if (isAlive()) {
        if (auto killed = sendSignal(SIGKILL); !killed) {
            spdlog::warn("ChildProcess: failed to kill {} (PID {}) on shutdown",
                         label_, processId_);
        }
    }
    if (supervisor_.joinable() &&
        supervisor_.get_id() != std::this_thread::get_id()) {
        supervisor_.join();
    }
}

void ChildProcess::logLines(OutputStream stream,
                            const std::vector<std::string>& lines) const {
    for (const auto& line : lines) {
        if (stream == OutputStream::Stdout) {
            spdlog::debug("[Session {}] {}", label_, line);
        } else {
            spdlog::debug("[Session {} stderr] {}", label_, line);
        }
    }
}

void ChildProcess::supervise(ExitCallback onExit) {
    std::array<char, kReadChunk> buffer{};
    std::optional<ExitStatus> observed;
    std::chrono::steady_clock::time_point drainDeadline{};

    auto readFrom = [&](int& fd, OutputStream stream) {
        while (fd >= 0) {
            auto n = ::read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                logLines(stream, capture_.append(
                                     stream, std::string_view(buffer.data(),
                                                              static_cast<size_t>(n))));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && errno == EAGAIN) {
                return;
            }
            ::close(fd);
            fd = -1;
        }
    };

    while (true) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (stdoutFd_ >= 0) {
            fds[count++] = pollfd{stdoutFd_, POLLIN, 0};
        }
        if (stderrFd_ >= 0) {
            fds[count++] = pollfd{stderrFd_, POLLIN, 0};
        }

        int ready = ::poll(count > 0 ? fds.data() : nullptr, count, kPollTimeoutMs);
        if (ready > 0) {
            for (nfds_t i = 0; i < count; ++i) {
                if (fds[i].revents == 0) {
                    continue;
                }
                if (fds[i].fd == stdoutFd_) {
                    readFrom(stdoutFd_, OutputStream::Stdout);
                } else if (fds[i].fd == stderrFd_) {
                    readFrom(stderrFd_, OutputStream::Stderr);
                }
            }
        }

        if (!observed) {
            observed = ProcessSpawner::peekExit(processId_);
            if (observed) {
                drainDeadline = std::chrono::steady_clock::now() + kDrainWindow;
            }
        }
        if (observed && ((stdoutFd_ < 0 && stderrFd_ < 0) ||
                         std::chrono::steady_clock::now() >= drainDeadline)) {
            break;
        }
    }

    // Descendants may still hold the pipes; stop reading once the leader is gone
    for (int* fd : {&stdoutFd_, &stderrFd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
    logLines(OutputStream::Stdout, capture_.finish());

    if (observed->exitCode) {
        spdlog::info("ChildProcess: {} (PID {}) exited with code {}", label_,
                     processId_, *observed->exitCode);
    } else if (observed->signal) {
        spdlog::info("ChildProcess: {} (PID {}) terminated by signal {}",
                     label_, processId_, *observed->signal);
    } else {
        spdlog::info("ChildProcess: {} (PID {}) exited", label_, processId_);
    }

    {
        std::lock_guard lock(mutex_);
        status_ = observed;
    }
    exitCv_.notify_all();

    if (onExit && !shutdownRequested_) {
        onExit(*observed);
    }

    std::lock_guard lock(mutex_);
    ProcessSpawner::reap(processId_);
    reaped_ = true;
}

}  // namespace tandem::session
