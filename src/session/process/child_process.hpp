/*
 * child_process.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TANDEM_SESSION_PROCESS_CHILD_PROCESS_HPP
#define TANDEM_SESSION_PROCESS_CHILD_PROCESS_HPP

#include "controllable_process.hpp"
#include "output_capture.hpp"
#include "process_spawning.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tandem::session {

/**
 * @brief Child spawned by this invocation, controlled through its live handle
 *
 * A supervisor thread drains stdout/stderr into the capture and detects the
 * exit without reaping, so the pid stays valid (a zombie still probes as
 * alive to other invocations) until the exit callback has run. Only then is
 * the child reaped.
 */
class ChildProcess final : public ControllableProcess,
                           public std::enable_shared_from_this<ChildProcess> {
public:
    using ExitCallback = std::function<void(const ExitStatus&)>;

    /**
     * @param label Name used in log lines (the session id)
     * @param child Spawned child; its pipe descriptors are adopted
     */
    ChildProcess(std::string label, SpawnedChild child);
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Start supervising; @p onExit runs on the supervisor thread
     *
     * The callback is not invoked for exits caused by shutdown().
     */
    void start(ExitCallback onExit);

    [[nodiscard]] int processId() const noexcept override { return processId_; }
    [[nodiscard]] bool isAlive() const override;
    [[nodiscard]] Result<void> sendSignal(int signal) override;
    [[nodiscard]] bool supportsExitNotification() const noexcept override {
        return true;
    }
    bool waitForExit(std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::optional<int> exitCode() const override;

    [[nodiscard]] std::optional<ExitStatus> exitStatus() const;

    [[nodiscard]] const OutputCapture& capture() const noexcept { return capture_; }

    /**
     * @brief Kill the child without notifying, then wait for the supervisor
     */
    void shutdown();

private:
    void supervise(ExitCallback onExit);
    void logLines(OutputStream stream, const std::vector<std::string>& lines) const;

    std::string label_;
    int processId_;
    int stdoutFd_;
    int stderrFd_;

    OutputCapture capture_;

    mutable std::mutex mutex_;
    std::condition_variable exitCv_;
    std::optional<ExitStatus> status_;
    bool reaped_{false};

    std::atomic<bool> shutdownRequested_{false};
    std::thread supervisor_;
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_PROCESS_CHILD_PROCESS_HPP
