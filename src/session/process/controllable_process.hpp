/*
 * controllable_process.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file controllable_process.hpp
 * @brief Two-variant abstraction over a process this invocation can signal
 * @date 2024
 * @version 1.0.0
 *
 * - ChildProcess: spawned by this invocation; owns the live handle, knows
 *   its exit status and can notify on exit.
 * - DetachedProcess: known only by identifier (loaded from the store);
 *   supports signal-by-id and liveness probing, nothing else.
 */

#ifndef TANDEM_SESSION_PROCESS_CONTROLLABLE_PROCESS_HPP
#define TANDEM_SESSION_PROCESS_CONTROLLABLE_PROCESS_HPP

#include "../types.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace tandem::session {

/**
 * @brief Observer of every signal sent during termination (pid, signal)
 */
using SignalObserver = std::function<void(int processId, int signal)>;

class ControllableProcess {
public:
    virtual ~ControllableProcess() = default;

    [[nodiscard]] virtual int processId() const noexcept = 0;

    /**
     * @brief Non-destructive liveness check
     */
    [[nodiscard]] virtual bool isAlive() const = 0;

    /**
     * @brief Send @p signal to the process and its process group
     *
     * A process that is already gone is not an error.
     */
    [[nodiscard]] virtual Result<void> sendSignal(int signal) = 0;

    /**
     * @brief Whether exit notifications (and the exit status) are available
     */
    [[nodiscard]] virtual bool supportsExitNotification() const noexcept = 0;

    /**
     * @brief Wait until the process is gone or @p timeout elapses
     * @return True if the process is gone
     */
    virtual bool waitForExit(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Exit code, if the process exited normally and it was observed
     */
    [[nodiscard]] virtual std::optional<int> exitCode() const { return std::nullopt; }
};

/**
 * @brief Process known only by its identifier
 *
 * Reconstructed from a stored session when the live handle belongs to
 * another invocation. Waiting is done by polling liveness until a deadline.
 */
class DetachedProcess final : public ControllableProcess {
public:
    explicit DetachedProcess(
        int processId,
        std::chrono::milliseconds pollInterval = std::chrono::milliseconds{50});

    [[nodiscard]] int processId() const noexcept override { return processId_; }
    [[nodiscard]] bool isAlive() const override;
    [[nodiscard]] Result<void> sendSignal(int signal) override;
    [[nodiscard]] bool supportsExitNotification() const noexcept override {
        return false;
    }
    bool waitForExit(std::chrono::milliseconds timeout) override;

private:
    int processId_;
    std::chrono::milliseconds pollInterval_;
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_PROCESS_CONTROLLABLE_PROCESS_HPP
