/*
 * process_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file process_controller.hpp
 * @brief Spawning, output capture and termination of session processes
 * @date 2024
 * @version 1.0.0
 */

#ifndef TANDEM_SESSION_PROCESS_PROCESS_CONTROLLER_HPP
#define TANDEM_SESSION_PROCESS_PROCESS_CONTROLLER_HPP

#include "child_process.hpp"
#include "controllable_process.hpp"
#include "../types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tandem::session {

/**
 * @brief Process controller settings
 */
struct ControllerOptions {
    std::string executable{"code"};  ///< Editor launched for every session
    std::chrono::milliseconds gracePeriod{5000};            ///< Live-handle grace
    std::chrono::milliseconds identifierGracePeriod{2000};  ///< Identifier-only grace
};

/**
 * @brief Result of a launch
 */
struct LaunchedProcess {
    int processId{-1};
    std::shared_ptr<ChildProcess> handle;
};

/**
 * @brief What terminate() did
 */
struct TerminationOutcome {
    bool wasAlive{false};        ///< False when the process was already gone
    bool forced{false};          ///< True when SIGKILL was needed
    std::optional<int> exitCode; ///< Only known through a live handle
};

/**
 * @brief Called on the supervisor thread when an owned child exits on its own
 *        (or because some invocation signalled it)
 */
using ExitObserver =
    std::function<void(const std::string& sessionId, const ExitStatus& status)>;

class ProcessController {
public:
    ProcessController();
    explicit ProcessController(const ControllerOptions& options);

    /**
     * @brief Kills and reaps every child still running
     */
    ~ProcessController();

    ProcessController(const ProcessController&) = delete;
    ProcessController& operator=(const ProcessController&) = delete;
    ProcessController(ProcessController&&) noexcept;
    ProcessController& operator=(ProcessController&&) noexcept;

    void setExitObserver(ExitObserver observer);
    void setSignalObserver(SignalObserver observer);

    [[nodiscard]] const ControllerOptions& getOptions() const;

    /**
     * @brief Spawn the configured executable for a session
     * @param sessionId Session the child belongs to
     * @param request Resource path (must exist), arguments, work directory
     *                (created if missing)
     * @return Process id and live handle, or ResourceNotFound / SpawnFailed
     */
    [[nodiscard]] Result<LaunchedProcess> launch(const std::string& sessionId,
                                                 const LaunchRequest& request);

    /**
     * @brief Graceful-then-forceful termination
     *
     * Sends SIGTERM, waits the grace period (live-handle or identifier-only),
     * then sends SIGKILL if the process is still alive. Terminating a process
     * that is already gone is a successful no-op.
     */
    [[nodiscard]] Result<TerminationOutcome> terminate(ControllableProcess& process);

    /**
     * @brief Live handle for a session spawned by this controller
     */
    [[nodiscard]] std::shared_ptr<ChildProcess> find(const std::string& sessionId) const;

    /**
     * @brief Live handle if owned, otherwise an identifier-only placeholder
     */
    [[nodiscard]] std::shared_ptr<ControllableProcess> controlFor(
        const std::string& sessionId, std::optional<int> processId) const;

    /**
     * @brief Snapshots of captures that gained lines since the previous call
     *
     * Each snapshot is returned once per version; the bookkeeping is dropped
     * with the handle on release().
     */
    [[nodiscard]] std::vector<std::pair<std::string, CaptureSnapshot>> takeUnflushedCaptures();

    /**
     * @brief Number of handles still registered
     */
    [[nodiscard]] size_t ownedCount() const;

    /**
     * @brief Forget a finalized session's handle
     */
    void release(const std::string& sessionId);

    /**
     * @brief Kill every running child and stop delivering exit notifications
     */
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_PROCESS_PROCESS_CONTROLLER_HPP
