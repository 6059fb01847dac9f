/*
 * orchestrator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file orchestrator.hpp
 * @brief Launch, stop and wait facade over the session subsystem
 * @date 2024
 * @version 1.0.0
 *
 * One SessionOrchestrator is one invocation. Invocations share nothing but
 * the state directory: any of them may stop a session another one launched,
 * and the Result reaches whichever invocation waits on it.
 */

#ifndef TANDEM_SESSION_ORCHESTRATOR_HPP
#define TANDEM_SESSION_ORCHESTRATOR_HPP

#include "completion/completion_coordinator.hpp"
#include "config/session_config.hpp"
#include "process/process_controller.hpp"
#include "signal/signal_channel.hpp"
#include "store/session_store.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tandem::session {

class SessionOrchestrator {
public:
    explicit SessionOrchestrator(const config::SessionConfig& config = {});

    /**
     * @brief Stops the poller, then kills children this invocation spawned
     *
     * Sessions left behind are reaped as stale by the next load.
     */
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /**
     * @brief Persist a new session, spawn its process, make it current
     * @return The session id, or ResourceNotFound / SpawnFailed /
     *         StorageError. No session remains after a failure.
     */
    [[nodiscard]] Result<std::string> launchSession(const LaunchRequest& request);

    /**
     * @brief Stop the session the current pointer names
     * @return NoCurrentSession when there is none
     */
    [[nodiscard]] Result<CompletionResult> stopCurrent();

    /**
     * @brief Stop a session by id, from any invocation
     * @return NotFound for unknown, already finished or already stopping
     *         sessions
     */
    [[nodiscard]] Result<CompletionResult> stopById(const std::string& sessionId);

    /**
     * @brief Stop every listed session
     * @return The results produced, one per session stopped
     */
    [[nodiscard]] Result<std::vector<CompletionResult>> stopAll();

    /**
     * @brief Wait for a session's Result; never blocks the caller
     */
    [[nodiscard]] WaitFuture waitFor(const std::string& sessionId);

    [[nodiscard]] Result<std::vector<SessionRecord>> listSessions();

    [[nodiscard]] Result<std::optional<std::string>> currentSession();

    /**
     * @brief Token ("<pid>:<nonce>") identifying this invocation
     */
    [[nodiscard]] const std::string& invocationToken() const noexcept;

    [[nodiscard]] const config::SessionConfig& getConfig() const noexcept;

    /**
     * @brief Trace every termination signal sent by this invocation
     */
    void setSignalObserver(SignalObserver observer);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief New id of the form "session-" + 8 lowercase base-36 characters
 */
[[nodiscard]] std::string generateSessionId();

}  // namespace tandem::session

#endif  // TANDEM_SESSION_ORCHESTRATOR_HPP
