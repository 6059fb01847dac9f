/*
 * completion_coordinator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file completion_coordinator.hpp
 * @brief Invocation-local pending waits and the signal poller
 * @date 2024
 * @version 1.0.0
 */

#ifndef TANDEM_SESSION_COMPLETION_COMPLETION_COORDINATOR_HPP
#define TANDEM_SESSION_COMPLETION_COMPLETION_COORDINATOR_HPP

#include "../signal/signal_channel.hpp"
#include "../store/session_store.hpp"
#include "../types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace tandem::session {

/**
 * @brief Poller timing
 */
struct CoordinatorOptions {
    std::chrono::milliseconds pollInterval{500};  ///< Interval between ticks
    std::chrono::milliseconds startupDelay{500};  ///< Delay before a wait's first check
};

using WaitFuture = std::future<Result<CompletionResult>>;

/**
 * @brief Runs at the start of every poll tick, without any lock held
 */
using TickHook = std::function<void()>;

/**
 * @brief Rendezvous between waiters and whoever finalizes a session
 *
 * A wait is registered immediately. Its first check runs after the startup
 * delay: a published signal resolves it at once, a session unknown to the
 * store resolves it with NotFound. Afterwards the poller consumes matching
 * signals every tick; a session that has neither a store entry nor a signal
 * fails the wait with WaitFailed. Local finalization resolves waits directly
 * through resolveLocal().
 *
 * Lock order: storage lock, then the coordinator's own mutex.
 */
class CompletionCoordinator {
public:
    CompletionCoordinator(SessionStore& store, SignalChannel& signals,
                          const CoordinatorOptions& options = {});
    ~CompletionCoordinator();

    CompletionCoordinator(const CompletionCoordinator&) = delete;
    CompletionCoordinator& operator=(const CompletionCoordinator&) = delete;

    /**
     * @brief Start the poller thread (idempotent)
     */
    void start();

    /**
     * @brief Stop the poller; unresolved waits fail with WaitFailed
     */
    void stop();

    [[nodiscard]] bool isRunning() const;

    /**
     * @brief Register a wait; never blocks the caller
     */
    [[nodiscard]] WaitFuture waitFor(const std::string& sessionId);

    /**
     * @brief Resolve every local wait on a session
     * @return True if at least one wait was resolved
     */
    bool resolveLocal(const std::string& sessionId, const CompletionResult& result);

    [[nodiscard]] bool hasPendingWait(const std::string& sessionId) const;
    [[nodiscard]] size_t pendingCount() const;

    void setTickHook(TickHook hook);

    [[nodiscard]] const CoordinatorOptions& getOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_COMPLETION_COMPLETION_COORDINATOR_HPP
