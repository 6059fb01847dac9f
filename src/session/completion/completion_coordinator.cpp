/*
 * completion_coordinator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "completion_coordinator.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tandem::session {

namespace {

using SteadyClock = std::chrono::steady_clock;
using WaitPromise = std::promise<Result<CompletionResult>>;

struct PendingWait {
    std::vector<WaitPromise> promises;
    SteadyClock::time_point firstCheckAt;
    bool checked{false};
};

void settle(std::vector<WaitPromise>& promises, const Result<CompletionResult>& value) {
    for (auto& promise : promises) {
        promise.set_value(value);
    }
}

}  // namespace

class CompletionCoordinator::Impl {
public:
    Impl(SessionStore& store, SignalChannel& signals, const CoordinatorOptions& options)
        : store_(store), signals_(signals), options_(options) {}

    ~Impl() { stop(); }

    void start() {
        std::lock_guard lock(mutex_);
        if (poller_.joinable()) {
            return;
        }
        nextTickAt_ = SteadyClock::now() + options_.pollInterval;
        poller_ = std::jthread([this](std::stop_token token) { run(token); });
        spdlog::debug("CompletionCoordinator: poller started ({} ms interval)",
                      options_.pollInterval.count());
    }

    void stop() {
        std::jthread poller;
        {
            std::lock_guard lock(mutex_);
            poller = std::move(poller_);
        }
        if (poller.joinable()) {
            poller.request_stop();
            wakeup_.notify_all();
            poller.join();
            spdlog::debug("CompletionCoordinator: poller stopped");
        }

        std::unordered_map<std::string, PendingWait> abandoned;
        {
            std::lock_guard lock(mutex_);
            abandoned.swap(pending_);
        }
        for (auto& [sessionId, wait] : abandoned) {
            spdlog::warn("CompletionCoordinator: abandoning wait on {}", sessionId);
            settle(wait.promises, std::unexpected(SessionError::WaitFailed));
        }
    }

    WaitFuture waitFor(const std::string& sessionId) {
        WaitPromise promise;
        auto future = promise.get_future();
        if (!isValidSessionId(sessionId)) {
            spdlog::warn("CompletionCoordinator: invalid session id '{}'", sessionId);
            promise.set_value(std::unexpected(SessionError::NotFound));
            return future;
        }
        {
            std::lock_guard lock(mutex_);
            auto [it, inserted] = pending_.try_emplace(sessionId);
            if (inserted) {
                it->second.firstCheckAt = SteadyClock::now() + options_.startupDelay;
            }
            it->second.promises.push_back(std::move(promise));
        }
        spdlog::debug("CompletionCoordinator: waiting for {}", sessionId);
        wakeup_.notify_all();
        return future;
    }

    bool resolve(const std::string& sessionId, const Result<CompletionResult>& value) {
        std::vector<WaitPromise> promises;
        {
            std::lock_guard lock(mutex_);
            auto it = pending_.find(sessionId);
            if (it == pending_.end()) {
                return false;
            }
            promises = std::move(it->second.promises);
            pending_.erase(it);
        }
        if (value) {
            spdlog::info("CompletionCoordinator: resolved {} wait(s) on {}",
                         promises.size(), sessionId);
        } else {
            spdlog::warn("CompletionCoordinator: wait on {} failed: {}", sessionId,
                         sessionErrorToString(value.error()));
        }
        settle(promises, value);
        return true;
    }

    void run(std::stop_token token) {
        while (!token.stop_requested()) {
            {
                std::unique_lock lock(mutex_);
                auto deadline = nextTickAt_;
                for (const auto& [sessionId, wait] : pending_) {
                    if (!wait.checked && wait.firstCheckAt < deadline) {
                        deadline = wait.firstCheckAt;
                    }
                }
                // Re-evaluated whenever waitFor() registers a new wait
                auto registered = pending_.size();
                wakeup_.wait_until(lock, token, deadline, [&] {
                    return pending_.size() != registered;
                });
                if (token.stop_requested()) {
                    return;
                }
            }

            runFirstChecks();

            bool tickDue = false;
            {
                std::lock_guard lock(mutex_);
                auto now = SteadyClock::now();
                if (now >= nextTickAt_) {
                    tickDue = true;
                    nextTickAt_ = now + options_.pollInterval;
                }
            }
            if (tickDue) {
                tick();
            }
        }
    }

    std::vector<std::string> collect(bool checked, bool dueOnly) {
        std::vector<std::string> ids;
        auto now = SteadyClock::now();
        std::lock_guard lock(mutex_);
        for (const auto& [sessionId, wait] : pending_) {
            if (wait.checked != checked) {
                continue;
            }
            if (dueOnly && wait.firstCheckAt > now) {
                continue;
            }
            ids.push_back(sessionId);
        }
        return ids;
    }

    void runFirstChecks() {
        auto due = collect(false, true);
        if (due.empty()) {
            return;
        }

        auto lock = store_.layout().lock();
        if (!lock) {
            spdlog::error("CompletionCoordinator: cannot lock storage: {}",
                          sessionErrorToString(lock.error()));
            return;
        }
        auto table = store_.readLocked(*lock);
        if (!table) {
            return;
        }

        for (const auto& sessionId : due) {
            auto signal = signals_.tryConsumeLocked(*lock, sessionId);
            if (signal && signal->has_value()) {
                resolve(sessionId, **signal);
                continue;
            }
            if (!table->contains(sessionId)) {
                spdlog::warn("CompletionCoordinator: session {} not found", sessionId);
                resolve(sessionId, std::unexpected(SessionError::NotFound));
                continue;
            }
            std::lock_guard guard(mutex_);
            if (auto it = pending_.find(sessionId); it != pending_.end()) {
                it->second.checked = true;
            }
        }
    }

    void tick() {
        TickHook hook;
        {
            std::lock_guard lock(mutex_);
            hook = tickHook_;
        }
        if (hook) {
            hook();
        }

        if (collect(true, false).empty()) {
            return;
        }

        auto lock = store_.layout().lock();
        if (!lock) {
            spdlog::error("CompletionCoordinator: cannot lock storage: {}",
                          sessionErrorToString(lock.error()));
            return;
        }
        // Reaping may resolve waits through the store's reap handler
        auto table = store_.loadLocked(*lock);
        if (!table) {
            return;
        }

        for (const auto& sessionId : collect(true, false)) {
            auto signal = signals_.tryConsumeLocked(*lock, sessionId);
            if (!signal) {
                continue;
            }
            if (signal->has_value()) {
                resolve(sessionId, **signal);
            } else if (!table->contains(sessionId)) {
                spdlog::error("CompletionCoordinator: session {} vanished without a result",
                              sessionId);
                resolve(sessionId, std::unexpected(SessionError::WaitFailed));
            }
        }
    }

    SessionStore& store_;
    SignalChannel& signals_;
    CoordinatorOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable_any wakeup_;
    std::unordered_map<std::string, PendingWait> pending_;
    SteadyClock::time_point nextTickAt_{};
    TickHook tickHook_;
    std::jthread poller_;
};

CompletionCoordinator::CompletionCoordinator(SessionStore& store,
                                             SignalChannel& signals,
                                             const CoordinatorOptions& options)
    : pImpl_(std::make_unique<Impl>(store, signals, options)) {}

CompletionCoordinator::~CompletionCoordinator() = default;

void CompletionCoordinator::start() { pImpl_->start(); }

void CompletionCoordinator::stop() { pImpl_->stop(); }

bool CompletionCoordinator::isRunning() const {
    std::lock_guard lock(pImpl_->mutex_);
    return pImpl_->poller_.joinable();
}

WaitFuture CompletionCoordinator::waitFor(const std::string& sessionId) {
    return pImpl_->waitFor(sessionId);
}

bool CompletionCoordinator::resolveLocal(const std::string& sessionId,
                                         const CompletionResult& result) {
    return pImpl_->resolve(sessionId, result);
}

bool CompletionCoordinator::hasPendingWait(const std::string& sessionId) const {
    std::lock_guard lock(pImpl_->mutex_);
    return pImpl_->pending_.contains(sessionId);
}

size_t CompletionCoordinator::pendingCount() const {
    std::lock_guard lock(pImpl_->mutex_);
    return pImpl_->pending_.size();
}

void CompletionCoordinator::setTickHook(TickHook hook) {
    std::lock_guard lock(pImpl_->mutex_);
    pImpl_->tickHook_ = std::move(hook);
}

const CoordinatorOptions& CompletionCoordinator::getOptions() const {
    return pImpl_->options_;
}

}  // namespace tandem::session
