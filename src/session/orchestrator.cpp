/*
 * orchestrator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <format>
#include <random>

#include <unistd.h>

namespace fs = std::filesystem;

namespace tandem::session {

namespace {

constexpr std::string_view kIdAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t kIdLength = 8;

std::mt19937_64& randomEngine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::string makeInvocationToken() {
    return std::format("{}:{:016x}", ::getpid(), randomEngine()());
}

ControllerOptions controllerOptions(const config::SessionConfig& config) {
    ControllerOptions options;
    options.executable = config.editorExecutable;
    options.gracePeriod = std::chrono::milliseconds(config.gracePeriodMs);
    options.identifierGracePeriod =
        std::chrono::milliseconds(config.identifierGracePeriodMs);
    return options;
}

CoordinatorOptions coordinatorOptions(const config::SessionConfig& config) {
    CoordinatorOptions options;
    options.pollInterval = std::chrono::milliseconds(config.pollIntervalMs);
    options.startupDelay = std::chrono::milliseconds(config.startupDelayMs);
    return options;
}

}  // namespace

std::string generateSessionId() {
    std::uniform_int_distribution<size_t> pick(0, kIdAlphabet.size() - 1);
    std::string id = "session-";
    for (size_t i = 0; i < kIdLength; ++i) {
        id += kIdAlphabet[pick(randomEngine())];
    }
    return id;
}

class SessionOrchestrator::Impl {
public:
    explicit Impl(const config::SessionConfig& config)
        : config_(config),
          token_(makeInvocationToken()),
          store_(StorageLayout(config.stateDirectory)),
          signals_(StorageLayout(config.stateDirectory)),
          coordinator_(store_, signals_, coordinatorOptions(config)),
          controller_(controllerOptions(config)) {
        store_.setReapHandler([this](const FileLock& lock, const CompletionResult& result) {
            deliverLocked(lock, result);
        });
        controller_.setExitObserver(
            [this](const std::string& sessionId, const ExitStatus& status) {
                onChildExit(sessionId, status);
            });
        coordinator_.setTickHook([this] { flushCaptures(); });
        coordinator_.start();

        spdlog::debug("SessionOrchestrator: invocation {} using {}", token_,
                      store_.layout().root().string());
    }

    ~Impl() {
        coordinator_.stop();
        controller_.shutdown();
    }

    /**
     * Resolve a local waiter, or leave the Result for another invocation
     */
    void deliverLocked(const FileLock& lock, const CompletionResult& result) {
        if (coordinator_.resolveLocal(result.sessionId, result)) {
            return;
        }
        if (auto published = signals_.publishLocked(lock, result.sessionId, result);
            !published) {
            spdlog::error("SessionOrchestrator: failed to publish result for {}: {}",
                          result.sessionId, sessionErrorToString(published.error()));
        }
    }

    /**
     * Prefer this invocation's live capture over the last flushed copy
     */
    SessionRecord withLiveCapture(SessionRecord record) const {
        if (auto child = controller_.find(record.sessionId)) {
            auto snapshot = child->capture().snapshot();
            record.outputLines = std::move(snapshot.outputLines);
            record.errorLines = std::move(snapshot.errorLines);
        }
        return record;
    }

    void onChildExit(const std::string& sessionId, const ExitStatus& status) {
        auto lock = store_.layout().lock();
        if (!lock) {
            spdlog::error("SessionOrchestrator: cannot finalize {}: {}", sessionId,
                          sessionErrorToString(lock.error()));
            return;
        }
        auto table = store_.readLocked(*lock);
        if (!table) {
            return;
        }
        auto it = table->find(sessionId);
        if (it == table->end()) {
            spdlog::debug("SessionOrchestrator: {} exited after being finalized", sessionId);
            controller_.release(sessionId);
            return;
        }
        if (it->second.stoppingBy) {
            spdlog::debug("SessionOrchestrator: {} exited while stopped by {}", sessionId,
                          *it->second.stoppingBy);
            if (*it->second.stoppingBy != token_) {
                controller_.release(sessionId);
            }
            return;
        }

        auto result = makeCompletionResult(withLiveCapture(it->second), status.exitCode);
        if (auto removed = store_.removeLocked(*lock, sessionId); !removed) {
            spdlog::error("SessionOrchestrator: cannot remove {}: {}", sessionId,
                          sessionErrorToString(removed.error()));
            return;
        }
        spdlog::info("SessionOrchestrator: session {} exited on its own", sessionId);
        deliverLocked(*lock, result);
        controller_.release(sessionId);
    }

    void flushCaptures() {
        for (auto& [sessionId, snapshot] : controller_.takeUnflushedCaptures()) {
            auto updated = store_.update(sessionId, [&](SessionRecord& record) {
                record.outputLines = std::move(snapshot.outputLines);
                record.errorLines = std::move(snapshot.errorLines);
            });
            if (!updated) {
                spdlog::warn("SessionOrchestrator: cannot flush output of {}: {}",
                             sessionId, sessionErrorToString(updated.error()));
            }
        }
    }

    Result<std::string> launch(const LaunchRequest& request) {
        std::error_code ec;
        if (request.resourcePath.empty() || !fs::exists(request.resourcePath, ec)) {
            spdlog::error("SessionOrchestrator: resource path does not exist: {}",
                          request.resourcePath.string());
            return std::unexpected(SessionError::ResourceNotFound);
        }

        SessionRecord record;
        record.sessionId = generateSessionId();
        record.resourcePath = request.resourcePath.string();
        record.workDirectory = request.workDirectory.string();
        record.arguments = request.arguments;
        record.startedAt = Clock::now();
        record.owner = token_;
        const auto sessionId = record.sessionId;

        if (auto saved = store_.upsert(record); !saved) {
            return std::unexpected(saved.error());
        }

        auto launched = controller_.launch(sessionId, request);
        if (!launched) {
            spdlog::error("SessionOrchestrator: launch of {} failed: {}", sessionId,
                          sessionErrorToString(launched.error()));
            if (auto removed = store_.remove(sessionId); !removed) {
                spdlog::error("SessionOrchestrator: cannot remove {}: {}", sessionId,
                              sessionErrorToString(removed.error()));
            }
            return std::unexpected(launched.error());
        }

        auto recorded = recordProcess(sessionId, launched->processId);
        if (!recorded) {
            return std::unexpected(recorded.error());
        }
        if (!*recorded) {
            // Finalized while spawning: stopped elsewhere or already exited
            if (auto terminated = controller_.terminate(*launched->handle); !terminated) {
                spdlog::error("SessionOrchestrator: cannot terminate orphaned {}",
                              sessionId);
            }
            controller_.release(sessionId);
        }

        spdlog::info("SessionOrchestrator: launched session {} (PID {})", sessionId,
                     launched->processId);
        return sessionId;
    }

    /**
     * Record the pid and point at the session, unless it is already gone
     */
    Result<bool> recordProcess(const std::string& sessionId, int processId) {
        auto lock = store_.layout().lock();
        if (!lock) {
            return std::unexpected(lock.error());
        }
        auto table = store_.readLocked(*lock);
        if (!table) {
            return std::unexpected(table.error());
        }
        auto it = table->find(sessionId);
        if (it == table->end()) {
            return false;
        }
        it->second.processId = processId;
        if (auto written = store_.writeLocked(*lock, *table); !written) {
            return std::unexpected(written.error());
        }
        if (auto pointed = store_.setCurrentPointerLocked(*lock, sessionId); !pointed) {
            return std::unexpected(pointed.error());
        }
        return true;
    }

    Result<SessionRecord> claim(const std::string& sessionId) {
        auto lock = store_.layout().lock();
        if (!lock) {
            return std::unexpected(lock.error());
        }
        auto table = store_.loadLocked(*lock);
        if (!table) {
            return std::unexpected(table.error());
        }
        auto it = table->find(sessionId);
        if (it == table->end()) {
            spdlog::warn("SessionOrchestrator: no session {}", sessionId);
            return std::unexpected(SessionError::NotFound);
        }
        if (it->second.stoppingBy) {
            spdlog::warn("SessionOrchestrator: session {} is already being stopped by {}",
                         sessionId, *it->second.stoppingBy);
            return std::unexpected(SessionError::NotFound);
        }
        it->second.stoppingBy = token_;
        if (auto written = store_.writeLocked(*lock, *table); !written) {
            return std::unexpected(written.error());
        }
        return it->second;
    }

    void releaseClaim(const std::string& sessionId) {
        auto cleared = store_.update(sessionId, [](SessionRecord& record) {
            record.stoppingBy.reset();
        });
        if (!cleared) {
            spdlog::error("SessionOrchestrator: cannot release claim on {}", sessionId);
        }
    }

    Result<CompletionResult> stop(const std::string& sessionId) {
        if (!isValidSessionId(sessionId)) {
            spdlog::warn("SessionOrchestrator: invalid session id '{}'", sessionId);
            return std::unexpected(SessionError::NotFound);
        }
        auto claimed = claim(sessionId);
        if (!claimed) {
            return std::unexpected(claimed.error());
        }

        std::optional<int> exitCode;
        if (auto control = controller_.controlFor(sessionId, claimed->processId)) {
            auto outcome = controller_.terminate(*control);
            if (!outcome) {
                spdlog::error("SessionOrchestrator: failed to stop {}: {}", sessionId,
                              sessionErrorToString(outcome.error()));
                releaseClaim(sessionId);
                return std::unexpected(outcome.error());
            }
            exitCode = outcome->exitCode;
        } else {
            spdlog::warn("SessionOrchestrator: session {} has no process yet", sessionId);
        }

        auto lock = store_.layout().lock();
        if (!lock) {
            return std::unexpected(lock.error());
        }
        auto table = store_.readLocked(*lock);
        if (!table) {
            return std::unexpected(table.error());
        }
        auto record = *claimed;
        if (auto it = table->find(sessionId); it != table->end()) {
            record = it->second;
        }

        auto result = makeCompletionResult(withLiveCapture(std::move(record)), exitCode);
        if (auto removed = store_.removeLocked(*lock, sessionId); !removed) {
            return std::unexpected(removed.error());
        }
        deliverLocked(*lock, result);
        controller_.release(sessionId);

        spdlog::info("SessionOrchestrator: stopped session {} after {} ms", sessionId,
                     result.durationMs);
        return result;
    }

    Result<CompletionResult> stopCurrent() {
        auto current = store_.currentPointer();
        if (!current) {
            return std::unexpected(current.error());
        }
        if (!current->has_value()) {
            spdlog::warn("SessionOrchestrator: no current session");
            return std::unexpected(SessionError::NoCurrentSession);
        }
        return stop(**current);
    }

    Result<std::vector<CompletionResult>> stopAll() {
        auto sessions = store_.load();
        if (!sessions) {
            return std::unexpected(sessions.error());
        }

        std::vector<CompletionResult> results;
        for (const auto& [sessionId, stored] : *sessions) {
            auto result = stop(sessionId);
            if (result) {
                results.push_back(std::move(*result));
            } else if (result.error() != SessionError::NotFound) {
                return std::unexpected(result.error());
            }
        }
        if (auto cleared = store_.setCurrentPointer(std::nullopt); !cleared) {
            return std::unexpected(cleared.error());
        }
        return results;
    }

    config::SessionConfig config_;
    std::string token_;
    SessionStore store_;
    SignalChannel signals_;
    CompletionCoordinator coordinator_;
    ProcessController controller_;
};

SessionOrchestrator::SessionOrchestrator(const config::SessionConfig& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

SessionOrchestrator::~SessionOrchestrator() = default;

Result<std::string> SessionOrchestrator::launchSession(const LaunchRequest& request) {
    return pImpl_->launch(request);
}

Result<CompletionResult> SessionOrchestrator::stopCurrent() {
    return pImpl_->stopCurrent();
}

Result<CompletionResult> SessionOrchestrator::stopById(const std::string& sessionId) {
    return pImpl_->stop(sessionId);
}

Result<std::vector<CompletionResult>> SessionOrchestrator::stopAll() {
    return pImpl_->stopAll();
}

WaitFuture SessionOrchestrator::waitFor(const std::string& sessionId) {
    return pImpl_->coordinator_.waitFor(sessionId);
}

Result<std::vector<SessionRecord>> SessionOrchestrator::listSessions() {
    auto sessions = pImpl_->store_.load();
    if (!sessions) {
        return std::unexpected(sessions.error());
    }
    std::vector<SessionRecord> records;
    records.reserve(sessions->size());
    for (auto& [sessionId, stored] : *sessions) {
        records.push_back(std::move(stored.record));
    }
    return records;
}

Result<std::optional<std::string>> SessionOrchestrator::currentSession() {
    auto lock = pImpl_->store_.layout().lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    auto table = pImpl_->store_.loadLocked(*lock);
    if (!table) {
        return std::unexpected(table.error());
    }
    return pImpl_->store_.currentPointerLocked(*lock);
}

const std::string& SessionOrchestrator::invocationToken() const noexcept {
    return pImpl_->token_;
}

const config::SessionConfig& SessionOrchestrator::getConfig() const noexcept {
    return pImpl_->config_;
}

void SessionOrchestrator::setSignalObserver(SignalObserver observer) {
    pImpl_->controller_.setSignalObserver(std::move(observer));
}

}  // namespace tandem::session
