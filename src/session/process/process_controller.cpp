/*
 * process_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_controller.hpp"
#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace fs = std::filesystem;

namespace tandem::session {

namespace {

/**
 * Outlives the controller inside supervisor callbacks. Callbacks run under a
 * shared lock so disabling waits for the ones already in flight.
 */
struct ExitDispatch {
    std::shared_mutex mutex;
    ExitObserver observer;
    bool enabled{true};

    void dispatch(const std::string& sessionId, const ExitStatus& status) {
        std::shared_lock lock(mutex);
        if (enabled && observer) {
            observer(sessionId, status);
        }
    }
};

struct OwnedChild {
    std::shared_ptr<ChildProcess> handle;
    std::uint64_t flushedVersion{0};
};

}  // namespace

class ProcessController::Impl {
public:
    explicit Impl(const ControllerOptions& options)
        : options_(options), dispatch_(std::make_shared<ExitDispatch>()) {}

    ~Impl() { shutdown(); }

    void notifySignal(int processId, int signal) {
        SignalObserver observer;
        {
            std::lock_guard lock(mutex_);
            observer = signalObserver_;
        }
        if (observer) {
            observer(processId, signal);
        }
    }

    void shutdown() {
        {
            std::unique_lock lock(dispatch_->mutex);
            dispatch_->enabled = false;
        }
        std::unordered_map<std::string, OwnedChild> children;
        {
            std::lock_guard lock(mutex_);
            children.swap(children_);
        }
        for (auto& [sessionId, owned] : children) {
            auto& child = owned.handle;
            if (child->isAlive()) {
                spdlog::info("ProcessController: killing session {} (PID {}) on shutdown",
                             sessionId, child->processId());
            }
            child->shutdown();
        }
    }

    ControllerOptions options_;
    std::shared_ptr<ExitDispatch> dispatch_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, OwnedChild> children_;
    SignalObserver signalObserver_;
};

ProcessController::ProcessController()
    : ProcessController(ControllerOptions{}) {}

ProcessController::ProcessController(const ControllerOptions& options)
    : pImpl_(std::make_unique<Impl>(options)) {}

ProcessController::~ProcessController() = default;

ProcessController::ProcessController(ProcessController&&) noexcept = default;
ProcessController& ProcessController::operator=(ProcessController&&) noexcept = default;

void ProcessController::setExitObserver(ExitObserver observer) {
    std::unique_lock lock(pImpl_->dispatch_->mutex);
    pImpl_->dispatch_->observer = std::move(observer);
}

void ProcessController::setSignalObserver(SignalObserver observer) {
    std::lock_guard lock(pImpl_->mutex_);
    pImpl_->signalObserver_ = std::move(observer);
}

const ControllerOptions& ProcessController::getOptions() const {
    return pImpl_->options_;
}

Result<LaunchedProcess> ProcessController::launch(const std::string& sessionId,
                                                  const LaunchRequest& request) {
    std::error_code ec;
    if (request.resourcePath.empty() || !fs::exists(request.resourcePath, ec)) {
        spdlog::error("ProcessController: resource path does not exist: {}",
                      request.resourcePath.string());
        return std::unexpected(SessionError::ResourceNotFound);
    }

    if (!request.workDirectory.empty() && !fs::exists(request.workDirectory, ec)) {
        fs::create_directories(request.workDirectory, ec);
        if (ec) {
            spdlog::error("ProcessController: cannot create work directory {}: {}",
                          request.workDirectory.string(), ec.message());
            return std::unexpected(SessionError::SpawnFailed);
        }
        spdlog::info("ProcessController: created work directory {}",
                     request.workDirectory.string());
    }

    auto spawned = ProcessSpawner::spawn(pImpl_->options_.executable,
                                         request.arguments, request.workDirectory);
    if (!spawned) {
        return std::unexpected(spawned.error());
    }

    auto handle = std::make_shared<ChildProcess>(sessionId, *spawned);
    {
        std::lock_guard lock(pImpl_->mutex_);
        pImpl_->children_[sessionId] = OwnedChild{handle, 0};
    }
    handle->start([dispatch = pImpl_->dispatch_, sessionId](const ExitStatus& status) {
        dispatch->dispatch(sessionId, status);
    });

    spdlog::info("ProcessController: session {} running as PID {}", sessionId,
                 spawned->processId);
    return LaunchedProcess{spawned->processId, handle};
}

Result<TerminationOutcome> ProcessController::terminate(ControllableProcess& process) {
    TerminationOutcome outcome;
    const int pid = process.processId();

    if (!process.isAlive()) {
        spdlog::debug("ProcessController: PID {} already gone", pid);
        outcome.exitCode = process.exitCode();
        return outcome;
    }
    outcome.wasAlive = true;

    const auto grace = process.supportsExitNotification()
                           ? pImpl_->options_.gracePeriod
                           : pImpl_->options_.identifierGracePeriod;

    spdlog::info("ProcessController: sending SIGTERM to PID {}", pid);
    pImpl_->notifySignal(pid, SIGTERM);
    if (auto sent = process.sendSignal(SIGTERM); !sent) {
        return std::unexpected(sent.error());
    }

    if (!process.waitForExit(grace)) {
        spdlog::warn("ProcessController: PID {} did not terminate within {} ms, using SIGKILL",
                     pid, grace.count());
        pImpl_->notifySignal(pid, SIGKILL);
        if (auto sent = process.sendSignal(SIGKILL); !sent) {
            return std::unexpected(sent.error());
        }
        outcome.forced = true;
        if (!process.waitForExit(grace)) {
            spdlog::error("ProcessController: PID {} survived SIGKILL", pid);
            return std::unexpected(SessionError::TerminationFailed);
        }
    } else {
        spdlog::info("ProcessController: PID {} terminated gracefully", pid);
    }

    outcome.exitCode = process.exitCode();
    return outcome;
}

std::shared_ptr<ChildProcess> ProcessController::find(const std::string& sessionId) const {
    std::lock_guard lock(pImpl_->mutex_);
    auto it = pImpl_->children_.find(sessionId);
    return it == pImpl_->children_.end() ? nullptr : it->second.handle;
}

std::shared_ptr<ControllableProcess> ProcessController::controlFor(
    const std::string& sessionId, std::optional<int> processId) const {
    if (auto child = find(sessionId)) {
        return child;
    }
    if (processId) {
        return std::make_shared<DetachedProcess>(*processId);
    }
    return nullptr;
}

std::vector<std::pair<std::string, CaptureSnapshot>>
ProcessController::takeUnflushedCaptures() {
    std::vector<std::pair<std::string, CaptureSnapshot>> result;
    std::lock_guard lock(pImpl_->mutex_);
    for (auto& [sessionId, owned] : pImpl_->children_) {
        if (owned.handle->capture().version() == owned.flushedVersion) {
            continue;
        }
        auto snapshot = owned.handle->capture().snapshot();
        owned.flushedVersion = snapshot.version;
        result.emplace_back(sessionId, std::move(snapshot));
    }
    return result;
}

size_t ProcessController::ownedCount() const {
    std::lock_guard lock(pImpl_->mutex_);
    return pImpl_->children_.size();
}

void ProcessController::release(const std::string& sessionId) {
    std::lock_guard lock(pImpl_->mutex_);
    pImpl_->children_.erase(sessionId);
}

void ProcessController::shutdown() {
    pImpl_->shutdown();
}

}  // namespace tandem::session
