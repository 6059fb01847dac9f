/*
 * controllable_process.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "controllable_process.hpp"
#include "process_spawning.hpp"

#include <thread>

namespace tandem::session {

DetachedProcess::DetachedProcess(int processId,
                                 std::chrono::milliseconds pollInterval)
    : processId_(processId), pollInterval_(pollInterval) {}

bool DetachedProcess::isAlive() const {
    return ProcessSpawner::isProcessRunning(processId_);
}

Result<void> DetachedProcess::sendSignal(int signal) {
    return ProcessSpawner::signalProcess(processId_, signal);
}

bool DetachedProcess::waitForExit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (isAlive()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(pollInterval_);
    }
    return true;
}

}  // namespace tandem::session
