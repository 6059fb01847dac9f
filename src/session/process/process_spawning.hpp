/*
 * process_spawning.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TANDEM_SESSION_PROCESS_PROCESS_SPAWNING_HPP
#define TANDEM_SESSION_PROCESS_PROCESS_SPAWNING_HPP

#include "../types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tandem::session {

/**
 * @brief A freshly spawned child and the read ends of its output pipes
 */
struct SpawnedChild {
    int processId{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
};

/**
 * @brief Exit status observed for a child
 */
struct ExitStatus {
    std::optional<int> exitCode;  ///< Set when the child exited normally
    std::optional<int> signal;    ///< Set when the child was killed by a signal
};

/**
 * @brief Platform process primitives
 */
class ProcessSpawner {
public:
    /**
     * @brief Spawn @p executable in its own process group
     * @param executable Program name or path (PATH lookup applies)
     * @param arguments Arguments following argv[0]
     * @param workingDirectory Directory the child starts in
     * @return The child and its output pipes, or SpawnFailed when fork or
     *         exec fails (exec errors are reported through a close-on-exec pipe)
     */
    [[nodiscard]] static Result<SpawnedChild> spawn(
        const std::string& executable,
        const std::vector<std::string>& arguments,
        const std::filesystem::path& workingDirectory);

    /**
     * @brief Check whether the child has exited without reaping it
     * @return The exit status once the child is a zombie, std::nullopt while
     *         it is still running
     */
    [[nodiscard]] static std::optional<ExitStatus> peekExit(int processId);

    /**
     * @brief Reap an exited child
     */
    static void reap(int processId);

    /**
     * @brief Send a signal to the process group led by @p processId
     *
     * Falls back to the single process when no such group exists.
     * ESRCH counts as success.
     */
    [[nodiscard]] static Result<void> signalProcess(int processId, int signal);

    /**
     * @brief Check if a process is still running (kill(pid, 0))
     */
    [[nodiscard]] static bool isProcessRunning(int processId);
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_PROCESS_PROCESS_SPAWNING_HPP
