/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Session lifecycle type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef TANDEM_SESSION_TYPES_HPP
#define TANDEM_SESSION_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem::session {

using json = nlohmann::json;

/**
 * @brief Error codes for session operations
 */
enum class SessionError {
    Success = 0,
    NotFound,
    NoCurrentSession,
    ResourceNotFound,
    SpawnFailed,
    TerminationFailed,
    WaitFailed,
    StorageError,
    InvalidConfiguration,
    UnknownError
};

/**
 * @brief Get string representation of SessionError
 */
[[nodiscard]] constexpr std::string_view sessionErrorToString(
    SessionError error) noexcept {
    switch (error) {
        case SessionError::Success: return "Success";
        case SessionError::NotFound: return "Session not found";
        case SessionError::NoCurrentSession: return "No current session";
        case SessionError::ResourceNotFound: return "Resource path does not exist";
        case SessionError::SpawnFailed: return "Process spawn failed";
        case SessionError::TerminationFailed: return "Process termination failed";
        case SessionError::WaitFailed: return "Session vanished while waiting";
        case SessionError::StorageError: return "Session storage error";
        case SessionError::InvalidConfiguration: return "Invalid configuration";
        case SessionError::UnknownError: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for session operations
 */
template <typename T>
using Result = std::expected<T, SessionError>;

using Clock = std::chrono::system_clock;

/**
 * @brief Inputs of a launch, as received from the tool-invocation boundary
 */
struct LaunchRequest {
    std::filesystem::path resourcePath;   ///< Extension development directory
    std::vector<std::string> arguments;   ///< Arguments passed to the editor
    std::filesystem::path workDirectory;  ///< Directory the process runs in
};

/**
 * @brief One tracked run of an external process, as persisted in the store
 */
struct SessionRecord {
    std::string sessionId;
    std::string resourcePath;
    std::string workDirectory;
    std::vector<std::string> arguments;
    Clock::time_point startedAt{};
    std::optional<int> processId;          ///< Absent until spawned
    std::vector<std::string> outputLines;
    std::vector<std::string> errorLines;
    std::string owner;                     ///< Token of the spawning invocation
    std::optional<std::string> stoppingBy; ///< Token of the invocation stopping it

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static SessionRecord fromJson(const json& j);
};

/**
 * @brief Outcome of a session's termination
 *
 * Produced exactly once per session, by whichever path claims the session
 * in the store first.
 */
struct CompletionResult {
    std::string sessionId;
    std::int64_t durationMs{0};
    std::optional<int> exitCode;  ///< Null when killed by a signal or unobserved
    std::vector<std::string> outputLines;
    std::vector<std::string> errorLines;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static CompletionResult fromJson(const json& j);

    bool operator==(const CompletionResult&) const = default;
};

/**
 * @brief Builds the result for a record terminating now
 */
[[nodiscard]] CompletionResult makeCompletionResult(
    const SessionRecord& record, std::optional<int> exitCode,
    Clock::time_point endedAt = Clock::now());

/**
 * @brief Whether @p sessionId is safe to use as a file name stem
 *
 * Accepts 1 to 64 characters from [A-Za-z0-9_-]; generated ids have the form
 * "session-" followed by 8 lowercase base-36 characters.
 */
[[nodiscard]] bool isValidSessionId(std::string_view sessionId) noexcept;

/**
 * @brief Extracts the process id part of an invocation token ("<pid>:<nonce>")
 */
[[nodiscard]] std::optional<int> tokenProcessId(std::string_view token);

}  // namespace tandem::session

#endif  // TANDEM_SESSION_TYPES_HPP
