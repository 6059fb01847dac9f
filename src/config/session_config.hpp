/*
 * session_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Session subsystem configuration (file + environment)

**************************************************/

#ifndef TANDEM_CONFIG_SESSION_CONFIG_HPP
#define TANDEM_CONFIG_SESSION_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "session/types.hpp"

namespace tandem::config {

using json = nlohmann::json;

/**
 * @brief Settings shared by the store, controller, coordinator and logging
 *
 * @example
 * ```json
 * {
 *   "stateDirectory": "/tmp/tandem-sessions",
 *   "editorExecutable": "code",
 *   "gracePeriodMs": 5000,
 *   "identifierGracePeriodMs": 2000,
 *   "pollIntervalMs": 500,
 *   "startupDelayMs": 500,
 *   "maxSummaryLength": 1000,
 *   "logLevel": "info",
 *   "logFile": ""
 * }
 * ```
 */
struct SessionConfig {
    /// Environment variables applied over the file
    static constexpr const char* ENV_STATE_DIR = "TANDEM_STATE_DIR";
    static constexpr const char* ENV_EDITOR = "TANDEM_EDITOR";
    static constexpr const char* ENV_LOG_LEVEL = "TANDEM_LOG_LEVEL";

    std::string stateDirectory;               ///< Empty = <tmp>/tandem-sessions
    std::string editorExecutable{"code"};     ///< Program launched per session
    int gracePeriodMs{5000};                  ///< SIGTERM grace, live handle
    int identifierGracePeriodMs{2000};        ///< SIGTERM grace, by process id
    int pollIntervalMs{500};                  ///< Signal poll interval
    int startupDelayMs{500};                  ///< Delay before a wait's first check
    size_t maxSummaryLength{1000};            ///< Summary truncation threshold
    std::string logLevel{"info"};             ///< trace/debug/info/warn/error/critical/off
    std::string logFile;                      ///< Empty = no file sink

    [[nodiscard]] json toJson() const {
        return {{"stateDirectory", stateDirectory},
                {"editorExecutable", editorExecutable},
                {"gracePeriodMs", gracePeriodMs},
                {"identifierGracePeriodMs", identifierGracePeriodMs},
                {"pollIntervalMs", pollIntervalMs},
                {"startupDelayMs", startupDelayMs},
                {"maxSummaryLength", maxSummaryLength},
                {"logLevel", logLevel},
                {"logFile", logFile}};
    }

    /**
     * @brief Build from JSON; missing keys keep their defaults
     * @throws nlohmann::json::type_error on wrongly typed keys
     */
    [[nodiscard]] static SessionConfig fromJson(const json& j) {
        SessionConfig cfg;
        cfg.stateDirectory = j.value("stateDirectory", cfg.stateDirectory);
        cfg.editorExecutable = j.value("editorExecutable", cfg.editorExecutable);
        cfg.gracePeriodMs = j.value("gracePeriodMs", cfg.gracePeriodMs);
        cfg.identifierGracePeriodMs =
            j.value("identifierGracePeriodMs", cfg.identifierGracePeriodMs);
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        cfg.startupDelayMs = j.value("startupDelayMs", cfg.startupDelayMs);
        cfg.maxSummaryLength = j.value("maxSummaryLength", cfg.maxSummaryLength);
        cfg.logLevel = j.value("logLevel", cfg.logLevel);
        cfg.logFile = j.value("logFile", cfg.logFile);
        return cfg;
    }

    /**
     * @brief Range checks
     * @return Empty on success, otherwise the offending key
     */
    [[nodiscard]] std::optional<std::string> validate() const;

    /**
     * @brief Apply TANDEM_* environment variables
     */
    void applyEnvironment();
};

/**
 * @brief Load configuration from an optional JSON file, then the environment
 *
 * A missing path yields the defaults. An unreadable or malformed file, or a
 * value out of range, yields InvalidConfiguration.
 */
[[nodiscard]] session::Result<SessionConfig> loadSessionConfig(
    const std::optional<std::filesystem::path>& path = std::nullopt);

}  // namespace tandem::config

#endif  // TANDEM_CONFIG_SESSION_CONFIG_HPP
