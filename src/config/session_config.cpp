/*
 * session_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session_config.hpp"

#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

namespace tandem::config {

std::optional<std::string> SessionConfig::validate() const {
    if (editorExecutable.empty()) {
        return "editorExecutable";
    }
    if (gracePeriodMs < 0) {
        return "gracePeriodMs";
    }
    if (identifierGracePeriodMs < 0) {
        return "identifierGracePeriodMs";
    }
    if (pollIntervalMs <= 0) {
        return "pollIntervalMs";
    }
    if (startupDelayMs < 0) {
        return "startupDelayMs";
    }
    if (maxSummaryLength == 0) {
        return "maxSummaryLength";
    }
    return std::nullopt;
}

void SessionConfig::applyEnvironment() {
    if (const char* value = std::getenv(ENV_STATE_DIR); value && *value) {
        stateDirectory = value;
    }
    if (const char* value = std::getenv(ENV_EDITOR); value && *value) {
        editorExecutable = value;
    }
    if (const char* value = std::getenv(ENV_LOG_LEVEL); value && *value) {
        logLevel = value;
    }
}

session::Result<SessionConfig> loadSessionConfig(
    const std::optional<std::filesystem::path>& path) {
    SessionConfig cfg;

    if (path) {
        std::ifstream in(*path);
        if (!in.is_open()) {
            spdlog::error("Config: cannot open {}", path->string());
            return std::unexpected(session::SessionError::InvalidConfiguration);
        }
        try {
            auto document = json::parse(in);
            if (!document.is_object()) {
                spdlog::error("Config: {} must contain a JSON object", path->string());
                return std::unexpected(session::SessionError::InvalidConfiguration);
            }
            cfg = SessionConfig::fromJson(document);
        } catch (const json::exception& e) {
            spdlog::error("Config: failed to parse {}: {}", path->string(), e.what());
            return std::unexpected(session::SessionError::InvalidConfiguration);
        }
    }

    cfg.applyEnvironment();

    if (auto invalid = cfg.validate()) {
        spdlog::error("Config: invalid value for '{}'", *invalid);
        return std::unexpected(session::SessionError::InvalidConfiguration);
    }
    return cfg;
}

}  // namespace tandem::config
