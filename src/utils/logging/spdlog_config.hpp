/*
 * spdlog_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration for the tandem tools

**************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tandem::logging {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/**
 * @brief Parse a level name; unknown names map to INFO
 */
[[nodiscard]] LogLevel logLevelFromString(std::string_view name) noexcept;

struct LoggerConfig {
    std::string name{"tandem"};
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool console_output = true;        ///< Colored sink on stderr
    bool file_output = false;
    std::string log_file_path = "logs/tandem.log";
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    bool flush_on_error = true;
    std::chrono::seconds flush_interval{3};
};

/**
 * @brief Process-wide logging setup
 *
 * Installs the default logger used by every `spdlog::info(...)` call.
 * Console output goes to stderr; stdout is reserved for command results.
 */
class LogConfig {
public:
    /**
     * @brief Install the default logger; later calls replace it
     * @param config Logger configuration
     * @return False if a sink could not be created; the default logger is
     *         left untouched in that case
     */
    static bool initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Set global log level
     * @param level New log level
     */
    static void setGlobalLevel(LogLevel level) noexcept;

    [[nodiscard]] static LogLevel globalLevel() noexcept;

    [[nodiscard]] static bool isInitialized() noexcept;

    /**
     * @brief Flush all loggers
     */
    static void flushAll() noexcept;

    static auto convertLevel(LogLevel level) noexcept -> spdlog::level::level_enum;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::atomic<LogLevel> global_level_{LogLevel::INFO};
};

}  // namespace tandem::logging
