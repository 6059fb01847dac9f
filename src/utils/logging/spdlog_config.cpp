/*
 * spdlog_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration implementation

**************************************************/

#include "spdlog_config.hpp"

#include <cstdio>
#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tandem::logging {

LogLevel logLevelFromString(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error" || name == "err") return LogLevel::ERROR;
    if (name == "critical" || name == "fatal") return LogLevel::CRITICAL;
    if (name == "off" || name == "none") return LogLevel::OFF;
    return LogLevel::INFO;
}

bool LogConfig::initialize(const LoggerConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern(config.pattern);
            sinks.push_back(console_sink);
        }

        if (config.file_output) {
            auto parent = std::filesystem::path(config.log_file_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file_path, config.max_file_size, config.max_files);
            file_sink->set_level(spdlog::level::trace);  // Log everything to file
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%n] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(),
                                                       sinks.end());
        if (config.flush_on_error) {
            logger->flush_on(spdlog::level::err);
        }
        spdlog::set_default_logger(logger);
        setGlobalLevel(config.level);
        spdlog::flush_every(config.flush_interval);

        spdlog::set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });
        initialized_.store(true, std::memory_order_release);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        return false;
    }

    spdlog::debug("Logging initialized at level {}",
                  spdlog::level::to_string_view(convertLevel(config.level)));
    return true;
}

void LogConfig::setGlobalLevel(LogLevel level) noexcept {
    global_level_.store(level, std::memory_order_release);
    spdlog::set_level(convertLevel(level));
}

LogLevel LogConfig::globalLevel() noexcept {
    return global_level_.load(std::memory_order_acquire);
}

bool LogConfig::isInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

void LogConfig::flushAll() noexcept {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l) { l->flush(); });
}

auto LogConfig::convertLevel(LogLevel level) noexcept -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace tandem::logging
