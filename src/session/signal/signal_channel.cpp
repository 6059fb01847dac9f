/*
 * signal_channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "signal_channel.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

namespace tandem::session {

namespace {

std::atomic<unsigned> claimCounter{0};

Result<std::optional<CompletionResult>> parseSignal(const fs::path& path,
                                                    const std::string& sessionId) {
    auto content = readWholeFile(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    if (!content->has_value()) {
        return std::optional<CompletionResult>{};
    }
    try {
        auto result = CompletionResult::fromJson(json::parse(**content));
        return std::optional<CompletionResult>{std::move(result)};
    } catch (const json::exception& e) {
        spdlog::error("SignalChannel: malformed signal for {}: {}", sessionId,
                      e.what());
        return std::unexpected(SessionError::StorageError);
    }
}

}  // namespace

SignalChannel::SignalChannel(StorageLayout layout) : layout_(std::move(layout)) {}

Result<void> SignalChannel::publish(const std::string& sessionId,
                                    const CompletionResult& result) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return publishLocked(*lock, sessionId, result);
}

Result<std::optional<CompletionResult>> SignalChannel::tryConsume(
    const std::string& sessionId) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return tryConsumeLocked(*lock, sessionId);
}

Result<std::optional<CompletionResult>> SignalChannel::peek(
    const std::string& sessionId) const {
    auto path = layout_.signalFile(sessionId);
    if (!path) {
        return std::unexpected(path.error());
    }
    return parseSignal(*path, sessionId);
}

Result<bool> SignalChannel::discard(const std::string& sessionId) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    auto path = layout_.signalFile(sessionId);
    if (!path) {
        return std::unexpected(path.error());
    }
    std::error_code ec;
    bool removed = fs::remove(*path, ec);
    if (ec) {
        spdlog::error("SignalChannel: cannot discard signal for {}: {}",
                      sessionId, ec.message());
        return std::unexpected(SessionError::StorageError);
    }
    return removed;
}

Result<void> SignalChannel::publishLocked(const FileLock&,
                                          const std::string& sessionId,
                                          const CompletionResult& result) {
    auto path = layout_.signalFile(sessionId);
    if (!path) {
        return std::unexpected(path.error());
    }
    if (auto written = writeFileAtomically(*path,
                                           result.toJson().dump(
                                               2, ' ', false, json::error_handler_t::replace));
        !written) {
        return written;
    }
    spdlog::info("SignalChannel: published completion signal for {}", sessionId);
    return {};
}

Result<std::optional<CompletionResult>> SignalChannel::tryConsumeLocked(
    const FileLock&, const std::string& sessionId) {
    auto path = layout_.signalFile(sessionId);
    if (!path) {
        return std::unexpected(path.error());
    }
    const auto& source = *path;
    auto claim = source;
    claim += ".claim." + std::to_string(::getpid()) + "." +
             std::to_string(claimCounter.fetch_add(1));

    std::error_code ec;
    fs::rename(source, claim, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return std::optional<CompletionResult>{};
        }
        spdlog::error("SignalChannel: cannot claim signal for {}: {}", sessionId,
                      ec.message());
        return std::unexpected(SessionError::StorageError);
    }

    auto result = parseSignal(claim, sessionId);
    fs::remove(claim, ec);
    if (ec) {
        spdlog::warn("SignalChannel: cannot remove claimed signal {}: {}",
                     claim.string(), ec.message());
    }
    if (result && result->has_value()) {
        spdlog::info("SignalChannel: consumed completion signal for {}", sessionId);
    }
    return result;
}

Result<bool> SignalChannel::existsLocked(const FileLock&,
                                         const std::string& sessionId) const {
    auto path = layout_.signalFile(sessionId);
    if (!path) {
        return std::unexpected(path.error());
    }
    std::error_code ec;
    bool present = fs::exists(*path, ec);
    if (ec) {
        return std::unexpected(SessionError::StorageError);
    }
    return present;
}

}  // namespace tandem::session
