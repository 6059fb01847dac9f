/*
 * signal_channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file signal_channel.hpp
 * @brief One-shot per-session completion mailbox on the filesystem
 * @date 2024
 * @version 1.0.0
 *
 * A signal is `signals/<sessionId>.json` holding a CompletionResult. It is
 * published through write-temp-then-rename and consumed by renaming it to a
 * consumer-unique claim name first, so at most one consumer ever reads it.
 */

#ifndef TANDEM_SESSION_SIGNAL_SIGNAL_CHANNEL_HPP
#define TANDEM_SESSION_SIGNAL_SIGNAL_CHANNEL_HPP

#include "../store/file_lock.hpp"
#include "../store/storage_layout.hpp"
#include "../types.hpp"

#include <optional>
#include <string>

namespace tandem::session {

class SignalChannel {
public:
    explicit SignalChannel(StorageLayout layout);

    [[nodiscard]] const StorageLayout& layout() const noexcept { return layout_; }

    /**
     * @brief Persist a result for whichever invocation waits on the session
     *
     * Replaces a signal already present for the same session.
     */
    [[nodiscard]] Result<void> publish(const std::string& sessionId,
                                       const CompletionResult& result);

    /**
     * @brief Take the signal if present; the file is deleted on success
     */
    [[nodiscard]] Result<std::optional<CompletionResult>> tryConsume(
        const std::string& sessionId);

    /**
     * @brief Read without consuming
     */
    [[nodiscard]] Result<std::optional<CompletionResult>> peek(
        const std::string& sessionId) const;

    /**
     * @brief Delete a pending signal
     * @return True if one existed
     */
    [[nodiscard]] Result<bool> discard(const std::string& sessionId);

    [[nodiscard]] Result<void> publishLocked(const FileLock& lock,
                                             const std::string& sessionId,
                                             const CompletionResult& result);

    [[nodiscard]] Result<std::optional<CompletionResult>> tryConsumeLocked(
        const FileLock& lock, const std::string& sessionId);

    [[nodiscard]] Result<bool> existsLocked(const FileLock& lock,
                                            const std::string& sessionId) const;

private:
    StorageLayout layout_;
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_SIGNAL_SIGNAL_CHANNEL_HPP
