/*
 * session_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file session_store.hpp
 * @brief Durable table of active sessions shared by every invocation
 * @date 2024
 * @version 1.0.0
 *
 * The table is one JSON document rewritten (write-temp-then-rename) on every
 * mutation while the storage lock is held. Loading reaps stale sessions:
 * entries whose process no longer exists are finalized through the reap
 * handler and removed.
 */

#ifndef TANDEM_SESSION_STORE_SESSION_STORE_HPP
#define TANDEM_SESSION_STORE_SESSION_STORE_HPP

#include "file_lock.hpp"
#include "storage_layout.hpp"
#include "../process/controllable_process.hpp"
#include "../types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tandem::session {

using SessionTable = std::map<std::string, SessionRecord>;

/**
 * @brief A loaded session with a control-capable placeholder
 *
 * `control` is an identifier-only DetachedProcess when the record has a
 * process id; it can terminate the process but never reports its exit.
 */
struct StoredSession {
    SessionRecord record;
    std::shared_ptr<ControllableProcess> control;
};

/**
 * @brief Called, with the storage lock held, for every session reaped as stale
 */
using ReapHandler =
    std::function<void(const FileLock& lock, const CompletionResult& result)>;

class SessionStore {
public:
    explicit SessionStore(StorageLayout layout);

    [[nodiscard]] const StorageLayout& layout() const noexcept { return layout_; }

    void setReapHandler(ReapHandler handler);

    // =========================================================================
    // Operations under a caller-held lock
    // =========================================================================

    /**
     * @brief Raw read of the table, no reaping
     */
    [[nodiscard]] Result<SessionTable> readLocked(const FileLock& lock) const;

    [[nodiscard]] Result<void> writeLocked(const FileLock& lock,
                                           const SessionTable& table) const;

    /**
     * @brief Read the table, reap stale sessions and expired stop claims
     *
     * Changes are persisted before returning.
     */
    [[nodiscard]] Result<SessionTable> loadLocked(const FileLock& lock);

    /**
     * @brief Remove a session, clearing the current pointer if it names it
     * @return True if the session was present
     */
    [[nodiscard]] Result<bool> removeLocked(const FileLock& lock,
                                            const std::string& sessionId);

    [[nodiscard]] Result<std::optional<std::string>> currentPointerLocked(
        const FileLock& lock) const;

    [[nodiscard]] Result<void> setCurrentPointerLocked(
        const FileLock& lock, const std::optional<std::string>& sessionId);

    // =========================================================================
    // Self-locking operations
    // =========================================================================

    /**
     * @brief Load every session, reaping stale ones
     */
    [[nodiscard]] Result<std::map<std::string, StoredSession>> load();

    /**
     * @brief Replace the whole table
     */
    [[nodiscard]] Result<void> save(const SessionTable& table);

    [[nodiscard]] Result<void> upsert(const SessionRecord& record);

    [[nodiscard]] Result<bool> remove(const std::string& sessionId);

    /**
     * @brief Read-modify-write one record if present
     * @return False if the session does not exist
     */
    [[nodiscard]] Result<bool> update(const std::string& sessionId,
                                      const std::function<void(SessionRecord&)>& mutator);

    [[nodiscard]] Result<std::optional<SessionRecord>> find(const std::string& sessionId);

    [[nodiscard]] Result<bool> contains(const std::string& sessionId);

    [[nodiscard]] Result<std::optional<std::string>> currentPointer();

    [[nodiscard]] Result<void> setCurrentPointer(const std::optional<std::string>& sessionId);

private:
    StorageLayout layout_;

    mutable std::mutex handlerMutex_;
    ReapHandler reapHandler_;
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_STORE_SESSION_STORE_HPP
