/*
 * session_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "session_store.hpp"
#include "../process/process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace tandem::session {

namespace {

bool invocationAlive(const std::string& token) {
    auto pid = tokenProcessId(token);
    return pid && ProcessSpawner::isProcessRunning(*pid);
}

}  // namespace

SessionStore::SessionStore(StorageLayout layout) : layout_(std::move(layout)) {}

void SessionStore::setReapHandler(ReapHandler handler) {
    std::lock_guard lock(handlerMutex_);
    reapHandler_ = std::move(handler);
}

Result<SessionTable> SessionStore::readLocked(const FileLock&) const {
    auto content = readWholeFile(layout_.sessionsFile());
    if (!content) {
        return std::unexpected(content.error());
    }
    SessionTable table;
    if (!content->has_value() || (*content)->empty()) {
        return table;
    }

    json document;
    try {
        document = json::parse(**content);
    } catch (const json::exception& e) {
        spdlog::error("SessionStore: error loading sessions: {}", e.what());
        return table;
    }
    if (!document.is_object()) {
        spdlog::error("SessionStore: {} is not a JSON object, ignoring it",
                      layout_.sessionsFile().string());
        return table;
    }

    for (const auto& [sessionId, entry] : document.items()) {
        if (!isValidSessionId(sessionId)) {
            spdlog::error("SessionStore: dropping entry with invalid id '{}'", sessionId);
            continue;
        }
        try {
            auto record = SessionRecord::fromJson(entry);
            record.sessionId = sessionId;
            table.emplace(sessionId, std::move(record));
        } catch (const json::exception& e) {
            spdlog::error("SessionStore: dropping malformed session {}: {}", sessionId,
                          e.what());
        }
    }
    return table;
}

Result<void> SessionStore::writeLocked(const FileLock&,
                                       const SessionTable& table) const {
    json document = json::object();
    for (const auto& [sessionId, record] : table) {
        document[sessionId] = record.toJson();
    }
    return writeFileAtomically(layout_.sessionsFile(), document.dump(2, ' ', false, json::error_handler_t::replace));
}

Result<SessionTable> SessionStore::loadLocked(const FileLock& lock) {
    auto table = readLocked(lock);
    if (!table) {
        return std::unexpected(table.error());
    }

    bool changed = false;
    std::vector<SessionRecord> stale;
    for (auto it = table->begin(); it != table->end();) {
        auto& record = it->second;

        if (record.stoppingBy && !invocationAlive(*record.stoppingBy)) {
            spdlog::warn("SessionStore: dropping stop claim on {} held by dead invocation {}",
                         record.sessionId, *record.stoppingBy);
            record.stoppingBy.reset();
            changed = true;
        }

        bool isStale = false;
        if (record.stoppingBy) {
            // The claimer is alive and will finalize
            isStale = false;
        } else if (record.processId) {
            isStale = !ProcessSpawner::isProcessRunning(*record.processId);
        } else {
            isStale = !invocationAlive(record.owner);
        }

        if (isStale) {
            spdlog::warn("SessionStore: reaping stale session {} (PID {})",
                         record.sessionId,
                         record.processId ? std::to_string(*record.processId)
                                          : std::string("none"));
            stale.push_back(std::move(record));
            it = table->erase(it);
            changed = true;
        } else {
            ++it;
        }
    }

    if (!changed) {
        return table;
    }
    if (auto written = writeLocked(lock, *table); !written) {
        return std::unexpected(written.error());
    }

    if (!stale.empty()) {
        auto current = currentPointerLocked(lock);
        if (current && current->has_value() && !table->contains(**current)) {
            if (auto cleared = setCurrentPointerLocked(lock, std::nullopt); !cleared) {
                return std::unexpected(cleared.error());
            }
        }

        ReapHandler handler;
        {
            std::lock_guard guard(handlerMutex_);
            handler = reapHandler_;
        }
        if (handler) {
            for (const auto& record : stale) {
                handler(lock, makeCompletionResult(record, std::nullopt));
            }
        }
    }
    return table;
}

Result<bool> SessionStore::removeLocked(const FileLock& lock,
                                        const std::string& sessionId) {
    auto table = readLocked(lock);
    if (!table) {
        return std::unexpected(table.error());
    }
    if (table->erase(sessionId) == 0) {
        return false;
    }
    if (auto written = writeLocked(lock, *table); !written) {
        return std::unexpected(written.error());
    }

    auto current = currentPointerLocked(lock);
    if (!current) {
        return std::unexpected(current.error());
    }
    if (*current == sessionId) {
        if (auto cleared = setCurrentPointerLocked(lock, std::nullopt); !cleared) {
            return std::unexpected(cleared.error());
        }
    }
    return true;
}

Result<std::optional<std::string>> SessionStore::currentPointerLocked(
    const FileLock&) const {
    auto content = readWholeFile(layout_.currentPointerFile());
    if (!content) {
        return std::unexpected(content.error());
    }
    if (!content->has_value()) {
        return std::optional<std::string>{};
    }

    auto value = **content;
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::optional<std::string>{};
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return std::optional<std::string>{value.substr(first, last - first + 1)};
}

Result<void> SessionStore::setCurrentPointerLocked(
    const FileLock&, const std::optional<std::string>& sessionId) {
    return writeFileAtomically(layout_.currentPointerFile(), sessionId.value_or(""));
}

Result<std::map<std::string, StoredSession>> SessionStore::load() {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    auto table = loadLocked(*lock);
    if (!table) {
        return std::unexpected(table.error());
    }

    std::map<std::string, StoredSession> sessions;
    for (auto& [sessionId, record] : *table) {
        StoredSession stored;
        if (record.processId) {
            stored.control = std::make_shared<DetachedProcess>(*record.processId);
        }
        stored.record = std::move(record);
        sessions.emplace(sessionId, std::move(stored));
    }
    return sessions;
}

Result<void> SessionStore::save(const SessionTable& table) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return writeLocked(*lock, table);
}

Result<void> SessionStore::upsert(const SessionRecord& record) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    auto table = readLocked(*lock);
    if (!table) {
        return std::unexpected(table.error());
    }
    (*table)[record.sessionId] = record;
    return writeLocked(*lock, *table);
}

Result<bool> SessionStore::remove(const std::string& sessionId) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return removeLocked(*lock, sessionId);
}

Result<bool> SessionStore::update(const std::string& sessionId,
                                  const std::function<void(SessionRecord&)>& mutator) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    auto table = readLocked(*lock);
    if (!table) {
        return std::unexpected(table.error());
    }
    auto it = table->find(sessionId);
    if (it == table->end()) {
        return false;
    }
    mutator(it->second);
    it->second.sessionId = sessionId;
    if (auto written = writeLocked(*lock, *table); !written) {
        return std::unexpected(written.error());
    }
    return true;
}

Result<std::optional<SessionRecord>> SessionStore::find(const std::string& sessionId) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    auto table = readLocked(*lock);
    if (!table) {
        return std::unexpected(table.error());
    }
    auto it = table->find(sessionId);
    if (it == table->end()) {
        return std::optional<SessionRecord>{};
    }
    return std::optional<SessionRecord>{it->second};
}

Result<bool> SessionStore::contains(const std::string& sessionId) {
    auto record = find(sessionId);
    if (!record) {
        return std::unexpected(record.error());
    }
    return record->has_value();
}

Result<std::optional<std::string>> SessionStore::currentPointer() {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return currentPointerLocked(*lock);
}

Result<void> SessionStore::setCurrentPointer(const std::optional<std::string>& sessionId) {
    auto lock = layout_.lock();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return setCurrentPointerLocked(*lock, sessionId);
}

}  // namespace tandem::session
