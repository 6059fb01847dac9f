/*
 * storage_layout.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file storage_layout.hpp
 * @brief Host-scoped location of the durable session state
 * @date 2024
 * @version 1.0.0
 *
 * All durable state lives under one directory:
 * - sessions.json        the session table
 * - current-session.txt  the "current session" pointer
 * - signals/<id>.json    one completion signal per finished session
 * - .lock                the inter-process lock file
 */

#ifndef TANDEM_SESSION_STORE_STORAGE_LAYOUT_HPP
#define TANDEM_SESSION_STORE_STORAGE_LAYOUT_HPP

#include "file_lock.hpp"
#include "../types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tandem::session {

class StorageLayout {
public:
    /**
     * @brief Layout rooted at the default location (<tmp>/tandem-sessions)
     */
    StorageLayout();

    explicit StorageLayout(std::filesystem::path root);

    [[nodiscard]] static std::filesystem::path defaultRoot();

    [[nodiscard]] const std::filesystem::path& root() const noexcept {
        return root_;
    }
    [[nodiscard]] std::filesystem::path sessionsFile() const;
    [[nodiscard]] std::filesystem::path currentPointerFile() const;
    [[nodiscard]] std::filesystem::path signalsDirectory() const;
    /**
     * @brief Signal file of a session
     * @return NotFound if @p sessionId is not a valid session id, so that no
     *         id can name a path outside the signals directory
     */
    [[nodiscard]] Result<std::filesystem::path> signalFile(std::string_view sessionId) const;
    [[nodiscard]] std::filesystem::path lockFile() const;

    /**
     * @brief Create the state and signal directories if missing
     */
    [[nodiscard]] Result<void> ensureDirectories() const;

    /**
     * @brief Acquire the storage lock shared by every invocation on the host
     */
    [[nodiscard]] Result<FileLock> lock() const;

private:
    std::filesystem::path root_;
};

/**
 * @brief Replace @p path with @p content through a temporary file and rename
 *
 * Readers observe either the old or the new content, never a partial write.
 */
[[nodiscard]] Result<void> writeFileAtomically(const std::filesystem::path& path,
                                               std::string_view content);

/**
 * @brief Read a whole file
 * @return File content, std::nullopt if the file does not exist
 */
[[nodiscard]] Result<std::optional<std::string>> readWholeFile(
    const std::filesystem::path& path);

}  // namespace tandem::session

#endif  // TANDEM_SESSION_STORE_STORAGE_LAYOUT_HPP
