/*
 * file_lock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TANDEM_SESSION_STORE_FILE_LOCK_HPP
#define TANDEM_SESSION_STORE_FILE_LOCK_HPP

#include "../types.hpp"

#include <filesystem>

namespace tandem::session {

/**
 * @brief Exclusive advisory lock on a file (flock), held for the object's lifetime
 *
 * Each acquisition opens its own descriptor, so the lock also excludes other
 * threads of the same process. Not recursive: a thread holding a FileLock
 * must not acquire another one on the same path.
 *
 * Functions taking a `const FileLock&` expect the caller to hold the storage
 * lock for the duration of the call.
 */
class FileLock {
public:
    /**
     * @brief Block until the lock on @p path is acquired
     * @param path Lock file, created if missing
     * @return The held lock, or StorageError
     */
    [[nodiscard]] static Result<FileLock> acquire(
        const std::filesystem::path& path);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    [[nodiscard]] bool isHeld() const noexcept { return fd_ >= 0; }

    /**
     * @brief Release the lock early
     */
    void release() noexcept;

private:
    explicit FileLock(int fd) noexcept : fd_(fd) {}

    int fd_{-1};
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_STORE_FILE_LOCK_HPP
