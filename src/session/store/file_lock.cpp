/*
 * file_lock.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "file_lock.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tandem::session {

Result<FileLock> FileLock::acquire(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        spdlog::error("FileLock: cannot open {}: {}", path.string(),
                      std::strerror(errno));
        return std::unexpected(SessionError::StorageError);
    }

    int rc;
    do {
        rc = ::flock(fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        spdlog::error("FileLock: flock({}) failed: {}", path.string(),
                      std::strerror(errno));
        ::close(fd);
        return std::unexpected(SessionError::StorageError);
    }
    return FileLock(fd);
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace tandem::session
