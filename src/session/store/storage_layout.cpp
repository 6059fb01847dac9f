/*
 * storage_layout.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "storage_layout.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace tandem::session {

namespace {

constexpr const char* kDefaultDirectoryName = "tandem-sessions";
constexpr const char* kSessionsFileName = "sessions.json";
constexpr const char* kCurrentPointerFileName = "current-session.txt";
constexpr const char* kSignalsDirectoryName = "signals";
constexpr const char* kLockFileName = ".lock";

std::atomic<unsigned> tempCounter{0};

}  // namespace

StorageLayout::StorageLayout() : root_(defaultRoot()) {}

StorageLayout::StorageLayout(fs::path root)
    : root_(root.empty() ? defaultRoot() : std::move(root)) {}

fs::path StorageLayout::defaultRoot() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / kDefaultDirectoryName;
}

fs::path StorageLayout::sessionsFile() const {
    return root_ / kSessionsFileName;
}

fs::path StorageLayout::currentPointerFile() const {
    return root_ / kCurrentPointerFileName;
}

fs::path StorageLayout::signalsDirectory() const {
    return root_ / kSignalsDirectoryName;
}

Result<fs::path> StorageLayout::signalFile(std::string_view sessionId) const {
    if (!isValidSessionId(sessionId)) {
        spdlog::warn("StorageLayout: rejecting invalid session id '{}'", sessionId);
        return std::unexpected(SessionError::NotFound);
    }
    return signalsDirectory() / (std::string(sessionId) + ".json");
}

fs::path StorageLayout::lockFile() const {
    return root_ / kLockFileName;
}

Result<void> StorageLayout::ensureDirectories() const {
    std::error_code ec;
    fs::create_directories(signalsDirectory(), ec);
    if (ec) {
        spdlog::error("StorageLayout: cannot create {}: {}",
                      signalsDirectory().string(), ec.message());
        return std::unexpected(SessionError::StorageError);
    }
    return {};
}

Result<FileLock> StorageLayout::lock() const {
    if (auto ensured = ensureDirectories(); !ensured) {
        return std::unexpected(ensured.error());
    }
    return FileLock::acquire(lockFile());
}

Result<void> writeFileAtomically(const fs::path& path, std::string_view content) {
    auto tempPath = path;
    tempPath += ".tmp." + std::to_string(::getpid()) + "." +
                std::to_string(tempCounter.fetch_add(1));
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("Storage: cannot open temporary file {}",
                          tempPath.string());
            return std::unexpected(SessionError::StorageError);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            spdlog::error("Storage: short write to {}", tempPath.string());
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return std::unexpected(SessionError::StorageError);
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        spdlog::error("Storage: rename {} -> {} failed: {}", tempPath.string(),
                      path.string(), ec.message());
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return std::unexpected(SessionError::StorageError);
    }
    return {};
}

Result<std::optional<std::string>> readWholeFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) {
            return std::optional<std::string>{};
        }
        spdlog::error("Storage: cannot open {} for reading", path.string());
        return std::unexpected(SessionError::StorageError);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return std::optional<std::string>{buffer.str()};
}

}  // namespace tandem::session
