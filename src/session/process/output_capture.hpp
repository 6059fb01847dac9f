/*
 * output_capture.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef TANDEM_SESSION_PROCESS_OUTPUT_CAPTURE_HPP
#define TANDEM_SESSION_PROCESS_OUTPUT_CAPTURE_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tandem::session {

enum class OutputStream { Stdout, Stderr };

/**
 * @brief Point-in-time copy of a capture
 */
struct CaptureSnapshot {
    std::vector<std::string> outputLines;
    std::vector<std::string> errorLines;
    std::uint64_t version{0};
};

/**
 * @brief Append-only, line-oriented capture of a child's stdout and stderr
 *
 * Raw chunks are split on '\n' (a trailing '\r' is dropped); an unterminated
 * tail is kept until more data arrives or finish() is called. Thread-safe.
 */
class OutputCapture {
public:
    /**
     * @brief Append a raw chunk
     * @return The complete lines this chunk produced
     */
    std::vector<std::string> append(OutputStream stream, std::string_view chunk);

    /**
     * @brief Flush unterminated tails as final lines
     * @return The lines flushed, stdout first
     */
    std::vector<std::string> finish();

    [[nodiscard]] CaptureSnapshot snapshot() const;

    /**
     * @brief Incremented whenever a line is added
     */
    [[nodiscard]] std::uint64_t version() const;

private:
    struct StreamState {
        std::vector<std::string> lines;
        std::string partial;
    };

    StreamState& state(OutputStream stream) {
        return stream == OutputStream::Stdout ? stdout_ : stderr_;
    }

    mutable std::mutex mutex_;
    StreamState stdout_;
    StreamState stderr_;
    std::uint64_t version_{0};
};

}  // namespace tandem::session

#endif  // TANDEM_SESSION_PROCESS_OUTPUT_CAPTURE_HPP
