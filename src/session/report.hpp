/*
 * report.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file report.hpp
 * @brief Caller-facing rendering of completion results
 * @date 2024
 * @version 1.0.0
 */

#ifndef TANDEM_SESSION_REPORT_HPP
#define TANDEM_SESSION_REPORT_HPP

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tandem::session {

inline constexpr size_t kDefaultSummaryLength = 1000;
inline constexpr std::string_view kTruncationMarker =
    "...\n(Output truncated, full logs available in the terminal)";
inline constexpr std::string_view kNoOutputText = "No output captured";

/**
 * @brief Summary returned by stop and wait operations
 */
struct SessionSummary {
    std::string sessionId;
    std::int64_t durationMs{0};
    std::optional<int> exitCode;
    std::string outputText;  ///< Joined stdout lines, possibly truncated
    std::string errorText;   ///< Joined stderr lines, possibly truncated

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Cut text beyond maxLength and append the truncation marker
 */
[[nodiscard]] std::string truncateText(std::string_view text, size_t maxLength);

[[nodiscard]] SessionSummary summarize(const CompletionResult& result,
                                       size_t maxLength = kDefaultSummaryLength);

/**
 * @brief Human-readable report
 *
 * "Session <id> finished in <s.ss> seconds with exit code <n|unknown>."
 * followed by the captured output and an "Errors:" block, truncated as a
 * whole.
 */
[[nodiscard]] std::string describe(const CompletionResult& result,
                                   size_t maxLength = kDefaultSummaryLength);

}  // namespace tandem::session

#endif  // TANDEM_SESSION_REPORT_HPP
