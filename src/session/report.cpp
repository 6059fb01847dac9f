/*
 * report.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "report.hpp"

#include <format>

namespace tandem::session {

namespace {

std::string joinLines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

}  // namespace

json SessionSummary::toJson() const {
    return {{"sessionId", sessionId},
            {"durationMs", durationMs},
            {"exitCode", exitCode ? json(*exitCode) : json(nullptr)},
            {"outputText", outputText},
            {"errorText", errorText}};
}

std::string truncateText(std::string_view text, size_t maxLength) {
    if (text.size() <= maxLength) {
        return std::string(text);
    }
    std::string truncated(text.substr(0, maxLength));
    truncated += kTruncationMarker;
    return truncated;
}

SessionSummary summarize(const CompletionResult& result, size_t maxLength) {
    SessionSummary summary;
    summary.sessionId = result.sessionId;
    summary.durationMs = result.durationMs;
    summary.exitCode = result.exitCode;
    summary.outputText = result.outputLines.empty()
                             ? std::string(kNoOutputText)
                             : truncateText(joinLines(result.outputLines), maxLength);
    summary.errorText = truncateText(joinLines(result.errorLines), maxLength);
    return summary;
}

std::string describe(const CompletionResult& result, size_t maxLength) {
    std::string body = result.outputLines.empty() ? std::string(kNoOutputText)
                                                  : joinLines(result.outputLines);
    if (!result.errorLines.empty()) {
        body += "\n\nErrors:\n" + joinLines(result.errorLines);
    }

    return std::format("Session {} finished in {:.2f} seconds with exit code {}.\n\n{}",
                       result.sessionId,
                       static_cast<double>(result.durationMs) / 1000.0,
                       result.exitCode ? std::to_string(*result.exitCode)
                                       : std::string("unknown"),
                       truncateText(body, maxLength));
}

}  // namespace tandem::session
