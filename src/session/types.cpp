/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <charconv>

namespace tandem::session {

namespace {

std::int64_t toEpochMs(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

Clock::time_point fromEpochMs(std::int64_t ms) {
    return Clock::time_point{std::chrono::milliseconds{ms}};
}

}  // namespace

json SessionRecord::toJson() const {
    json j{{"sessionId", sessionId},
           {"resourcePath", resourcePath},
           {"workDirectory", workDirectory},
           {"arguments", arguments},
           {"startedAt", toEpochMs(startedAt)},
           {"outputLines", outputLines},
           {"errorLines", errorLines},
           {"owner", owner}};
    j["processId"] = processId ? json(*processId) : json(nullptr);
    j["stoppingBy"] = stoppingBy ? json(*stoppingBy) : json(nullptr);
    return j;
}

SessionRecord SessionRecord::fromJson(const json& j) {
    SessionRecord record;
    record.sessionId = j.at("sessionId").get<std::string>();
    record.resourcePath = j.value("resourcePath", std::string{});
    record.workDirectory = j.value("workDirectory", std::string{});
    if (j.contains("arguments") && j["arguments"].is_array()) {
        record.arguments = j["arguments"].get<std::vector<std::string>>();
    }
    record.startedAt = fromEpochMs(j.value("startedAt", std::int64_t{0}));
    if (j.contains("processId") && j["processId"].is_number_integer()) {
        record.processId = j["processId"].get<int>();
    }
    if (j.contains("outputLines") && j["outputLines"].is_array()) {
        record.outputLines = j["outputLines"].get<std::vector<std::string>>();
    }
    if (j.contains("errorLines") && j["errorLines"].is_array()) {
        record.errorLines = j["errorLines"].get<std::vector<std::string>>();
    }
    record.owner = j.value("owner", std::string{});
    if (j.contains("stoppingBy") && j["stoppingBy"].is_string()) {
        record.stoppingBy = j["stoppingBy"].get<std::string>();
    }
    return record;
}

json CompletionResult::toJson() const {
    json j{{"sessionId", sessionId},
           {"durationMs", durationMs},
           {"outputLines", outputLines},
           {"errorLines", errorLines}};
    j["exitCode"] = exitCode ? json(*exitCode) : json(nullptr);
    return j;
}

CompletionResult CompletionResult::fromJson(const json& j) {
    CompletionResult result;
    result.sessionId = j.at("sessionId").get<std::string>();
    result.durationMs = j.value("durationMs", std::int64_t{0});
    if (j.contains("exitCode") && j["exitCode"].is_number_integer()) {
        result.exitCode = j["exitCode"].get<int>();
    }
    if (j.contains("outputLines") && j["outputLines"].is_array()) {
        result.outputLines = j["outputLines"].get<std::vector<std::string>>();
    }
    if (j.contains("errorLines") && j["errorLines"].is_array()) {
        result.errorLines = j["errorLines"].get<std::vector<std::string>>();
    }
    return result;
}

CompletionResult makeCompletionResult(const SessionRecord& record,
                                      std::optional<int> exitCode,
                                      Clock::time_point endedAt) {
    CompletionResult result;
    result.sessionId = record.sessionId;
    result.durationMs = std::max<std::int64_t>(
        0, std::chrono::duration_cast<std::chrono::milliseconds>(
               endedAt - record.startedAt)
               .count());
    result.exitCode = exitCode;
    result.outputLines = record.outputLines;
    result.errorLines = record.errorLines;
    return result;
}

bool isValidSessionId(std::string_view sessionId) noexcept {
    constexpr size_t kMaxLength = 64;
    if (sessionId.empty() || sessionId.size() > kMaxLength) {
        return false;
    }
    return std::all_of(sessionId.begin(), sessionId.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_';
    });
}

std::optional<int> tokenProcessId(std::string_view token) {
    auto sep = token.find(':');
    auto digits = token.substr(0, sep);
    int pid = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), pid);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

}  // namespace tandem::session
