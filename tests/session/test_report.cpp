/*
 * test_report.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_report.cpp
 * @brief Tests for summaries and the human-readable report
 */

#include <gtest/gtest.h>
#include "session/report.hpp"

using namespace tandem::session;

namespace {

CompletionResult resultWith(std::vector<std::string> output,
                            std::vector<std::string> errors = {}) {
    CompletionResult result;
    result.sessionId = "session-report01";
    result.durationMs = 1500;
    result.outputLines = std::move(output);
    result.errorLines = std::move(errors);
    return result;
}

}  // namespace

// =============================================================================
// Truncation
// =============================================================================

TEST(ReportTest, TextAtTheLimitIsKept) {
    std::string text(kDefaultSummaryLength, 'x');
    EXPECT_EQ(truncateText(text, kDefaultSummaryLength), text);
}

TEST(ReportTest, TextBeyondTheLimitGetsMarker) {
    std::string text(kDefaultSummaryLength + 1, 'x');
    auto truncated = truncateText(text, kDefaultSummaryLength);
    EXPECT_EQ(truncated.size(), kDefaultSummaryLength + kTruncationMarker.size());
    EXPECT_TRUE(truncated.ends_with(kTruncationMarker));
    EXPECT_EQ(truncated.substr(0, kDefaultSummaryLength),
              std::string(kDefaultSummaryLength, 'x'));
}

// =============================================================================
// Summaries
// =============================================================================

TEST(ReportTest, SummaryJoinsLines) {
    auto summary = summarize(resultWith({"first", "second"}, {"oops"}));
    EXPECT_EQ(summary.outputText, "first\nsecond");
    EXPECT_EQ(summary.errorText, "oops");
    EXPECT_EQ(summary.durationMs, 1500);
    EXPECT_FALSE(summary.exitCode.has_value());
}

TEST(ReportTest, EmptyCaptureReadsNoOutput) {
    auto summary = summarize(resultWith({}));
    EXPECT_EQ(summary.outputText, kNoOutputText);
    EXPECT_TRUE(summary.errorText.empty());
}

TEST(ReportTest, LongOutputIsTruncatedInSummary) {
    auto summary = summarize(resultWith({std::string(1200, 'a')}));
    EXPECT_TRUE(summary.outputText.ends_with(kTruncationMarker));
}

TEST(ReportTest, SummaryJsonCarriesNullExitCode) {
    auto j = summarize(resultWith({"x"})).toJson();
    EXPECT_TRUE(j["exitCode"].is_null());
    EXPECT_EQ(j["sessionId"], "session-report01");
    EXPECT_EQ(j["outputText"], "x");
}

// =============================================================================
// Describe
// =============================================================================

TEST(ReportTest, DescribeUnknownExitCode) {
    auto text = describe(resultWith({"hello"}));
    EXPECT_EQ(text,
              "Session session-report01 finished in 1.50 seconds with exit code "
              "unknown.\n\nhello");
}

TEST(ReportTest, DescribeIncludesErrorsBlock) {
    auto result = resultWith({}, {"bad thing"});
    result.exitCode = 2;
    auto text = describe(result);
    EXPECT_NE(text.find("with exit code 2."), std::string::npos);
    EXPECT_NE(text.find("No output captured\n\nErrors:\nbad thing"), std::string::npos);
}
