/*
 * test_orchestrator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_orchestrator.cpp
 * @brief End-to-end tests: launch, stop and wait across invocations
 */

#include <gtest/gtest.h>
#include "session/orchestrator.hpp"
#include "session/session_test_utils.hpp"

#include <csignal>
#include <mutex>
#include <regex>

#include <unistd.h>

using namespace tandem;
using namespace tandem::session;
using namespace tandem::test;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class SessionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = testConfig(dir_.path());
        orchestrator_ = std::make_unique<SessionOrchestrator>(config_);
    }

    void TearDown() override { orchestrator_.reset(); }

    LaunchRequest shellRequest(const std::string& script) const {
        LaunchRequest request;
        request.resourcePath = dir_.path();
        request.workDirectory = dir_.path() / "work";
        request.arguments = {"-c", script};
        return request;
    }

    std::optional<SessionRecord> stored(SessionOrchestrator& orchestrator,
                                        const std::string& sessionId) {
        auto sessions = orchestrator.listSessions();
        if (!sessions) {
            return std::nullopt;
        }
        for (auto& record : *sessions) {
            if (record.sessionId == sessionId) {
                return record;
            }
        }
        return std::nullopt;
    }

    /**
     * Output becomes visible to other invocations once flushed by the poller
     */
    bool waitForFlushedLine(const std::string& sessionId, const std::string& line) {
        return waitUntil([&] {
            auto record = stored(*orchestrator_, sessionId);
            return record && containsLine(record->outputLines, line);
        });
    }

    TempStateDir dir_;
    config::SessionConfig config_;
    std::unique_ptr<SessionOrchestrator> orchestrator_;
};

// =============================================================================
// Launch
// =============================================================================

TEST_F(SessionOrchestratorTest, GeneratedIdsHaveFixedShape) {
    std::regex shape("session-[0-9a-z]{8}");
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(std::regex_match(generateSessionId(), shape));
    }
}

TEST_F(SessionOrchestratorTest, MissingResourceCreatesNoSession) {
    auto request = shellRequest("echo never");
    request.resourcePath = "/missing";

    auto launched = orchestrator_->launchSession(request);
    ASSERT_FALSE(launched.has_value());
    EXPECT_EQ(launched.error(), SessionError::ResourceNotFound);
    EXPECT_TRUE(orchestrator_->listSessions()->empty());
    EXPECT_FALSE(orchestrator_->currentSession()->has_value());
}

TEST_F(SessionOrchestratorTest, SpawnFailureRemovesSession) {
    auto cfg = config_;
    cfg.editorExecutable = "/nonexistent/editor-binary";
    SessionOrchestrator broken{cfg};

    auto launched = broken.launchSession(shellRequest("true"));
    ASSERT_FALSE(launched.has_value());
    EXPECT_EQ(launched.error(), SessionError::SpawnFailed);
    EXPECT_TRUE(broken.listSessions()->empty());
}

TEST_F(SessionOrchestratorTest, LaunchPersistsAndBecomesCurrent) {
    auto launched = orchestrator_->launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    auto record = stored(*orchestrator_, *launched);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->processId.has_value());
    EXPECT_EQ(record->owner, orchestrator_->invocationToken());
    EXPECT_EQ(record->arguments, (std::vector<std::string>{"-c", "sleep 30"}));
    EXPECT_EQ(*orchestrator_->currentSession(), *launched);
}

// =============================================================================
// Stop
// =============================================================================

TEST_F(SessionOrchestratorTest, StopReturnsOutputWrittenBeforeKill) {
    auto launched = orchestrator_->launchSession(shellRequest("echo hello; sleep 30"));
    ASSERT_TRUE(launched.has_value());
    ASSERT_TRUE(waitForFlushedLine(*launched, "hello"));

    auto result = orchestrator_->stopById(*launched);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sessionId, *launched);
    EXPECT_TRUE(containsLine(result->outputLines, "hello"));
    EXPECT_FALSE(result->exitCode.has_value());
    EXPECT_FALSE(stored(*orchestrator_, *launched).has_value());
}

TEST_F(SessionOrchestratorTest, UnknownSessionIsNotFound) {
    auto result = orchestrator_->stopById("unknown");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SessionError::NotFound);
}

TEST_F(SessionOrchestratorTest, PathLikeIdsAreNotFound) {
    auto launched = orchestrator_->launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    auto stopped = orchestrator_->stopById("../sessions");
    ASSERT_FALSE(stopped.has_value());
    EXPECT_EQ(stopped.error(), SessionError::NotFound);

    auto future = orchestrator_->waitFor("../sessions");
    ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(future.get().error(), SessionError::NotFound);

    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(stored(*orchestrator_, *launched).has_value());
    EXPECT_EQ(*orchestrator_->currentSession(), *launched);
}

TEST_F(SessionOrchestratorTest, SecondStopIsNotFound) {
    auto launched = orchestrator_->launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    ASSERT_TRUE(orchestrator_->stopById(*launched).has_value());
    auto again = orchestrator_->stopById(*launched);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), SessionError::NotFound);
}

TEST_F(SessionOrchestratorTest, StopCurrentFollowsPointer) {
    EXPECT_EQ(orchestrator_->stopCurrent().error(), SessionError::NoCurrentSession);

    auto launched = orchestrator_->launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    auto result = orchestrator_->stopCurrent();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sessionId, *launched);
    EXPECT_FALSE(orchestrator_->currentSession()->has_value());
    EXPECT_EQ(orchestrator_->stopCurrent().error(), SessionError::NoCurrentSession);
}

TEST_F(SessionOrchestratorTest, StopByIdLeavesOtherCurrentSession) {
    auto first = orchestrator_->launchSession(shellRequest("sleep 30"));
    auto second = orchestrator_->launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*orchestrator_->currentSession(), *second);

    ASSERT_TRUE(orchestrator_->stopById(*first).has_value());
    EXPECT_EQ(*orchestrator_->currentSession(), *second);

    auto results = orchestrator_->stopAll();
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ(results->front().sessionId, *second);
    EXPECT_FALSE(orchestrator_->currentSession()->has_value());
    EXPECT_TRUE(orchestrator_->listSessions()->empty());
}

TEST_F(SessionOrchestratorTest, StopSendsGracefulSignalFirst) {
    std::mutex traceMutex;
    std::vector<int> trace;
    orchestrator_->setSignalObserver([&](int, int signal) {
        std::lock_guard lock(traceMutex);
        trace.push_back(signal);
    });

    auto launched =
        orchestrator_->launchSession(shellRequest("trap '' TERM; echo ready; sleep 30"));
    ASSERT_TRUE(launched.has_value());
    ASSERT_TRUE(waitForFlushedLine(*launched, "ready"));

    auto result = orchestrator_->stopById(*launched);
    ASSERT_TRUE(result.has_value());
    std::lock_guard lock(traceMutex);
    EXPECT_EQ(trace, (std::vector<int>{SIGTERM, SIGKILL}));
}

// =============================================================================
// Wait
// =============================================================================

TEST_F(SessionOrchestratorTest, WaitResolvesWithOwnExitCode) {
    auto launched = orchestrator_->launchSession(shellRequest("echo done; exit 0"));
    ASSERT_TRUE(launched.has_value());

    auto future = orchestrator_->waitFor(*launched);
    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_TRUE(containsLine(result->outputLines, "done"));
    EXPECT_FALSE(stored(*orchestrator_, *launched).has_value());
}

TEST_F(SessionOrchestratorTest, LocalStopResolvesPendingWait) {
    auto launched = orchestrator_->launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    auto future = orchestrator_->waitFor(*launched);
    auto stopped = orchestrator_->stopById(*launched);
    ASSERT_TRUE(stopped.has_value());

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, *stopped);
}

TEST_F(SessionOrchestratorTest, WaitAfterStopDoesNotWaitForPollInterval) {
    auto cfg = config_;
    cfg.pollIntervalMs = 5000;
    cfg.startupDelayMs = 20;
    SessionOrchestrator slowPoller{cfg};

    auto launched = slowPoller.launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());
    auto stopped = slowPoller.stopById(*launched);
    ASSERT_TRUE(stopped.has_value());

    auto started = std::chrono::steady_clock::now();
    auto future = slowPoller.waitFor(*launched);
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, *stopped);
}

TEST_F(SessionOrchestratorTest, WaitForUnknownSessionIsNotFound) {
    auto future = orchestrator_->waitFor("session-nobody00");
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get().error(), SessionError::NotFound);
}

// =============================================================================
// Across Invocations
// =============================================================================

TEST_F(SessionOrchestratorTest, StopFromAnotherInvocationReachesWaiter) {
    auto launched = orchestrator_->launchSession(shellRequest("echo hi; sleep 30"));
    ASSERT_TRUE(launched.has_value());
    ASSERT_TRUE(waitForFlushedLine(*launched, "hi"));
    auto future = orchestrator_->waitFor(*launched);

    SessionOrchestrator other{config_};
    EXPECT_NE(other.invocationToken(), orchestrator_->invocationToken());
    auto stopped = other.stopById(*launched);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_TRUE(containsLine(stopped->outputLines, "hi"));

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, *stopped);
}

TEST_F(SessionOrchestratorTest, AnotherInvocationSeesCurrentSession) {
    auto launched = orchestrator_->launchSession(shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    SessionOrchestrator other{config_};
    EXPECT_EQ(*other.currentSession(), *launched);
    auto result = other.stopCurrent();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sessionId, *launched);
    EXPECT_FALSE(orchestrator_->currentSession()->has_value());
}

TEST_F(SessionOrchestratorTest, AbandonedSessionsAreReapedByNextInvocation) {
    std::string sessionId;
    {
        SessionOrchestrator launcher{config_};
        auto launched = launcher.launchSession(shellRequest("sleep 30"));
        ASSERT_TRUE(launched.has_value());
        sessionId = *launched;
    }

    auto future = orchestrator_->waitFor(sessionId);
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sessionId, sessionId);
    EXPECT_FALSE(result->exitCode.has_value());
    EXPECT_TRUE(orchestrator_->listSessions()->empty());
}
