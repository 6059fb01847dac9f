/*
 * test_process_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_process_controller.cpp
 * @brief Tests for spawning, output capture and termination
 */

#include <gtest/gtest.h>
#include "session/process/process_controller.hpp"
#include "session/session_test_utils.hpp"

#include <algorithm>
#include <csignal>
#include <future>
#include <mutex>
#include <vector>

using namespace tandem::session;
using namespace tandem::test;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class ProcessControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ControllerOptions options;
        options.executable = "/bin/sh";
        options.gracePeriod = 300ms;
        options.identifierGracePeriod = 2000ms;
        controller_ = std::make_unique<ProcessController>(options);
        controller_->setSignalObserver([this](int, int signal) {
            std::lock_guard lock(traceMutex_);
            trace_.push_back(signal);
        });
    }

    void TearDown() override { controller_.reset(); }

    LaunchRequest shellRequest(const std::string& script) const {
        LaunchRequest request;
        request.resourcePath = dir_.path();
        request.workDirectory = dir_.path() / "work";
        request.arguments = {"-c", script};
        return request;
    }

    static bool captured(const ChildProcess& child, const std::string& line) {
        return containsLine(child.capture().snapshot().outputLines, line);
    }

    std::vector<int> trace() {
        std::lock_guard lock(traceMutex_);
        return trace_;
    }

    TempStateDir dir_;
    std::unique_ptr<ProcessController> controller_;
    std::mutex traceMutex_;
    std::vector<int> trace_;
};

// =============================================================================
// Launch
// =============================================================================

TEST_F(ProcessControllerTest, MissingResourceSpawnsNothing) {
    auto request = shellRequest("echo never");
    request.resourcePath = "/missing";

    auto launched = controller_->launch("session-missing0", request);
    ASSERT_FALSE(launched.has_value());
    EXPECT_EQ(launched.error(), SessionError::ResourceNotFound);
    EXPECT_EQ(controller_->find("session-missing0"), nullptr);
}

TEST_F(ProcessControllerTest, UnknownExecutableFailsSynchronously) {
    ProcessController controller{ControllerOptions{"/nonexistent/editor-binary"}};
    auto launched = controller.launch("session-noexec00", shellRequest("true"));
    ASSERT_FALSE(launched.has_value());
    EXPECT_EQ(launched.error(), SessionError::SpawnFailed);
}

TEST_F(ProcessControllerTest, CreatesMissingWorkDirectory) {
    auto launched = controller_->launch("session-workdir0", shellRequest("pwd"));
    ASSERT_TRUE(launched.has_value());
    EXPECT_TRUE(std::filesystem::is_directory(dir_.path() / "work"));
    ASSERT_TRUE(launched->handle->waitForExit(5s));
    EXPECT_EQ(launched->handle->exitCode(), 0);
}

TEST_F(ProcessControllerTest, CapturesBothStreams) {
    auto launched = controller_->launch(
        "session-streams0", shellRequest("echo out; echo err 1>&2; printf tail"));
    ASSERT_TRUE(launched.has_value());
    ASSERT_TRUE(launched->handle->waitForExit(5s));

    auto snapshot = launched->handle->capture().snapshot();
    EXPECT_EQ(snapshot.outputLines, (std::vector<std::string>{"out", "tail"}));
    EXPECT_EQ(snapshot.errorLines, std::vector<std::string>{"err"});
}

TEST_F(ProcessControllerTest, ChildInheritsOnlyStandardDescriptorsForNull) {
    // Only stdin may refer to /dev/null in the child
    auto launched = controller_->launch(
        "session-fdcheck0",
        shellRequest(R"(for f in /proc/$$/fd/*; do n=${f##*/}; )"
                     R"sh(if [ "$n" != 0 ] && [ "$(readlink "$f")" = /dev/null ]; then )sh"
                     R"(echo "leaked $n"; fi; done; echo checked)"));
    ASSERT_TRUE(launched.has_value());
    ASSERT_TRUE(launched->handle->waitForExit(5s));

    auto lines = launched->handle->capture().snapshot().outputLines;
    EXPECT_TRUE(containsLine(lines, "checked"));
    EXPECT_EQ(std::count_if(lines.begin(), lines.end(),
                            [](const std::string& line) { return line.starts_with("leaked"); }),
              0);
}

TEST_F(ProcessControllerTest, ExitObserverReceivesExitCode) {
    std::promise<std::pair<std::string, ExitStatus>> exited;
    auto future = exited.get_future();
    controller_->setExitObserver([&](const std::string& sessionId, const ExitStatus& status) {
        exited.set_value({sessionId, status});
    });

    auto launched = controller_->launch("session-exit0003", shellRequest("exit 3"));
    ASSERT_TRUE(launched.has_value());
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);

    auto [sessionId, status] = future.get();
    EXPECT_EQ(sessionId, "session-exit0003");
    EXPECT_EQ(status.exitCode, 3);
    EXPECT_FALSE(status.signal.has_value());
}

// =============================================================================
// Termination
// =============================================================================

TEST_F(ProcessControllerTest, TerminateKeepsOutputWrittenBeforeKill) {
    auto launched =
        controller_->launch("session-s1s1s1s1", shellRequest("echo hello; sleep 30"));
    ASSERT_TRUE(launched.has_value());
    auto& child = *launched->handle;
    ASSERT_TRUE(waitUntil([&] { return captured(child, "hello"); }));

    auto outcome = controller_->terminate(child);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->wasAlive);
    EXPECT_FALSE(outcome->forced);
    EXPECT_FALSE(outcome->exitCode.has_value());
    EXPECT_FALSE(child.isAlive());
    EXPECT_TRUE(captured(child, "hello"));
    EXPECT_EQ(trace(), std::vector<int>{SIGTERM});
}

TEST_F(ProcessControllerTest, GracefulSignalPrecedesForcefulKill) {
    auto launched = controller_->launch(
        "session-stubborn", shellRequest("trap '' TERM; echo ready; sleep 30"));
    ASSERT_TRUE(launched.has_value());
    auto& child = *launched->handle;
    ASSERT_TRUE(waitUntil([&] { return captured(child, "ready"); }));

    auto outcome = controller_->terminate(child);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->forced);
    EXPECT_EQ(child.exitStatus()->signal, SIGKILL);
    EXPECT_EQ(trace(), (std::vector<int>{SIGTERM, SIGKILL}));
}

TEST_F(ProcessControllerTest, TerminateIsIdempotent) {
    auto launched = controller_->launch("session-twice000", shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    ASSERT_TRUE(controller_->terminate(*launched->handle).has_value());
    auto again = controller_->terminate(*launched->handle);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again->wasAlive);
    EXPECT_EQ(trace().size(), 1u);
}

TEST_F(ProcessControllerTest, TerminateByIdentifier) {
    auto launched = controller_->launch("session-byid0000", shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    auto control = controller_->controlFor("session-elsewhere", launched->processId);
    ASSERT_NE(control, nullptr);
    EXPECT_FALSE(control->supportsExitNotification());

    auto outcome = controller_->terminate(*control);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->wasAlive);
    EXPECT_FALSE(outcome->exitCode.has_value());
    EXPECT_FALSE(launched->handle->isAlive());
}

TEST_F(ProcessControllerTest, DeadIdentifierIsNoOp) {
    DetachedProcess gone{deadProcessId()};
    auto outcome = controller_->terminate(gone);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->wasAlive);
    EXPECT_TRUE(trace().empty());
}

TEST_F(ProcessControllerTest, ControlForPrefersLiveHandle) {
    auto launched = controller_->launch("session-owned000", shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());

    auto control = controller_->controlFor("session-owned000", 1);
    EXPECT_TRUE(control->supportsExitNotification());
    EXPECT_EQ(control->processId(), launched->processId);
    EXPECT_EQ(controller_->controlFor("session-unknown0", std::nullopt), nullptr);
}

TEST_F(ProcessControllerTest, ShutdownKillsRunningChildren) {
    bool observed = false;
    controller_->setExitObserver([&](const std::string&, const ExitStatus&) { observed = true; });

    auto launched = controller_->launch("session-shutdown", shellRequest("sleep 30"));
    ASSERT_TRUE(launched.has_value());
    auto handle = launched->handle;

    controller_->shutdown();
    EXPECT_FALSE(handle->isAlive());
    EXPECT_FALSE(observed);
    EXPECT_EQ(controller_->find("session-shutdown"), nullptr);
}

// =============================================================================
// Output Flushing
// =============================================================================

TEST_F(ProcessControllerTest, UnflushedCapturesAreReturnedOncePerVersion) {
    auto launched = controller_->launch("session-flush000", shellRequest("echo one; sleep 30"));
    ASSERT_TRUE(launched.has_value());

    std::vector<std::pair<std::string, CaptureSnapshot>> first;
    ASSERT_TRUE(waitUntil([&] {
        first = controller_->takeUnflushedCaptures();
        return !first.empty();
    }));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].first, "session-flush000");
    EXPECT_TRUE(containsLine(first[0].second.outputLines, "one"));
    EXPECT_TRUE(controller_->takeUnflushedCaptures().empty());
    EXPECT_EQ(controller_->ownedCount(), 1u);

    ASSERT_TRUE(controller_->terminate(*launched->handle).has_value());
    controller_->release("session-flush000");
    EXPECT_EQ(controller_->ownedCount(), 0u);
    EXPECT_TRUE(controller_->takeUnflushedCaptures().empty());
}
