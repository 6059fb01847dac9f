/*
 * test_signal_channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_signal_channel.cpp
 * @brief Tests for the one-shot completion mailbox
 */

#include <gtest/gtest.h>
#include "session/signal/signal_channel.hpp"
#include "session/store/session_store.hpp"
#include "session/session_test_utils.hpp"

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

using namespace tandem::session;
using namespace tandem::test;

// =============================================================================
// Test Fixture
// =============================================================================

class SignalChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_unique<SignalChannel>(StorageLayout(dir_.path()));
    }

    static CompletionResult sampleResult(const std::string& sessionId) {
        CompletionResult result;
        result.sessionId = sessionId;
        result.durationMs = 1234;
        result.exitCode = 0;
        result.outputLines = {"compiled", "tests passed"};
        return result;
    }

    TempStateDir dir_;
    std::unique_ptr<SignalChannel> channel_;
};

// =============================================================================
// Publish / Consume
// =============================================================================

TEST_F(SignalChannelTest, ConsumeMissingSignalIsEmpty) {
    auto consumed = channel_->tryConsume("session-none0000");
    ASSERT_TRUE(consumed.has_value());
    EXPECT_FALSE(consumed->has_value());
}

TEST_F(SignalChannelTest, PublishedSignalIsConsumedOnce) {
    auto result = sampleResult("session-once0000");
    ASSERT_TRUE(channel_->publish(result.sessionId, result).has_value());

    auto first = channel_->tryConsume(result.sessionId);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->has_value());
    EXPECT_EQ(**first, result);

    auto second = channel_->tryConsume(result.sessionId);
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second->has_value());
    EXPECT_FALSE(std::filesystem::exists(*channel_->layout().signalFile(result.sessionId)));
}

TEST_F(SignalChannelTest, SignalIsVisibleToAnotherChannel) {
    auto result = sampleResult("session-shared00");
    ASSERT_TRUE(channel_->publish(result.sessionId, result).has_value());

    SignalChannel other{StorageLayout(dir_.path())};
    auto consumed = other.tryConsume(result.sessionId);
    ASSERT_TRUE(consumed.has_value());
    ASSERT_TRUE(consumed->has_value());
    EXPECT_EQ((*consumed)->outputLines, result.outputLines);
}

TEST_F(SignalChannelTest, PeekDoesNotConsume) {
    auto result = sampleResult("session-peek0000");
    ASSERT_TRUE(channel_->publish(result.sessionId, result).has_value());

    auto peeked = channel_->peek(result.sessionId);
    ASSERT_TRUE(peeked.has_value());
    ASSERT_TRUE(peeked->has_value());
    EXPECT_EQ(**peeked, result);

    EXPECT_TRUE(channel_->tryConsume(result.sessionId)->has_value());
}

TEST_F(SignalChannelTest, DiscardRemovesSignal) {
    auto result = sampleResult("session-discard0");
    ASSERT_TRUE(channel_->publish(result.sessionId, result).has_value());

    auto lock = channel_->layout().lock();
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(*channel_->existsLocked(*lock, result.sessionId));
    lock->release();

    EXPECT_TRUE(*channel_->discard(result.sessionId));
    EXPECT_FALSE(*channel_->discard(result.sessionId));
    EXPECT_FALSE(channel_->tryConsume(result.sessionId)->has_value());
}

TEST_F(SignalChannelTest, MalformedSignalIsAnError) {
    ASSERT_TRUE(channel_->layout().ensureDirectories().has_value());
    {
        std::ofstream out(*channel_->layout().signalFile("session-broken00"));
        out << "[1, 2";
    }
    auto consumed = channel_->tryConsume("session-broken00");
    ASSERT_FALSE(consumed.has_value());
    EXPECT_EQ(consumed.error(), SessionError::StorageError);
    EXPECT_FALSE(std::filesystem::exists(*channel_->layout().signalFile("session-broken00")));
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(SignalChannelTest, ConcurrentConsumersGetExactlyOneResult) {
    constexpr int kConsumers = 8;
    constexpr int kRounds = 20;

    for (int round = 0; round < kRounds; ++round) {
        auto sessionId = "session-race" + std::to_string(round);
        ASSERT_TRUE(channel_->publish(sessionId, sampleResult(sessionId)).has_value());

        std::atomic<int> winners{0};
        std::atomic<int> failures{0};
        std::vector<std::thread> consumers;
        for (int i = 0; i < kConsumers; ++i) {
            consumers.emplace_back([&, sessionId] {
                SignalChannel channel{StorageLayout(dir_.path())};
                auto consumed = channel.tryConsume(sessionId);
                if (!consumed) {
                    failures++;
                } else if (consumed->has_value()) {
                    winners++;
                }
            });
        }
        for (auto& consumer : consumers) {
            consumer.join();
        }
        EXPECT_EQ(winners.load(), 1) << "round " << round;
        EXPECT_EQ(failures.load(), 0) << "round " << round;
    }
}

// =============================================================================
// Session id validation
// =============================================================================

TEST_F(SignalChannelTest, TraversalIdCannotConsumeSessionTable) {
    SessionStore store{StorageLayout(dir_.path())};
    SessionRecord record;
    record.sessionId = "session-keep0000";
    record.startedAt = Clock::now();
    record.processId = static_cast<int>(::getpid());
    record.owner = std::to_string(::getpid()) + ":test";
    ASSERT_TRUE(store.upsert(record).has_value());

    auto consumed = channel_->tryConsume("../sessions");
    ASSERT_FALSE(consumed.has_value());
    EXPECT_EQ(consumed.error(), SessionError::NotFound);

    auto published = channel_->publish("../sessions", sampleResult("../sessions"));
    ASSERT_FALSE(published.has_value());
    EXPECT_EQ(published.error(), SessionError::NotFound);

    EXPECT_FALSE(channel_->peek("../sessions").has_value());
    EXPECT_FALSE(channel_->discard("../sessions").has_value());

    EXPECT_TRUE(std::filesystem::exists(store.layout().sessionsFile()));
    auto sessions = store.load();
    ASSERT_TRUE(sessions.has_value());
    EXPECT_EQ(sessions->size(), 1u);
    EXPECT_TRUE(sessions->contains("session-keep0000"));
}
