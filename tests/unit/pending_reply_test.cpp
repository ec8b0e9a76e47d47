#include "dispatch/pending_reply.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "mocks/mock_connection.hpp"

using namespace relay;
using namespace relay::dispatch;
using namespace relay::tests;
using namespace std::chrono_literals;

TEST(PendingReplyTest, FulfillWakesWaiter) {
    PendingReply slot("pi1", make_connection("pi1"));

    std::thread device([&slot]() {
        std::this_thread::sleep_for(20ms);
        EXPECT_TRUE(slot.fulfill("pong"));
    });

    auto outcome = slot.wait_for(2000ms);
    device.join();

    EXPECT_EQ(outcome.kind, ReplyKind::REPLY);
    EXPECT_EQ(outcome.payload, "pong");
    EXPECT_TRUE(slot.is_resolved());
}

TEST(PendingReplyTest, FulfilledBeforeWaitReturnsImmediately) {
    PendingReply slot("pi1", make_connection("pi1"));
    ASSERT_TRUE(slot.fulfill("early"));

    auto start = std::chrono::steady_clock::now();
    auto outcome = slot.wait_for(5000ms);

    EXPECT_EQ(outcome.kind, ReplyKind::REPLY);
    EXPECT_EQ(outcome.payload, "early");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
}

TEST(PendingReplyTest, TimeoutIsFinal) {
    PendingReply slot("pi1", make_connection("pi1"));

    auto outcome = slot.wait_for(30ms);
    EXPECT_EQ(outcome.kind, ReplyKind::TIMEOUT);

    // A reply after the deadline must not overwrite the outcome
    EXPECT_FALSE(slot.fulfill("late"));
    EXPECT_FALSE(slot.discard("connection closed"));
}

TEST(PendingReplyTest, PassedDeadlineTimesOutWithoutWaiting) {
    PendingReply slot("pi1", make_connection("pi1"));

    auto start = std::chrono::steady_clock::now();
    auto outcome = slot.wait_until(start - 100ms);

    EXPECT_EQ(outcome.kind, ReplyKind::TIMEOUT);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_FALSE(slot.fulfill("late"));
}

TEST(PendingReplyTest, PassedDeadlineStillReturnsEarlierReply) {
    PendingReply slot("pi1", make_connection("pi1"));
    ASSERT_TRUE(slot.fulfill("answered during send"));

    auto outcome = slot.wait_until(std::chrono::steady_clock::now() - 100ms);
    EXPECT_EQ(outcome.kind, ReplyKind::REPLY);
    EXPECT_EQ(outcome.payload, "answered during send");
}

TEST(PendingReplyTest, DiscardCarriesReason) {
    PendingReply slot("pi1", make_connection("pi1"));
    ASSERT_TRUE(slot.discard("connection replaced"));

    auto outcome = slot.wait_for(1000ms);
    EXPECT_EQ(outcome.kind, ReplyKind::DISCONNECTED);
    EXPECT_EQ(outcome.reason, "connection replaced");
    EXPECT_FALSE(slot.fulfill("too late"));
}

TEST(PendingReplyTest, FirstResolutionWins) {
    PendingReply slot("pi1", make_connection("pi1"));

    EXPECT_TRUE(slot.fulfill("first"));
    EXPECT_FALSE(slot.fulfill("second"));
    EXPECT_FALSE(slot.discard("connection closed"));

    auto outcome = slot.wait_for(10ms);
    EXPECT_EQ(outcome.kind, ReplyKind::REPLY);
    EXPECT_EQ(outcome.payload, "first");
}

TEST(PendingReplyTest, ConcurrentResolversExactlyOneWins) {
    for (int round = 0; round < 50; ++round) {
        PendingReply slot("pi1", make_connection("pi1"));
        std::atomic<int> winners{0};
        std::atomic<bool> go{false};

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&, t]() {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                bool won = (t % 2 == 0) ? slot.fulfill("reply " + std::to_string(t)) : slot.discard("closed");
                if (won) {
                    winners.fetch_add(1);
                }
            });
        }

        go.store(true);
        auto outcome = slot.wait_for(1ms);
        for (auto &thread : threads) {
            thread.join();
        }

        // The waiter's own timeout counts as a resolution too
        if (outcome.kind == ReplyKind::TIMEOUT) {
            EXPECT_EQ(winners.load(), 0);
        } else {
            EXPECT_EQ(winners.load(), 1);
        }
    }
}

TEST(PendingReplyTest, KeepsDeviceAndConnection) {
    auto conn = make_connection("pi1");
    PendingReply slot("pi1", conn);

    EXPECT_EQ(slot.device_id(), "pi1");
    EXPECT_EQ(slot.connection(), conn);
    EXPECT_FALSE(slot.is_resolved());
}
