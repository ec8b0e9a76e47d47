#include "registry/connection_registry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <vector>

#include "mocks/mock_connection.hpp"

using namespace relay;
using namespace testing;
using namespace relay::tests;

class ConnectionRegistryTest : public Test {
protected:
    registry::ConnectionRegistry registry;
};

TEST_F(ConnectionRegistryTest, RegisterThenLookup) {
    auto conn = make_connection("pi1");
    registry.register_connection("pi1", conn);

    EXPECT_EQ(registry.lookup("pi1"), conn);
    EXPECT_TRUE(registry.is_registered("pi1"));
    EXPECT_EQ(registry.connection_count(), 1u);
}

TEST_F(ConnectionRegistryTest, LookupUnknownReturnsNull) {
    EXPECT_EQ(registry.lookup("missing"), nullptr);
    EXPECT_FALSE(registry.is_registered("missing"));
}

TEST_F(ConnectionRegistryTest, EmptyIdOrNullConnectionIgnored) {
    registry.register_connection("", make_connection(""));
    registry.register_connection("pi1", nullptr);

    EXPECT_EQ(registry.connection_count(), 0u);
}

TEST_F(ConnectionRegistryTest, ReRegisterReplacesAndClosesPreviousOnce) {
    auto first = make_connection("pi1");
    auto second = make_connection("pi1");
    auto third = make_connection("pi1");

    EXPECT_CALL(*first, close(_)).Times(1);
    EXPECT_CALL(*second, close(_)).Times(1);
    EXPECT_CALL(*third, close(_)).Times(0);

    registry.register_connection("pi1", first);
    registry.register_connection("pi1", second);
    registry.register_connection("pi1", third);

    EXPECT_EQ(registry.lookup("pi1"), third);
    EXPECT_EQ(registry.connection_count(), 1u);
}

TEST_F(ConnectionRegistryTest, RegisteringSameConnectionTwiceIsNoOp) {
    auto conn = make_connection("pi1");
    EXPECT_CALL(*conn, close(_)).Times(0);

    std::vector<registry::RemovalReason> reasons;
    registry.add_removal_listener(
        [&](const std::string &, const registry::ConnectionRegistry::ConnectionPtr &,
            registry::RemovalReason reason) { reasons.push_back(reason); });

    registry.register_connection("pi1", conn);
    registry.register_connection("pi1", conn);

    EXPECT_EQ(registry.lookup("pi1"), conn);
    EXPECT_TRUE(reasons.empty());
}

TEST_F(ConnectionRegistryTest, UnregisterMatchingConnection) {
    auto conn = make_connection("pi1");
    registry.register_connection("pi1", conn);

    EXPECT_TRUE(registry.unregister_connection("pi1", conn));
    EXPECT_EQ(registry.lookup("pi1"), nullptr);
    EXPECT_EQ(registry.connection_count(), 0u);
}

TEST_F(ConnectionRegistryTest, UnregisterStaleConnectionIsNoOp) {
    auto old_conn = make_connection("pi1");
    auto new_conn = make_connection("pi1");

    registry.register_connection("pi1", old_conn);
    registry.register_connection("pi1", new_conn);

    // The old session's disconnect handler fires after it was replaced
    EXPECT_FALSE(registry.unregister_connection("pi1", old_conn));
    EXPECT_EQ(registry.lookup("pi1"), new_conn);
}

TEST_F(ConnectionRegistryTest, UnregisterUnknownDevice) {
    EXPECT_FALSE(registry.unregister_connection("ghost", make_connection("ghost")));
}

TEST_F(ConnectionRegistryTest, UnregisterDoesNotCloseConnection) {
    auto conn = make_connection("pi1");
    EXPECT_CALL(*conn, close(_)).Times(0);

    registry.register_connection("pi1", conn);
    EXPECT_TRUE(registry.unregister_connection("pi1", conn));
}

TEST_F(ConnectionRegistryTest, SnapshotIsSorted) {
    registry.register_connection("charlie", make_connection("charlie"));
    registry.register_connection("alpha", make_connection("alpha"));
    registry.register_connection("bravo", make_connection("bravo"));

    EXPECT_THAT(registry.snapshot(), ElementsAre("alpha", "bravo", "charlie"));
}

TEST_F(ConnectionRegistryTest, ClearClosesEverything) {
    auto a = make_connection("a");
    auto b = make_connection("b");
    EXPECT_CALL(*a, close(_)).Times(1);
    EXPECT_CALL(*b, close(_)).Times(1);

    registry.register_connection("a", a);
    registry.register_connection("b", b);
    registry.clear();

    EXPECT_EQ(registry.connection_count(), 0u);
    EXPECT_TRUE(registry.snapshot().empty());
}

TEST_F(ConnectionRegistryTest, RemovalListenerReceivesReasons) {
    using Event = std::tuple<std::string, registry::ConnectionRegistry::ConnectionPtr, registry::RemovalReason>;
    std::vector<Event> events;
    registry.add_removal_listener([&](const std::string &id, const registry::ConnectionRegistry::ConnectionPtr &conn,
                                      registry::RemovalReason reason) { events.emplace_back(id, conn, reason); });

    auto first = make_connection("pi1");
    auto second = make_connection("pi1");
    auto other = make_connection("pi2");

    registry.register_connection("pi1", first);
    registry.register_connection("pi1", second);
    registry.register_connection("pi2", other);
    registry.unregister_connection("pi1", second);
    registry.clear();

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], Event("pi1", first, registry::RemovalReason::REPLACED));
    EXPECT_EQ(events[1], Event("pi1", second, registry::RemovalReason::CLOSED));
    EXPECT_EQ(events[2], Event("pi2", other, registry::RemovalReason::SHUTDOWN));
}

TEST(RemovalReasonTest, NamesUsedInLogs) {
    EXPECT_STREQ(registry::removal_reason_to_string(registry::RemovalReason::REPLACED), "replaced");
    EXPECT_STREQ(registry::removal_reason_to_string(registry::RemovalReason::CLOSED), "closed");
    EXPECT_STREQ(registry::removal_reason_to_string(registry::RemovalReason::SHUTDOWN), "shutdown");
}

TEST_F(ConnectionRegistryTest, RemovedListenerIsNotCalled) {
    int calls = 0;
    auto id = registry.add_removal_listener(
        [&](const std::string &, const registry::ConnectionRegistry::ConnectionPtr &, registry::RemovalReason) {
            ++calls;
        });
    registry.remove_removal_listener(id);

    auto conn = make_connection("pi1");
    registry.register_connection("pi1", conn);
    registry.unregister_connection("pi1", conn);

    EXPECT_EQ(calls, 0);
}

TEST_F(ConnectionRegistryTest, ListenerMayCallBackIntoRegistry) {
    // Listeners run outside the registry lock
    size_t seen_count = 99;
    registry.add_removal_listener(
        [&](const std::string &, const registry::ConnectionRegistry::ConnectionPtr &, registry::RemovalReason) {
            seen_count = registry.connection_count();
        });

    auto conn = make_connection("pi1");
    registry.register_connection("pi1", conn);
    registry.unregister_connection("pi1", conn);

    EXPECT_EQ(seen_count, 0u);
}

TEST_F(ConnectionRegistryTest, ConcurrentReconnectsLeaveOneLiveConnection) {
    constexpr int kThreads = 8;
    constexpr int kIterations = 200;

    std::atomic<int> closes{0};
    std::atomic<int> replaced{0};
    registry.add_removal_listener(
        [&](const std::string &, const registry::ConnectionRegistry::ConnectionPtr &, registry::RemovalReason reason) {
            if (reason == registry::RemovalReason::REPLACED) {
                replaced.fetch_add(1);
            }
        });

    std::vector<std::shared_ptr<NiceMock<MockConnection>>> all;
    std::mutex all_mutex;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kIterations; ++i) {
                auto conn = make_connection("pi1");
                ON_CALL(*conn, close(_)).WillByDefault([&closes](const std::string &) { closes.fetch_add(1); });
                {
                    std::lock_guard<std::mutex> lock(all_mutex);
                    all.push_back(conn);
                }
                registry.register_connection("pi1", conn);
                if (i % 3 == 0) {
                    registry.unregister_connection("pi1", conn);
                }
                registry.lookup("pi1");
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    // Only superseded connections are closed, each exactly once
    auto live = registry.lookup("pi1");
    EXPECT_LE(registry.connection_count(), 1u);
    if (live) {
        EXPECT_NE(std::find(all.begin(), all.end(), live), all.end());
    }
    EXPECT_EQ(closes.load(), replaced.load());
}
