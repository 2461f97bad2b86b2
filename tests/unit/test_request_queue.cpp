#include <gtest/gtest.h>
#include <modelgate/modelgate.hpp>

#include <cstdlib>
#include <map>
#include <thread>

using namespace modelgate;
using namespace std::chrono_literals;

// ===========================================================================
// Helpers
// ===========================================================================

static QueueEntry make_entry(RequestId id, const IsolationScope& scope,
                             Priority prio = Priority::Normal) {
    return QueueEntry(id, scope, prio);
}

static const IsolationScope kScopeA("acme", "support-bot");
static const IsolationScope kScopeB("acme", "sales-bot");
static const IsolationScope kScopeC("globex", "support-bot");

// ===========================================================================
// Ordering within one scope
// ===========================================================================

TEST(RequestQueueTest, FifoWithinScopeAndTier) {
    RequestQueue q;
    q.push(make_entry(1, kScopeA));
    q.push(make_entry(2, kScopeA));
    q.push(make_entry(3, kScopeA));

    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(q.pop()->id, 1u);
    EXPECT_EQ(q.pop()->id, 2u);
    EXPECT_EQ(q.pop()->id, 3u);
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_TRUE(q.empty());
}

TEST(RequestQueueTest, HigherTiersPreemptLowerTiers) {
    RequestQueue q;
    q.push(make_entry(1, kScopeA, Priority::Low));
    q.push(make_entry(2, kScopeA, Priority::High));
    q.push(make_entry(3, kScopeA, Priority::Normal));
    q.push(make_entry(4, kScopeA, Priority::Urgent));

    EXPECT_EQ(q.pop()->priority, Priority::Urgent);
    EXPECT_EQ(q.pop()->priority, Priority::High);
    EXPECT_EQ(q.pop()->priority, Priority::Normal);
    EXPECT_EQ(q.pop()->priority, Priority::Low);
}

TEST(RequestQueueTest, UrgentJumpsAheadOfEarlierNormal) {
    RequestQueue q;
    q.push(make_entry(1, kScopeA));
    q.push(make_entry(2, kScopeA));
    q.push(make_entry(3, kScopeA));
    q.push(make_entry(4, kScopeA, Priority::Urgent));

    EXPECT_EQ(q.pop()->id, 4u);
    EXPECT_EQ(q.pop()->id, 1u);
    EXPECT_EQ(q.pop()->id, 2u);
    EXPECT_EQ(q.pop()->id, 3u);
}

// ===========================================================================
// Fairness across scopes
// ===========================================================================

TEST(RequestQueueTest, RoundRobinAcrossScopesAtSameTier) {
    RequestQueue q;
    // Scope A floods first, then B submits
    for (RequestId id = 1; id <= 4; ++id) q.push(make_entry(id, kScopeA));
    for (RequestId id = 11; id <= 14; ++id) q.push(make_entry(id, kScopeB));

    std::map<std::string, int> served;
    for (int i = 0; i < 8; ++i) {
        auto e = q.pop();
        ASSERT_TRUE(e.has_value());
        served[e->scope.scope_key()]++;
        int diff = served[kScopeA.scope_key()] - served[kScopeB.scope_key()];
        EXPECT_LE(std::abs(diff), 1) << "after dispatch " << i;
    }
}

TEST(RequestQueueTest, RoundRobinRotatesThroughThreeScopes) {
    RequestQueue q;
    q.push(make_entry(1, kScopeA));
    q.push(make_entry(2, kScopeA));
    q.push(make_entry(3, kScopeB));
    q.push(make_entry(4, kScopeC));
    q.push(make_entry(5, kScopeB));

    std::vector<RequestId> order;
    while (auto e = q.pop()) order.push_back(e->id);

    ASSERT_EQ(order.size(), 5u);
    EXPECT_EQ(order[0], 1u);
    EXPECT_EQ(order[1], 3u);
    EXPECT_EQ(order[2], 4u);
    EXPECT_EQ(order[3], 2u);
    EXPECT_EQ(order[4], 5u);
}

TEST(RequestQueueTest, StrictPriorityAcrossScopes) {
    RequestQueue q;
    q.push(make_entry(1, kScopeA, Priority::Normal));
    q.push(make_entry(2, kScopeB, Priority::High));

    EXPECT_EQ(q.pop()->id, 2u);
    EXPECT_EQ(q.pop()->id, 1u);
}

// ===========================================================================
// Aging
// ===========================================================================

TEST(RequestQueueTest, EffectivePriorityClimbsOneTierPerInterval) {
    RequestQueue q(100, 100, 1s);
    QueueEntry e = make_entry(1, kScopeA, Priority::Low);
    e.enqueued_at = Clock::now();

    EXPECT_EQ(q.effective_priority(e, e.enqueued_at), Priority::Low);
    EXPECT_EQ(q.effective_priority(e, e.enqueued_at + 999ms), Priority::Low);
    EXPECT_EQ(q.effective_priority(e, e.enqueued_at + 1s), Priority::Normal);
    EXPECT_EQ(q.effective_priority(e, e.enqueued_at + 2s), Priority::High);
    EXPECT_EQ(q.effective_priority(e, e.enqueued_at + 3s), Priority::Urgent);
    EXPECT_EQ(q.effective_priority(e, e.enqueued_at + 1h), Priority::Urgent);
}

TEST(RequestQueueTest, ZeroIntervalDisablesAging) {
    RequestQueue q(100, 100, Duration::zero());
    QueueEntry e = make_entry(1, kScopeA, Priority::Low);
    e.enqueued_at = Clock::now();
    EXPECT_EQ(q.effective_priority(e, e.enqueued_at + 24h), Priority::Low);
}

TEST(RequestQueueTest, AgedLowRequestOvertakesNewerHigh) {
    RequestQueue q(100, 100, 20ms);
    q.push(make_entry(1, kScopeA, Priority::Low));
    std::this_thread::sleep_for(60ms);   // three intervals: Low -> Urgent
    q.push(make_entry(2, kScopeA, Priority::High));

    EXPECT_EQ(q.pop()->id, 1u);
    EXPECT_EQ(q.pop()->id, 2u);
}

// ===========================================================================
// Bounds
// ===========================================================================

TEST(RequestQueueTest, GlobalBoundRejects) {
    RequestQueue q(2, 10);
    q.push(make_entry(1, kScopeA));
    q.push(make_entry(2, kScopeB));
    EXPECT_THROW(q.push(make_entry(3, kScopeC)), QueueFullException);
    EXPECT_EQ(q.size(), 2u);
}

TEST(RequestQueueTest, PerScopeBoundRejectsOnlyThatScope) {
    RequestQueue q(100, 2);
    q.push(make_entry(1, kScopeA));
    q.push(make_entry(2, kScopeA));

    try {
        q.push(make_entry(3, kScopeA));
        FAIL() << "expected QueueFullException";
    } catch (const QueueFullException& e) {
        EXPECT_EQ(e.request_id(), 3u);
    }
    EXPECT_NO_THROW(q.push(make_entry(4, kScopeB)));
    EXPECT_EQ(q.size_for_scope(kScopeA), 2u);
    EXPECT_EQ(q.size_for_scope(kScopeB), 1u);
}

TEST(RequestQueueTest, DelayedRetriesBypassBounds) {
    RequestQueue q(1, 1);
    q.push(make_entry(1, kScopeA));
    EXPECT_NO_THROW(q.push_delayed(make_entry(2, kScopeA), Clock::now() + 1h));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.delayed_size(), 1u);
}

// ===========================================================================
// Removal, delayed entries, blocking
// ===========================================================================

TEST(RequestQueueTest, RemoveReadyAndDelayed) {
    RequestQueue q;
    q.push(make_entry(1, kScopeA));
    q.push(make_entry(2, kScopeB));
    q.push_delayed(make_entry(3, kScopeA), Clock::now() + 1h);

    EXPECT_TRUE(q.remove(1));
    EXPECT_TRUE(q.remove(3));
    EXPECT_FALSE(q.remove(99));
    EXPECT_EQ(q.size(), 1u);
    EXPECT_EQ(q.active_scopes(), 1u);
    EXPECT_EQ(q.pop()->id, 2u);
}

TEST(RequestQueueTest, DelayedEntryBecomesReadyWhenDue) {
    RequestQueue q;
    q.push_delayed(make_entry(7, kScopeA), Clock::now() + 30ms);

    EXPECT_FALSE(q.pop().has_value());
    auto e = q.wait_and_pop(2s);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->id, 7u);
}

TEST(RequestQueueTest, WaitAndPopTimesOutWhenEmpty) {
    RequestQueue q;
    auto start = Clock::now();
    EXPECT_FALSE(q.wait_and_pop(30ms).has_value());
    EXPECT_GE(Clock::now() - start, 25ms);
}

TEST(RequestQueueTest, WaitAndPopWakesOnPush) {
    RequestQueue q;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        q.push(make_entry(5, kScopeA));
    });

    auto e = q.wait_and_pop(5s);
    producer.join();
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->id, 5u);
}

TEST(RequestQueueTest, CloseWakesWaitersAndRejectsPushes) {
    RequestQueue q;
    std::thread waiter([&] { EXPECT_FALSE(q.wait_and_pop(10s).has_value()); });
    std::this_thread::sleep_for(20ms);
    q.close();
    waiter.join();

    EXPECT_TRUE(q.closed());
    EXPECT_THROW(q.push(make_entry(1, kScopeA)), QueueFullException);
    q.reopen();
    EXPECT_NO_THROW(q.push(make_entry(1, kScopeA)));
}

TEST(RequestQueueTest, SizeByPriorityCountsReadyAndDelayed) {
    RequestQueue q;
    q.push(make_entry(1, kScopeA, Priority::Low));
    q.push(make_entry(2, kScopeB, Priority::Urgent));
    q.push_delayed(make_entry(3, kScopeA, Priority::Urgent), Clock::now() + 1h);

    auto sizes = q.size_by_priority();
    EXPECT_EQ(sizes[static_cast<int>(Priority::Low)], 1u);
    EXPECT_EQ(sizes[static_cast<int>(Priority::Normal)], 0u);
    EXPECT_EQ(sizes[static_cast<int>(Priority::Urgent)], 2u);
}
