#include <gtest/gtest.h>
#include <modelgate/modelgate.hpp>
#include "../support/fakes.hpp"

using namespace modelgate;
using namespace modelgate::testing;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture: full scheduler wired to fakes
// ===========================================================================

class SchedulerScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        invoker_ = std::make_shared<ScriptedInvoker>();
        persistence_ = std::make_shared<RecordingPersistence>();
        monitor_ = std::make_shared<RecordingMonitor>();
    }

    void TearDown() override {
        invoker_->release();
        if (scheduler_) scheduler_->stop();
    }

    void build(Config config = fast_config()) {
        scheduler_ = std::make_unique<Scheduler>(config,
                                                 std::make_shared<FakeConfigProvider>(),
                                                 std::make_shared<FakeClientFactory>(),
                                                 invoker_,
                                                 persistence_);
        scheduler_->set_monitor(monitor_);
    }

    IsolationScope scope_{"acme", "support-bot"};

    std::shared_ptr<ScriptedInvoker> invoker_;
    std::shared_ptr<RecordingPersistence> persistence_;
    std::shared_ptr<RecordingMonitor> monitor_;
    std::unique_ptr<Scheduler> scheduler_;
};

// ===========================================================================
// Admission control
// ===========================================================================

TEST_F(SchedulerScenarioTest, ExceededQuotaRejectsSynchronously) {
    build();
    QuotaPolicy policy;
    policy.daily_token_limit = 1000;
    scheduler_->set_policy("acme", policy);
    scheduler_->quota().record_usage("acme", "support-bot", 950, 0.0);
    scheduler_->start();

    auto depth_before = scheduler_->requests().queue_depth();
    EXPECT_THROW(scheduler_->submit(scope_, "too much", Priority::Normal, 100),
                 QuotaExceededException);
    EXPECT_EQ(scheduler_->requests().queue_depth(), depth_before);

    auto rejected = scheduler_->requests().requests_for_tenant("acme");
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].status, RequestStatus::Failed);
    EXPECT_EQ(rejected[0].error.kind, ErrorKind::QuotaExceeded);
    EXPECT_EQ(scheduler_->requests().stats().quota_rejected, 1u);
    EXPECT_EQ(invoker_->call_count(), 0);
}

TEST_F(SchedulerScenarioTest, ExceededTenantDoesNotBlockOtherTenants) {
    build();
    QuotaPolicy tight;
    tight.daily_token_limit = 100;
    scheduler_->set_policy("acme", tight);
    scheduler_->quota().record_usage("acme", "support-bot", 100, 0.0);
    scheduler_->start();

    EXPECT_THROW(scheduler_->submit(scope_, "x", Priority::Normal, 1), QuotaExceededException);

    auto id = scheduler_->submit(IsolationScope("globex", "support-bot"), "y",
                                 Priority::Normal, 1);
    EXPECT_TRUE(scheduler_->await_result(id, 5s).succeeded());
}

// ===========================================================================
// Dispatch order
// ===========================================================================

TEST_F(SchedulerScenarioTest, UrgentDispatchesBeforeEarlierNormals) {
    build(fast_config(1));

    std::vector<RequestId> normals;
    for (int i = 0; i < 3; ++i) {
        normals.push_back(scheduler_->submit(scope_, "n" + std::to_string(i),
                                             Priority::Normal, 10));
    }
    auto urgent = scheduler_->submit(scope_, "u", Priority::Urgent, 10);
    scheduler_->start();

    for (auto id : normals) {
        ASSERT_TRUE(scheduler_->await_result(id, 5s).succeeded());
    }
    ASSERT_TRUE(scheduler_->await_result(urgent, 5s).succeeded());

    std::vector<RequestId> expected{urgent, normals[0], normals[1], normals[2]};
    EXPECT_EQ(monitor_->dispatch_order(), expected);
}

TEST_F(SchedulerScenarioTest, MixedPrioritiesDispatchHighestFirst) {
    build(fast_config(1));

    auto low = scheduler_->submit(scope_, "low", Priority::Low, 0);
    auto high = scheduler_->submit(scope_, "high", Priority::High, 0);
    auto normal = scheduler_->submit(scope_, "normal", Priority::Normal, 0);
    auto urgent = scheduler_->submit(scope_, "urgent", Priority::Urgent, 0);
    scheduler_->start();

    ASSERT_TRUE(scheduler_->await_result(low, 5s).succeeded());

    std::vector<RequestId> expected{urgent, high, normal, low};
    EXPECT_EQ(monitor_->dispatch_order(), expected);
}

// ===========================================================================
// Retries
// ===========================================================================

TEST_F(SchedulerScenarioTest, TransientFailuresRetryUntilSuccess) {
    invoker_->fail_transient_times(2);
    build();
    scheduler_->start();

    auto result = scheduler_->await_result(scheduler_->submit(scope_, "flaky", Priority::Normal, 10),
                                           5s);
    EXPECT_EQ(result.status, RequestStatus::Completed);
    EXPECT_EQ(result.attempt_count, 3u);
    EXPECT_EQ(invoker_->call_count(), 3);
    EXPECT_EQ(monitor_->count(EventType::RequestRetryScheduled), 2u);

    // Only the successful attempt is accounted and persisted
    auto usage = scheduler_->get_usage("acme");
    EXPECT_EQ(usage.tokens_used_today, 10);
    EXPECT_EQ(usage.requests_today, 1);
    ASSERT_TRUE(scheduler_->quota().wait_for_persistence(2s));
    EXPECT_EQ(persistence_->stored_count(), 1u);
}

TEST_F(SchedulerScenarioTest, RetriedRequestKeepsItsTier) {
    invoker_->fail_transient_times(1);
    build(fast_config(1));

    auto urgent = scheduler_->submit(scope_, "urgent", Priority::Urgent, 0);
    scheduler_->start();

    auto result = scheduler_->await_result(urgent, 5s);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.priority, Priority::Urgent);
    EXPECT_EQ(result.attempt_count, 2u);
}

// ===========================================================================
// Cancellation
// ===========================================================================

TEST_F(SchedulerScenarioTest, CancelledRequestsNeverReachTheProvider) {
    build(fast_config(1));

    auto keep = scheduler_->submit(scope_, "keep", Priority::Normal, 0);
    auto drop = scheduler_->submit(scope_, "drop", Priority::Normal, 0);
    EXPECT_TRUE(scheduler_->cancel(drop));
    EXPECT_FALSE(scheduler_->cancel(drop));   // already terminal
    scheduler_->start();

    ASSERT_TRUE(scheduler_->await_result(keep, 5s).succeeded());
    EXPECT_EQ(scheduler_->await_result(drop, 1s).status, RequestStatus::Cancelled);

    auto calls = invoker_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], "keep");
}

// ===========================================================================
// Alerts and administration
// ===========================================================================

TEST_F(SchedulerScenarioTest, AlertListenerSeesEscalation) {
    auto listener = std::make_shared<RecordingListener>();
    build();
    QuotaPolicy policy;
    policy.daily_token_limit = 100;
    scheduler_->set_policy("acme", policy);
    scheduler_->add_alert_listener(listener);
    invoker_->set_tokens_per_call(85);
    scheduler_->start();

    ASSERT_TRUE(scheduler_->await_result(scheduler_->submit(scope_, "big", Priority::Normal, 0),
                                         5s).succeeded());

    ASSERT_EQ(listener->count(), 1u);
    EXPECT_EQ(std::get<1>(listener->transitions[0]), QuotaAlertLevel::Ok);
    EXPECT_EQ(std::get<2>(listener->transitions[0]), QuotaAlertLevel::Warning);

    auto status = scheduler_->get_quota_status("acme");
    EXPECT_TRUE(status.explicit_policy);
    EXPECT_EQ(status.evaluation.level, QuotaAlertLevel::Warning);
}

TEST_F(SchedulerScenarioTest, InvalidationForcesClientRebuild) {
    build();
    scheduler_->start();

    ASSERT_TRUE(scheduler_->await_result(scheduler_->submit(scope_, "a", Priority::Normal, 0),
                                         5s).succeeded());
    EXPECT_EQ(scheduler_->clients().size(), 1u);

    EXPECT_EQ(scheduler_->invalidate_tenant("acme"), 1u);
    EXPECT_EQ(scheduler_->clients().size(), 0u);

    ASSERT_TRUE(scheduler_->await_result(scheduler_->submit(scope_, "b", Priority::Normal, 0),
                                         5s).succeeded());
    EXPECT_EQ(monitor_->count(EventType::ClientCreated), 2u);
    EXPECT_EQ(scheduler_->invalidate_all(), 1u);
}

TEST_F(SchedulerScenarioTest, StartStopIsIdempotent) {
    build();
    scheduler_->start();
    scheduler_->start();
    EXPECT_TRUE(scheduler_->is_running());
    scheduler_->stop();
    scheduler_->stop();
    EXPECT_FALSE(scheduler_->is_running());
}
