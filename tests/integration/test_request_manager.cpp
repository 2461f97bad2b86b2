#include <gtest/gtest.h>
#include <modelgate/modelgate.hpp>
#include "../support/fakes.hpp"

#include <thread>

using namespace modelgate;
using namespace modelgate::testing;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture
// ===========================================================================

class RequestManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_provider_ = std::make_shared<FakeConfigProvider>();
        factory_ = std::make_shared<FakeClientFactory>();
        invoker_ = std::make_shared<ScriptedInvoker>();
        monitor_ = std::make_shared<RecordingMonitor>();
    }

    void TearDown() override {
        // Never leave a worker parked on a held call
        invoker_->release();
        if (manager_) manager_->stop();
        if (quota_) quota_->stop();
    }

    void build(Config config = fast_config()) {
        quota_ = std::make_shared<QuotaManager>(config.quota);
        clients_ = std::make_shared<ClientRegistry>(config_provider_, factory_, config.clients);
        manager_ = std::make_unique<RequestManager>(config, quota_, clients_, invoker_);
        manager_->set_monitor(monitor_);
        quota_->set_monitor(monitor_);
    }

    void build_and_start(Config config = fast_config()) {
        build(config);
        quota_->start();
        manager_->start();
    }

    IsolationScope scope_{"acme", "support-bot"};

    std::shared_ptr<FakeConfigProvider> config_provider_;
    std::shared_ptr<FakeClientFactory> factory_;
    std::shared_ptr<ScriptedInvoker> invoker_;
    std::shared_ptr<RecordingMonitor> monitor_;

    std::shared_ptr<QuotaManager> quota_;
    std::shared_ptr<ClientRegistry> clients_;
    std::unique_ptr<RequestManager> manager_;
};

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_F(RequestManagerTest, CompletesAndHandsOverResult) {
    build_and_start();

    auto id = manager_->submit(scope_, "hello");
    auto result = manager_->await_result(id, 5s);

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.result.value(), "echo:hello");
    EXPECT_EQ(result.attempt_count, 1u);
    EXPECT_EQ(result.tokens_used, 10);
    EXPECT_TRUE(result.started_at.has_value());
    EXPECT_TRUE(result.completed_at.has_value());
    EXPECT_TRUE(result.execution_time.has_value());
    EXPECT_EQ(result.error.kind, ErrorKind::None);

    // Collected results are released
    EXPECT_FALSE(manager_->get_status(id).has_value());
    EXPECT_THROW(manager_->await_result(id, 10ms), RequestNotFoundException);
}

TEST_F(RequestManagerTest, SuccessfulCallIsBilledOnce) {
    build_and_start();
    invoker_->set_tokens_per_call(42);

    auto id = manager_->submit(scope_, "bill me");
    ASSERT_TRUE(manager_->await_result(id, 5s).succeeded());

    auto usage = quota_->get_usage("acme");
    EXPECT_EQ(usage.tokens_used_today, 42);
    EXPECT_EQ(usage.requests_today, 1);
    EXPECT_DOUBLE_EQ(usage.cost_incurred_this_month, 0.01);
}

TEST_F(RequestManagerTest, AwaitTimeoutReturnsPendingSnapshot) {
    build();   // not started: nothing dispatches

    auto id = manager_->submit(scope_, "waiting");
    auto snapshot = manager_->await_result(id, 20ms);

    EXPECT_FALSE(snapshot.is_terminal());
    EXPECT_EQ(snapshot.status, RequestStatus::Admitted);
    EXPECT_TRUE(manager_->get_status(id).has_value());
}

TEST_F(RequestManagerTest, UnknownRequestIsNotFound) {
    build();
    EXPECT_THROW(manager_->await_result(999, 10ms), RequestNotFoundException);
    EXPECT_FALSE(manager_->cancel(999));
    EXPECT_FALSE(manager_->get_status(999).has_value());
}

TEST_F(RequestManagerTest, RequiresCollaborators) {
    build();
    EXPECT_THROW(RequestManager(fast_config(), nullptr, clients_, invoker_), ValidationException);
    EXPECT_THROW(RequestManager(fast_config(), quota_, nullptr, invoker_), ValidationException);
    EXPECT_THROW(RequestManager(fast_config(), quota_, clients_, nullptr), ValidationException);
}

TEST_F(RequestManagerTest, DefaultDeadlineMustFitUnderMaximum) {
    build();
    auto config = fast_config();
    config.max_deadline = std::chrono::seconds(10);
    config.default_deadline = std::chrono::seconds(11);
    EXPECT_THROW(RequestManager(config, quota_, clients_, invoker_), ValidationException);
}

TEST_F(RequestManagerTest, AwaitWithUnboundedTimeoutStillWaits) {
    invoker_->hold();
    build_and_start();
    auto id = manager_->submit(scope_, "slow");
    ASSERT_TRUE(invoker_->wait_for_in_flight(1, 5s));

    std::thread releaser([this] {
        std::this_thread::sleep_for(30ms);
        invoker_->release();
    });
    auto result = manager_->await_result(id, Duration::max());
    releaser.join();

    EXPECT_TRUE(result.succeeded());
}

// ===========================================================================
// Submission validation
// ===========================================================================

TEST_F(RequestManagerTest, InvalidSubmissionsAreRejectedBeforeQueueing) {
    build();

    SubmitOptions bad_priority;
    bad_priority.priority = static_cast<Priority>(7);
    EXPECT_THROW(manager_->submit(scope_, "x", bad_priority), ValidationException);

    SubmitOptions negative;
    negative.estimated_tokens = -1;
    EXPECT_THROW(manager_->submit(scope_, "x", negative), ValidationException);

    SubmitOptions zero_deadline;
    zero_deadline.deadline = Duration::zero();
    EXPECT_THROW(manager_->submit(scope_, "x", zero_deadline), ValidationException);

    SubmitOptions unbounded_deadline;
    unbounded_deadline.deadline = Duration::max();
    EXPECT_THROW(manager_->submit(scope_, "x", unbounded_deadline), ValidationException);

    EXPECT_EQ(manager_->queue_depth(), 0u);
    EXPECT_EQ(manager_->stats().submitted, 0u);
}

TEST_F(RequestManagerTest, IdempotencyKeyResolvesToFirstRequest) {
    build();

    SubmitOptions options;
    options.idempotency_key = "order-17";
    auto first = manager_->submit(scope_, "a", options);
    auto second = manager_->submit(scope_, "b", options);

    EXPECT_EQ(first, second);
    EXPECT_EQ(manager_->queue_depth(), 1u);

    // Once collected, the key is free again
    manager_->start();
    ASSERT_TRUE(manager_->await_result(first, 5s).succeeded());
    auto third = manager_->submit(scope_, "c", options);
    EXPECT_NE(third, first);
}

TEST_F(RequestManagerTest, QueueFullLeavesFailedDescriptor) {
    auto config = fast_config();
    config.max_queue_size = 1;
    build(config);

    manager_->submit(scope_, "fits");
    RequestId rejected = 0;
    try {
        manager_->submit(scope_, "overflow");
        FAIL() << "expected QueueFullException";
    } catch (const QueueFullException& e) {
        rejected = e.request_id();
    }

    auto status = manager_->get_status(rejected);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, RequestStatus::Failed);
    EXPECT_EQ(status->error.kind, ErrorKind::QueueFull);
    EXPECT_EQ(manager_->queue_depth(), 1u);
    EXPECT_EQ(monitor_->count(EventType::RequestRejected), 1u);
}

TEST_F(RequestManagerTest, WarningLevelAdmitsWithEvent) {
    build();
    QuotaPolicy policy;
    policy.daily_token_limit = 1000;
    quota_->set_policy("acme", policy);
    quota_->record_usage("acme", "support-bot", 850, 0.0);

    SubmitOptions options;
    options.estimated_tokens = 10;
    auto id = manager_->submit(scope_, "near the edge", options);

    EXPECT_EQ(manager_->get_status(id)->status, RequestStatus::Admitted);
    EXPECT_EQ(monitor_->count(EventType::QuotaAdmissionWarning), 1u);
}

// ===========================================================================
// Cancellation
// ===========================================================================

TEST_F(RequestManagerTest, CancelQueuedRequest) {
    build();
    auto id = manager_->submit(scope_, "never runs");

    EXPECT_TRUE(manager_->cancel(id));
    EXPECT_EQ(manager_->queue_depth(), 0u);

    auto result = manager_->await_result(id, 1s);
    EXPECT_EQ(result.status, RequestStatus::Cancelled);
    EXPECT_EQ(result.error.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(result.cancel_requested);
    EXPECT_EQ(invoker_->call_count(), 0);
}

TEST_F(RequestManagerTest, CancelRunningRequestThatHonorsToken) {
    invoker_->hold(/*honor_cancel=*/true);
    build_and_start();

    auto id = manager_->submit(scope_, "long call");
    ASSERT_TRUE(invoker_->wait_for_in_flight(1, 5s));

    EXPECT_TRUE(manager_->cancel(id));
    auto running = manager_->get_status(id);
    ASSERT_TRUE(running.has_value());
    EXPECT_TRUE(running->cancel_requested);
    invoker_->poke();

    auto result = manager_->await_result(id, 5s);
    EXPECT_EQ(result.status, RequestStatus::Cancelled);
    EXPECT_TRUE(result.cancel_requested);
    EXPECT_EQ(monitor_->count(EventType::RequestCancelSignalled), 1u);
}

TEST_F(RequestManagerTest, CancelledRunningCallThatSucceedsIsBilledButDiscarded) {
    invoker_->hold(/*honor_cancel=*/false);
    build_and_start();

    auto id = manager_->submit(scope_, "ignores cancel");
    ASSERT_TRUE(invoker_->wait_for_in_flight(1, 5s));
    EXPECT_TRUE(manager_->cancel(id));

    // The call is still held: the flag is visible while the request runs
    auto running = manager_->get_status(id);
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->status, RequestStatus::Running);
    EXPECT_TRUE(running->cancel_requested);

    invoker_->release();

    auto result = manager_->await_result(id, 5s);
    EXPECT_EQ(result.status, RequestStatus::Cancelled);
    EXPECT_TRUE(result.cancel_requested);
    EXPECT_FALSE(result.result.has_value());
    EXPECT_EQ(quota_->get_usage("acme").tokens_used_today, 10);
}

TEST_F(RequestManagerTest, CancelAfterTerminalIsRejected) {
    build_and_start();
    auto id = manager_->submit(scope_, "quick");

    ASSERT_TRUE(eventually([&] {
        auto s = manager_->get_status(id);
        return s.has_value() && s->is_terminal();
    }));
    EXPECT_FALSE(manager_->cancel(id));
    EXPECT_EQ(manager_->get_status(id)->status, RequestStatus::Completed);
}

TEST_F(RequestManagerTest, StopCancelsStillQueuedRequests) {
    invoker_->hold();
    build_and_start(fast_config(1));

    auto running = manager_->submit(scope_, "in flight");
    ASSERT_TRUE(invoker_->wait_for_in_flight(1, 5s));
    auto queued = manager_->submit(scope_, "behind it");

    std::thread releaser([&] {
        std::this_thread::sleep_for(30ms);
        invoker_->release();
    });
    manager_->stop();
    releaser.join();

    EXPECT_EQ(manager_->get_status(running)->status, RequestStatus::Completed);
    auto behind = manager_->get_status(queued);
    ASSERT_TRUE(behind.has_value());
    EXPECT_EQ(behind->status, RequestStatus::Cancelled);
    EXPECT_EQ(behind->error.message, "Scheduler stopped");
}

// ===========================================================================
// Failures and retries
// ===========================================================================

TEST_F(RequestManagerTest, TerminalProviderErrorIsNotRetried) {
    invoker_->fail_terminal(true);
    build_and_start();

    auto result = manager_->await_result(manager_->submit(scope_, "bad"), 5s);
    EXPECT_EQ(result.status, RequestStatus::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::ProviderTerminal);
    EXPECT_EQ(result.attempt_count, 1u);
    EXPECT_EQ(manager_->stats().retried, 0u);
}

TEST_F(RequestManagerTest, TransientErrorsExhaustAttempts) {
    invoker_->fail_transient_times(10);
    build_and_start();

    auto result = manager_->await_result(manager_->submit(scope_, "flaky"), 5s);
    EXPECT_EQ(result.status, RequestStatus::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::ProviderTransient);
    EXPECT_EQ(result.attempt_count, 3u);
    EXPECT_NE(result.error.message.find("after 3 attempts"), std::string::npos);
    EXPECT_EQ(manager_->stats().retried, 2u);
    EXPECT_EQ(quota_->get_usage("acme").tokens_used_today, 0);
}

TEST_F(RequestManagerTest, UnexpectedInvokerErrorIsInternal) {
    invoker_->fail_internal(true);
    build_and_start();

    auto result = manager_->await_result(manager_->submit(scope_, "odd"), 5s);
    EXPECT_EQ(result.status, RequestStatus::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::Internal);
}

TEST_F(RequestManagerTest, ClientResolutionFailureFailsRequest) {
    factory_->fail = true;
    build_and_start();

    auto result = manager_->await_result(manager_->submit(scope_, "no client"), 5s);
    EXPECT_EQ(result.status, RequestStatus::Failed);
    EXPECT_EQ(result.error.kind, ErrorKind::ClientResolution);
    EXPECT_EQ(invoker_->call_count(), 0);
}

TEST_F(RequestManagerTest, ProviderOverrideReachesInvoker) {
    build_and_start();

    SubmitOptions options;
    options.provider_identity = "backup-provider";
    ASSERT_TRUE(manager_->await_result(manager_->submit(scope_, "x", options), 5s).succeeded());

    auto providers = invoker_->providers();
    ASSERT_EQ(providers.size(), 1u);
    EXPECT_EQ(providers[0], "backup-provider");
}

// ===========================================================================
// Deadlines
// ===========================================================================

TEST_F(RequestManagerTest, WatchdogReclaimsStuckCall) {
    invoker_->hold();
    build_and_start();

    SubmitOptions options;
    options.deadline = 40ms;
    auto id = manager_->submit(scope_, "stuck", options);

    auto result = manager_->await_result(id, 5s);
    EXPECT_EQ(result.status, RequestStatus::TimedOut);
    EXPECT_EQ(result.error.kind, ErrorKind::Timeout);
    EXPECT_EQ(monitor_->count(EventType::WatchdogReclaimed), 1u);

    // The late response is dropped but the work is still billed
    invoker_->release();
    EXPECT_TRUE(eventually([&] {
        return monitor_->count(EventType::RequestResultDiscarded) == 1;
    }));
    EXPECT_EQ(quota_->get_usage("acme").tokens_used_today, 10);
}

TEST_F(RequestManagerTest, QueuedRequestTimesOut) {
    build();   // not started

    SubmitOptions options;
    options.deadline = 20ms;
    auto id = manager_->submit(scope_, "too slow", options);
    std::this_thread::sleep_for(40ms);

    manager_->start();
    auto result = manager_->await_result(id, 5s);
    EXPECT_EQ(result.status, RequestStatus::TimedOut);
    EXPECT_EQ(invoker_->call_count(), 0);
}

TEST_F(RequestManagerTest, RetryThatWouldMissDeadlineTimesOut) {
    auto config = fast_config();
    config.backoff_base = 10s;
    config.backoff_max = 10s;
    invoker_->fail_transient_times(1);
    build_and_start(config);

    SubmitOptions options;
    options.deadline = 2s;
    auto result = manager_->await_result(manager_->submit(scope_, "x", options), 5s);

    EXPECT_EQ(result.status, RequestStatus::TimedOut);
    EXPECT_EQ(result.attempt_count, 1u);
    EXPECT_EQ(manager_->stats().retried, 0u);
}

// ===========================================================================
// Queries & maintenance
// ===========================================================================

TEST_F(RequestManagerTest, RequestsForTenantFiltersAndLimits) {
    build();
    IsolationScope other("globex", "support-bot");

    auto a1 = manager_->submit(scope_, "1");
    auto a2 = manager_->submit(scope_, "2");
    manager_->submit(scope_, "3");
    manager_->submit(other, "4");
    manager_->cancel(a2);

    auto all = manager_->requests_for_tenant("acme");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].request_id, a1);

    auto cancelled = manager_->requests_for_tenant("acme", RequestStatus::Cancelled);
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].request_id, a2);

    EXPECT_EQ(manager_->requests_for_tenant("acme", std::nullopt, 2).size(), 2u);
    EXPECT_EQ(manager_->requests_for_tenant("globex").size(), 1u);
}

TEST_F(RequestManagerTest, CleanupEvictsUncollectedResults) {
    build_and_start();
    auto id = manager_->submit(scope_, "forgotten");
    ASSERT_TRUE(eventually([&] {
        auto s = manager_->get_status(id);
        return s.has_value() && s->is_terminal();
    }));

    EXPECT_EQ(manager_->cleanup(1h), 0u);
    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(manager_->cleanup(1ms), 1u);
    EXPECT_FALSE(manager_->get_status(id).has_value());
}

TEST_F(RequestManagerTest, StatsReflectQueueByPriority) {
    build();
    SubmitOptions urgent;
    urgent.priority = Priority::Urgent;
    manager_->submit(scope_, "a");
    manager_->submit(scope_, "b", urgent);
    manager_->submit(scope_, "c", urgent);

    auto stats = manager_->stats();
    EXPECT_EQ(stats.submitted, 3u);
    EXPECT_EQ(stats.queue_depth, 3u);
    EXPECT_EQ(stats.tracked, 3u);
    EXPECT_EQ(stats.queued_by_priority[static_cast<int>(Priority::Normal)], 1u);
    EXPECT_EQ(stats.queued_by_priority[static_cast<int>(Priority::Urgent)], 2u);
}

TEST_F(RequestManagerTest, WatchdogPublishesSnapshots) {
    build_and_start();
    EXPECT_TRUE(eventually([&] { return monitor_->snapshot_count() >= 2; }));
}
