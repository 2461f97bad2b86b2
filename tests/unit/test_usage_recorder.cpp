#include <gtest/gtest.h>
#include <modelgate/modelgate.hpp>
#include "../support/fakes.hpp"

using namespace modelgate;
using namespace modelgate::testing;
using namespace std::chrono_literals;

static UsageDelta make_delta(TokenCount tokens) {
    UsageDelta d;
    d.tenant_id = "acme";
    d.agent_id = "bot";
    d.tokens = tokens;
    d.cost = 0.01;
    d.timestamp = WallClock::now();
    return d;
}

static QuotaConfig fast_quota_config() {
    QuotaConfig config;
    config.persistence_retry_delay = 1ms;
    return config;
}

TEST(UsageRecorderTest, NullSinkIsNoop) {
    UsageRecorder recorder(nullptr, fast_quota_config());
    recorder.start(nullptr);
    recorder.enqueue(make_delta(5));

    EXPECT_EQ(recorder.pending(), 0u);
    EXPECT_TRUE(recorder.wait_idle(100ms));
    recorder.stop();
}

TEST(UsageRecorderTest, StopDrainsQueuedDeltas) {
    auto sink = std::make_shared<RecordingPersistence>();
    UsageRecorder recorder(sink, fast_quota_config());

    // Queued before the writer exists
    for (int i = 0; i < 10; ++i) recorder.enqueue(make_delta(i));
    recorder.start(nullptr);
    recorder.stop();

    EXPECT_EQ(sink->stored_count(), 10u);
    EXPECT_EQ(recorder.persisted_count(), 10u);
    EXPECT_FALSE(recorder.is_running());
}

TEST(UsageRecorderTest, ExhaustedAttemptsDropAndDegrade) {
    auto sink = std::make_shared<RecordingPersistence>();
    sink->always_fail = true;
    UsageRecorder recorder(sink, fast_quota_config());
    recorder.start(nullptr);

    recorder.enqueue(make_delta(1));
    recorder.enqueue(make_delta(2));
    ASSERT_TRUE(recorder.wait_idle(2s));

    EXPECT_TRUE(recorder.degraded());
    EXPECT_EQ(recorder.dropped_count(), 2u);
    EXPECT_EQ(sink->attempts.load(), 6);
    recorder.stop();
}
