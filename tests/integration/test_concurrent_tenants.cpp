#include <gtest/gtest.h>
#include <modelgate/modelgate.hpp>
#include "../support/fakes.hpp"

#include <map>
#include <set>
#include <thread>

using namespace modelgate;
using namespace modelgate::testing;
using namespace std::chrono_literals;

// ===========================================================================
// Many tenants, many submitters, several workers
// ===========================================================================

TEST(ConcurrentTenantsTest, CountersSumAcrossConcurrentSubmitters) {
    auto invoker = std::make_shared<ScriptedInvoker>();
    auto factory = std::make_shared<FakeClientFactory>();
    Scheduler scheduler(fast_config(4), std::make_shared<FakeConfigProvider>(), factory, invoker);
    scheduler.start();

    const std::vector<TenantId> tenants{"acme", "globex", "initech"};
    const int per_thread = 20;

    std::mutex ids_mutex;
    std::vector<RequestId> ids;
    std::vector<std::thread> submitters;
    for (const auto& tenant : tenants) {
        for (int t = 0; t < 2; ++t) {
            submitters.emplace_back([&, tenant, t] {
                IsolationScope scope(tenant, "agent-" + std::to_string(t));
                for (int i = 0; i < per_thread; ++i) {
                    auto id = scheduler.submit(scope, tenant + "/" + std::to_string(i),
                                               Priority::Normal, 10);
                    std::lock_guard<std::mutex> lock(ids_mutex);
                    ids.push_back(id);
                }
            });
        }
    }
    for (auto& t : submitters) t.join();

    std::set<RequestId> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), ids.size());

    for (auto id : ids) {
        ASSERT_TRUE(scheduler.await_result(id, 10s).succeeded());
    }

    for (const auto& tenant : tenants) {
        auto usage = scheduler.get_usage(tenant);
        EXPECT_EQ(usage.requests_today, 2 * per_thread) << tenant;
        EXPECT_EQ(usage.tokens_used_today, 2 * per_thread * 10) << tenant;
        EXPECT_EQ(usage.agents.at("agent-0").requests_today, per_thread) << tenant;
    }

    // One client per (tenant, agent), each configured for its own tenant
    EXPECT_EQ(scheduler.clients().size(), tenants.size() * 2);
    std::lock_guard<std::mutex> lock(factory->mutex);
    for (std::size_t i = 0; i < factory->clients.size(); ++i) {
        auto tenant = factory->clients[i]->config().connection_params.at("tenant");
        EXPECT_EQ(factory->scope_keys[i].rfind(tenant + ":", 0), 0u);
    }
}

TEST(ConcurrentTenantsTest, BusyScopeDoesNotStarveQuietScope) {
    auto invoker = std::make_shared<ScriptedInvoker>();
    auto monitor = std::make_shared<RecordingMonitor>();
    Scheduler scheduler(fast_config(1), std::make_shared<FakeConfigProvider>(),
                        std::make_shared<FakeClientFactory>(), invoker);
    scheduler.set_monitor(monitor);

    IsolationScope noisy("acme", "bulk-bot");
    IsolationScope quiet("globex", "chat-bot");

    std::map<RequestId, std::string> owner;
    for (int i = 0; i < 10; ++i) {
        owner[scheduler.submit(noisy, "bulk", Priority::Normal, 0)] = "noisy";
    }
    std::vector<RequestId> quiet_ids;
    for (int i = 0; i < 3; ++i) {
        auto id = scheduler.submit(quiet, "chat", Priority::Normal, 0);
        owner[id] = "quiet";
        quiet_ids.push_back(id);
    }
    scheduler.start();

    for (auto& [id, who] : owner) {
        ASSERT_TRUE(scheduler.await_result(id, 10s).succeeded()) << who;
    }

    // Quiet requests interleave with the backlog instead of waiting behind it
    auto order = monitor->dispatch_order();
    ASSERT_EQ(order.size(), owner.size());
    std::size_t last_quiet = 0;
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (owner[order[i]] == "quiet") last_quiet = i;
    }
    EXPECT_LE(last_quiet, 5u);
}

TEST(ConcurrentTenantsTest, ConversationsShareTheAgentClient) {
    auto invoker = std::make_shared<ScriptedInvoker>();
    auto factory = std::make_shared<FakeClientFactory>();
    Scheduler scheduler(fast_config(2), std::make_shared<FakeConfigProvider>(), factory, invoker);
    scheduler.start();

    std::vector<RequestId> ids;
    for (int c = 0; c < 5; ++c) {
        IsolationScope scope("acme", "support-bot", "discord", "conv-" + std::to_string(c));
        ids.push_back(scheduler.submit(scope, "hi", Priority::Normal, 0));
    }
    for (auto id : ids) {
        ASSERT_TRUE(scheduler.await_result(id, 5s).succeeded());
    }

    EXPECT_EQ(scheduler.clients().size(), 1u);
    EXPECT_EQ(scheduler.clients().stats().clients_per_group.at("acme:support-bot"), 1u);
}
