// 01_basic_usage.cpp
//
// Minimal ModelGate example: one tenant, two agents, a simulated provider.
// Demonstrates submission, priority dispatch, retry of transient provider
// errors and result collection.
//
// Scenario:
//   - "acme" runs a support bot and a sales bot.
//   - The provider fails the first call with a transient error.
//   - An urgent request submitted last is dispatched first.
//   - Every result is collected with await_result().

#include <modelgate/modelgate.hpp>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace modelgate;
using namespace std::chrono_literals;

namespace {

class DemoClient : public ProviderClient {
public:
    explicit DemoClient(ModelConfig config) : config_(std::move(config)) {}
    const ModelConfig& config() const override { return config_; }

private:
    ModelConfig config_;
};

class DemoConfigProvider : public ModelConfigProvider {
public:
    ModelConfig resolve_model_config(const IsolationScope& scope) override {
        ModelConfig cfg;
        cfg.provider_identity = "demo-provider";
        cfg.model_name = scope.agent_id() == "sales-bot" ? "large-model" : "small-model";
        return cfg;
    }
};

class DemoClientFactory : public ClientFactory {
public:
    std::shared_ptr<ProviderClient> create_client(const IsolationScope& scope,
                                                  const ModelConfig& config) override {
        std::cout << "  [factory] building client for " << scope.scope_key()
                  << " (" << config.model_name << ")\n";
        return std::make_shared<DemoClient>(config);
    }
};

// Echoes the payload after a short delay; the very first call fails
class DemoInvoker : public ModelInvoker {
public:
    InvocationResult invoke(ProviderClient& client, const Payload& payload,
                            Timestamp /*deadline*/, const CancellationToken& cancel) override {
        if (calls_.fetch_add(1) == 0) {
            throw ProviderTransientError("HTTP 503 Service Unavailable");
        }
        for (int i = 0; i < 5 && !cancel.is_cancelled(); ++i) {
            std::this_thread::sleep_for(10ms);
        }
        InvocationResult result;
        result.output = client.config().model_name + " says: " + payload;
        result.tokens_used = static_cast<TokenCount>(payload.size()) * 4;
        result.cost = static_cast<Cost>(result.tokens_used) * 0.00002;
        return result;
    }

private:
    std::atomic<int> calls_{0};
};

} // anonymous namespace

int main() {
    std::cout << "=== ModelGate: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the scheduler with a single worker so ordering is visible.
    // ----------------------------------------------------------------
    Config config;
    config.worker_count = 1;
    config.backoff_base = 50ms;
    config.default_deadline = 10s;

    Scheduler scheduler(config,
                        std::make_shared<DemoConfigProvider>(),
                        std::make_shared<DemoClientFactory>(),
                        std::make_shared<DemoInvoker>());

    // Attach a console monitor so we can see what happens internally.
    scheduler.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Queue work before starting: three normal requests, then an
    //    urgent one that should jump the queue.
    // ----------------------------------------------------------------
    IsolationScope support("acme", "support-bot", "web", "conv-1");
    IsolationScope sales("acme", "sales-bot");

    std::vector<RequestId> ids;
    ids.push_back(scheduler.submit(support, "Where is my order?", Priority::Normal, 50));
    ids.push_back(scheduler.submit(sales, "Draft a follow-up email", Priority::Normal, 200));
    ids.push_back(scheduler.submit(support, "Reset my password", Priority::Normal, 50));
    ids.push_back(scheduler.submit(support, "Site is down!", Priority::Urgent, 50));

    std::cout << "Submitted " << ids.size() << " requests.\n\n";

    // ----------------------------------------------------------------
    // 3. Start the workers and collect results.
    // ----------------------------------------------------------------
    scheduler.start();

    for (auto id : ids) {
        auto result = scheduler.await_result(id, 5s);
        std::cout << "Request " << id << " -> " << to_string(result.status)
                  << " after " << result.attempt_count << " attempt(s)";
        if (result.result.has_value()) {
            std::cout << ": " << result.result.value();
        } else if (!result.error.message.empty()) {
            std::cout << ": " << result.error.message;
        }
        std::cout << "\n";
    }

    // ----------------------------------------------------------------
    // 4. Inspect what the tenant has consumed.
    // ----------------------------------------------------------------
    auto usage = scheduler.get_usage("acme");
    std::cout << "\nacme today: " << usage.tokens_used_today << " tokens, "
              << usage.requests_today << " requests, $"
              << usage.cost_incurred_this_month << " this month\n";
    for (const auto& [agent, agent_usage] : usage.agents) {
        std::cout << "  " << agent << ": " << agent_usage.tokens_today << " tokens\n";
    }

    auto clients = scheduler.clients().stats();
    std::cout << "Cached clients: " << clients.total_clients
              << " across " << clients.isolation_groups << " isolation groups\n";

    scheduler.stop();
    std::cout << "\n=== Done ===\n";
    return 0;
}
