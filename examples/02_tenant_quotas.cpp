// 02_tenant_quotas.cpp
//
// Per-tenant quota admission and alerting.
//
// Scenario:
//   - "acme" gets a small daily token budget, "globex" keeps the default.
//   - An alert listener prints every level transition.
//   - acme spends its budget; further submissions are rejected up front
//     with QuotaExceededException while globex is unaffected.
//   - A MetricsMonitor summarises the run.

#include <modelgate/modelgate.hpp>

#include <iostream>
#include <string>

using namespace modelgate;
using namespace std::chrono_literals;

namespace {

class FixedClient : public ProviderClient {
public:
    explicit FixedClient(ModelConfig config) : config_(std::move(config)) {}
    const ModelConfig& config() const override { return config_; }

private:
    ModelConfig config_;
};

class StaticConfigProvider : public ModelConfigProvider {
public:
    ModelConfig resolve_model_config(const IsolationScope& /*scope*/) override {
        ModelConfig cfg;
        cfg.provider_identity = "demo-provider";
        cfg.model_name = "demo-model";
        return cfg;
    }
};

class FixedClientFactory : public ClientFactory {
public:
    std::shared_ptr<ProviderClient> create_client(const IsolationScope& /*scope*/,
                                                  const ModelConfig& config) override {
        return std::make_shared<FixedClient>(config);
    }
};

// Every call consumes 300 tokens
class FixedCostInvoker : public ModelInvoker {
public:
    InvocationResult invoke(ProviderClient& /*client*/, const Payload& payload,
                            Timestamp /*deadline*/, const CancellationToken& /*cancel*/) override {
        return InvocationResult{"ok: " + payload, 300, 0.006};
    }
};

class PrintingListener : public AlertListener {
public:
    void on_alert_level_changed(const TenantId& tenant_id, QuotaAlertLevel old_level,
                                QuotaAlertLevel new_level) override {
        std::cout << "  [alert] " << tenant_id << ": " << to_string(old_level)
                  << " -> " << to_string(new_level) << "\n";
    }
};

void submit_and_report(Scheduler& scheduler, const IsolationScope& scope, int n) {
    try {
        auto id = scheduler.submit(scope, "task " + std::to_string(n), Priority::Normal, 300);
        auto result = scheduler.await_result(id, 5s);
        std::cout << scope.tenant_id() << " task " << n << ": " << to_string(result.status) << "\n";
    } catch (const QuotaExceededException& e) {
        std::cout << scope.tenant_id() << " task " << n << ": rejected (" << e.what() << ")\n";
    }
}

} // anonymous namespace

int main() {
    std::cout << "=== ModelGate: Tenant Quotas Example ===\n\n";

    Config config;
    config.worker_count = 2;

    Scheduler scheduler(config,
                        std::make_shared<StaticConfigProvider>(),
                        std::make_shared<FixedClientFactory>(),
                        std::make_shared<FixedCostInvoker>());

    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(metrics);
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    scheduler.set_monitor(composite);

    // ----------------------------------------------------------------
    // 1. Policies: acme may spend 1000 tokens a day.
    // ----------------------------------------------------------------
    QuotaPolicy tight;
    tight.daily_token_limit = 1000;
    tight.warning_threshold = 0.5;
    scheduler.set_policy("acme", tight);
    scheduler.add_alert_listener(std::make_shared<PrintingListener>());

    scheduler.start();

    // ----------------------------------------------------------------
    // 2. Burn through the budget.
    // ----------------------------------------------------------------
    IsolationScope acme("acme", "research-bot");
    IsolationScope globex("globex", "research-bot");

    for (int i = 1; i <= 5; ++i) {
        submit_and_report(scheduler, acme, i);
    }
    submit_and_report(scheduler, globex, 1);

    // ----------------------------------------------------------------
    // 3. Report.
    // ----------------------------------------------------------------
    auto status = scheduler.get_quota_status("acme");
    std::cout << "\nacme: " << status.usage.tokens_used_today << "/"
              << status.policy.daily_token_limit << " tokens, level "
              << to_string(status.evaluation.level) << " (" << status.evaluation.metric << ")\n";

    for (const auto& alert : scheduler.quota().recent_alerts(std::nullopt, 1h)) {
        std::cout << "  " << alert.message << "\n";
    }

    scheduler.stop();

    auto m = metrics->get_metrics();
    std::cout << "\nSubmitted: " << m.submitted_requests
              << "  Completed: " << m.completed_requests
              << "  Quota rejections: " << m.quota_rejections
              << "  Tokens recorded: " << m.tokens_recorded << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
