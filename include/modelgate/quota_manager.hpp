#pragma once

#include "modelgate/types.hpp"
#include "modelgate/config.hpp"
#include "modelgate/collaborators.hpp"
#include "modelgate/monitor.hpp"
#include "modelgate/usage_recorder.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

// Calendar period identifiers in local time: yyyymmdd and yyyymm.
using PeriodId = std::int64_t;

PeriodId day_period(WallTime t);
PeriodId month_period(WallTime t);

struct AgentUsage {
    TokenCount tokens_today{0};
    std::int64_t requests_today{0};
    Cost cost_this_month{0.0};
};

// Running per-tenant counters for the current day and month
struct UsageStats {
    TenantId tenant_id;

    TokenCount tokens_used_today{0};
    std::int64_t requests_today{0};
    Cost cost_incurred_this_month{0.0};

    TokenCount tokens_used_this_month{0};
    std::int64_t requests_this_month{0};

    PeriodId day_period_id{0};
    PeriodId month_period_id{0};
    WallTime last_daily_reset{};
    WallTime last_monthly_reset{};

    std::unordered_map<AgentName, AgentUsage> agents;
};

// One raised alert, kept in a bounded history
struct QuotaAlert {
    TenantId tenant_id;
    QuotaAlertLevel level{QuotaAlertLevel::Ok};
    std::string metric;   // daily_tokens | monthly_cost | daily_requests
    double current_usage{0.0};
    double limit{0.0};
    double usage_ratio{0.0};
    std::string message;
    WallTime timestamp{};
};

// Result of evaluating usage against a policy
struct QuotaEvaluation {
    QuotaAlertLevel level{QuotaAlertLevel::Ok};
    std::string metric;
    double tokens_ratio{0.0};
    double cost_ratio{0.0};
    double requests_ratio{0.0};
    double max_ratio{0.0};
};

struct QuotaStatus {
    TenantId tenant_id;
    QuotaPolicy policy;
    bool explicit_policy{false};
    UsageStats usage;
    QuotaEvaluation evaluation;
};

// Pure: classify usage (plus a projected call of `extra_tokens`) against
// a policy. The highest of the three usage ratios decides the level.
QuotaEvaluation evaluate_quota(const QuotaPolicy& policy,
                               const UsageStats& usage,
                               TokenCount extra_tokens,
                               double critical_threshold);

class QuotaManager {
public:
    using TimeSource = std::function<WallTime()>;

    explicit QuotaManager(QuotaConfig config = QuotaConfig{},
                          std::shared_ptr<UsagePersistence> persistence = nullptr);
    ~QuotaManager();

    QuotaManager(const QuotaManager&) = delete;
    QuotaManager& operator=(const QuotaManager&) = delete;

    // ==================== Policy ====================

    void set_policy(const TenantId& tenant_id, QuotaPolicy policy);
    QuotaPolicy get_policy(const TenantId& tenant_id) const;
    bool has_policy(const TenantId& tenant_id) const;

    // ==================== Admission & Accounting ====================

    // Projected post-call level. Reads counters only; never mutates them.
    QuotaAlertLevel check_admission(const TenantId& tenant_id, TokenCount estimated_tokens);

    void record_usage(const TenantId& tenant_id, const AgentName& agent_id,
                      TokenCount tokens_used, Cost cost_incurred);

    // Applies a pending day/month rollover. Returns true if counters were
    // reset; a second call within the same period is a no-op.
    bool apply_period_rollover(const TenantId& tenant_id);

    // ==================== Queries ====================

    UsageStats get_usage(const TenantId& tenant_id) const;
    std::optional<AgentUsage> get_agent_usage(const TenantId& tenant_id,
                                              const AgentName& agent_id) const;
    QuotaStatus get_quota_status(const TenantId& tenant_id) const;

    std::vector<QuotaAlert> recent_alerts(const std::optional<TenantId>& tenant_id,
                                          Duration window) const;
    void cleanup_alerts(Duration max_age);

    // ==================== Listeners ====================

    void add_alert_listener(std::shared_ptr<AlertListener> listener);
    bool remove_alert_listener(const std::shared_ptr<AlertListener>& listener);

    // ==================== Persistence ====================

    bool persistence_degraded() const noexcept;
    bool wait_for_persistence(Duration timeout);
    const UsageRecorder& recorder() const noexcept;

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);
    void set_time_source(TimeSource source);
    const QuotaConfig& config() const noexcept;

    void start();
    void stop();

private:
    struct TenantState {
        mutable std::mutex mutex;
        QuotaPolicy policy;
        bool explicit_policy{false};
        UsageStats usage;
        QuotaAlertLevel last_level{QuotaAlertLevel::Ok};
    };

    QuotaConfig config_;

    mutable std::shared_mutex tenants_mutex_;
    std::unordered_map<TenantId, std::shared_ptr<TenantState>> tenants_;

    mutable std::mutex alerts_mutex_;
    std::deque<QuotaAlert> alerts_;

    mutable std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<AlertListener>> listeners_;

    std::shared_ptr<Monitor> monitor_;
    TimeSource now_;
    UsageRecorder recorder_;

    std::shared_ptr<TenantState> find_state(const TenantId& tenant_id) const;
    std::shared_ptr<TenantState> get_or_create_state(const TenantId& tenant_id);

    // Caller must hold state.mutex
    bool roll_periods(TenantState& state, WallTime now, const TenantId& tenant_id);
    UsageStats current_view(const TenantState& state, WallTime now) const;

    void raise_alert(const TenantId& tenant_id, QuotaAlertLevel old_level,
                     const QuotaEvaluation& eval, const QuotaPolicy& policy,
                     const UsageStats& usage);
    void notify_listeners(const TenantId& tenant_id, QuotaAlertLevel old_level,
                          QuotaAlertLevel new_level);
    void emit_event(EventType type, const std::string& message,
                    const TenantId& tenant_id,
                    std::optional<AgentName> agent_id = std::nullopt,
                    std::optional<QuotaAlertLevel> level = std::nullopt,
                    std::optional<TokenCount> tokens = std::nullopt,
                    std::optional<Cost> cost = std::nullopt);
};

} // namespace modelgate
