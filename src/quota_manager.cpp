#include "modelgate/quota_manager.hpp"
#include "modelgate/exceptions.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace modelgate {

namespace {

std::tm to_local_tm(WallTime t) {
    std::time_t tt = WallClock::to_time_t(t);
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &tt);
#else
    localtime_r(&tt, &out);
#endif
    return out;
}

double usage_ratio(double used, double limit) {
    return (limit > 0) ? used / limit : 0.0;
}

std::string format_ratio(double ratio) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << (ratio * 100.0) << "%";
    return os.str();
}

void validate_tenant(const TenantId& tenant_id) {
    if (tenant_id.empty()) {
        throw ValidationException("tenant_id must not be empty");
    }
}

} // anonymous namespace

PeriodId day_period(WallTime t) {
    std::tm tm = to_local_tm(t);
    return static_cast<PeriodId>(tm.tm_year + 1900) * 10000 +
           static_cast<PeriodId>(tm.tm_mon + 1) * 100 +
           static_cast<PeriodId>(tm.tm_mday);
}

PeriodId month_period(WallTime t) {
    std::tm tm = to_local_tm(t);
    return static_cast<PeriodId>(tm.tm_year + 1900) * 100 +
           static_cast<PeriodId>(tm.tm_mon + 1);
}

QuotaEvaluation evaluate_quota(const QuotaPolicy& policy,
                               const UsageStats& usage,
                               TokenCount extra_tokens,
                               double critical_threshold)
{
    QuotaEvaluation eval;
    eval.tokens_ratio = usage_ratio(static_cast<double>(usage.tokens_used_today + extra_tokens),
                                    static_cast<double>(policy.daily_token_limit));
    eval.cost_ratio = usage_ratio(usage.cost_incurred_this_month, policy.monthly_cost_limit);
    // Requests made so far; the call under admission is the next one
    eval.requests_ratio = usage_ratio(static_cast<double>(usage.requests_today),
                                      static_cast<double>(policy.daily_request_limit));

    eval.max_ratio = eval.tokens_ratio;
    eval.metric = "daily_tokens";
    if (eval.cost_ratio > eval.max_ratio) {
        eval.max_ratio = eval.cost_ratio;
        eval.metric = "monthly_cost";
    }
    if (eval.requests_ratio > eval.max_ratio) {
        eval.max_ratio = eval.requests_ratio;
        eval.metric = "daily_requests";
    }

    if (eval.max_ratio >= 1.0) {
        eval.level = QuotaAlertLevel::Exceeded;
    } else if (eval.max_ratio >= std::max(critical_threshold, policy.warning_threshold)) {
        eval.level = QuotaAlertLevel::Critical;
    } else if (eval.max_ratio >= policy.warning_threshold) {
        eval.level = QuotaAlertLevel::Warning;
    } else {
        eval.level = QuotaAlertLevel::Ok;
    }
    return eval;
}

QuotaManager::QuotaManager(QuotaConfig config, std::shared_ptr<UsagePersistence> persistence)
    : config_(std::move(config))
    , now_([] { return WallClock::now(); })
    , recorder_(std::move(persistence), config_)
{}

QuotaManager::~QuotaManager() {
    stop();
}

// ==================== Policy ====================

void QuotaManager::set_policy(const TenantId& tenant_id, QuotaPolicy policy) {
    validate_tenant(tenant_id);
    if (!(policy.warning_threshold > 0.0 && policy.warning_threshold <= 1.0)) {
        throw ValidationException("warning_threshold must be in (0, 1]");
    }

    auto state = get_or_create_state(tenant_id);
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto now = now_();
        state->policy = policy;
        state->explicit_policy = true;
        auto view = current_view(*state, now);
        state->last_level = evaluate_quota(policy, view, 0, config_.critical_threshold).level;
    }

    emit_event(EventType::QuotaPolicyChanged,
               "Policy set: daily_tokens=" + std::to_string(policy.daily_token_limit) +
               " monthly_cost=" + std::to_string(policy.monthly_cost_limit) +
               " daily_requests=" + std::to_string(policy.daily_request_limit),
               tenant_id);
}

QuotaPolicy QuotaManager::get_policy(const TenantId& tenant_id) const {
    auto state = find_state(tenant_id);
    if (!state) return config_.default_policy;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->explicit_policy ? state->policy : config_.default_policy;
}

bool QuotaManager::has_policy(const TenantId& tenant_id) const {
    auto state = find_state(tenant_id);
    if (!state) return false;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->explicit_policy;
}

// ==================== Admission & Accounting ====================

QuotaAlertLevel QuotaManager::check_admission(const TenantId& tenant_id,
                                              TokenCount estimated_tokens) {
    validate_tenant(tenant_id);
    if (estimated_tokens < 0) {
        throw ValidationException("estimated_tokens must not be negative");
    }

    auto state = get_or_create_state(tenant_id);
    std::lock_guard<std::mutex> lock(state->mutex);

    const QuotaPolicy& policy = state->explicit_policy ? state->policy : config_.default_policy;
    auto view = current_view(*state, now_());
    return evaluate_quota(policy, view, estimated_tokens, config_.critical_threshold).level;
}

void QuotaManager::record_usage(const TenantId& tenant_id, const AgentName& agent_id,
                                TokenCount tokens_used, Cost cost_incurred) {
    validate_tenant(tenant_id);
    if (agent_id.empty()) {
        throw ValidationException("agent_id must not be empty");
    }
    if (tokens_used < 0 || cost_incurred < 0.0) {
        throw ValidationException("usage deltas must not be negative");
    }

    auto state = get_or_create_state(tenant_id);

    bool rolled = false;
    bool raise = false;
    QuotaAlertLevel old_level;
    QuotaEvaluation eval;
    QuotaPolicy policy;
    UsageStats usage_copy;
    auto now = now_();

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        rolled = roll_periods(*state, now, tenant_id);

        auto& usage = state->usage;
        usage.tokens_used_today += tokens_used;
        usage.requests_today += 1;
        usage.cost_incurred_this_month += cost_incurred;
        usage.tokens_used_this_month += tokens_used;
        usage.requests_this_month += 1;

        auto& agent = usage.agents[agent_id];
        agent.tokens_today += tokens_used;
        agent.requests_today += 1;
        agent.cost_this_month += cost_incurred;

        policy = state->explicit_policy ? state->policy : config_.default_policy;
        eval = evaluate_quota(policy, usage, 0, config_.critical_threshold);

        old_level = state->last_level;
        if (eval.level > old_level) {
            raise = true;
            state->last_level = eval.level;
        }
        if (raise) {
            usage_copy = usage;
        }
    }

    if (rolled) {
        emit_event(EventType::QuotaPeriodReset, "Usage counters reset for new period", tenant_id);
    }

    emit_event(EventType::UsageRecorded, "Usage recorded", tenant_id, agent_id,
               eval.level, tokens_used, cost_incurred);

    if (raise) {
        raise_alert(tenant_id, old_level, eval, policy, usage_copy);
    }

    UsageDelta delta;
    delta.tenant_id = tenant_id;
    delta.agent_id = agent_id;
    delta.tokens = tokens_used;
    delta.cost = cost_incurred;
    delta.timestamp = now;
    recorder_.enqueue(std::move(delta));
}

bool QuotaManager::apply_period_rollover(const TenantId& tenant_id) {
    auto state = find_state(tenant_id);
    if (!state) return false;

    bool rolled = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        rolled = roll_periods(*state, now_(), tenant_id);
    }
    if (rolled) {
        emit_event(EventType::QuotaPeriodReset, "Usage counters reset for new period", tenant_id);
    }
    return rolled;
}

// ==================== Queries ====================

UsageStats QuotaManager::get_usage(const TenantId& tenant_id) const {
    auto state = find_state(tenant_id);
    if (!state) {
        UsageStats empty;
        empty.tenant_id = tenant_id;
        auto now = now_();
        empty.day_period_id = day_period(now);
        empty.month_period_id = month_period(now);
        return empty;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return current_view(*state, now_());
}

std::optional<AgentUsage> QuotaManager::get_agent_usage(const TenantId& tenant_id,
                                                        const AgentName& agent_id) const {
    auto usage = get_usage(tenant_id);
    auto it = usage.agents.find(agent_id);
    if (it == usage.agents.end()) return std::nullopt;
    return it->second;
}

QuotaStatus QuotaManager::get_quota_status(const TenantId& tenant_id) const {
    QuotaStatus status;
    status.tenant_id = tenant_id;
    status.policy = config_.default_policy;
    status.usage.tenant_id = tenant_id;

    auto state = find_state(tenant_id);
    if (state) {
        std::lock_guard<std::mutex> lock(state->mutex);
        status.explicit_policy = state->explicit_policy;
        if (state->explicit_policy) status.policy = state->policy;
        status.usage = current_view(*state, now_());
    }
    status.evaluation = evaluate_quota(status.policy, status.usage, 0, config_.critical_threshold);
    return status;
}

std::vector<QuotaAlert> QuotaManager::recent_alerts(const std::optional<TenantId>& tenant_id,
                                                    Duration window) const {
    auto cutoff = now_() - std::chrono::duration_cast<WallClock::duration>(window);

    std::lock_guard<std::mutex> lock(alerts_mutex_);
    std::vector<QuotaAlert> result;
    for (const auto& alert : alerts_) {
        if (tenant_id.has_value() && alert.tenant_id != tenant_id.value()) continue;
        if (alert.timestamp < cutoff) continue;
        result.push_back(alert);
    }
    return result;
}

void QuotaManager::cleanup_alerts(Duration max_age) {
    auto cutoff = now_() - std::chrono::duration_cast<WallClock::duration>(max_age);

    std::lock_guard<std::mutex> lock(alerts_mutex_);
    alerts_.erase(std::remove_if(alerts_.begin(), alerts_.end(),
                                 [cutoff](const QuotaAlert& a) { return a.timestamp < cutoff; }),
                  alerts_.end());
}

// ==================== Listeners ====================

void QuotaManager::add_alert_listener(std::shared_ptr<AlertListener> listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

bool QuotaManager::remove_alert_listener(const std::shared_ptr<AlertListener>& listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = std::find(listeners_.begin(), listeners_.end(), listener);
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

// ==================== Persistence ====================

bool QuotaManager::persistence_degraded() const noexcept {
    return recorder_.degraded();
}

bool QuotaManager::wait_for_persistence(Duration timeout) {
    return recorder_.wait_idle(timeout);
}

const UsageRecorder& QuotaManager::recorder() const noexcept {
    return recorder_;
}

// ==================== Configuration ====================

void QuotaManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

void QuotaManager::set_time_source(TimeSource source) {
    if (source) now_ = std::move(source);
}

const QuotaConfig& QuotaManager::config() const noexcept {
    return config_;
}

void QuotaManager::start() {
    recorder_.start(monitor_);
}

void QuotaManager::stop() {
    recorder_.stop();
}

// ==================== Internal Helpers ====================

std::shared_ptr<QuotaManager::TenantState> QuotaManager::find_state(const TenantId& tenant_id) const {
    std::shared_lock lock(tenants_mutex_);
    auto it = tenants_.find(tenant_id);
    if (it == tenants_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<QuotaManager::TenantState> QuotaManager::get_or_create_state(const TenantId& tenant_id) {
    if (auto existing = find_state(tenant_id)) {
        return existing;
    }

    std::unique_lock lock(tenants_mutex_);
    auto& slot = tenants_[tenant_id];
    if (!slot) {
        auto now = now_();
        slot = std::make_shared<TenantState>();
        slot->usage.tenant_id = tenant_id;
        slot->usage.day_period_id = day_period(now);
        slot->usage.month_period_id = month_period(now);
        slot->usage.last_daily_reset = now;
        slot->usage.last_monthly_reset = now;
    }
    return slot;
}

bool QuotaManager::roll_periods(TenantState& state, WallTime now, const TenantId& /*tenant_id*/) {
    auto& usage = state.usage;
    auto today = day_period(now);
    auto this_month = month_period(now);
    bool rolled = false;

    // Periods only move forward; a clock stepping backwards never resets
    if (today > usage.day_period_id) {
        usage.tokens_used_today = 0;
        usage.requests_today = 0;
        for (auto& [_, agent] : usage.agents) {
            agent.tokens_today = 0;
            agent.requests_today = 0;
        }
        usage.day_period_id = today;
        usage.last_daily_reset = now;
        rolled = true;
    }

    if (this_month > usage.month_period_id) {
        usage.cost_incurred_this_month = 0.0;
        usage.tokens_used_this_month = 0;
        usage.requests_this_month = 0;
        for (auto& [_, agent] : usage.agents) {
            agent.cost_this_month = 0.0;
        }
        usage.month_period_id = this_month;
        usage.last_monthly_reset = now;
        rolled = true;
    }

    if (rolled) {
        const QuotaPolicy& policy = state.explicit_policy ? state.policy : config_.default_policy;
        state.last_level = evaluate_quota(policy, usage, 0, config_.critical_threshold).level;
    }
    return rolled;
}

UsageStats QuotaManager::current_view(const TenantState& state, WallTime now) const {
    UsageStats view = state.usage;
    auto today = day_period(now);
    auto this_month = month_period(now);

    if (today > view.day_period_id) {
        view.tokens_used_today = 0;
        view.requests_today = 0;
        for (auto& [_, agent] : view.agents) {
            agent.tokens_today = 0;
            agent.requests_today = 0;
        }
        view.day_period_id = today;
    }
    if (this_month > view.month_period_id) {
        view.cost_incurred_this_month = 0.0;
        view.tokens_used_this_month = 0;
        view.requests_this_month = 0;
        for (auto& [_, agent] : view.agents) {
            agent.cost_this_month = 0.0;
        }
        view.month_period_id = this_month;
    }
    return view;
}

void QuotaManager::raise_alert(const TenantId& tenant_id, QuotaAlertLevel old_level,
                               const QuotaEvaluation& eval, const QuotaPolicy& policy,
                               const UsageStats& usage) {
    QuotaAlert alert;
    alert.tenant_id = tenant_id;
    alert.level = eval.level;
    alert.metric = eval.metric;
    alert.usage_ratio = eval.max_ratio;
    alert.timestamp = now_();

    if (eval.metric == "daily_tokens") {
        alert.current_usage = static_cast<double>(usage.tokens_used_today);
        alert.limit = static_cast<double>(policy.daily_token_limit);
    } else if (eval.metric == "monthly_cost") {
        alert.current_usage = usage.cost_incurred_this_month;
        alert.limit = policy.monthly_cost_limit;
    } else {
        alert.current_usage = static_cast<double>(usage.requests_today);
        alert.limit = static_cast<double>(policy.daily_request_limit);
    }
    alert.message = "Tenant " + tenant_id + " " + to_string(eval.level) + ": " +
                    eval.metric + " at " + format_ratio(eval.max_ratio);

    {
        std::lock_guard<std::mutex> lock(alerts_mutex_);
        alerts_.push_back(alert);
        if (config_.alert_history_limit > 0 && alerts_.size() > config_.alert_history_limit) {
            auto keep = config_.alert_history_limit / 2;
            alerts_.erase(alerts_.begin(), alerts_.end() - static_cast<std::ptrdiff_t>(keep));
        }
    }

    emit_event(EventType::QuotaAlertRaised, alert.message, tenant_id,
               std::nullopt, eval.level);

    notify_listeners(tenant_id, old_level, eval.level);
}

void QuotaManager::notify_listeners(const TenantId& tenant_id, QuotaAlertLevel old_level,
                                    QuotaAlertLevel new_level) {
    std::vector<std::shared_ptr<AlertListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }

    for (auto& listener : listeners) {
        try {
            listener->on_alert_level_changed(tenant_id, old_level, new_level);
        } catch (const std::exception& e) {
            emit_event(EventType::AlertListenerFailed,
                       std::string("Alert listener threw: ") + e.what(), tenant_id,
                       std::nullopt, new_level);
        }
    }
}

void QuotaManager::emit_event(EventType type, const std::string& message,
                              const TenantId& tenant_id,
                              std::optional<AgentName> agent_id,
                              std::optional<QuotaAlertLevel> level,
                              std::optional<TokenCount> tokens,
                              std::optional<Cost> cost) {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.tenant_id = tenant_id;
    event.agent_id = std::move(agent_id);
    event.alert_level = level;
    event.tokens = tokens;
    event.cost = cost;

    monitor_->on_event(event);
}

} // namespace modelgate
