#pragma once

#include "modelgate/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

enum class EventType {
    // Request lifecycle
    RequestSubmitted,
    RequestAdmitted,
    RequestRejected,
    RequestDispatched,
    RequestRetryScheduled,
    RequestCompleted,
    RequestFailed,
    RequestTimedOut,
    RequestCancelled,
    RequestCancelSignalled,
    RequestEvicted,
    RequestResultDiscarded,
    WatchdogReclaimed,
    // Quota accounting
    QuotaPolicyChanged,
    QuotaAdmissionWarning,
    QuotaAlertRaised,
    QuotaPeriodReset,
    UsageRecorded,
    AlertListenerFailed,
    // Usage persistence
    PersistenceRetry,
    PersistenceDegraded,
    PersistenceRecovered,
    // Client registry
    ClientCreated,
    ClientReused,
    ClientEvicted,
    ClientInvalidated,
    // Workers
    WorkerStarted,
    WorkerStopped
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<TenantId> tenant_id;
    std::optional<AgentName> agent_id;
    std::optional<std::string> scope_key;
    std::optional<RequestId> request_id;
    std::optional<Priority> priority;
    std::optional<QuotaAlertLevel> alert_level;
    std::optional<std::size_t> attempt;
    std::optional<TokenCount> tokens;
    std::optional<Cost> cost;

    // Operation duration in microseconds (queue wait, execution time)
    std::optional<double> duration_us;
};

// Point-in-time view of the scheduler, emitted periodically
struct SchedulerSnapshot {
    Timestamp timestamp{};
    std::size_t queue_depth{0};
    std::size_t running{0};
    std::size_t tracked_requests{0};
    std::size_t cached_clients{0};
    bool persistence_degraded{false};
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const SchedulerSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SchedulerSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t submitted_requests{0};
        std::uint64_t completed_requests{0};
        std::uint64_t failed_requests{0};
        std::uint64_t timed_out_requests{0};
        std::uint64_t cancelled_requests{0};
        std::uint64_t quota_rejections{0};
        std::uint64_t retries{0};
        std::uint64_t quota_alerts{0};
        std::uint64_t persistence_failures{0};
        TokenCount tokens_recorded{0};
        Cost cost_recorded{0.0};
        double average_queue_wait_ms{0.0};
        double average_execution_ms{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SchedulerSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_queue_depth_alert_threshold(std::size_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::size_t queue_depth_threshold_{0};
    AlertCallback queue_depth_cb_;

    std::uint64_t wait_sample_count_{0};
    double wait_sum_ms_{0.0};
    std::uint64_t exec_sample_count_{0};
    double exec_sum_ms_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SchedulerSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace modelgate
