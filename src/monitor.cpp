#include "modelgate/monitor.hpp"

#include <iostream>
#include <iomanip>

namespace modelgate {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::RequestSubmitted:       return "RequestSubmitted";
        case EventType::RequestAdmitted:        return "RequestAdmitted";
        case EventType::RequestRejected:        return "RequestRejected";
        case EventType::RequestDispatched:      return "RequestDispatched";
        case EventType::RequestRetryScheduled:  return "RequestRetryScheduled";
        case EventType::RequestCompleted:       return "RequestCompleted";
        case EventType::RequestFailed:          return "RequestFailed";
        case EventType::RequestTimedOut:        return "RequestTimedOut";
        case EventType::RequestCancelled:       return "RequestCancelled";
        case EventType::RequestCancelSignalled: return "RequestCancelSignalled";
        case EventType::RequestEvicted:         return "RequestEvicted";
        case EventType::RequestResultDiscarded: return "RequestResultDiscarded";
        case EventType::WatchdogReclaimed:      return "WatchdogReclaimed";
        case EventType::QuotaPolicyChanged:     return "QuotaPolicyChanged";
        case EventType::QuotaAdmissionWarning:  return "QuotaAdmissionWarning";
        case EventType::QuotaAlertRaised:       return "QuotaAlertRaised";
        case EventType::QuotaPeriodReset:       return "QuotaPeriodReset";
        case EventType::UsageRecorded:          return "UsageRecorded";
        case EventType::AlertListenerFailed:    return "AlertListenerFailed";
        case EventType::PersistenceRetry:       return "PersistenceRetry";
        case EventType::PersistenceDegraded:    return "PersistenceDegraded";
        case EventType::PersistenceRecovered:   return "PersistenceRecovered";
        case EventType::ClientCreated:          return "ClientCreated";
        case EventType::ClientReused:           return "ClientReused";
        case EventType::ClientEvicted:          return "ClientEvicted";
        case EventType::ClientInvalidated:      return "ClientInvalidated";
        case EventType::WorkerStarted:          return "WorkerStarted";
        case EventType::WorkerStopped:          return "WorkerStopped";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::RequestRejected:
        case EventType::RequestFailed:
        case EventType::RequestTimedOut:
        case EventType::RequestCancelled:
        case EventType::WatchdogReclaimed:
        case EventType::QuotaPolicyChanged:
        case EventType::QuotaAlertRaised:
        case EventType::AlertListenerFailed:
        case EventType::PersistenceDegraded:
        case EventType::PersistenceRecovered:
        case EventType::ClientInvalidated:
            return true;
        default:
            return false;
    }
}

bool is_debug_event(EventType t) {
    switch (t) {
        case EventType::RequestDispatched:
        case EventType::UsageRecorded:
        case EventType::ClientReused:
        case EventType::PersistenceRetry:
        case EventType::WorkerStarted:
        case EventType::WorkerStopped:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[ModelGate] " << to_string(event.type);

    if (event.scope_key.has_value()) {
        std::cout << " scope=" << event.scope_key.value();
    } else if (event.tenant_id.has_value()) {
        std::cout << " tenant=" << event.tenant_id.value();
        if (event.agent_id.has_value()) {
            std::cout << " agent=" << event.agent_id.value();
        }
    }
    if (event.request_id.has_value()) {
        std::cout << " request=" << event.request_id.value();
    }
    if (event.priority.has_value()) {
        std::cout << " priority=" << to_string(event.priority.value());
    }
    if (event.alert_level.has_value()) {
        std::cout << " level=" << to_string(event.alert_level.value());
    }
    if (event.attempt.has_value()) {
        std::cout << " attempt=" << event.attempt.value();
    }
    if (event.tokens.has_value()) {
        std::cout << " tokens=" << event.tokens.value();
    }
    if (event.cost.has_value()) {
        std::cout << " cost=" << std::fixed << std::setprecision(6) << event.cost.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const SchedulerSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[ModelGate] === Scheduler Snapshot ===\n";
    std::cout << "  Queue depth: " << snapshot.queue_depth << "\n";
    std::cout << "  Running: " << snapshot.running << "\n";
    std::cout << "  Tracked requests: " << snapshot.tracked_requests << "\n";
    std::cout << "  Cached clients: " << snapshot.cached_clients << "\n";
    std::cout << "  Persistence: " << (snapshot.persistence_degraded ? "DEGRADED" : "OK") << "\n";
    std::cout << "  ===========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::RequestSubmitted:
            metrics_.submitted_requests++;
            break;
        case EventType::RequestDispatched:
            if (event.duration_us.has_value()) {
                wait_sum_ms_ += event.duration_us.value() / 1000.0;
                wait_sample_count_++;
                metrics_.average_queue_wait_ms = wait_sum_ms_ / wait_sample_count_;
            }
            break;
        case EventType::RequestCompleted:
            metrics_.completed_requests++;
            if (event.duration_us.has_value()) {
                exec_sum_ms_ += event.duration_us.value() / 1000.0;
                exec_sample_count_++;
                metrics_.average_execution_ms = exec_sum_ms_ / exec_sample_count_;
            }
            break;
        case EventType::RequestFailed:
            metrics_.failed_requests++;
            break;
        case EventType::RequestRejected:
            metrics_.failed_requests++;
            if (event.alert_level == QuotaAlertLevel::Exceeded) {
                metrics_.quota_rejections++;
            }
            break;
        case EventType::RequestTimedOut:
            metrics_.timed_out_requests++;
            break;
        case EventType::RequestCancelled:
            metrics_.cancelled_requests++;
            break;
        case EventType::RequestRetryScheduled:
            metrics_.retries++;
            break;
        case EventType::QuotaAlertRaised:
            metrics_.quota_alerts++;
            break;
        case EventType::PersistenceDegraded:
            metrics_.persistence_failures++;
            break;
        case EventType::UsageRecorded:
            metrics_.tokens_recorded += event.tokens.value_or(0);
            metrics_.cost_recorded += event.cost.value_or(0.0);
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_snapshot(const SchedulerSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    if (queue_depth_cb_ && snapshot.queue_depth > queue_depth_threshold_) {
        queue_depth_cb_("Queue depth " + std::to_string(snapshot.queue_depth) +
                        " exceeds threshold " + std::to_string(queue_depth_threshold_));
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    wait_sample_count_ = 0;
    wait_sum_ms_ = 0.0;
    exec_sample_count_ = 0;
    exec_sum_ms_ = 0.0;
}

void MetricsMonitor::set_queue_depth_alert_threshold(std::size_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    queue_depth_threshold_ = threshold;
    queue_depth_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const SchedulerSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace modelgate
