#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <modelgate/modelgate.hpp>

using namespace modelgate;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_modelgate, m) {
    m.doc() = "ModelGate: multi-tenant model request scheduling with quota admission";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<Priority>(m, "Priority")
        .value("Low",    Priority::Low)
        .value("Normal", Priority::Normal)
        .value("High",   Priority::High)
        .value("Urgent", Priority::Urgent)
        .export_values();

    py::enum_<RequestStatus>(m, "RequestStatus")
        .value("Pending",   RequestStatus::Pending)
        .value("Admitted",  RequestStatus::Admitted)
        .value("Running",   RequestStatus::Running)
        .value("Completed", RequestStatus::Completed)
        .value("Failed",    RequestStatus::Failed)
        .value("TimedOut",  RequestStatus::TimedOut)
        .value("Cancelled", RequestStatus::Cancelled)
        .export_values();

    py::enum_<QuotaAlertLevel>(m, "QuotaAlertLevel")
        .value("Ok",       QuotaAlertLevel::Ok)
        .value("Warning",  QuotaAlertLevel::Warning)
        .value("Critical", QuotaAlertLevel::Critical)
        .value("Exceeded", QuotaAlertLevel::Exceeded)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("None_",             ErrorKind::None)
        .value("Validation",        ErrorKind::Validation)
        .value("QuotaExceeded",     ErrorKind::QuotaExceeded)
        .value("QueueFull",         ErrorKind::QueueFull)
        .value("ProviderTransient", ErrorKind::ProviderTransient)
        .value("ProviderTerminal",  ErrorKind::ProviderTerminal)
        .value("Timeout",           ErrorKind::Timeout)
        .value("Cancelled",         ErrorKind::Cancelled)
        .value("ClientResolution",  ErrorKind::ClientResolution)
        .value("Internal",          ErrorKind::Internal);

    py::enum_<EventType>(m, "EventType")
        .value("RequestSubmitted",       EventType::RequestSubmitted)
        .value("RequestAdmitted",        EventType::RequestAdmitted)
        .value("RequestRejected",        EventType::RequestRejected)
        .value("RequestDispatched",      EventType::RequestDispatched)
        .value("RequestRetryScheduled",  EventType::RequestRetryScheduled)
        .value("RequestCompleted",       EventType::RequestCompleted)
        .value("RequestFailed",          EventType::RequestFailed)
        .value("RequestTimedOut",        EventType::RequestTimedOut)
        .value("RequestCancelled",       EventType::RequestCancelled)
        .value("RequestCancelSignalled", EventType::RequestCancelSignalled)
        .value("RequestEvicted",         EventType::RequestEvicted)
        .value("RequestResultDiscarded", EventType::RequestResultDiscarded)
        .value("WatchdogReclaimed",      EventType::WatchdogReclaimed)
        .value("QuotaPolicyChanged",     EventType::QuotaPolicyChanged)
        .value("QuotaAdmissionWarning",  EventType::QuotaAdmissionWarning)
        .value("QuotaAlertRaised",       EventType::QuotaAlertRaised)
        .value("QuotaPeriodReset",       EventType::QuotaPeriodReset)
        .value("UsageRecorded",          EventType::UsageRecorded)
        .value("AlertListenerFailed",    EventType::AlertListenerFailed)
        .value("PersistenceRetry",       EventType::PersistenceRetry)
        .value("PersistenceDegraded",    EventType::PersistenceDegraded)
        .value("PersistenceRecovered",   EventType::PersistenceRecovered)
        .value("ClientCreated",          EventType::ClientCreated)
        .value("ClientReused",           EventType::ClientReused)
        .value("ClientEvicted",          EventType::ClientEvicted)
        .value("ClientInvalidated",      EventType::ClientInvalidated)
        .value("WorkerStarted",          EventType::WorkerStarted)
        .value("WorkerStopped",          EventType::WorkerStopped)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<QuotaPolicy>(m, "QuotaPolicy")
        .def(py::init<>())
        .def_readwrite("daily_token_limit",   &QuotaPolicy::daily_token_limit)
        .def_readwrite("monthly_cost_limit",  &QuotaPolicy::monthly_cost_limit)
        .def_readwrite("daily_request_limit", &QuotaPolicy::daily_request_limit)
        .def_readwrite("warning_threshold",   &QuotaPolicy::warning_threshold);

    py::class_<QuotaConfig>(m, "QuotaConfig")
        .def(py::init<>())
        .def_readwrite("default_policy",           &QuotaConfig::default_policy)
        .def_readwrite("critical_threshold",       &QuotaConfig::critical_threshold)
        .def_readwrite("persistence_max_attempts", &QuotaConfig::persistence_max_attempts)
        .def_readwrite("persistence_retry_delay",  &QuotaConfig::persistence_retry_delay)
        .def_readwrite("alert_history_limit",      &QuotaConfig::alert_history_limit);

    py::class_<ClientCacheConfig>(m, "ClientCacheConfig")
        .def(py::init<>())
        .def_readwrite("idle_ttl",                &ClientCacheConfig::idle_ttl)
        .def_readwrite("max_cached_clients",      &ClientCacheConfig::max_cached_clients)
        .def_readwrite("assume_alive_on_unknown", &ClientCacheConfig::assume_alive_on_unknown);

    // Config (top-level, embeds the two sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("worker_count",         &Config::worker_count)
        .def_readwrite("max_queue_size",       &Config::max_queue_size)
        .def_readwrite("max_queue_per_scope",  &Config::max_queue_per_scope)
        .def_readwrite("default_deadline",     &Config::default_deadline)
        .def_readwrite("max_deadline",         &Config::max_deadline)
        .def_readwrite("max_attempts",         &Config::max_attempts)
        .def_readwrite("backoff_base",         &Config::backoff_base)
        .def_readwrite("backoff_max",          &Config::backoff_max)
        .def_readwrite("aging_interval",       &Config::aging_interval)
        .def_readwrite("result_retention",     &Config::result_retention)
        .def_readwrite("watchdog_interval",    &Config::watchdog_interval)
        .def_readwrite("worker_poll_interval", &Config::worker_poll_interval)
        .def_readwrite("quota",                &Config::quota)
        .def_readwrite("clients",              &Config::clients);

    // ---- Requests ---------------------------------------------------------

    py::class_<SubmitOptions>(m, "SubmitOptions")
        .def(py::init<>())
        .def_readwrite("priority",          &SubmitOptions::priority)
        .def_readwrite("estimated_tokens",  &SubmitOptions::estimated_tokens)
        .def_readwrite("idempotency_key",   &SubmitOptions::idempotency_key)
        .def_readwrite("provider_identity", &SubmitOptions::provider_identity)
        .def_readwrite("deadline",          &SubmitOptions::deadline);

    py::class_<RequestError>(m, "RequestError")
        .def(py::init<>())
        .def_readwrite("kind",    &RequestError::kind)
        .def_readwrite("message", &RequestError::message);

    py::class_<InvocationResult>(m, "InvocationResult")
        .def(py::init<>())
        .def(py::init([](std::string output, TokenCount tokens, Cost cost) {
                 return InvocationResult{std::move(output), tokens, cost};
             }),
             py::arg("output"), py::arg("tokens_used") = 0, py::arg("cost") = 0.0)
        .def_readwrite("output",      &InvocationResult::output)
        .def_readwrite("tokens_used", &InvocationResult::tokens_used)
        .def_readwrite("cost",        &InvocationResult::cost);

    // Snapshots are handed out by the scheduler and never built from Python
    py::class_<RequestSnapshot>(m, "RequestSnapshot")
        .def_readonly("request_id",        &RequestSnapshot::request_id)
        .def_readonly("scope",             &RequestSnapshot::scope)
        .def_readonly("priority",          &RequestSnapshot::priority)
        .def_readonly("estimated_tokens",  &RequestSnapshot::estimated_tokens)
        .def_readonly("provider_identity", &RequestSnapshot::provider_identity)
        .def_readonly("idempotency_key",   &RequestSnapshot::idempotency_key)
        .def_readonly("status",            &RequestSnapshot::status)
        .def_readonly("result",            &RequestSnapshot::result)
        .def_readonly("error",             &RequestSnapshot::error)
        .def_readonly("attempt_count",     &RequestSnapshot::attempt_count)
        .def_readonly("cancel_requested",  &RequestSnapshot::cancel_requested)
        .def_readonly("execution_time",    &RequestSnapshot::execution_time)
        .def_readonly("tokens_used",       &RequestSnapshot::tokens_used)
        .def_readonly("cost_incurred",     &RequestSnapshot::cost_incurred)
        .def("is_terminal", &RequestSnapshot::is_terminal)
        .def("succeeded",   &RequestSnapshot::succeeded)
        .def("__repr__", [](const RequestSnapshot& s) {
            return "<RequestSnapshot id=" + std::to_string(s.request_id)
                 + " scope='" + s.scope.full_key()
                 + "' status=" + std::string(to_string(s.status)) + ">";
        });

    py::class_<ManagerStats>(m, "ManagerStats")
        .def(py::init<>())
        .def_readwrite("submitted",          &ManagerStats::submitted)
        .def_readwrite("completed",          &ManagerStats::completed)
        .def_readwrite("failed",             &ManagerStats::failed)
        .def_readwrite("cancelled",          &ManagerStats::cancelled)
        .def_readwrite("timed_out",          &ManagerStats::timed_out)
        .def_readwrite("quota_rejected",     &ManagerStats::quota_rejected)
        .def_readwrite("retried",            &ManagerStats::retried)
        .def_readwrite("queue_depth",        &ManagerStats::queue_depth)
        .def_readwrite("running",            &ManagerStats::running)
        .def_readwrite("tracked",            &ManagerStats::tracked)
        .def_readwrite("queued_by_priority", &ManagerStats::queued_by_priority);

    // ---- Quota accounting -------------------------------------------------

    py::class_<AgentUsage>(m, "AgentUsage")
        .def(py::init<>())
        .def_readwrite("tokens_today",    &AgentUsage::tokens_today)
        .def_readwrite("requests_today",  &AgentUsage::requests_today)
        .def_readwrite("cost_this_month", &AgentUsage::cost_this_month);

    py::class_<UsageStats>(m, "UsageStats")
        .def(py::init<>())
        .def_readwrite("tenant_id",                &UsageStats::tenant_id)
        .def_readwrite("tokens_used_today",        &UsageStats::tokens_used_today)
        .def_readwrite("requests_today",           &UsageStats::requests_today)
        .def_readwrite("cost_incurred_this_month", &UsageStats::cost_incurred_this_month)
        .def_readwrite("tokens_used_this_month",   &UsageStats::tokens_used_this_month)
        .def_readwrite("requests_this_month",      &UsageStats::requests_this_month)
        .def_readwrite("day_period_id",            &UsageStats::day_period_id)
        .def_readwrite("month_period_id",          &UsageStats::month_period_id)
        .def_readwrite("last_daily_reset",         &UsageStats::last_daily_reset)
        .def_readwrite("last_monthly_reset",       &UsageStats::last_monthly_reset)
        .def_readwrite("agents",                   &UsageStats::agents);

    py::class_<QuotaEvaluation>(m, "QuotaEvaluation")
        .def(py::init<>())
        .def_readwrite("level",          &QuotaEvaluation::level)
        .def_readwrite("metric",         &QuotaEvaluation::metric)
        .def_readwrite("tokens_ratio",   &QuotaEvaluation::tokens_ratio)
        .def_readwrite("cost_ratio",     &QuotaEvaluation::cost_ratio)
        .def_readwrite("requests_ratio", &QuotaEvaluation::requests_ratio)
        .def_readwrite("max_ratio",      &QuotaEvaluation::max_ratio);

    py::class_<QuotaStatus>(m, "QuotaStatus")
        .def(py::init<>())
        .def_readwrite("tenant_id",       &QuotaStatus::tenant_id)
        .def_readwrite("policy",          &QuotaStatus::policy)
        .def_readwrite("explicit_policy", &QuotaStatus::explicit_policy)
        .def_readwrite("usage",           &QuotaStatus::usage)
        .def_readwrite("evaluation",      &QuotaStatus::evaluation);

    py::class_<QuotaAlert>(m, "QuotaAlert")
        .def(py::init<>())
        .def_readwrite("tenant_id",     &QuotaAlert::tenant_id)
        .def_readwrite("level",         &QuotaAlert::level)
        .def_readwrite("metric",        &QuotaAlert::metric)
        .def_readwrite("current_usage", &QuotaAlert::current_usage)
        .def_readwrite("limit",         &QuotaAlert::limit)
        .def_readwrite("usage_ratio",   &QuotaAlert::usage_ratio)
        .def_readwrite("message",       &QuotaAlert::message)
        .def_readwrite("timestamp",     &QuotaAlert::timestamp);

    py::class_<ClientRegistryStats>(m, "ClientRegistryStats")
        .def(py::init<>())
        .def_readwrite("isolation_groups",  &ClientRegistryStats::isolation_groups)
        .def_readwrite("total_clients",     &ClientRegistryStats::total_clients)
        .def_readwrite("clients_per_group", &ClientRegistryStats::clients_per_group)
        .def_readwrite("hits",              &ClientRegistryStats::hits)
        .def_readwrite("misses",            &ClientRegistryStats::misses)
        .def_readwrite("evictions",         &ClientRegistryStats::evictions);

    // ---- Monitoring -------------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",        &MonitorEvent::type)
        .def_readwrite("timestamp",   &MonitorEvent::timestamp)
        .def_readwrite("message",     &MonitorEvent::message)
        .def_readwrite("tenant_id",   &MonitorEvent::tenant_id)
        .def_readwrite("agent_id",    &MonitorEvent::agent_id)
        .def_readwrite("scope_key",   &MonitorEvent::scope_key)
        .def_readwrite("request_id",  &MonitorEvent::request_id)
        .def_readwrite("priority",    &MonitorEvent::priority)
        .def_readwrite("alert_level", &MonitorEvent::alert_level)
        .def_readwrite("attempt",     &MonitorEvent::attempt)
        .def_readwrite("tokens",      &MonitorEvent::tokens)
        .def_readwrite("cost",        &MonitorEvent::cost)
        .def_readwrite("duration_us", &MonitorEvent::duration_us);

    py::class_<SchedulerSnapshot>(m, "SchedulerSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",            &SchedulerSnapshot::timestamp)
        .def_readwrite("queue_depth",          &SchedulerSnapshot::queue_depth)
        .def_readwrite("running",              &SchedulerSnapshot::running)
        .def_readwrite("tracked_requests",     &SchedulerSnapshot::tracked_requests)
        .def_readwrite("cached_clients",       &SchedulerSnapshot::cached_clients)
        .def_readwrite("persistence_degraded", &SchedulerSnapshot::persistence_degraded);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("submitted_requests",    &MetricsMonitor::Metrics::submitted_requests)
        .def_readwrite("completed_requests",    &MetricsMonitor::Metrics::completed_requests)
        .def_readwrite("failed_requests",       &MetricsMonitor::Metrics::failed_requests)
        .def_readwrite("timed_out_requests",    &MetricsMonitor::Metrics::timed_out_requests)
        .def_readwrite("cancelled_requests",    &MetricsMonitor::Metrics::cancelled_requests)
        .def_readwrite("quota_rejections",      &MetricsMonitor::Metrics::quota_rejections)
        .def_readwrite("retries",               &MetricsMonitor::Metrics::retries)
        .def_readwrite("quota_alerts",          &MetricsMonitor::Metrics::quota_alerts)
        .def_readwrite("persistence_failures",  &MetricsMonitor::Metrics::persistence_failures)
        .def_readwrite("tokens_recorded",       &MetricsMonitor::Metrics::tokens_recorded)
        .def_readwrite("cost_recorded",         &MetricsMonitor::Metrics::cost_recorded)
        .def_readwrite("average_queue_wait_ms", &MetricsMonitor::Metrics::average_queue_wait_ms)
        .def_readwrite("average_execution_ms",  &MetricsMonitor::Metrics::average_execution_ms);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_ModelGateError =
        py::register_exception<ModelGateException>(m, "ModelGateError", PyExc_RuntimeError);

    // Derived from ModelGateError
    static auto py_ValidationError =
        py::register_exception<ValidationException>(m, "ValidationError", py_ModelGateError.ptr());
    static auto py_QuotaExceededError =
        py::register_exception<QuotaExceededException>(m, "QuotaExceededError", py_ModelGateError.ptr());
    static auto py_QueueFullError =
        py::register_exception<QueueFullException>(m, "QueueFullError", py_ModelGateError.ptr());
    static auto py_RequestNotFoundError =
        py::register_exception<RequestNotFoundException>(m, "RequestNotFoundError", py_ModelGateError.ptr());
    static auto py_ClientResolutionError =
        py::register_exception<ClientResolutionException>(m, "ClientResolutionError", py_ModelGateError.ptr());

    // Raised from Python invokers to steer the retry policy
    static auto py_ProviderTransientError =
        py::register_exception<ProviderTransientError>(m, "ProviderTransientError", py_ModelGateError.ptr());
    static auto py_ProviderTerminalError =
        py::register_exception<ProviderTerminalError>(m, "ProviderTerminalError", py_ModelGateError.ptr());
}
