#include "modelgate/request_manager.hpp"
#include "modelgate/exceptions.hpp"

#include <algorithm>

namespace modelgate {

namespace {

double to_us(Duration d) {
    return std::chrono::duration<double, std::micro>(d).count();
}

} // anonymous namespace

RequestManager::RequestManager(Config config,
                               std::shared_ptr<QuotaManager> quota,
                               std::shared_ptr<ClientRegistry> clients,
                               std::shared_ptr<ModelInvoker> invoker)
    : config_(std::move(config))
    , quota_(std::move(quota))
    , clients_(std::move(clients))
    , invoker_(std::move(invoker))
    , queue_(config_.max_queue_size, config_.max_queue_per_scope, config_.aging_interval)
{
    if (!quota_ || !clients_ || !invoker_) {
        throw ValidationException("RequestManager requires quota, client registry and invoker");
    }
    if (config_.max_deadline <= Duration::zero()) {
        throw ValidationException("max_deadline must be positive");
    }
    if (config_.default_deadline <= Duration::zero() ||
        config_.default_deadline > config_.max_deadline) {
        throw ValidationException("default_deadline must be in (0, max_deadline]");
    }
}

RequestManager::~RequestManager() {
    stop();
}

// ==================== Request API ====================

RequestId RequestManager::submit(const IsolationScope& scope, Payload payload,
                                 const SubmitOptions& options) {
    if (!is_valid_priority(options.priority)) {
        throw ValidationException("Invalid priority value " +
                                  std::to_string(static_cast<int>(options.priority)));
    }
    if (options.estimated_tokens < 0) {
        throw ValidationException("estimated_tokens must not be negative");
    }
    if (options.deadline.has_value() && options.deadline.value() <= Duration::zero()) {
        throw ValidationException("deadline must be positive");
    }
    if (options.deadline.has_value() && options.deadline.value() > config_.max_deadline) {
        throw ValidationException("deadline exceeds max_deadline");
    }

    auto now = Clock::now();
    RequestId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (options.idempotency_key.has_value()) {
            auto it = idempotency_index_.find(options.idempotency_key.value());
            if (it != idempotency_index_.end()) {
                return it->second;
            }
        }

        id = next_request_id_++;
        Descriptor d(scope);
        d.info.request_id = id;
        d.info.priority = options.priority;
        d.info.estimated_tokens = options.estimated_tokens;
        d.info.provider_identity = options.provider_identity;
        d.info.idempotency_key = options.idempotency_key;
        d.info.submitted_at = now;
        d.info.deadline = now + options.deadline.value_or(config_.default_deadline);
        d.payload = std::move(payload);
        descriptors_.emplace(id, std::move(d));

        if (options.idempotency_key.has_value()) {
            idempotency_index_[options.idempotency_key.value()] = id;
        }
        counters_.submitted++;
    }

    auto submitted = make_event(EventType::RequestSubmitted, "Request submitted", id, scope,
                                options.priority);
    submitted.tokens = options.estimated_tokens;
    publish(submitted);

    // Admission control; EXCEEDED never reaches the queue
    auto level = quota_->check_admission(scope.tenant_id(), options.estimated_tokens);

    if (level == QuotaAlertLevel::Exceeded) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = descriptors_.find(id);
            if (it != descriptors_.end() && it->second.info.status == RequestStatus::Pending) {
                finish_locked(it->second, RequestStatus::Failed, ErrorKind::QuotaExceeded,
                              "Quota exceeded for tenant " + scope.tenant_id(), Clock::now());
                counters_.quota_rejected++;
            }
        }
        results_cv_.notify_all();

        auto rejected = make_event(EventType::RequestRejected, "Quota exceeded", id, scope,
                                   options.priority);
        rejected.alert_level = level;
        publish(rejected);
        throw QuotaExceededException(scope.tenant_id(), id, level);
    }

    if (level == QuotaAlertLevel::Warning || level == QuotaAlertLevel::Critical) {
        auto warning = make_event(EventType::QuotaAdmissionWarning,
                                  std::string("Admitted at quota level ") + to_string(level),
                                  id, scope, options.priority);
        warning.alert_level = level;
        publish(warning);
    }

    bool queue_full = false;
    std::string queue_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = descriptors_.find(id);
        if (it == descriptors_.end() || it->second.info.status != RequestStatus::Pending) {
            // Cancelled between admission and enqueue
            return id;
        }
        auto& d = it->second;
        try {
            queue_.push(QueueEntry(id, scope, options.priority));
            d.info.status = RequestStatus::Admitted;
            d.info.queued_at = Clock::now();
        } catch (const QueueFullException& e) {
            queue_full = true;
            queue_error = e.what();
            finish_locked(d, RequestStatus::Failed, ErrorKind::QueueFull, queue_error, Clock::now());
        }
    }

    if (queue_full) {
        results_cv_.notify_all();
        auto rejected = make_event(EventType::RequestRejected, queue_error, id, scope,
                                   options.priority);
        rejected.alert_level = level;
        publish(rejected);
        throw QueueFullException(id, scope.full_key());
    }

    auto admitted = make_event(EventType::RequestAdmitted, "Request admitted", id, scope,
                               options.priority);
    admitted.alert_level = level;
    publish(admitted);
    return id;
}

RequestSnapshot RequestManager::await_result(RequestId id, Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (descriptors_.find(id) == descriptors_.end()) {
        throw RequestNotFoundException(id);
    }

    // Waits are capped at max_deadline
    results_cv_.wait_for(lock, std::min(timeout, config_.max_deadline), [this, id] {
        auto it = descriptors_.find(id);
        return it == descriptors_.end() || it->second.info.is_terminal();
    });

    auto it = descriptors_.find(id);
    if (it == descriptors_.end()) {
        // Collected by another caller or evicted while waiting
        throw RequestNotFoundException(id);
    }

    RequestSnapshot snapshot = it->second.info;
    if (snapshot.is_terminal()) {
        release_locked(id);
    }
    return snapshot;
}

bool RequestManager::cancel(RequestId id) {
    MonitorEvent event{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = descriptors_.find(id);
        if (it == descriptors_.end()) return false;

        auto& d = it->second;
        switch (d.info.status) {
            case RequestStatus::Pending:
            case RequestStatus::Admitted:
                queue_.remove(id);
                finish_locked(d, RequestStatus::Cancelled, ErrorKind::Cancelled,
                              "Cancelled before dispatch", Clock::now());
                event = make_event(EventType::RequestCancelled, "Cancelled before dispatch",
                                   id, d.info.scope, d.info.priority, d.info.attempt_count);
                break;

            case RequestStatus::Running:
                if (d.info.cancel_requested) return true;
                d.info.cancel_requested = true;
                d.cancel_token.cancel();
                event = make_event(EventType::RequestCancelSignalled,
                                   "Cancellation signalled to in-flight call",
                                   id, d.info.scope, d.info.priority, d.info.attempt_count);
                break;

            default:
                return false;
        }
    }

    results_cv_.notify_all();
    publish(event);
    return true;
}

std::optional<RequestSnapshot> RequestManager::get_status(RequestId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(id);
    if (it == descriptors_.end()) return std::nullopt;
    return it->second.info;
}

// ==================== Queries & Maintenance ====================

std::vector<RequestSnapshot> RequestManager::requests_for_tenant(
    const TenantId& tenant_id,
    std::optional<RequestStatus> status,
    std::size_t limit) const
{
    std::vector<RequestSnapshot> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, d] : descriptors_) {
            if (d.info.scope.tenant_id() != tenant_id) continue;
            if (status.has_value() && d.info.status != status.value()) continue;
            result.push_back(d.info);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const RequestSnapshot& a, const RequestSnapshot& b) {
                  return a.request_id < b.request_id;
              });
    if (result.size() > limit) {
        result.erase(result.begin() + static_cast<std::ptrdiff_t>(limit), result.end());
    }
    return result;
}

std::size_t RequestManager::cleanup(Duration max_age) {
    auto cutoff = Clock::now() - max_age;
    std::vector<MonitorEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RequestId> stale;
        for (const auto& [id, d] : descriptors_) {
            if (d.info.is_terminal() && d.info.completed_at.has_value() &&
                d.info.completed_at.value() < cutoff) {
                stale.push_back(id);
                events.push_back(make_event(EventType::RequestEvicted,
                                            "Uncollected result evicted",
                                            id, d.info.scope, d.info.priority));
            }
        }
        for (auto id : stale) {
            release_locked(id);
        }
    }
    publish(events);
    return events.size();
}

ManagerStats RequestManager::stats() const {
    ManagerStats s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s = counters_;
        s.running = running_count_;
        s.tracked = descriptors_.size();
    }
    s.queue_depth = queue_.size();
    s.queued_by_priority = queue_.size_by_priority();
    return s;
}

std::size_t RequestManager::queue_depth() const {
    return queue_.size();
}

// ==================== Configuration ====================

void RequestManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

const Config& RequestManager::config() const noexcept {
    return config_;
}

void RequestManager::start() {
    if (running_.exchange(true)) return;
    queue_.reopen();

    std::size_t count = std::max<std::size_t>(1, config_.worker_count);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    watchdog_thread_ = std::thread([this] { watchdog_loop(); });
}

void RequestManager::stop() {
    if (!running_.exchange(false)) return;

    queue_.close();
    watchdog_cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    if (watchdog_thread_.joinable()) {
        watchdog_thread_.join();
    }

    cancel_all_queued("Scheduler stopped");
}

bool RequestManager::is_running() const noexcept {
    return running_.load();
}

// ==================== Workers ====================

void RequestManager::worker_loop(std::size_t worker_index) {
    if (monitor_) {
        MonitorEvent started{};
        started.type = EventType::WorkerStarted;
        started.timestamp = Clock::now();
        started.message = "Worker " + std::to_string(worker_index) + " started";
        monitor_->on_event(started);
    }

    while (running_.load()) {
        auto entry = queue_.wait_and_pop(config_.worker_poll_interval);
        if (!entry) continue;
        execute(entry.value());
    }

    if (monitor_) {
        MonitorEvent stopped{};
        stopped.type = EventType::WorkerStopped;
        stopped.timestamp = Clock::now();
        stopped.message = "Worker " + std::to_string(worker_index) + " stopped";
        monitor_->on_event(stopped);
    }
}

void RequestManager::execute(const QueueEntry& entry) {
    auto now = Clock::now();

    Payload payload;
    ProviderIdentity provider_identity;
    Timestamp deadline;
    CancellationToken token;
    MonitorEvent event{};
    bool dispatched = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = descriptors_.find(entry.id);
        // Cancelled or timed out after being popped
        if (it == descriptors_.end() || it->second.info.status != RequestStatus::Admitted) {
            return;
        }

        auto& d = it->second;
        if (now >= d.info.deadline) {
            finish_locked(d, RequestStatus::TimedOut, ErrorKind::Timeout,
                          "Deadline passed while queued", now);
            event = make_event(EventType::RequestTimedOut, "Deadline passed while queued",
                               entry.id, d.info.scope, d.info.priority, d.info.attempt_count);
        } else {
            d.info.status = RequestStatus::Running;
            d.info.attempt_count++;
            if (!d.info.started_at.has_value()) {
                d.info.started_at = now;
            }
            running_count_++;

            payload = d.payload;
            provider_identity = d.info.provider_identity;
            deadline = d.info.deadline;
            token = d.cancel_token;
            dispatched = true;

            event = make_event(EventType::RequestDispatched, "Request dispatched",
                               entry.id, d.info.scope, d.info.priority, d.info.attempt_count);
            event.duration_us = to_us(now - entry.enqueued_at);
        }
    }

    if (!dispatched) {
        results_cv_.notify_all();
        publish(event);
        return;
    }
    publish(event);

    auto outcome = invoke_once(entry.scope, provider_identity, payload, deadline, token);
    apply_outcome(entry, std::move(outcome), now);
}

RequestManager::AttemptOutcome RequestManager::invoke_once(const IsolationScope& scope,
                                                           const ProviderIdentity& provider_identity,
                                                           const Payload& payload,
                                                           Timestamp deadline,
                                                           const CancellationToken& token) {
    AttemptOutcome outcome;

    std::shared_ptr<ProviderClient> client;
    try {
        client = clients_->get_client(scope, provider_identity);
    } catch (const ClientResolutionException& e) {
        outcome.error_kind = ErrorKind::ClientResolution;
        outcome.error_message = e.what();
        return outcome;
    }

    try {
        outcome.result = invoker_->invoke(*client, payload, deadline, token);
        outcome.success = true;
    } catch (const ProviderTransientError& e) {
        outcome.error_kind = ErrorKind::ProviderTransient;
        outcome.error_message = e.what();
    } catch (const ProviderTerminalError& e) {
        outcome.error_kind = ErrorKind::ProviderTerminal;
        outcome.error_message = e.what();
    } catch (const std::exception& e) {
        outcome.error_kind = ErrorKind::Internal;
        outcome.error_message = std::string("Model call raised: ") + e.what();
    }
    return outcome;
}

void RequestManager::apply_outcome(const QueueEntry& entry, AttemptOutcome outcome,
                                   Timestamp attempt_started) {
    const RequestId id = entry.id;
    auto now = Clock::now();
    std::vector<MonitorEvent> events;
    bool terminal = false;

    TokenCount tokens = std::max<TokenCount>(0, outcome.result.tokens_used);
    Cost cost = std::max<Cost>(0.0, outcome.result.cost);

    // Work that was performed is billed, whatever happens to the result
    if (outcome.success) {
        try {
            quota_->record_usage(entry.scope.tenant_id(), entry.scope.agent_id(), tokens, cost);
        } catch (const ModelGateException& e) {
            outcome.success = false;
            outcome.error_kind = ErrorKind::Internal;
            outcome.error_message = std::string("Usage accounting failed: ") + e.what();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_count_--;

        auto it = descriptors_.find(id);
        if (it == descriptors_.end()) {
            // Timed out and already collected by the caller
            events.push_back(make_event(EventType::RequestResultDiscarded,
                                        "Response for released request discarded",
                                        id, entry.scope, entry.priority));
        } else if (it->second.info.status != RequestStatus::Running) {
            auto& d = it->second;
            // The watchdog already timed this request out
            auto discarded = make_event(EventType::RequestResultDiscarded,
                                        "Late response discarded", id, d.info.scope,
                                        d.info.priority, d.info.attempt_count);
            if (outcome.success) {
                discarded.tokens = tokens;
                discarded.cost = cost;
            }
            events.push_back(discarded);
        } else {
            auto& d = it->second;
            const auto& scope = d.info.scope;
            terminal = true;

            if (outcome.success) {
                d.info.tokens_used = tokens;
                d.info.cost_incurred = cost;

                if (d.info.cancel_requested) {
                    finish_locked(d, RequestStatus::Cancelled, ErrorKind::Cancelled,
                                  "Cancelled during execution; result discarded", now);
                    events.push_back(make_event(EventType::RequestCancelled,
                                                "Cancelled during execution; result discarded",
                                                id, scope, d.info.priority, d.info.attempt_count));
                } else {
                    d.info.result = std::move(outcome.result.output);
                    finish_locked(d, RequestStatus::Completed, ErrorKind::None, "", now);
                    auto completed = make_event(EventType::RequestCompleted, "Request completed",
                                                id, scope, d.info.priority, d.info.attempt_count);
                    completed.tokens = tokens;
                    completed.cost = cost;
                    completed.duration_us = to_us(now - attempt_started);
                    events.push_back(completed);
                }
            } else if (d.info.cancel_requested) {
                finish_locked(d, RequestStatus::Cancelled, ErrorKind::Cancelled,
                              "Cancelled during execution: " + outcome.error_message, now);
                events.push_back(make_event(EventType::RequestCancelled, outcome.error_message,
                                            id, scope, d.info.priority, d.info.attempt_count));
            } else if (outcome.error_kind == ErrorKind::ProviderTransient &&
                       d.info.attempt_count < config_.max_attempts) {
                auto ready_at = now + backoff_for(d.info.attempt_count);
                if (ready_at >= d.info.deadline) {
                    finish_locked(d, RequestStatus::TimedOut, ErrorKind::Timeout,
                                  "Deadline reached before retry: " + outcome.error_message, now);
                    events.push_back(make_event(EventType::RequestTimedOut,
                                                "Deadline reached before retry",
                                                id, scope, d.info.priority, d.info.attempt_count));
                } else {
                    terminal = false;
                    d.info.status = RequestStatus::Admitted;
                    d.info.queued_at = now;
                    queue_.push_delayed(QueueEntry(id, scope, d.info.priority), ready_at);
                    counters_.retried++;
                    auto retry = make_event(EventType::RequestRetryScheduled, outcome.error_message,
                                            id, scope, d.info.priority, d.info.attempt_count);
                    retry.duration_us = to_us(ready_at - now);
                    events.push_back(retry);
                }
            } else {
                std::string message = outcome.error_message;
                if (outcome.error_kind == ErrorKind::ProviderTransient) {
                    message += " (after " + std::to_string(d.info.attempt_count) + " attempts)";
                }
                finish_locked(d, RequestStatus::Failed, outcome.error_kind, message, now);
                events.push_back(make_event(EventType::RequestFailed, message,
                                            id, scope, d.info.priority, d.info.attempt_count));
            }
        }
    }

    if (terminal) {
        results_cv_.notify_all();
    }
    publish(events);
}

// ==================== Watchdog ====================

void RequestManager::watchdog_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(watchdog_mutex_);
            watchdog_cv_.wait_for(lock, config_.watchdog_interval,
                                  [this] { return !running_.load(); });
        }
        if (!running_.load()) break;

        reclaim_expired();
        cleanup(config_.result_retention);
        clients_->evict_idle();
        emit_snapshot();
    }
}

void RequestManager::reclaim_expired() {
    auto now = Clock::now();
    std::vector<MonitorEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, d] : descriptors_) {
            if (d.info.is_terminal() || now < d.info.deadline) continue;

            if (d.info.status == RequestStatus::Running) {
                // Abandon the call; its late response will be discarded
                d.cancel_token.cancel();
                finish_locked(d, RequestStatus::TimedOut, ErrorKind::Timeout,
                              "Deadline exceeded during execution", now);
                events.push_back(make_event(EventType::WatchdogReclaimed,
                                            "Deadline exceeded during execution",
                                            id, d.info.scope, d.info.priority,
                                            d.info.attempt_count));
            } else {
                queue_.remove(id);
                finish_locked(d, RequestStatus::TimedOut, ErrorKind::Timeout,
                              "Deadline exceeded while queued", now);
            }
            events.push_back(make_event(EventType::RequestTimedOut, d.info.error.message,
                                        id, d.info.scope, d.info.priority,
                                        d.info.attempt_count));
        }
    }

    if (!events.empty()) {
        results_cv_.notify_all();
    }
    publish(events);
}

void RequestManager::cancel_all_queued(const std::string& reason) {
    auto now = Clock::now();
    std::vector<MonitorEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, d] : descriptors_) {
            if (d.info.status != RequestStatus::Pending &&
                d.info.status != RequestStatus::Admitted) continue;
            queue_.remove(id);
            finish_locked(d, RequestStatus::Cancelled, ErrorKind::Cancelled, reason, now);
            events.push_back(make_event(EventType::RequestCancelled, reason,
                                        id, d.info.scope, d.info.priority,
                                        d.info.attempt_count));
        }
    }

    if (!events.empty()) {
        results_cv_.notify_all();
    }
    publish(events);
}

void RequestManager::emit_snapshot() {
    if (!monitor_) return;

    SchedulerSnapshot snapshot;
    snapshot.timestamp = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.running = running_count_;
        snapshot.tracked_requests = descriptors_.size();
    }
    snapshot.queue_depth = queue_.size();
    snapshot.cached_clients = clients_->size();
    snapshot.persistence_degraded = quota_->persistence_degraded();

    monitor_->on_snapshot(snapshot);
}

// ==================== Internal Helpers ====================

void RequestManager::finish_locked(Descriptor& d, RequestStatus status, ErrorKind kind,
                                   std::string message, Timestamp now) {
    d.info.status = status;
    d.info.error = RequestError{kind, std::move(message)};
    d.info.completed_at = now;
    if (d.info.started_at.has_value()) {
        d.info.execution_time = now - d.info.started_at.value();
    }

    switch (status) {
        case RequestStatus::Completed: counters_.completed++; break;
        case RequestStatus::Failed:    counters_.failed++; break;
        case RequestStatus::TimedOut:  counters_.timed_out++; break;
        case RequestStatus::Cancelled:
            d.info.cancel_requested = true;
            counters_.cancelled++;
            break;
        default:
            break;
    }
}

void RequestManager::release_locked(RequestId id) {
    auto it = descriptors_.find(id);
    if (it == descriptors_.end()) return;

    const auto& key = it->second.info.idempotency_key;
    if (key.has_value()) {
        auto idx = idempotency_index_.find(key.value());
        if (idx != idempotency_index_.end() && idx->second == id) {
            idempotency_index_.erase(idx);
        }
    }
    descriptors_.erase(it);
}

Duration RequestManager::backoff_for(std::size_t attempt) const {
    Duration delay = config_.backoff_base;
    for (std::size_t i = 1; i < attempt && delay < config_.backoff_max; ++i) {
        delay *= 2;
    }
    return std::min(delay, config_.backoff_max);
}

MonitorEvent RequestManager::make_event(EventType type, const std::string& message,
                                        RequestId id, const IsolationScope& scope,
                                        std::optional<Priority> priority,
                                        std::optional<std::size_t> attempt) const {
    MonitorEvent event{};
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.tenant_id = scope.tenant_id();
    event.agent_id = scope.agent_id();
    event.scope_key = scope.full_key();
    event.request_id = id;
    event.priority = priority;
    event.attempt = attempt;
    return event;
}

void RequestManager::publish(const MonitorEvent& event) const {
    if (!monitor_) return;
    monitor_->on_event(event);
}

void RequestManager::publish(const std::vector<MonitorEvent>& events) const {
    if (!monitor_) return;
    for (const auto& event : events) {
        monitor_->on_event(event);
    }
}

} // namespace modelgate
