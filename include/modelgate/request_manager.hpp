#pragma once

#include "modelgate/types.hpp"
#include "modelgate/config.hpp"
#include "modelgate/collaborators.hpp"
#include "modelgate/isolation_scope.hpp"
#include "modelgate/monitor.hpp"
#include "modelgate/request_queue.hpp"
#include "modelgate/quota_manager.hpp"
#include "modelgate/client_registry.hpp"

#include <array>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace modelgate {

struct SubmitOptions {
    Priority priority{Priority::Normal};
    TokenCount estimated_tokens{0};

    // Duplicate submissions with the same key resolve to the first request
    std::optional<std::string> idempotency_key;

    // Empty = whatever the configuration collaborator resolves
    ProviderIdentity provider_identity;

    // Overrides Config::default_deadline
    std::optional<Duration> deadline;
};

// Copy of a request descriptor as seen by callers
struct RequestSnapshot {
    RequestId request_id{0};
    IsolationScope scope;
    Priority priority{Priority::Normal};
    TokenCount estimated_tokens{0};
    ProviderIdentity provider_identity;
    std::optional<std::string> idempotency_key;

    RequestStatus status{RequestStatus::Pending};
    std::optional<std::string> result;
    RequestError error;
    std::size_t attempt_count{0};
    bool cancel_requested{false};

    Timestamp submitted_at{};
    Timestamp deadline{};
    std::optional<Timestamp> queued_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<Duration> execution_time;

    // Usage of the attempt that produced a response, if any
    TokenCount tokens_used{0};
    Cost cost_incurred{0.0};

    explicit RequestSnapshot(IsolationScope s) : scope(std::move(s)) {}

    bool is_terminal() const noexcept { return modelgate::is_terminal(status); }
    bool succeeded() const noexcept { return status == RequestStatus::Completed; }
};

struct ManagerStats {
    std::uint64_t submitted{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t cancelled{0};
    std::uint64_t timed_out{0};
    std::uint64_t quota_rejected{0};
    std::uint64_t retried{0};

    std::size_t queue_depth{0};
    std::size_t running{0};
    std::size_t tracked{0};
    std::array<std::size_t, PRIORITY_TIER_COUNT> queued_by_priority{};
};

// Orchestrates the request lifecycle:
//   PENDING -> ADMITTED -> RUNNING -> COMPLETED | FAILED | TIMED_OUT | CANCELLED
//
// Admission runs synchronously in submit(). A fixed pool of workers pulls
// from the scope-partitioned queue and executes model calls with retry;
// a watchdog thread enforces deadlines and evicts stale state.
class RequestManager {
public:
    RequestManager(Config config,
                   std::shared_ptr<QuotaManager> quota,
                   std::shared_ptr<ClientRegistry> clients,
                   std::shared_ptr<ModelInvoker> invoker);
    ~RequestManager();

    RequestManager(const RequestManager&) = delete;
    RequestManager& operator=(const RequestManager&) = delete;

    // ==================== Request API ====================

    // Throws ValidationException, QuotaExceededException or
    // QueueFullException. Rejected requests still leave a FAILED descriptor.
    RequestId submit(const IsolationScope& scope, Payload payload,
                     const SubmitOptions& options = SubmitOptions{});

    // Waits up to `timeout` for a terminal state. A terminal snapshot is
    // handed over and the descriptor is released; otherwise the current
    // (pending) snapshot is returned. Throws RequestNotFoundException.
    RequestSnapshot await_result(RequestId id, Duration timeout);

    bool cancel(RequestId id);

    std::optional<RequestSnapshot> get_status(RequestId id) const;

    // ==================== Queries & Maintenance ====================

    std::vector<RequestSnapshot> requests_for_tenant(
        const TenantId& tenant_id,
        std::optional<RequestStatus> status = std::nullopt,
        std::size_t limit = 100) const;

    // Evicts terminal descriptors finished more than max_age ago
    std::size_t cleanup(Duration max_age);

    ManagerStats stats() const;
    std::size_t queue_depth() const;

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);
    const Config& config() const noexcept;

    void start();
    void stop();
    bool is_running() const noexcept;

private:
    struct Descriptor {
        RequestSnapshot info;
        Payload payload;
        CancellationToken cancel_token;

        explicit Descriptor(IsolationScope scope) : info(std::move(scope)) {}
    };

    // Outcome of one model-call attempt, applied under the lock
    struct AttemptOutcome {
        bool success{false};
        InvocationResult result;
        ErrorKind error_kind{ErrorKind::None};
        std::string error_message;
    };

    Config config_;
    std::shared_ptr<QuotaManager> quota_;
    std::shared_ptr<ClientRegistry> clients_;
    std::shared_ptr<ModelInvoker> invoker_;
    std::shared_ptr<Monitor> monitor_;

    RequestQueue queue_;

    mutable std::mutex mutex_;
    std::condition_variable results_cv_;
    std::unordered_map<RequestId, Descriptor> descriptors_;
    std::unordered_map<std::string, RequestId> idempotency_index_;
    RequestId next_request_id_{1};
    std::size_t running_count_{0};
    ManagerStats counters_;

    // Workers and watchdog
    std::vector<std::thread> workers_;
    std::thread watchdog_thread_;
    std::atomic<bool> running_{false};
    std::mutex watchdog_mutex_;
    std::condition_variable watchdog_cv_;

    void worker_loop(std::size_t worker_index);
    void execute(const QueueEntry& entry);
    AttemptOutcome invoke_once(const IsolationScope& scope,
                               const ProviderIdentity& provider_identity,
                               const Payload& payload,
                               Timestamp deadline,
                               const CancellationToken& token);
    void apply_outcome(const QueueEntry& entry, AttemptOutcome outcome, Timestamp attempt_started);

    void watchdog_loop();
    void reclaim_expired();
    void cancel_all_queued(const std::string& reason);
    void emit_snapshot();

    // Caller must hold mutex_
    void finish_locked(Descriptor& d, RequestStatus status, ErrorKind kind,
                       std::string message, Timestamp now);
    void release_locked(RequestId id);
    Duration backoff_for(std::size_t attempt) const;

    // Events are built under the lock and published after it is released
    MonitorEvent make_event(EventType type, const std::string& message,
                            RequestId id, const IsolationScope& scope,
                            std::optional<Priority> priority = std::nullopt,
                            std::optional<std::size_t> attempt = std::nullopt) const;
    void publish(const MonitorEvent& event) const;
    void publish(const std::vector<MonitorEvent>& events) const;
};

} // namespace modelgate
