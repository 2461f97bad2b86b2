#pragma once

#include "modelgate/types.hpp"
#include <cstddef>

namespace modelgate {

// Per-tenant usage ceilings. A limit <= 0 means "unlimited" for that metric.
struct QuotaPolicy {
    TokenCount daily_token_limit = 1000000;
    Cost monthly_cost_limit = 100.0;
    std::int64_t daily_request_limit = 10000;

    // Fraction of any limit at which WARNING is raised (0-1)
    double warning_threshold = 0.8;
};

// Quota accounting configuration
struct QuotaConfig {
    // Applied to tenants without an explicit policy
    QuotaPolicy default_policy;

    // Usage ratio at which WARNING escalates to CRITICAL
    double critical_threshold = 0.95;

    // Attempts made to persist one usage delta before degrading
    std::size_t persistence_max_attempts = 3;

    // Delay between persistence attempts (doubles on each retry)
    Duration persistence_retry_delay = std::chrono::milliseconds(200);

    // Alert history bound; trimmed to half when exceeded
    std::size_t alert_history_limit = 1000;
};

// Provider-client cache configuration
struct ClientCacheConfig {
    // Clients unused for longer than this are evicted by the sweep
    Duration idle_ttl = std::chrono::minutes(30);

    // LRU bound on cached clients across all scopes
    std::size_t max_cached_clients = 1024;

    // Behavior when a cached client cannot report its liveness.
    // false: treat as dead and rebuild (fail-closed)
    // true: keep using it (fail-open)
    bool assume_alive_on_unknown = false;
};

struct Config {
    // Number of concurrent worker threads dispatching model calls
    std::size_t worker_count = 4;

    // Request queue capacity across all scopes
    std::size_t max_queue_size = 10000;

    // Request queue capacity for a single isolation scope
    std::size_t max_queue_per_scope = 1000;

    // Hard wall-clock deadline measured from submission
    Duration default_deadline = std::chrono::seconds(300);

    // Upper bound for per-request deadlines and await_result waits
    Duration max_deadline = std::chrono::hours(24);

    // Total attempts for a request, including the first
    std::size_t max_attempts = 3;

    // Exponential backoff between retryable failures
    Duration backoff_base = std::chrono::milliseconds(500);
    Duration backoff_max = std::chrono::seconds(30);

    // A waiting request climbs one priority tier per elapsed interval
    // (zero disables aging)
    Duration aging_interval = std::chrono::seconds(30);

    // Terminal descriptors are evicted after this long if never collected
    Duration result_retention = std::chrono::minutes(10);

    // How often the watchdog reclaims stuck requests and sweeps caches
    Duration watchdog_interval = std::chrono::milliseconds(250);

    // How long an idle worker blocks on the queue before re-checking
    Duration worker_poll_interval = std::chrono::milliseconds(50);

    // Quota accounting
    QuotaConfig quota;

    // Provider-client cache
    ClientCacheConfig clients;
};

} // namespace modelgate
