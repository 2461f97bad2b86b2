#pragma once

#include "modelgate/types.hpp"
#include "modelgate/config.hpp"
#include "modelgate/collaborators.hpp"
#include "modelgate/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace modelgate {

struct UsageDelta {
    TenantId tenant_id;
    AgentName agent_id;
    TokenCount tokens{0};
    Cost cost{0.0};
    WallTime timestamp{};
};

// Background writer that forwards usage deltas to the persistence
// collaborator with retry. Callers never block on the sink; a delta that
// exhausts its attempts is dropped and the recorder reports degraded
// until a later delta is stored successfully.
class UsageRecorder {
public:
    UsageRecorder(std::shared_ptr<UsagePersistence> sink, QuotaConfig config);
    ~UsageRecorder();

    // Non-copyable
    UsageRecorder(const UsageRecorder&) = delete;
    UsageRecorder& operator=(const UsageRecorder&) = delete;

    void enqueue(UsageDelta delta);

    // Lifecycle
    void start(std::shared_ptr<Monitor> monitor);
    void stop();
    bool is_running() const noexcept;

    // Blocks until every queued delta has been handled or timeout elapses.
    bool wait_idle(Duration timeout);

    // Queries
    bool degraded() const noexcept;
    std::size_t pending() const;
    std::uint64_t persisted_count() const noexcept;
    std::uint64_t dropped_count() const noexcept;

private:
    std::shared_ptr<UsagePersistence> sink_;
    QuotaConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<UsageDelta> queue_;
    bool in_flight_{false};

    std::thread writer_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> degraded_{false};
    std::atomic<std::uint64_t> persisted_{0};
    std::atomic<std::uint64_t> dropped_{0};

    void write_loop();
    bool persist_with_retry(const UsageDelta& delta);
    void emit_event(EventType type, const std::string& message, const UsageDelta& delta,
                    std::optional<std::size_t> attempt = std::nullopt);
};

} // namespace modelgate
