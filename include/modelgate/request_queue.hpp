#pragma once

#include "modelgate/types.hpp"
#include "modelgate/isolation_scope.hpp"

#include <array>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace modelgate {

// Ordering handle for an admitted request. The descriptor itself lives in
// RequestManager; the queue only holds what it needs to order dispatch.
struct QueueEntry {
    RequestId id{0};
    IsolationScope scope;
    Priority priority{Priority::Normal};
    Timestamp enqueued_at{};
    std::uint64_t sequence{0};

    QueueEntry(RequestId id_, IsolationScope scope_, Priority priority_)
        : id(id_), scope(std::move(scope_)), priority(priority_) {}
};

// Priority queue partitioned by isolation scope.
//
// Each scope owns one FIFO per base priority. Dispatch picks the highest
// effective tier present at any scope head; scopes tied at that tier are
// served round-robin. A waiting entry climbs one tier per full aging
// interval, capped at Urgent.
class RequestQueue {
public:
    RequestQueue(std::size_t max_queue_size = 10000,
                 std::size_t max_queue_per_scope = 1000,
                 Duration aging_interval = std::chrono::seconds(30));

    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    // Throws QueueFullException when the global or per-scope bound is hit.
    // Stamps enqueued_at and sequence.
    void push(QueueEntry entry);

    // Parks a retry until ready_at. Retries were already admitted, so they
    // are not subject to the capacity bounds.
    void push_delayed(QueueEntry entry, Timestamp ready_at);

    std::optional<QueueEntry> pop();

    // Block until an entry is dispatchable, the queue closes, or timeout elapses.
    std::optional<QueueEntry> wait_and_pop(Duration timeout);

    // Remove a ready or delayed entry
    bool remove(RequestId id);

    Priority effective_priority(const QueueEntry& entry, Timestamp now) const;

    // Sizes
    std::size_t size() const;            // ready + delayed
    std::size_t ready_size() const;
    std::size_t delayed_size() const;
    std::size_t size_for_scope(const IsolationScope& scope) const;
    std::array<std::size_t, PRIORITY_TIER_COUNT> size_by_priority() const;
    std::size_t active_scopes() const;
    bool empty() const;
    std::size_t max_size() const noexcept;

    void notify();

    // A closed queue rejects pushes and wakes every waiter
    void close();
    void reopen();
    bool closed() const;

private:
    struct ScopeQueue {
        std::array<std::deque<QueueEntry>, PRIORITY_TIER_COUNT> tiers;
        std::size_t size{0};
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t max_queue_size_;
    std::size_t max_queue_per_scope_;
    Duration aging_interval_;
    bool closed_{false};

    std::unordered_map<IsolationScope, ScopeQueue> scopes_;
    std::vector<IsolationScope> rotation_;
    std::array<std::size_t, PRIORITY_TIER_COUNT> cursor_{};
    std::multimap<Timestamp, QueueEntry> delayed_;
    std::size_t ready_count_{0};
    std::uint64_t next_sequence_{1};

    // Caller must hold mutex_
    void insert_ready(QueueEntry entry, Timestamp now);
    void promote_due(Timestamp now);
    std::optional<QueueEntry> select_next(Timestamp now);
    void drop_scope(const IsolationScope& scope);
    int effective_tier(const QueueEntry& entry, Timestamp now) const;
};

} // namespace modelgate
