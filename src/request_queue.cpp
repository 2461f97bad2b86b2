#include "modelgate/request_queue.hpp"
#include "modelgate/exceptions.hpp"

#include <algorithm>

namespace modelgate {

RequestQueue::RequestQueue(std::size_t max_queue_size,
                           std::size_t max_queue_per_scope,
                           Duration aging_interval)
    : max_queue_size_(max_queue_size)
    , max_queue_per_scope_(max_queue_per_scope)
    , aging_interval_(aging_interval)
{}

void RequestQueue::push(QueueEntry entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw QueueFullException(entry.id);
        }
        if (ready_count_ + delayed_.size() >= max_queue_size_) {
            throw QueueFullException(entry.id);
        }
        auto it = scopes_.find(entry.scope);
        if (it != scopes_.end() && it->second.size >= max_queue_per_scope_) {
            throw QueueFullException(entry.id, entry.scope.full_key());
        }
        insert_ready(std::move(entry), Clock::now());
    }
    cv_.notify_one();
}

void RequestQueue::push_delayed(QueueEntry entry, Timestamp ready_at) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delayed_.emplace(ready_at, std::move(entry));
    }
    // Wake a waiter so it can recompute its sleep against the new deadline
    cv_.notify_one();
}

std::optional<QueueEntry> RequestQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    promote_due(now);
    return select_next(now);
}

std::optional<QueueEntry> RequestQueue::wait_and_pop(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = Clock::now() + timeout;

    while (true) {
        if (closed_) {
            return std::nullopt;
        }
        auto now = Clock::now();
        promote_due(now);
        if (auto entry = select_next(now)) {
            return entry;
        }
        if (now >= deadline) {
            return std::nullopt;
        }

        auto wake_at = deadline;
        if (!delayed_.empty()) {
            wake_at = std::min(wake_at, delayed_.begin()->first);
        }
        cv_.wait_until(lock, wake_at);
    }
}

bool RequestQueue::remove(RequestId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = delayed_.begin(); it != delayed_.end(); ++it) {
        if (it->second.id == id) {
            delayed_.erase(it);
            return true;
        }
    }

    for (auto& [scope, sq] : scopes_) {
        for (auto& tier : sq.tiers) {
            auto it = std::find_if(tier.begin(), tier.end(),
                [id](const QueueEntry& e) { return e.id == id; });
            if (it != tier.end()) {
                tier.erase(it);
                --sq.size;
                --ready_count_;
                if (sq.size == 0) {
                    // Copy: drop_scope erases the map node holding `scope`
                    IsolationScope key = scope;
                    drop_scope(key);
                }
                return true;
            }
        }
    }
    return false;
}

Priority RequestQueue::effective_priority(const QueueEntry& entry, Timestamp now) const {
    return static_cast<Priority>(effective_tier(entry, now));
}

std::size_t RequestQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_count_ + delayed_.size();
}

std::size_t RequestQueue::ready_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_count_;
}

std::size_t RequestQueue::delayed_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delayed_.size();
}

std::size_t RequestQueue::size_for_scope(const IsolationScope& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scopes_.find(scope);
    return it == scopes_.end() ? 0 : it->second.size;
}

std::array<std::size_t, PRIORITY_TIER_COUNT> RequestQueue::size_by_priority() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::array<std::size_t, PRIORITY_TIER_COUNT> counts{};
    for (const auto& [scope, sq] : scopes_) {
        for (int t = 0; t < PRIORITY_TIER_COUNT; ++t) {
            counts[t] += sq.tiers[t].size();
        }
    }
    for (const auto& [ready_at, entry] : delayed_) {
        counts[static_cast<int>(entry.priority)]++;
    }
    return counts;
}

std::size_t RequestQueue::active_scopes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotation_.size();
}

bool RequestQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_count_ == 0 && delayed_.empty();
}

std::size_t RequestQueue::max_size() const noexcept {
    return max_queue_size_;
}

void RequestQueue::notify() {
    cv_.notify_all();
}

void RequestQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void RequestQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool RequestQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ==================== Internal Helpers ====================

void RequestQueue::insert_ready(QueueEntry entry, Timestamp now) {
    entry.enqueued_at = now;
    entry.sequence = next_sequence_++;

    auto it = scopes_.find(entry.scope);
    if (it == scopes_.end()) {
        it = scopes_.emplace(entry.scope, ScopeQueue{}).first;
        rotation_.push_back(entry.scope);
    }
    auto tier = static_cast<int>(entry.priority);
    it->second.tiers[tier].push_back(std::move(entry));
    it->second.size++;
    ready_count_++;
}

void RequestQueue::promote_due(Timestamp now) {
    while (!delayed_.empty() && delayed_.begin()->first <= now) {
        auto node = delayed_.extract(delayed_.begin());
        insert_ready(std::move(node.mapped()), now);
    }
}

int RequestQueue::effective_tier(const QueueEntry& entry, Timestamp now) const {
    int tier = static_cast<int>(entry.priority);
    if (aging_interval_ > Duration::zero() && now > entry.enqueued_at) {
        auto steps = (now - entry.enqueued_at) / aging_interval_;
        tier += static_cast<int>(std::min<decltype(steps)>(steps, PRIORITY_TIER_COUNT));
    }
    return std::min(tier, PRIORITY_TIER_COUNT - 1);
}

std::optional<QueueEntry> RequestQueue::select_next(Timestamp now) {
    if (ready_count_ == 0) {
        return std::nullopt;
    }

    // Best head per scope: highest effective tier, then earliest sequence
    struct Candidate {
        int tier{-1};
        int base{-1};
        std::uint64_t sequence{0};
    };

    std::vector<Candidate> candidates(rotation_.size());
    int best_tier = -1;

    for (std::size_t i = 0; i < rotation_.size(); ++i) {
        const auto& sq = scopes_.at(rotation_[i]);
        Candidate& c = candidates[i];
        for (int base = 0; base < PRIORITY_TIER_COUNT; ++base) {
            if (sq.tiers[base].empty()) continue;
            const auto& head = sq.tiers[base].front();
            int tier = effective_tier(head, now);
            if (tier > c.tier || (tier == c.tier && head.sequence < c.sequence)) {
                c.tier = tier;
                c.base = base;
                c.sequence = head.sequence;
            }
        }
        best_tier = std::max(best_tier, c.tier);
    }

    if (best_tier < 0) {
        return std::nullopt;
    }

    // Round-robin over scopes tied at the winning tier
    const std::size_t n = rotation_.size();
    std::size_t start = cursor_[best_tier] % n;
    std::size_t chosen = start;
    for (std::size_t k = 0; k < n; ++k) {
        std::size_t idx = (start + k) % n;
        if (candidates[idx].tier == best_tier) {
            chosen = idx;
            break;
        }
    }
    cursor_[best_tier] = chosen + 1;

    IsolationScope scope = rotation_[chosen];
    auto& sq = scopes_.at(scope);
    auto& fifo = sq.tiers[candidates[chosen].base];
    QueueEntry entry = std::move(fifo.front());
    fifo.pop_front();
    sq.size--;
    ready_count_--;

    if (sq.size == 0) {
        drop_scope(scope);
    }
    return entry;
}

void RequestQueue::drop_scope(const IsolationScope& scope) {
    scopes_.erase(scope);
    auto it = std::find(rotation_.begin(), rotation_.end(), scope);
    if (it == rotation_.end()) return;

    auto idx = static_cast<std::size_t>(it - rotation_.begin());
    rotation_.erase(it);
    for (auto& c : cursor_) {
        if (c > idx) --c;
    }
}

} // namespace modelgate
