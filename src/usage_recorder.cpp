#include "modelgate/usage_recorder.hpp"

#include <algorithm>

namespace modelgate {

UsageRecorder::UsageRecorder(std::shared_ptr<UsagePersistence> sink, QuotaConfig config)
    : sink_(std::move(sink))
    , config_(std::move(config)) {}

UsageRecorder::~UsageRecorder() {
    if (running_.load()) {
        stop();
    }
}

void UsageRecorder::enqueue(UsageDelta delta) {
    if (!sink_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(delta));
    }
    cv_.notify_one();
}

void UsageRecorder::start(std::shared_ptr<Monitor> monitor) {
    if (running_.exchange(true)) return;
    monitor_ = std::move(monitor);
    writer_thread_ = std::thread([this] { write_loop(); });
}

void UsageRecorder::stop() {
    if (!running_.exchange(false)) return;
    cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    idle_cv_.notify_all();
}

bool UsageRecorder::is_running() const noexcept {
    return running_.load();
}

bool UsageRecorder::wait_idle(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !in_flight_;
    });
}

bool UsageRecorder::degraded() const noexcept {
    return degraded_.load();
}

std::size_t UsageRecorder::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + (in_flight_ ? 1 : 0);
}

std::uint64_t UsageRecorder::persisted_count() const noexcept {
    return persisted_.load();
}

std::uint64_t UsageRecorder::dropped_count() const noexcept {
    return dropped_.load();
}

void UsageRecorder::write_loop() {
    while (true) {
        UsageDelta delta;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            // Drain what is already queued before honoring stop
            if (queue_.empty()) {
                break;
            }
            delta = std::move(queue_.front());
            queue_.pop_front();
            in_flight_ = true;
        }

        bool stored = persist_with_retry(delta);

        if (stored) {
            persisted_.fetch_add(1);
            if (degraded_.exchange(false)) {
                emit_event(EventType::PersistenceRecovered,
                           "Usage persistence recovered", delta);
            }
        } else {
            dropped_.fetch_add(1);
            degraded_.store(true);
            emit_event(EventType::PersistenceDegraded,
                       "Usage delta kept in memory only after " +
                       std::to_string(config_.persistence_max_attempts) + " attempts",
                       delta, config_.persistence_max_attempts);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
        }
        idle_cv_.notify_all();
    }
}

bool UsageRecorder::persist_with_retry(const UsageDelta& delta) {
    std::size_t max_attempts = std::max<std::size_t>(1, config_.persistence_max_attempts);
    Duration delay = config_.persistence_retry_delay;

    for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
        try {
            sink_->persist_usage_delta(delta.tenant_id, delta.agent_id,
                                       delta.tokens, delta.cost, delta.timestamp);
            return true;
        } catch (const std::exception& e) {
            if (attempt == max_attempts) {
                return false;
            }
            emit_event(EventType::PersistenceRetry,
                       std::string("Persist failed: ") + e.what(), delta, attempt);
        }

        // stop() cuts the backoff short; remaining attempts still run
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, delay, [this] { return !running_.load(); });
        if (running_.load()) {
            delay *= 2;
        } else {
            delay = Duration::zero();
        }
    }
    return false;
}

void UsageRecorder::emit_event(EventType type, const std::string& message,
                               const UsageDelta& delta,
                               std::optional<std::size_t> attempt) {
    if (!monitor_) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.tenant_id = delta.tenant_id;
    event.agent_id = delta.agent_id;
    event.tokens = delta.tokens;
    event.cost = delta.cost;
    event.attempt = attempt;

    monitor_->on_event(event);
}

} // namespace modelgate
