#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

// Unique identifiers
using RequestId = std::uint64_t;
using TenantId = std::string;
using AgentName = std::string;
using ProviderIdentity = std::string;

// Token counts and monetary cost
using TokenCount = std::int64_t;
using Cost = double;

// Scheduling time (monotonic)
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Accounting time (calendar based, for day/month periods)
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// Opaque request payload; the scheduler never inspects it
using Payload = std::string;

// Request priority tiers, lowest to highest
enum class Priority {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

constexpr int PRIORITY_TIER_COUNT = 4;

// Request lifecycle
enum class RequestStatus {
    Pending,
    Admitted,
    Running,
    Completed,
    Failed,
    TimedOut,
    Cancelled
};

// Ordered severity of a tenant's proximity to its quota ceiling
enum class QuotaAlertLevel {
    Ok = 0,
    Warning = 1,
    Critical = 2,
    Exceeded = 3
};

// Classification of a terminal error attached to a request
enum class ErrorKind {
    None,
    Validation,
    QuotaExceeded,
    QueueFull,
    ProviderTransient,
    ProviderTerminal,
    Timeout,
    Cancelled,
    ClientResolution,
    Internal
};

struct RequestError {
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

// What a model call produced
struct InvocationResult {
    std::string output;
    TokenCount tokens_used{0};
    Cost cost{0.0};
};

inline bool is_terminal(RequestStatus s) {
    switch (s) {
        case RequestStatus::Completed:
        case RequestStatus::Failed:
        case RequestStatus::TimedOut:
        case RequestStatus::Cancelled:
            return true;
        default:
            return false;
    }
}

inline bool is_valid_priority(Priority p) {
    auto v = static_cast<int>(p);
    return v >= 0 && v < PRIORITY_TIER_COUNT;
}

inline const char* to_string(Priority p) {
    switch (p) {
        case Priority::Low:    return "Low";
        case Priority::Normal: return "Normal";
        case Priority::High:   return "High";
        case Priority::Urgent: return "Urgent";
    }
    return "Unknown";
}

inline const char* to_string(RequestStatus s) {
    switch (s) {
        case RequestStatus::Pending:   return "Pending";
        case RequestStatus::Admitted:  return "Admitted";
        case RequestStatus::Running:   return "Running";
        case RequestStatus::Completed: return "Completed";
        case RequestStatus::Failed:    return "Failed";
        case RequestStatus::TimedOut:  return "TimedOut";
        case RequestStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

inline const char* to_string(QuotaAlertLevel l) {
    switch (l) {
        case QuotaAlertLevel::Ok:       return "Ok";
        case QuotaAlertLevel::Warning:  return "Warning";
        case QuotaAlertLevel::Critical: return "Critical";
        case QuotaAlertLevel::Exceeded: return "Exceeded";
    }
    return "Unknown";
}

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:              return "None";
        case ErrorKind::Validation:        return "Validation";
        case ErrorKind::QuotaExceeded:     return "QuotaExceeded";
        case ErrorKind::QueueFull:         return "QueueFull";
        case ErrorKind::ProviderTransient: return "ProviderTransient";
        case ErrorKind::ProviderTerminal:  return "ProviderTerminal";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::Cancelled:         return "Cancelled";
        case ErrorKind::ClientResolution:  return "ClientResolution";
        case ErrorKind::Internal:          return "Internal";
    }
    return "Unknown";
}

} // namespace modelgate
