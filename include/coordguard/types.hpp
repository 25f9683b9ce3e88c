#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coordguard {

// Wall-clock time in seconds since the Unix epoch
using Timestamp = double;

// Durations in seconds
using Seconds = double;

// Caller-supplied coordination identifier
using CoordinationId = std::string;

// Work item priority (lower rank = more urgent)
enum class Priority {
    Critical,
    High,
    Medium,
    Low
};

// Task complexity, shrinks the effective batch size when High
enum class Complexity {
    Low,
    Medium,
    High
};

// Coarse execution approach, ordered from cheapest to most conservative
enum class Strategy {
    Direct,
    Parallel,
    Strategic,
    Degraded
};

// Structured error kinds surfaced on the public API
enum class ErrorKind {
    None,
    InvalidCount,
    OverCapacity,
    Busy,
    BudgetExceeded,
    OrphanCompletion,
    PersistenceFailure
};

// A single unit of requested work
struct WorkItem {
    std::string kind;
    std::string description;
    std::string payload;
    Priority    priority{Priority::Medium};
    std::string domain;
    Seconds     estimated_duration{0.0};
    std::vector<std::string> dependencies;  // kinds this item depends on
};

// Process-wide limits for one coordination window
struct ResourceBudget {
    int     max_concurrent_items{10};
    int     max_batch_size{6};           // research-tuned optimum is 4
    Seconds max_response_time{30.0};     // 0 = unlimited
    double  max_resource_usage{1.0};     // fraction 0..1
    double  current_resource_usage{0.0};
};

// Output of the batch planner, consumed by the external executor
struct CoordinationPlan {
    std::vector<std::vector<WorkItem>> batches;
    Strategy strategy{Strategy::Direct};
    Seconds  estimated_total_time{0.0};
    bool     degraded{false};

    std::size_t item_count() const {
        std::size_t n = 0;
        for (const auto& batch : batches) n += batch.size();
        return n;
    }
};

// Result of an operation that can fail in a recoverable way
struct Status {
    ErrorKind   kind{ErrorKind::None};
    std::string message;

    bool ok() const noexcept { return kind == ErrorKind::None; }

    static Status success() { return Status{}; }
    static Status error(ErrorKind kind, std::string message) {
        return Status{kind, std::move(message)};
    }
};

// Admission controller verdict
struct AdmissionDecision {
    bool        admitted{false};
    ErrorKind   error{ErrorKind::None};
    std::string reason;
    int         estimated_cost{0};
};

inline int priority_rank(Priority p) {
    switch (p) {
        case Priority::Critical: return 0;
        case Priority::High:     return 1;
        case Priority::Medium:   return 2;
        case Priority::Low:      return 3;
    }
    return 3;
}

inline const char* to_string(Priority p) {
    switch (p) {
        case Priority::Critical: return "critical";
        case Priority::High:     return "high";
        case Priority::Medium:   return "medium";
        case Priority::Low:      return "low";
    }
    return "unknown";
}

inline const char* to_string(Complexity c) {
    switch (c) {
        case Complexity::Low:    return "low";
        case Complexity::Medium: return "medium";
        case Complexity::High:   return "high";
    }
    return "unknown";
}

inline const char* to_string(Strategy s) {
    switch (s) {
        case Strategy::Direct:    return "direct";
        case Strategy::Parallel:  return "parallel";
        case Strategy::Strategic: return "strategic";
        case Strategy::Degraded:  return "degraded";
    }
    return "unknown";
}

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:               return "None";
        case ErrorKind::InvalidCount:       return "InvalidCount";
        case ErrorKind::OverCapacity:       return "OverCapacity";
        case ErrorKind::Busy:               return "Busy";
        case ErrorKind::BudgetExceeded:     return "BudgetExceeded";
        case ErrorKind::OrphanCompletion:   return "OrphanCompletion";
        case ErrorKind::PersistenceFailure: return "PersistenceFailure";
    }
    return "Unknown";
}

std::optional<Strategy> parse_strategy(const std::string& name);
std::optional<Priority> parse_priority(const std::string& name);
std::optional<Complexity> parse_complexity(const std::string& name);

} // namespace coordguard
