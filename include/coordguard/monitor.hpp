#pragma once

#include "coordguard/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coordguard {

enum class EventType {
    CoordinationAdmitted,
    CoordinationRejected,
    WindowOpened,
    WindowClosed,
    PlanCreated,
    // Lifecycle reports from the executor
    CoordinationStarted,
    CoordinationCompleted,
    CoordinationFailed,
    OrphanCompletion,
    // Learning
    PatternCreated,
    PatternUpdated,
    InsightGenerated,
    InsightsPruned,
    // State store
    StateLoadFailed,
    PersistenceFailure
};

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<CoordinationId> coordination_id;
    std::optional<int> item_count;
    std::optional<std::string> strategy;
    std::optional<std::string> pattern_key;
    std::optional<ErrorKind> error_kind;

    // Measured coordination duration (terminal reports only)
    std::optional<Seconds> duration_seconds;
};

// Point-in-time view of an engine for monitoring
struct EngineSnapshot {
    Timestamp timestamp{};
    int open_windows{0};
    double current_resource_usage{0.0};
    double max_resource_usage{1.0};
    std::size_t total_events{0};
    std::size_t open_coordinations{0};
    std::size_t patterns{0};
    std::size_t insights{0};
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const EngineSnapshot& snapshot) = 0;
};

// Writes events through the shared spdlog logger
class LogMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit LogMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const EngineSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
};

// Counters over the event stream
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t admitted{0};
        std::uint64_t rejected{0};
        std::map<ErrorKind, std::uint64_t> rejections_by_kind;
        std::uint64_t plans_created{0};
        std::uint64_t started{0};
        std::uint64_t completed{0};
        std::uint64_t failed{0};
        std::uint64_t orphan_completions{0};
        std::uint64_t patterns_created{0};
        std::uint64_t insights_generated{0};
        std::uint64_t persistence_failures{0};
        double average_duration_seconds{0.0};
        double resource_usage_percent{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const EngineSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_persistence_failure_alert(AlertCallback cb);
    void set_usage_alert_threshold(double threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    AlertCallback persistence_cb_;
    double usage_threshold_{1.1};  // > 1.0 means disabled
    AlertCallback usage_cb_;

    std::uint64_t duration_samples_{0};
    double duration_sum_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const EngineSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

const char* to_string(EventType t);

} // namespace coordguard
