#include "coordguard/monitor.hpp"
#include "coordguard/logging.hpp"

#include <fmt/format.h>

namespace coordguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::CoordinationAdmitted:  return "CoordinationAdmitted";
        case EventType::CoordinationRejected:  return "CoordinationRejected";
        case EventType::WindowOpened:          return "WindowOpened";
        case EventType::WindowClosed:          return "WindowClosed";
        case EventType::PlanCreated:           return "PlanCreated";
        case EventType::CoordinationStarted:   return "CoordinationStarted";
        case EventType::CoordinationCompleted: return "CoordinationCompleted";
        case EventType::CoordinationFailed:    return "CoordinationFailed";
        case EventType::OrphanCompletion:      return "OrphanCompletion";
        case EventType::PatternCreated:        return "PatternCreated";
        case EventType::PatternUpdated:        return "PatternUpdated";
        case EventType::InsightGenerated:      return "InsightGenerated";
        case EventType::InsightsPruned:        return "InsightsPruned";
        case EventType::StateLoadFailed:       return "StateLoadFailed";
        case EventType::PersistenceFailure:    return "PersistenceFailure";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::CoordinationRejected:
        case EventType::CoordinationCompleted:
        case EventType::CoordinationFailed:
        case EventType::OrphanCompletion:
        case EventType::PatternCreated:
        case EventType::InsightGenerated:
        case EventType::StateLoadFailed:
        case EventType::PersistenceFailure:
            return true;
        default:
            return false;
    }
}

spdlog::level::level_enum level_for(EventType t) {
    switch (t) {
        case EventType::PersistenceFailure:
            return spdlog::level::err;
        case EventType::OrphanCompletion:
        case EventType::StateLoadFailed:
        case EventType::CoordinationFailed:
            return spdlog::level::warn;
        default:
            return spdlog::level::info;
    }
}

std::string describe(const MonitorEvent& event) {
    std::string line = to_string(event.type);

    if (event.coordination_id.has_value()) {
        line += fmt::format(" id={}", event.coordination_id.value());
    }
    if (event.item_count.has_value()) {
        line += fmt::format(" items={}", event.item_count.value());
    }
    if (event.strategy.has_value()) {
        line += fmt::format(" strategy={}", event.strategy.value());
    }
    if (event.pattern_key.has_value()) {
        line += fmt::format(" pattern={}", event.pattern_key.value());
    }
    if (event.error_kind.has_value()) {
        line += fmt::format(" error={}", to_string(event.error_kind.value()));
    }
    if (event.duration_seconds.has_value()) {
        line += fmt::format(" duration={:.3f}s", event.duration_seconds.value());
    }
    if (!event.message.empty()) {
        line += " | " + event.message;
    }
    return line;
}

} // anonymous namespace

// ========== LogMonitor ==========

LogMonitor::LogMonitor(Verbosity v) : verbosity_(v) {}

void LogMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    // Debug prints everything Verbose does, tagged with the event timestamp
    if (verbosity_ == Verbosity::Debug) {
        log::get()->log(level_for(event.type), "{} t={:.3f}", describe(event), event.timestamp);
        return;
    }
    log::get()->log(level_for(event.type), "{}", describe(event));
}

void LogMonitor::on_snapshot(const EngineSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    auto logger = log::get();
    logger->info("=== Engine Snapshot ===");
    logger->info("  Open windows: {}", snapshot.open_windows);
    logger->info("  Resource usage: {:.1f}% of {:.1f}%",
                 snapshot.current_resource_usage * 100.0,
                 snapshot.max_resource_usage * 100.0);
    logger->info("  Events: {} ({} open)", snapshot.total_events, snapshot.open_coordinations);
    logger->info("  Patterns: {}  Insights: {}", snapshot.patterns, snapshot.insights);
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback alert;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::CoordinationAdmitted:
                metrics_.admitted++;
                break;
            case EventType::CoordinationRejected:
                metrics_.rejected++;
                if (event.error_kind.has_value()) {
                    metrics_.rejections_by_kind[event.error_kind.value()]++;
                }
                break;
            case EventType::PlanCreated:
                metrics_.plans_created++;
                break;
            case EventType::CoordinationStarted:
                metrics_.started++;
                break;
            case EventType::CoordinationCompleted:
            case EventType::CoordinationFailed:
                if (event.type == EventType::CoordinationCompleted) {
                    metrics_.completed++;
                } else {
                    metrics_.failed++;
                }
                if (event.duration_seconds.has_value()) {
                    duration_samples_++;
                    duration_sum_ += event.duration_seconds.value();
                    metrics_.average_duration_seconds =
                        duration_sum_ / static_cast<double>(duration_samples_);
                }
                break;
            case EventType::OrphanCompletion:
                metrics_.orphan_completions++;
                break;
            case EventType::PatternCreated:
                metrics_.patterns_created++;
                break;
            case EventType::InsightGenerated:
                metrics_.insights_generated++;
                break;
            case EventType::PersistenceFailure:
                metrics_.persistence_failures++;
                alert = persistence_cb_;
                break;
            default:
                break;
        }
    }

    if (alert) {
        alert(event.message);
    }
}

void MetricsMonitor::on_snapshot(const EngineSnapshot& snapshot) {
    AlertCallback alert;
    double percent = 0.0;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        percent = snapshot.current_resource_usage * 100.0;
        metrics_.resource_usage_percent = percent;
        if (usage_cb_ && percent > usage_threshold_ * 100.0) {
            alert = usage_cb_;
        }
    }

    if (alert) {
        alert(fmt::format("Resource usage {:.1f}% exceeds threshold", percent));
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    duration_samples_ = 0;
    duration_sum_ = 0.0;
}

void MetricsMonitor::set_persistence_failure_alert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    persistence_cb_ = std::move(cb);
}

void MetricsMonitor::set_usage_alert_threshold(double threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    usage_threshold_ = threshold;
    usage_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const EngineSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace coordguard
