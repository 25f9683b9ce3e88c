#include "coordguard/admission_controller.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

namespace coordguard {

AdmissionController::AdmissionController(ResourceBudget budget, AdmissionConfig config)
    : config_(std::move(config))
    , budget_(budget) {}

// ========== Admission ==========

AdmissionDecision AdmissionController::can_admit(int item_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_locked(item_count);
}

AdmissionDecision AdmissionController::try_begin_window(int item_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto decision = check_locked(item_count);
    if (decision.admitted) {
        open_window_locked(item_count);
    }
    return decision;
}

AdmissionDecision AdmissionController::check_locked(int item_count) const {
    AdmissionDecision decision;

    if (item_count <= 0) {
        decision.error = ErrorKind::InvalidCount;
        decision.reason = "Invalid item count: " + std::to_string(item_count);
        return decision;
    }

    if (item_count > budget_.max_concurrent_items) {
        decision.error = ErrorKind::OverCapacity;
        decision.reason = "Exceeds limit of " + std::to_string(budget_.max_concurrent_items) +
                          " concurrent items (requested " + std::to_string(item_count) + ")";
        return decision;
    }

    if (open_windows_ > 0) {
        decision.error = ErrorKind::Busy;
        decision.reason = "Another coordination is already in progress";
        return decision;
    }

    decision.estimated_cost = estimate_cost(item_count);
    if (decision.estimated_cost > config_.cost_warning_threshold) {
        decision.error = ErrorKind::BudgetExceeded;
        decision.reason = "Estimated cost (" + std::to_string(decision.estimated_cost) +
                          ") exceeds warning threshold " +
                          std::to_string(config_.cost_warning_threshold);
        return decision;
    }

    if (budget_.current_resource_usage + usage_share(item_count) > budget_.max_resource_usage) {
        decision.error = ErrorKind::BudgetExceeded;
        decision.reason = "Resource usage would exceed " +
                          std::to_string(budget_.max_resource_usage);
        return decision;
    }

    decision.admitted = true;
    decision.reason = "ok";
    return decision;
}

void AdmissionController::begin_window(int item_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_window_locked(item_count);
}

void AdmissionController::open_window_locked(int item_count) {
    open_windows_++;
    double share = item_count > 0 ? usage_share(item_count) : 0.0;
    window_usage_.push_back(share);
    budget_.current_resource_usage =
        std::accumulate(window_usage_.begin(), window_usage_.end(), 0.0);
}

void AdmissionController::end_window() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_windows_ = std::max(0, open_windows_ - 1);
    if (!window_usage_.empty()) {
        window_usage_.pop_back();
    }
    budget_.current_resource_usage =
        std::accumulate(window_usage_.begin(), window_usage_.end(), 0.0);
}

int AdmissionController::open_windows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_windows_;
}

// ========== Estimation ==========

int AdmissionController::estimate_cost(int item_count) const noexcept {
    const long long n = std::max(0, item_count);
    const long long overhead = std::min<long long>(n * config_.per_item_overhead,
                                                   config_.overhead_cap);
    const long long cost = config_.base_cost + n * config_.per_item_cost + overhead;
    // Saturates for item counts far beyond any budget
    return static_cast<int>(std::min<long long>(cost, std::numeric_limits<int>::max()));
}

Seconds AdmissionController::estimate_duration(int item_count) const noexcept {
    if (item_count <= 1) {
        return 1.0;
    }
    if (item_count <= 4) {
        return 2.0 + (item_count - 1) * 0.5;
    }
    return 4.0 + (item_count - 4) * 0.3;
}

BatchingSuggestion AdmissionController::suggest_batching(int item_count) const {
    BatchingSuggestion s;
    s.items_per_batch = item_count;
    s.estimated_duration = estimate_duration(item_count);

    if (item_count <= 2) {
        s.kind = BatchingSuggestion::Kind::Direct;
        s.description = "Direct coordination - single item or simple pair";
        return s;
    }
    if (item_count <= config_.small_batch_max) {
        s.kind = BatchingSuggestion::Kind::SmallBatch;
        s.description = "Small batch coordination";
        return s;
    }
    if (item_count <= config_.large_batch_max) {
        s.kind = BatchingSuggestion::Kind::LargeBatch;
        s.description = "Large batch coordination - approaching limits";
        return s;
    }

    int size = std::max(1, config_.optimal_batch_size);
    s.kind = BatchingSuggestion::Kind::Sequential;
    s.items_per_batch = size;
    s.batches = (item_count + size - 1) / size;
    s.estimated_duration = estimate_duration(item_count) * s.batches *
                           config_.sequential_overlap_factor;
    s.description = "Sequential batching recommended - " + std::to_string(s.batches) +
                    " batches of ~" + std::to_string(size) + " items";
    return s;
}

// ========== Performance history ==========

void AdmissionController::record_performance(int item_count, Seconds actual_duration,
                                             Strategy strategy, std::optional<int> cost_used) {
    PerformanceRecord record;
    record.item_count = item_count;
    record.estimated_cost = cost_used.value_or(estimate_cost(item_count));
    record.duration = actual_duration;
    record.strategy = strategy;

    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(record);
    while (history_.size() > config_.history_capacity) {
        history_.pop_front();
    }
}

std::optional<PerformanceSummary> AdmissionController::performance_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.empty()) {
        return std::nullopt;
    }

    PerformanceSummary summary;
    summary.total_coordinations = history_.size();

    std::size_t window = std::min(config_.summary_window, history_.size());
    summary.recent_coordinations = window;

    double duration_sum = 0.0;
    double items_sum = 0.0;
    double cost_sum = 0.0;
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(window); it != history_.end(); ++it) {
        duration_sum += it->duration;
        items_sum += it->item_count;
        cost_sum += it->estimated_cost;
        summary.strategy_distribution[to_string(it->strategy)]++;
    }
    summary.average_duration = duration_sum / static_cast<double>(window);
    summary.average_items = items_sum / static_cast<double>(window);
    summary.average_cost = cost_sum / static_cast<double>(window);

    for (const auto& record : history_) {
        summary.max_items_coordinated = std::max(summary.max_items_coordinated, record.item_count);
        summary.total_estimated_cost += record.estimated_cost;
    }
    return summary;
}

// ========== Accessors ==========

ResourceBudget AdmissionController::budget() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_;
}

const AdmissionConfig& AdmissionController::config() const noexcept {
    return config_;
}

double AdmissionController::usage_share(int item_count) const noexcept {
    if (config_.cost_warning_threshold <= 0) {
        return 0.0;
    }
    double share = static_cast<double>(estimate_cost(item_count)) /
                   static_cast<double>(config_.cost_warning_threshold);
    return std::min(1.0, share);
}

} // namespace coordguard
