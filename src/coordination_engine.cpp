#include "coordguard/coordination_engine.hpp"
#include "coordguard/exceptions.hpp"
#include "coordguard/logging.hpp"

#include <algorithm>
#include <set>

namespace coordguard {

namespace {

std::shared_ptr<StateStore> default_store(std::shared_ptr<StateStore> store,
                                          const PersistenceConfig& persistence) {
    if (store) return store;
    if (persistence.enabled && !persistence.data_dir.empty()) {
        return std::make_shared<JsonFileStateStore>(persistence.data_dir);
    }
    return std::make_shared<MemoryStateStore>();
}

std::shared_ptr<Clock> default_clock(std::shared_ptr<Clock> clock) {
    if (clock) return clock;
    return std::make_shared<SystemClock>();
}

// Distinct non-empty item domains in first-seen order
std::vector<std::string> item_domains(const std::vector<WorkItem>& items) {
    std::vector<std::string> domains;
    std::set<std::string> seen;
    for (const auto& item : items) {
        if (item.domain.empty()) continue;
        if (seen.insert(item.domain).second) {
            domains.push_back(item.domain);
        }
    }
    return domains;
}

} // anonymous namespace

template <typename SaveFn>
Status CoordinationEngine::persist_locked(const char* what, SaveFn save, PendingEvents& pending) {
    try {
        save();
        persistence_status_ = Status::success();
    } catch (const PersistenceException& e) {
        log::get()->error("Could not save {}: {}", what, e.what());
        persistence_status_ = Status::error(ErrorKind::PersistenceFailure, e.what());

        auto event = make_event(EventType::PersistenceFailure, e.what());
        event.error_kind = ErrorKind::PersistenceFailure;
        pending.push_back(std::move(event));
    }
    return persistence_status_;
}

CoordinationEngine::CoordinationEngine(EngineConfig config,
                                       std::shared_ptr<StateStore> store,
                                       std::shared_ptr<Clock> clock)
    : config_(std::move(config))
    , store_(default_store(std::move(store), config_.persistence))
    , clock_(default_clock(std::move(clock)))
    , admission_(config_.budget, config_.admission)
    , selector_(config_.strategy)
    , planner_(config_.planner)
    , insight_generator_(config_.insights)
    , recommender_(config_.recommend)
    , learner_(config_.learning)
    , analytics_cache_(config_.analytics.cache_ttl)
{
    validate(config_);
    log::set_level(config_.log_level);

    // No monitor can be attached yet; load problems are only logged
    PendingEvents ignored;
    std::lock_guard<std::mutex> lock(state_mutex_);
    load_state_locked(ignored);
}

CoordinationEngine::~CoordinationEngine() = default;

// ==================== Admission ====================

AdmissionDecision CoordinationEngine::can_admit(int item_count) const {
    return admission_.can_admit(item_count);
}

AdmissionDecision CoordinationEngine::try_begin_window(int item_count) {
    auto decision = admission_.try_begin_window(item_count);

    if (!decision.admitted) {
        auto event = make_event(EventType::CoordinationRejected, decision.reason);
        event.item_count = item_count;
        event.error_kind = decision.error;
        emit({event});
        return decision;
    }

    auto event = make_event(EventType::WindowOpened, "Coordination window opened");
    event.item_count = item_count;
    emit({event});
    publish_snapshot();
    return decision;
}

void CoordinationEngine::begin_window(int item_count) {
    admission_.begin_window(item_count);

    auto event = make_event(EventType::WindowOpened, "Coordination window opened");
    if (item_count > 0) event.item_count = item_count;
    emit({event});
    publish_snapshot();
}

void CoordinationEngine::end_window() {
    admission_.end_window();
    emit({make_event(EventType::WindowClosed, "Coordination window closed")});
    publish_snapshot();
}

int CoordinationEngine::open_windows() const {
    return admission_.open_windows();
}

BatchingSuggestion CoordinationEngine::suggest_batching(int item_count) const {
    return admission_.suggest_batching(item_count);
}

std::optional<PerformanceSummary> CoordinationEngine::performance_summary() const {
    return admission_.performance_summary();
}

// ==================== Strategy & Planning ====================

Strategy CoordinationEngine::select_strategy(int item_count,
                                             const std::vector<std::string>& domains,
                                             bool violates_constraints) const {
    return selector_.select(item_count, domains, violates_constraints);
}

CoordinationPlan CoordinationEngine::plan(const std::vector<WorkItem>& items,
                                          Complexity complexity) const {
    return planner_.plan(items, admission_.budget(), complexity);
}

CoordinationPlan CoordinationEngine::plan(const std::vector<WorkItem>& items,
                                          const ResourceBudget& budget,
                                          Complexity complexity) const {
    return planner_.plan(items, budget, complexity);
}

CoordinationResult CoordinationEngine::coordinate(const std::vector<WorkItem>& items,
                                                  Complexity complexity) {
    CoordinationResult result;
    const int count = static_cast<int>(items.size());
    const auto domains = item_domains(items);

    result.admission = admission_.can_admit(count);
    result.recommendation = recommend(domains, count);

    PendingEvents pending;
    if (result.admission.admitted) {
        auto event = make_event(EventType::CoordinationAdmitted, result.admission.reason);
        event.item_count = count;
        pending.push_back(std::move(event));
    } else {
        auto event = make_event(EventType::CoordinationRejected, result.admission.reason);
        event.item_count = count;
        event.error_kind = result.admission.error;
        pending.push_back(std::move(event));
    }

    // Over-limit requests still get a (degraded) plan; invalid or busy ones do not
    const bool plannable = result.admission.error != ErrorKind::InvalidCount &&
                           result.admission.error != ErrorKind::Busy;
    result.selected_strategy = selector_.select(count, domains, !result.admission.admitted);

    if (plannable) {
        result.plan = planner_.plan(items, admission_.budget(), complexity);

        auto event = make_event(EventType::PlanCreated,
                                std::to_string(result.plan->batches.size()) + " batch(es)");
        event.item_count = count;
        event.strategy = to_string(result.plan->strategy);
        pending.push_back(std::move(event));
    }

    emit(pending);
    return result;
}

// ==================== Lifecycle Reporting ====================

Status CoordinationEngine::report_start(const CoordinationId& id,
                                        int item_count,
                                        std::vector<std::string> domains,
                                        std::string strategy,
                                        std::optional<std::vector<std::string>> items) {
    PendingEvents pending;
    Status status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const auto& event = event_log_.record_start(id, item_count, std::move(domains),
                                                    std::move(strategy), std::move(items),
                                                    clock_->now());
        analytics_cache_.invalidate();

        auto started = make_event(EventType::CoordinationStarted, "Coordination started");
        started.coordination_id = id;
        started.item_count = event.item_count;
        started.strategy = event.strategy;
        pending.push_back(std::move(started));

        status = persist_locked("events", [this] { store_->save_events(event_log_.events()); },
                                pending);
    }
    emit(pending);
    return status;
}

Status CoordinationEngine::report_complete(const CoordinationId& id,
                                           bool success,
                                           std::optional<std::string> error_message) {
    auto type = success ? CoordinationEventType::Complete : CoordinationEventType::Error;
    return report_terminal(id, type, success, std::move(error_message));
}

Status CoordinationEngine::report_timeout(const CoordinationId& id) {
    return report_terminal(id, CoordinationEventType::Timeout, false,
                           std::string("Coordination timed out"));
}

Status CoordinationEngine::report_terminal(const CoordinationId& id,
                                           CoordinationEventType type,
                                           bool success,
                                           std::optional<std::string> error_message) {
    PendingEvents pending;
    Status status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto record = event_log_.record_terminal(id, type, success, std::move(error_message),
                                                 clock_->now());
        analytics_cache_.invalidate();

        if (record.is_orphan()) {
            log::get()->warn("Terminal report for unknown coordination '{}'", id);

            auto orphan = make_event(EventType::OrphanCompletion,
                                     "No open start for this coordination");
            orphan.coordination_id = id;
            orphan.error_kind = ErrorKind::OrphanCompletion;
            pending.push_back(std::move(orphan));

            status = persist_locked("events",
                                    [this] { store_->save_events(event_log_.events()); },
                                    pending);
            if (status.ok()) {
                status = Status::error(ErrorKind::OrphanCompletion,
                                       "No open coordination with id '" + id + "'");
            }
        } else {
            const auto& event = record.event;

            auto done = make_event(success ? EventType::CoordinationCompleted
                                           : EventType::CoordinationFailed,
                                   event.error_message.value_or(""));
            done.coordination_id = id;
            done.item_count = event.item_count;
            done.strategy = event.strategy;
            done.duration_seconds = event.duration;
            pending.push_back(std::move(done));

            auto learned = learner_.learn(*record.start, event);
            auto key = learned.pattern.key.to_string();
            if (learned.created) {
                log::get()->debug("Learned new pattern {}", key);
            }
            auto pattern_event = make_event(learned.created ? EventType::PatternCreated
                                                            : EventType::PatternUpdated,
                                            "");
            pattern_event.pattern_key = key;
            pattern_event.coordination_id = id;
            pending.push_back(std::move(pattern_event));

            if (auto strategy = parse_strategy(event.strategy)) {
                admission_.record_performance(event.item_count, event.duration.value_or(0.0),
                                              *strategy);
            }

            auto events_status = persist_locked(
                "events", [this] { store_->save_events(event_log_.events()); }, pending);
            auto patterns_status = persist_locked(
                "patterns", [this] { store_->save_patterns(learner_.patterns()); }, pending);
            status = events_status.ok() ? patterns_status : events_status;
            persistence_status_ = status;
        }
    }
    emit(pending);
    return status;
}

// ==================== Learning Queries ====================

Analytics CoordinationEngine::get_analytics() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return analytics_locked(clock_->now());
}

std::vector<Insight> CoordinationEngine::generate_insights() {
    PendingEvents pending;
    std::vector<Insight> fresh;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const Timestamp now = clock_->now();

        auto analytics = analytics_locked(now);
        fresh = insight_generator_.generate(learner_.patterns(), analytics, now);
        auto pruned = insight_generator_.merge(insights_, fresh, now);
        analytics_cache_.invalidate();

        for (const auto& insight : fresh) {
            auto event = make_event(EventType::InsightGenerated, insight.description);
            event.pattern_key = insight.id;
            pending.push_back(std::move(event));
        }
        if (pruned > 0) {
            pending.push_back(make_event(EventType::InsightsPruned,
                                         std::to_string(pruned) + " expired insight(s) removed"));
        }

        // Failure is recorded in last_persistence_status()
        persist_locked("insights", [this] { store_->save_insights(insights_); }, pending);
    }
    emit(pending);
    return fresh;
}

Recommendation CoordinationEngine::recommend(const std::vector<std::string>& domains,
                                             int item_count) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return recommender_.recommend(learner_.patterns(), domains, item_count);
}

// ==================== State Access ====================

std::vector<CoordinationEvent> CoordinationEngine::events() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return event_log_.events();
}

PatternMap CoordinationEngine::patterns() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return learner_.patterns();
}

std::optional<Pattern> CoordinationEngine::find_pattern(const PatternKey& key) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return learner_.find(key);
}

std::vector<Insight> CoordinationEngine::insights() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return insights_;
}

EngineSnapshot CoordinationEngine::snapshot() const {
    auto budget = admission_.budget();

    EngineSnapshot snap;
    snap.timestamp = clock_->now();
    snap.open_windows = admission_.open_windows();
    snap.current_resource_usage = budget.current_resource_usage;
    snap.max_resource_usage = budget.max_resource_usage;

    std::lock_guard<std::mutex> lock(state_mutex_);
    snap.total_events = event_log_.size();
    snap.open_coordinations = event_log_.open_count();
    snap.patterns = learner_.size();
    snap.insights = insights_.size();
    return snap;
}

void CoordinationEngine::publish_snapshot() const {
    auto monitor = current_monitor();
    if (monitor) {
        monitor->on_snapshot(snapshot());
    }
}

Status CoordinationEngine::reload() {
    PendingEvents pending;
    Status status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status = load_state_locked(pending);
    }
    emit(pending);
    return status;
}

// ==================== Configuration ====================

void CoordinationEngine::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    monitor_ = std::move(monitor);
}

const EngineConfig& CoordinationEngine::config() const noexcept {
    return config_;
}

Status CoordinationEngine::last_persistence_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return persistence_status_;
}

// ==================== Internals ====================

Status CoordinationEngine::load_state_locked(PendingEvents& pending) {
    Status status;
    try {
        event_log_.restore(store_->load_events());
        learner_.restore(store_->load_patterns());
        insights_ = store_->load_insights();
    } catch (const CoordGuardException& e) {
        // A store that cannot be read leaves the engine empty, never half-loaded
        log::get()->warn("Failed to load coordination state: {}", e.what());
        event_log_.restore({});
        learner_.restore({});
        insights_.clear();
        status = Status::error(ErrorKind::PersistenceFailure, e.what());
        pending.push_back(make_event(EventType::StateLoadFailed, e.what()));
    }
    analytics_cache_.invalidate();

    log::get()->debug("Loaded {} events, {} patterns, {} insights",
                      event_log_.size(), learner_.size(), insights_.size());
    return status;
}

Analytics CoordinationEngine::analytics_locked(Timestamp now) {
    if (auto cached = analytics_cache_.get(now)) {
        return *cached;
    }
    auto analytics = build_analytics(event_log_.events(), learner_.patterns(),
                                     insights_.size(), now, config_.analytics);
    analytics_cache_.put(analytics, now);
    return analytics;
}

MonitorEvent CoordinationEngine::make_event(EventType type, std::string message) const {
    MonitorEvent event;
    event.type = type;
    event.timestamp = clock_->now();
    event.message = std::move(message);
    return event;
}

void CoordinationEngine::emit(const PendingEvents& pending) const {
    if (pending.empty()) return;
    auto monitor = current_monitor();
    if (!monitor) return;

    for (const auto& event : pending) {
        monitor->on_event(event);
    }
}

std::shared_ptr<Monitor> CoordinationEngine::current_monitor() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return monitor_;
}

} // namespace coordguard
