#include "coordguard/event_log.hpp"

namespace coordguard {

bool operator==(const CoordinationEvent& a, const CoordinationEvent& b) {
    return a.id == b.id &&
           a.type == b.type &&
           a.timestamp == b.timestamp &&
           a.item_count == b.item_count &&
           a.domains == b.domains &&
           a.strategy == b.strategy &&
           a.duration == b.duration &&
           a.success == b.success &&
           a.items == b.items &&
           a.error_message == b.error_message;
}

std::optional<CoordinationEventType> parse_event_type(const std::string& name) {
    if (name == "start")    return CoordinationEventType::Start;
    if (name == "complete") return CoordinationEventType::Complete;
    if (name == "error")    return CoordinationEventType::Error;
    if (name == "timeout")  return CoordinationEventType::Timeout;
    return std::nullopt;
}

const CoordinationEvent& EventLog::record_start(const CoordinationId& id,
                                                int item_count,
                                                std::vector<std::string> domains,
                                                std::string strategy,
                                                std::optional<std::vector<std::string>> items,
                                                Timestamp now)
{
    CoordinationEvent event;
    event.id = id;
    event.type = CoordinationEventType::Start;
    event.timestamp = now;
    event.item_count = item_count;
    event.domains = std::move(domains);
    event.strategy = std::move(strategy);
    event.items = std::move(items);

    events_.push_back(std::move(event));
    // A repeated Start for an open id supersedes the earlier one
    open_starts_[id] = events_.size() - 1;
    return events_.back();
}

TerminalRecord EventLog::record_terminal(const CoordinationId& id,
                                         CoordinationEventType type,
                                         bool success,
                                         std::optional<std::string> error_message,
                                         Timestamp now)
{
    TerminalRecord record;

    CoordinationEvent event;
    event.id = id;
    event.type = type;
    event.timestamp = now;
    event.success = success;
    event.error_message = std::move(error_message);

    auto it = open_starts_.find(id);
    if (it != open_starts_.end()) {
        const CoordinationEvent& start = events_[it->second];
        event.item_count = start.item_count;
        event.domains = start.domains;
        event.strategy = start.strategy;
        event.items = start.items;
        event.duration = now - start.timestamp;
        record.start = start;
        open_starts_.erase(it);
    } else {
        event.item_count = 0;
        event.strategy = "unknown";
    }

    events_.push_back(event);
    record.event = std::move(event);
    return record;
}

void EventLog::restore(std::vector<CoordinationEvent> events) {
    events_ = std::move(events);
    open_starts_.clear();
    for (std::size_t i = 0; i < events_.size(); ++i) {
        if (events_[i].is_terminal()) {
            open_starts_.erase(events_[i].id);
        } else {
            open_starts_[events_[i].id] = i;
        }
    }
}

const std::vector<CoordinationEvent>& EventLog::events() const noexcept {
    return events_;
}

std::size_t EventLog::size() const noexcept {
    return events_.size();
}

bool EventLog::is_open(const CoordinationId& id) const {
    return open_starts_.count(id) > 0;
}

std::size_t EventLog::open_count() const noexcept {
    return open_starts_.size();
}

} // namespace coordguard
