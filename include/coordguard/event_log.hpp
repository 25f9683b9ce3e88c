#pragma once

#include "coordguard/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordguard {

enum class CoordinationEventType {
    Start,
    Complete,
    Error,
    Timeout
};

// Append-only lifecycle record. A Start and a terminal event sharing the same
// id form one completed coordination.
struct CoordinationEvent {
    CoordinationId id;
    CoordinationEventType type{CoordinationEventType::Start};
    Timestamp timestamp{0.0};
    int item_count{0};
    std::vector<std::string> domains;
    std::string strategy;
    std::optional<Seconds> duration;
    std::optional<bool> success;
    std::optional<std::vector<std::string>> items;  // kinds of the coordinated work items
    std::optional<std::string> error_message;

    bool is_terminal() const noexcept { return type != CoordinationEventType::Start; }
};

bool operator==(const CoordinationEvent& a, const CoordinationEvent& b);
inline bool operator!=(const CoordinationEvent& a, const CoordinationEvent& b) { return !(a == b); }

// Result of closing a coordination
struct TerminalRecord {
    CoordinationEvent event;
    std::optional<CoordinationEvent> start;  // empty for an orphan completion

    bool is_orphan() const noexcept { return !start.has_value(); }
};

// Per-id state machine: Start -> {Complete | Error | Timeout}.
// Not synchronized; the owning engine serializes access.
class EventLog {
public:
    const CoordinationEvent& record_start(const CoordinationId& id,
                                          int item_count,
                                          std::vector<std::string> domains,
                                          std::string strategy,
                                          std::optional<std::vector<std::string>> items,
                                          Timestamp now);

    TerminalRecord record_terminal(const CoordinationId& id,
                                   CoordinationEventType type,
                                   bool success,
                                   std::optional<std::string> error_message,
                                   Timestamp now);

    // Replace the log with persisted events and rebuild open coordinations
    void restore(std::vector<CoordinationEvent> events);

    const std::vector<CoordinationEvent>& events() const noexcept;
    std::size_t size() const noexcept;
    bool is_open(const CoordinationId& id) const;
    std::size_t open_count() const noexcept;

private:
    std::vector<CoordinationEvent> events_;
    std::unordered_map<CoordinationId, std::size_t> open_starts_;  // id -> index in events_
};

inline const char* to_string(CoordinationEventType t) {
    switch (t) {
        case CoordinationEventType::Start:    return "start";
        case CoordinationEventType::Complete: return "complete";
        case CoordinationEventType::Error:    return "error";
        case CoordinationEventType::Timeout:  return "timeout";
    }
    return "unknown";
}

std::optional<CoordinationEventType> parse_event_type(const std::string& name);

} // namespace coordguard
