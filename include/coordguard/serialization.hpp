#pragma once

#include "coordguard/event_log.hpp"
#include "coordguard/insight_generator.hpp"
#include "coordguard/pattern_learner.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace coordguard {

// JSON mapping for the three persisted documents.
// The *_from_json functions throw SerializationException on bad input.

Json::Value to_json(const CoordinationEvent& event);
Json::Value to_json(const Pattern& pattern);
Json::Value to_json(const Insight& insight);

CoordinationEvent event_from_json(const Json::Value& value);
Pattern pattern_from_json(const Json::Value& value);
Insight insight_from_json(const Json::Value& value);

// Whole documents: events[] / patterns{id: pattern} / insights[]
std::string events_to_string(const std::vector<CoordinationEvent>& events);
std::string patterns_to_string(const PatternMap& patterns);
std::string insights_to_string(const std::vector<Insight>& insights);

std::vector<CoordinationEvent> events_from_string(const std::string& text);
PatternMap patterns_from_string(const std::string& text);
std::vector<Insight> insights_from_string(const std::string& text);

} // namespace coordguard
