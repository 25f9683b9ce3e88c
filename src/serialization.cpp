#include "coordguard/serialization.hpp"
#include "coordguard/exceptions.hpp"

#include <memory>

namespace coordguard {

namespace {

const Json::Value& require(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key)) {
        throw SerializationException(std::string("Missing field: ") + key);
    }
    return obj[key];
}

std::string require_string(const Json::Value& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.isString()) {
        throw SerializationException(std::string("Field is not a string: ") + key);
    }
    return v.asString();
}

double require_double(const Json::Value& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.isNumeric()) {
        throw SerializationException(std::string("Field is not a number: ") + key);
    }
    return v.asDouble();
}

int require_int(const Json::Value& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.isInt()) {
        throw SerializationException(std::string("Field is not an integer: ") + key);
    }
    return v.asInt();
}

std::vector<std::string> require_strings(const Json::Value& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.isArray()) {
        throw SerializationException(std::string("Field is not an array: ") + key);
    }
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto& item : v) {
        if (!item.isString()) {
            throw SerializationException(std::string("Non-string element in: ") + key);
        }
        out.push_back(item.asString());
    }
    return out;
}

// Absent and null both map to nullopt
const Json::Value* optional_field(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key) || obj[key].isNull()) {
        return nullptr;
    }
    return &obj[key];
}

Json::Value string_array(const std::vector<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values) {
        arr.append(v);
    }
    return arr;
}

std::string write(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["precision"] = 17;  // lossless double round-trip
    return Json::writeString(builder, root);
}

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    bool ok = false;
    try {
        ok = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    } catch (const Json::Exception& e) {
        // Nesting beyond the reader's stack limit throws instead of failing
        throw SerializationException(std::string("Malformed JSON: ") + e.what());
    }
    if (!ok) {
        throw SerializationException("Malformed JSON: " + errors);
    }
    return root;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CoordinationEvent
// ---------------------------------------------------------------------------

Json::Value to_json(const CoordinationEvent& event) {
    Json::Value v(Json::objectValue);
    v["id"] = event.id;
    v["type"] = to_string(event.type);
    v["timestamp"] = event.timestamp;
    v["item_count"] = event.item_count;
    v["domains"] = string_array(event.domains);
    v["strategy"] = event.strategy;
    v["duration"] = event.duration ? Json::Value(*event.duration) : Json::Value();
    v["success"] = event.success ? Json::Value(*event.success) : Json::Value();
    v["items"] = event.items ? string_array(*event.items) : Json::Value();
    v["error_message"] = event.error_message ? Json::Value(*event.error_message) : Json::Value();
    return v;
}

CoordinationEvent event_from_json(const Json::Value& value) {
    CoordinationEvent event;
    event.id = require_string(value, "id");

    auto type = parse_event_type(require_string(value, "type"));
    if (!type) {
        throw SerializationException("Unknown event type: " + value["type"].asString());
    }
    event.type = *type;
    event.timestamp = require_double(value, "timestamp");
    event.item_count = require_int(value, "item_count");
    event.domains = require_strings(value, "domains");
    event.strategy = require_string(value, "strategy");

    if (optional_field(value, "duration")) {
        event.duration = require_double(value, "duration");
    }
    if (const auto* success = optional_field(value, "success")) {
        if (!success->isBool()) {
            throw SerializationException("Field is not a boolean: success");
        }
        event.success = success->asBool();
    }
    if (optional_field(value, "items")) {
        event.items = require_strings(value, "items");
    }
    if (optional_field(value, "error_message")) {
        event.error_message = require_string(value, "error_message");
    }
    return event;
}

// ---------------------------------------------------------------------------
// Pattern
// ---------------------------------------------------------------------------

Json::Value to_json(const Pattern& pattern) {
    Json::Value v(Json::objectValue);
    v["pattern_id"] = pattern.key.to_string();
    v["pattern_type"] = to_string(pattern.type);
    v["domains"] = string_array(pattern.key.domains);
    v["item_count"] = pattern.key.item_count;
    v["strategy"] = pattern.key.strategy;
    v["success_rate"] = pattern.success_rate;
    v["avg_duration"] = pattern.avg_duration;
    v["usage_count"] = pattern.usage_count;
    v["last_used"] = pattern.last_used;
    v["confidence"] = pattern.confidence;
    return v;
}

Pattern pattern_from_json(const Json::Value& value) {
    Pattern pattern;
    pattern.key = PatternKey::make(require_strings(value, "domains"),
                                   require_int(value, "item_count"),
                                   require_string(value, "strategy"));

    auto type = parse_pattern_type(require_string(value, "pattern_type"));
    if (!type) {
        throw SerializationException("Unknown pattern type: " + value["pattern_type"].asString());
    }
    pattern.type = *type;
    pattern.success_rate = require_double(value, "success_rate");
    pattern.avg_duration = require_double(value, "avg_duration");
    pattern.usage_count = require_int(value, "usage_count");
    pattern.last_used = require_double(value, "last_used");
    pattern.confidence = require_double(value, "confidence");
    return pattern;
}

// ---------------------------------------------------------------------------
// Insight
// ---------------------------------------------------------------------------

Json::Value to_json(const Insight& insight) {
    Json::Value v(Json::objectValue);
    v["insight_id"] = insight.id;
    v["category"] = to_string(insight.category);
    v["description"] = insight.description;
    v["recommendation"] = insight.recommendation;
    v["impact_score"] = insight.impact_score;
    v["confidence"] = insight.confidence;
    v["created_at"] = insight.created_at;
    v["applies_to"] = string_array(insight.applies_to);
    return v;
}

Insight insight_from_json(const Json::Value& value) {
    Insight insight;
    insight.id = require_string(value, "insight_id");

    auto category = parse_insight_category(require_string(value, "category"));
    if (!category) {
        throw SerializationException("Unknown insight category: " + value["category"].asString());
    }
    insight.category = *category;
    insight.description = require_string(value, "description");
    insight.recommendation = require_string(value, "recommendation");
    insight.impact_score = require_double(value, "impact_score");
    insight.confidence = require_double(value, "confidence");
    insight.created_at = require_double(value, "created_at");
    insight.applies_to = require_strings(value, "applies_to");
    return insight;
}

// ---------------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------------

std::string events_to_string(const std::vector<CoordinationEvent>& events) {
    Json::Value root(Json::arrayValue);
    for (const auto& event : events) {
        root.append(to_json(event));
    }
    return write(root);
}

std::string patterns_to_string(const PatternMap& patterns) {
    Json::Value root(Json::objectValue);
    for (const auto& [key, pattern] : patterns) {
        root[key.to_string()] = to_json(pattern);
    }
    return write(root);
}

std::string insights_to_string(const std::vector<Insight>& insights) {
    Json::Value root(Json::arrayValue);
    for (const auto& insight : insights) {
        root.append(to_json(insight));
    }
    return write(root);
}

std::vector<CoordinationEvent> events_from_string(const std::string& text) {
    auto root = parse(text);
    if (!root.isArray()) {
        throw SerializationException("Events document is not an array");
    }
    std::vector<CoordinationEvent> events;
    events.reserve(root.size());
    for (const auto& item : root) {
        events.push_back(event_from_json(item));
    }
    return events;
}

PatternMap patterns_from_string(const std::string& text) {
    auto root = parse(text);
    if (!root.isObject()) {
        throw SerializationException("Patterns document is not an object");
    }
    PatternMap patterns;
    for (const auto& name : root.getMemberNames()) {
        auto pattern = pattern_from_json(root[name]);
        auto key = pattern.key;
        patterns.emplace(std::move(key), std::move(pattern));
    }
    return patterns;
}

std::vector<Insight> insights_from_string(const std::string& text) {
    auto root = parse(text);
    if (!root.isArray()) {
        throw SerializationException("Insights document is not an array");
    }
    std::vector<Insight> insights;
    insights.reserve(root.size());
    for (const auto& item : root) {
        insights.push_back(insight_from_json(item));
    }
    return insights;
}

} // namespace coordguard
