#include "coordguard/storage.hpp"
#include "coordguard/exceptions.hpp"
#include "coordguard/logging.hpp"
#include "coordguard/serialization.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace coordguard {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log::get()->warn("Cannot open {}", path.string());
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Parses with the given reader; malformed content is logged and dropped
template <typename T, typename Parser>
T load_document(const fs::path& path, Parser parse) {
    auto text = read_file(path);
    if (!text) {
        return T{};
    }
    try {
        return parse(*text);
    } catch (const SerializationException& e) {
        log::get()->warn("Ignoring unreadable state file {}: {}", path.string(), e.what());
        return T{};
    }
}

} // anonymous namespace

// ========== MemoryStateStore ==========

std::vector<CoordinationEvent> MemoryStateStore::load_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

PatternMap MemoryStateStore::load_patterns() {
    std::lock_guard<std::mutex> lock(mutex_);
    return patterns_;
}

std::vector<Insight> MemoryStateStore::load_insights() {
    std::lock_guard<std::mutex> lock(mutex_);
    return insights_;
}

void MemoryStateStore::save_events(const std::vector<CoordinationEvent>& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_ = events;
}

void MemoryStateStore::save_patterns(const PatternMap& patterns) {
    std::lock_guard<std::mutex> lock(mutex_);
    patterns_ = patterns;
}

void MemoryStateStore::save_insights(const std::vector<Insight>& insights) {
    std::lock_guard<std::mutex> lock(mutex_);
    insights_ = insights;
}

// ========== JsonFileStateStore ==========

JsonFileStateStore::JsonFileStateStore(fs::path directory)
    : directory_(std::move(directory)) {}

fs::path JsonFileStateStore::events_path() const {
    return directory_ / "events.json";
}

fs::path JsonFileStateStore::patterns_path() const {
    return directory_ / "patterns.json";
}

fs::path JsonFileStateStore::insights_path() const {
    return directory_ / "insights.json";
}

std::vector<CoordinationEvent> JsonFileStateStore::load_events() {
    return load_document<std::vector<CoordinationEvent>>(events_path(), events_from_string);
}

PatternMap JsonFileStateStore::load_patterns() {
    return load_document<PatternMap>(patterns_path(), patterns_from_string);
}

std::vector<Insight> JsonFileStateStore::load_insights() {
    return load_document<std::vector<Insight>>(insights_path(), insights_from_string);
}

void JsonFileStateStore::save_events(const std::vector<CoordinationEvent>& events) {
    write_document(events_path(), events_to_string(events));
}

void JsonFileStateStore::save_patterns(const PatternMap& patterns) {
    write_document(patterns_path(), patterns_to_string(patterns));
}

void JsonFileStateStore::save_insights(const std::vector<Insight>& insights) {
    write_document(insights_path(), insights_to_string(insights));
}

void JsonFileStateStore::write_document(const fs::path& target, const std::string& content) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw PersistenceException(directory_.string(), ec.message());
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PersistenceException(target.string(), "cannot open temporary file");
        }
        out << content;
        out.flush();
        if (!out) {
            throw PersistenceException(target.string(), "write failed");
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(tmp, ec);
        throw PersistenceException(target.string(), "rename failed: " + reason);
    }
}

} // namespace coordguard
