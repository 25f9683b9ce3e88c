#pragma once

#include "coordguard/event_log.hpp"
#include "coordguard/insight_generator.hpp"
#include "coordguard/pattern_learner.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace coordguard {

// Durable home of the three learning documents.
// load_* never throws: missing or unreadable data yields an empty collection.
// save_* throws PersistenceException when the write cannot be completed.
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::vector<CoordinationEvent> load_events() = 0;
    virtual PatternMap load_patterns() = 0;
    virtual std::vector<Insight> load_insights() = 0;

    virtual void save_events(const std::vector<CoordinationEvent>& events) = 0;
    virtual void save_patterns(const PatternMap& patterns) = 0;
    virtual void save_insights(const std::vector<Insight>& insights) = 0;
};

// Keeps everything in process; used for tests and ephemeral engines
class MemoryStateStore : public StateStore {
public:
    std::vector<CoordinationEvent> load_events() override;
    PatternMap load_patterns() override;
    std::vector<Insight> load_insights() override;

    void save_events(const std::vector<CoordinationEvent>& events) override;
    void save_patterns(const PatternMap& patterns) override;
    void save_insights(const std::vector<Insight>& insights) override;

private:
    mutable std::mutex mutex_;
    std::vector<CoordinationEvent> events_;
    PatternMap patterns_;
    std::vector<Insight> insights_;
};

// events.json, patterns.json and insights.json under one directory.
// Each save writes a sibling temp file and renames it over the target.
class JsonFileStateStore : public StateStore {
public:
    explicit JsonFileStateStore(std::filesystem::path directory);

    std::vector<CoordinationEvent> load_events() override;
    PatternMap load_patterns() override;
    std::vector<Insight> load_insights() override;

    void save_events(const std::vector<CoordinationEvent>& events) override;
    void save_patterns(const PatternMap& patterns) override;
    void save_insights(const std::vector<Insight>& insights) override;

    const std::filesystem::path& directory() const noexcept { return directory_; }
    std::filesystem::path events_path() const;
    std::filesystem::path patterns_path() const;
    std::filesystem::path insights_path() const;

private:
    void write_document(const std::filesystem::path& target, const std::string& content);

    std::filesystem::path directory_;
};

} // namespace coordguard
