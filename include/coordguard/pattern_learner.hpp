#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/event_log.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordguard {

enum class PatternType {
    Sequential,
    Parallel,
    Batch,
    Hybrid
};

// Composite pattern identity: (domain set, item count, strategy).
// Domains are kept sorted and de-duplicated so order never matters.
struct PatternKey {
    std::vector<std::string> domains;
    int item_count{0};
    std::string strategy;

    static PatternKey make(std::vector<std::string> domains, int item_count, std::string strategy);

    // Canonical "a+b_<count>_<strategy>" form, used as id and JSON key
    std::string to_string() const;

    bool operator==(const PatternKey& other) const {
        return item_count == other.item_count &&
               strategy == other.strategy &&
               domains == other.domains;
    }
    bool operator!=(const PatternKey& other) const { return !(*this == other); }
};

struct PatternKeyHash {
    std::size_t operator()(const PatternKey& key) const noexcept;
};

// Learned statistic for one key
struct Pattern {
    PatternKey key;
    PatternType type{PatternType::Hybrid};
    double success_rate{0.0};
    Seconds avg_duration{0.0};
    int usage_count{0};
    Timestamp last_used{0.0};
    double confidence{0.0};
};

bool operator==(const Pattern& a, const Pattern& b);
inline bool operator!=(const Pattern& a, const Pattern& b) { return !(a == b); }

using PatternMap = std::unordered_map<PatternKey, Pattern, PatternKeyHash>;

// Outcome of learning from one completed coordination
struct LearnResult {
    Pattern pattern;
    bool created{false};
};

// Weighted running statistics per pattern key. Patterns are created on the
// first completion and updated, never deleted, afterwards.
// Not synchronized; the owning engine serializes access.
class PatternLearner {
public:
    explicit PatternLearner(LearningConfig config = LearningConfig{});

    // Requires terminal.duration; callers filter orphan completions first
    LearnResult learn(const CoordinationEvent& start, const CoordinationEvent& terminal);

    std::optional<Pattern> find(const PatternKey& key) const;
    const PatternMap& patterns() const noexcept;
    std::size_t size() const noexcept;
    void restore(PatternMap patterns);

    const LearningConfig& config() const noexcept;

    static PatternType classify(const std::string& strategy, int item_count);

private:
    LearningConfig config_;
    PatternMap patterns_;
};

inline const char* to_string(PatternType t) {
    switch (t) {
        case PatternType::Sequential: return "sequential";
        case PatternType::Parallel:   return "parallel";
        case PatternType::Batch:      return "batch";
        case PatternType::Hybrid:     return "hybrid";
    }
    return "unknown";
}

std::optional<PatternType> parse_pattern_type(const std::string& name);

} // namespace coordguard
