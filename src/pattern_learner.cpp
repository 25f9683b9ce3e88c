#include "coordguard/pattern_learner.hpp"

#include <algorithm>
#include <cctype>
#include <functional>

namespace coordguard {

// ---------------------------------------------------------------------------
// PatternKey
// ---------------------------------------------------------------------------

PatternKey PatternKey::make(std::vector<std::string> domains, int item_count, std::string strategy) {
    std::sort(domains.begin(), domains.end());
    domains.erase(std::unique(domains.begin(), domains.end()), domains.end());
    return PatternKey{std::move(domains), item_count, std::move(strategy)};
}

std::string PatternKey::to_string() const {
    std::string result;
    for (std::size_t i = 0; i < domains.size(); ++i) {
        if (i > 0) result += '+';
        result += domains[i];
    }
    result += '_';
    result += std::to_string(item_count);
    result += '_';
    result += strategy;
    return result;
}

std::size_t PatternKeyHash::operator()(const PatternKey& key) const noexcept {
    std::hash<std::string> str_hash;
    std::size_t seed = std::hash<int>{}(key.item_count);
    auto combine = [&seed](std::size_t h) {
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    combine(str_hash(key.strategy));
    for (const auto& domain : key.domains) {
        combine(str_hash(domain));
    }
    return seed;
}

bool operator==(const Pattern& a, const Pattern& b) {
    return a.key == b.key &&
           a.type == b.type &&
           a.success_rate == b.success_rate &&
           a.avg_duration == b.avg_duration &&
           a.usage_count == b.usage_count &&
           a.last_used == b.last_used &&
           a.confidence == b.confidence;
}

std::optional<PatternType> parse_pattern_type(const std::string& name) {
    if (name == "sequential") return PatternType::Sequential;
    if (name == "parallel")   return PatternType::Parallel;
    if (name == "batch")      return PatternType::Batch;
    if (name == "hybrid")     return PatternType::Hybrid;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PatternLearner
// ---------------------------------------------------------------------------

PatternLearner::PatternLearner(LearningConfig config)
    : config_(config) {}

LearnResult PatternLearner::learn(const CoordinationEvent& start, const CoordinationEvent& terminal) {
    const Seconds duration = terminal.duration.value_or(0.0);
    const double outcome = terminal.success.value_or(false) ? 1.0 : 0.0;

    auto key = PatternKey::make(start.domains, start.item_count, start.strategy);

    LearnResult result;
    auto it = patterns_.find(key);
    if (it == patterns_.end()) {
        Pattern pattern;
        pattern.key = key;
        pattern.type = classify(start.strategy, start.item_count);
        pattern.success_rate = outcome;
        pattern.avg_duration = duration;
        pattern.usage_count = 1;
        pattern.last_used = terminal.timestamp;
        pattern.confidence = config_.initial_confidence;

        result.created = true;
        it = patterns_.emplace(std::move(key), std::move(pattern)).first;
    } else {
        Pattern& p = it->second;
        double n = static_cast<double>(p.usage_count);

        p.avg_duration = (p.avg_duration * n + duration) / (n + 1.0);
        p.success_rate = (p.success_rate * n + outcome) / (n + 1.0);
        p.usage_count++;
        p.last_used = terminal.timestamp;
        p.confidence = std::min(config_.confidence_cap,
                                p.usage_count * config_.usage_weight +
                                p.success_rate * config_.success_weight);
    }

    result.pattern = it->second;
    return result;
}

std::optional<Pattern> PatternLearner::find(const PatternKey& key) const {
    auto it = patterns_.find(key);
    if (it == patterns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const PatternMap& PatternLearner::patterns() const noexcept {
    return patterns_;
}

std::size_t PatternLearner::size() const noexcept {
    return patterns_.size();
}

void PatternLearner::restore(PatternMap patterns) {
    patterns_ = std::move(patterns);
}

const LearningConfig& PatternLearner::config() const noexcept {
    return config_;
}

PatternType PatternLearner::classify(const std::string& strategy, int item_count) {
    std::string lower = strategy;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("batch") != std::string::npos) {
        return PatternType::Batch;
    }
    if (lower.find("parallel") != std::string::npos) {
        return PatternType::Parallel;
    }
    if (item_count == 1) {
        return PatternType::Sequential;
    }
    return PatternType::Hybrid;
}

} // namespace coordguard
