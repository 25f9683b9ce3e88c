#include "coordguard/types.hpp"

#include <algorithm>
#include <cctype>

namespace coordguard {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

std::optional<Strategy> parse_strategy(const std::string& name) {
    auto n = lowercase(name);
    if (n == "direct")    return Strategy::Direct;
    if (n == "parallel")  return Strategy::Parallel;
    if (n == "strategic") return Strategy::Strategic;
    if (n == "degraded")  return Strategy::Degraded;
    return std::nullopt;
}

std::optional<Priority> parse_priority(const std::string& name) {
    auto n = lowercase(name);
    if (n == "critical") return Priority::Critical;
    if (n == "high")     return Priority::High;
    if (n == "medium")   return Priority::Medium;
    if (n == "low")      return Priority::Low;
    return std::nullopt;
}

std::optional<Complexity> parse_complexity(const std::string& name) {
    auto n = lowercase(name);
    if (n == "low")    return Complexity::Low;
    if (n == "medium") return Complexity::Medium;
    if (n == "high")   return Complexity::High;
    return std::nullopt;
}

} // namespace coordguard
