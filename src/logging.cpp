#include "coordguard/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace coordguard::log {

namespace {
constexpr const char* kLoggerName = "coordguard";
std::mutex init_mutex;
} // anonymous namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(init_mutex);
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return logger;
}

void set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        get()->warn("Unknown log level '{}', keeping {}", level,
                    spdlog::level::to_string_view(get()->level()));
        return;
    }
    get()->set_level(parsed);
}

} // namespace coordguard::log
