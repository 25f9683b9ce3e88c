#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace coordguard::log {

// Shared "coordguard" logger, created on first use
std::shared_ptr<spdlog::logger> get();

// Accepts spdlog level names; unknown names leave the level unchanged
void set_level(const std::string& level);

} // namespace coordguard::log
