#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace vecsearch {

// Shared "vecsearch" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Unknown names leave the level unchanged and return false.
bool set_log_level(const std::string& name);

} // namespace vecsearch
