#include "vecsearch/logging.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vecsearch {

namespace {
constexpr const char* kLoggerName = "vecsearch";
std::once_flag g_logger_once;
}

std::shared_ptr<spdlog::logger> logger() {
  std::call_once(g_logger_once, []() {
    if (!spdlog::get(kLoggerName)) {
      auto lg = spdlog::stderr_color_mt(kLoggerName);
      lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      lg->set_level(spdlog::level::info);
    }
  });
  return spdlog::get(kLoggerName);
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

bool set_log_level(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  if (level == spdlog::level::off && name != "off") {
    return false;
  }
  set_log_level(level);
  return true;
}

} // namespace vecsearch
