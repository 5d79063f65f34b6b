#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace hostlink {

/// Shared "hostlink" logger, created on first use.
inline std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = []() {
    if (auto existing = spdlog::get("hostlink"))
      return existing;
    auto created = spdlog::stdout_color_mt("hostlink");
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
    return created;
  }();
  return instance;
}

/// Set the logger level from a name such as "debug" or "warn".
inline void set_log_level(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off")
    throw std::invalid_argument("unknown log level: " + name);
  logger()->set_level(level);
}

} // namespace hostlink
