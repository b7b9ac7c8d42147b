#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <ripple/version.hpp>

namespace ripple {
namespace log {

// Library logger ("ripple"). Created on first use with a colour stdout sink
// and level warn; an application that registered a logger under the same
// name before first use gets its own logger back.
inline std::shared_ptr<spdlog::logger> get() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get(RIPPLE_LOGGER_NAME)) return existing;
    auto l = spdlog::stdout_color_mt(RIPPLE_LOGGER_NAME);
    l->set_level(spdlog::level::warn);
    l->set_pattern("[%H:%M:%S.%e][%n][%l] %v");
    return l;
  }();
  return logger;
}

inline void set_level(spdlog::level::level_enum lvl) { get()->set_level(lvl); }

// Apply SPDLOG_LEVEL from the environment, e.g. SPDLOG_LEVEL=ripple=debug
inline void load_env_levels() {
  get();
  spdlog::cfg::load_env_levels();
}

} // namespace log
} // namespace ripple
