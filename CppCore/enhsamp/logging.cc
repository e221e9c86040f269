// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace enhsamp {
namespace log {

/**
 * @details
 * The logger writes to stderr and defaults to the @c warn level, so that
 * sampling runs are quiet unless a caller asks for progress output. An
 * application may also register its own logger under the same name before
 * the first call.
 */
std::shared_ptr<spdlog::logger> get() {
  static std::once_flag init_flag;
  std::call_once(init_flag, [] {
    if (!spdlog::get("enhsamp")) {
      auto logger = spdlog::stderr_color_mt("enhsamp");
      logger->set_level(spdlog::level::warn);
    }
  });
  return spdlog::get("enhsamp");
}

void set_level(spdlog::level::level_enum level) { get()->set_level(level); }

} // namespace log
} // namespace enhsamp
