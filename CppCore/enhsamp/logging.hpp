#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Access to the library logger.
 *
 * All components write through one named @c spdlog logger so that an
 * application can redirect or silence the library in one place.
 */

#include <memory>
#include <spdlog/spdlog.h>

namespace enhsamp {
namespace log {

/**
 * @brief Fetches the library logger, creating it on first use.
 * @return Shared pointer to the logger named @c "enhsamp".
 */
std::shared_ptr<spdlog::logger> get();

/**
 * @brief Sets the verbosity of the library logger.
 * @param level The minimum level that is emitted.
 * @return Void.
 */
void set_level(spdlog::level::level_enum level);

} // namespace log
} // namespace enhsamp
