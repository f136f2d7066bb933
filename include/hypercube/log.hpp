#pragma once

/// @file include/hypercube/log.hpp
/// @brief Logger access for the hypercube engine.
///
/// The engine logs through a named spdlog logger ("hypercube") writing to
/// stderr. Embedders may hand the engine their own logger through
/// `EngineConfig::logger`; this header only provides the default.

#include <spdlog/spdlog.h>

#include <memory>

namespace hypercube::log {

/// Name of the default logger.
static constexpr const char* LOGGER_NAME = "hypercube";

/// The default "hypercube" logger, created on first use (stderr, colour).
/// Reuses a logger of the same name if one is already registered.
[[nodiscard]] std::shared_ptr<spdlog::logger> default_logger();

/// Set the level of the default logger.
void set_level(spdlog::level::level_enum level);

} // namespace hypercube::log
