/// @file src/core/log.cpp
/// @brief Default logger for the hypercube engine.

#include "hypercube/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace hypercube::log {

std::shared_ptr<spdlog::logger> default_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    try {
        auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_level(spdlog::level::info);
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread between get() and create.
        return spdlog::get(LOGGER_NAME);
    }
}

void set_level(spdlog::level::level_enum level) {
    default_logger()->set_level(level);
}

} // namespace hypercube::log
