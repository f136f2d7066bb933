/// @file src/core/error.cpp
/// @brief EngineError formatting and constructors.

#include "hypercube/error.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <utility>

namespace hypercube {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::CircularDependency: return "CircularDependency";
        case ErrorKind::InvalidFormula:     return "InvalidFormula";
        case ErrorKind::UnknownMetric:      return "UnknownMetric";
        case ErrorKind::Configuration:      return "Configuration";
    }
    return "Unknown";
}

std::string EngineError::to_string() const {
    std::string out = fmt::format("{}: {}", hypercube::to_string(kind), message);
    if (!cycle.empty()) {
        out += fmt::format(" [{} -> {}]", fmt::join(cycle, " -> "), cycle.front());
    }
    if (!suggestion.empty()) {
        out += fmt::format(" (suggestion: {})", suggestion);
    }
    return out;
}

EngineError EngineError::configuration(std::string message) {
    return EngineError{.kind = ErrorKind::Configuration, .message = std::move(message),
                       .cycle = {}, .suggestion = {}};
}

EngineError EngineError::unknown_metric(const MetricId& id) {
    return EngineError{.kind = ErrorKind::UnknownMetric,
                       .message = fmt::format("unknown metric '{}'", id),
                       .cycle = {}, .suggestion = {}};
}

} // namespace hypercube
