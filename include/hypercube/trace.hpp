#pragma once

/// @file include/hypercube/trace.hpp
/// @brief Explainability Log — append-only record of recompute batches.
///
/// # Module: Explainability Log
///
/// ## Responsibility
/// Record, for every input update that triggered a non-empty batch, which
/// node changed, who changed it, which nodes were recomputed and how long it
/// took. Entries are immutable once appended.
///
/// ## Retention
/// Bounded ring buffer: once `capacity` entries are held, appending evicts
/// the oldest entry.

#include "hypercube/types.hpp"
#include "hypercube/constants.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <random>
#include <string>
#include <vector>

namespace hypercube::trace {

/// One explainability record.
struct TraceEntry {
    std::string                           id;               ///< Random UUID v4
    std::chrono::system_clock::time_point created_at;
    MetricId                              trigger_node_id;
    std::string                           trigger_user_id;
    std::vector<MetricId>                 affected_nodes;   ///< Tier order
    double                                duration_ms = 0.0;

    /// `created_at` as ISO-8601 UTC with millisecond precision,
    /// e.g. "2024-01-31T12:00:00.123Z".
    [[nodiscard]] std::string created_at_iso() const;
};

/// Bounded, append-only trace store.
class ExplainLog {
public:
    explicit ExplainLog(std::size_t capacity = constants::DEFAULT_TRACE_CAPACITY);

    /// Append a record stamped with a fresh id and the current time.
    /// Returns the stored entry.
    const TraceEntry& append(MetricId trigger_node_id,
                             std::string trigger_user_id,
                             std::vector<MetricId> affected_nodes,
                             double duration_ms);

    /// The most recent `limit` entries, oldest first.
    [[nodiscard]] std::vector<TraceEntry> recent(std::size_t limit) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Drop every entry.
    void clear() noexcept;

private:
    /// Random RFC 4122 version-4 UUID string.
    [[nodiscard]] std::string next_id();

    std::size_t            capacity_;
    std::deque<TraceEntry> entries_;
    std::mt19937_64        rng_;
};

} // namespace hypercube::trace
