/// @file src/trace/explain_log.cpp
/// @brief ExplainLog — bounded ring buffer of recompute records.

#include "hypercube/trace.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <utility>

namespace hypercube::trace {

std::string TraceEntry::created_at_iso() const {
    using namespace std::chrono;
    const auto ms_total = duration_cast<milliseconds>(created_at.time_since_epoch()).count();
    const auto millis   = static_cast<int>(((ms_total % 1000) + 1000) % 1000);
    const std::time_t seconds = system_clock::to_time_t(created_at);

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, millis);
}

ExplainLog::ExplainLog(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1))
    , rng_(std::random_device{}()) {}

const TraceEntry& ExplainLog::append(MetricId trigger_node_id,
                                     std::string trigger_user_id,
                                     std::vector<MetricId> affected_nodes,
                                     double duration_ms) {
    entries_.push_back(TraceEntry{
        .id              = next_id(),
        .created_at      = std::chrono::system_clock::now(),
        .trigger_node_id = std::move(trigger_node_id),
        .trigger_user_id = std::move(trigger_user_id),
        .affected_nodes  = std::move(affected_nodes),
        .duration_ms     = duration_ms,
    });
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    return entries_.back();
}

std::vector<TraceEntry> ExplainLog::recent(std::size_t limit) const {
    const std::size_t n = std::min(limit, entries_.size());
    return {entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end()};
}

void ExplainLog::clear() noexcept {
    entries_.clear();
}

std::string ExplainLog::next_id() {
    const std::uint64_t hi = rng_();
    const std::uint64_t lo = rng_();

    // Version 4 in the high nibble of octet 6, variant 10xx in octet 8.
    const std::uint64_t v_hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    const std::uint64_t v_lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       v_hi >> 32, (v_hi >> 16) & 0xFFFF, v_hi & 0xFFFF,
                       v_lo >> 48, v_lo & 0xFFFFFFFFFFFFULL);
}

} // namespace hypercube::trace
