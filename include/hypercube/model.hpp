#pragma once

/// @file include/hypercube/model.hpp
/// @brief Dimension Catalog and Metric Registry.
///
/// # Module: Model Metadata
///
/// ## Responsibility
/// Hold the structural metadata of a model:
///   - `DimensionCatalog` — named axes with ordered member labels
///   - `MetricRegistry`   — node metadata (id, display name, category, dims)
///
/// Neither class owns values; tensors live in the TensorStore and edges in
/// the DependencyGraph. Both are plain containers with no locking: structural
/// mutation must not overlap an in-flight recompute.

#include "hypercube/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hypercube::model {

// ─── Dimension ────────────────────────────────────────────────────────────────

/// A named categorical axis with ordered, unique member labels.
struct Dimension {
    std::string                                  name;
    std::vector<std::string>                     members;
    std::unordered_map<std::string, std::size_t> member_to_index;

    /// Index of `member`, or `nullopt` if it is not a member.
    [[nodiscard]] std::optional<std::size_t>
    index_of(const std::string& member) const;

    [[nodiscard]] std::size_t extent() const noexcept { return members.size(); }
};

/// Outcome of `DimensionCatalog::define`.
enum class DefineResult {
    Created,    ///< New dimension
    Unchanged,  ///< Same members as before; nothing to do
    Replaced,   ///< Members changed; tensors over this dim must be reset
};

/// Named axes with ordered member labels.
class DimensionCatalog {
public:
    /// Define or redefine a dimension.
    ///
    /// Precondition: `members` is non-empty and free of duplicates (checked
    /// by `validate_members`).
    DefineResult define(const std::string& name,
                        std::vector<std::string> members);

    /// Empty string if `members` is usable, otherwise the reason it is not.
    [[nodiscard]] static std::string
    validate_members(std::span<const std::string> members);

    /// Index of `member` within dimension `name`, or `nullopt` if either the
    /// dimension or the member is unknown.
    [[nodiscard]] std::optional<std::size_t>
    member_index(const std::string& name, const std::string& member) const;

    /// Ordered members of `name`; empty if the dimension is undefined.
    [[nodiscard]] std::span<const std::string>
    members(const std::string& name) const;

    /// Member count of `name`, or UNKNOWN_DIMENSION_EXTENT if undefined.
    [[nodiscard]] std::size_t extent(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] std::size_t size() const noexcept { return dims_.size(); }

private:
    std::unordered_map<std::string, Dimension> dims_;
};

// ─── Metric ───────────────────────────────────────────────────────────────────

/// Metadata for one node of the computation graph.
struct Metric {
    MetricId                 id;
    std::string              display_name;
    std::string              category;
    std::vector<std::string> dims;            ///< Declared dimension names, in order
    bool                     is_calculated = false;  ///< Has a formula
    bool                     is_placeholder = false; ///< Auto-created from a reference
};

/// Registry of metric metadata in registration order.
///
/// `NodeIndex` values are dense and stable: a metric keeps its index for the
/// lifetime of the registry, which lets the graph and tensor store use plain
/// vectors indexed by node.
class MetricRegistry {
public:
    /// Register a new metric. Precondition: `metric.id` is not registered.
    NodeIndex add(Metric metric);

    /// Index of `id`, or `nullopt` if unknown.
    [[nodiscard]] std::optional<NodeIndex> find(std::string_view id) const;

    [[nodiscard]] const Metric& at(NodeIndex node) const { return metrics_.at(node); }
    [[nodiscard]] Metric&       at(NodeIndex node)       { return metrics_.at(node); }

    [[nodiscard]] std::size_t size() const noexcept { return metrics_.size(); }

    /// All metrics in registration order.
    [[nodiscard]] std::span<const Metric> all() const noexcept { return metrics_; }

private:
    std::vector<Metric>                        metrics_;
    std::unordered_map<std::string, NodeIndex> index_;
};

} // namespace hypercube::model
