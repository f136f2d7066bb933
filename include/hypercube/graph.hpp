#pragma once

/// @file include/hypercube/graph.hpp
/// @brief Dependency Graph with cycle detection and tiered ordering.
///
/// # Module: Dependency Graph
///
/// ## Responsibility
/// Directed graph over metric indices with edges from dependency to
/// dependent. Edges are fully derived from formulas: `set_dependencies`
/// replaces all incoming edges of a node at once.
///
/// ## Algorithms
/// - `cycle_through`     — would giving `node` these dependencies close a
///                         cycle? Answers without mutating the graph.
///                         O(V + E) reachability from `node` along out-edges.
/// - `find_cycle`        — full-graph pass (iterative three-colour DFS), used
///                         when validation is re-enabled after a bulk load.
/// - `descendants`       — everything reachable from a node.
/// - `generations`       — Kahn layering of an induced subgraph: a node's
///                         generation is the length of the longest path to it
///                         from within the subset, so a generation shares no
///                         edges and can be evaluated concurrently.
///
/// All traversals visit neighbours in insertion order and break ties by
/// NodeIndex, so every result is deterministic.

#include "hypercube/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace hypercube::graph {

/// A directed edge (dependency → dependent).
struct Edge {
    NodeIndex source;
    NodeIndex target;
};

/// Adjacency-list DAG over dense node indices.
class DependencyGraph {
public:
    /// Make sure `node` exists (nodes are dense; intermediate indices are
    /// created as isolated nodes).
    void ensure_node(NodeIndex node);

    /// Replace every incoming edge of `node` with edges from `deps`.
    /// Duplicate dependencies produce a single edge.
    void set_dependencies(NodeIndex node, std::span<const NodeIndex> deps);

    /// Drop every incoming edge of `node`.
    void clear_dependencies(NodeIndex node);

    /// If making `deps` the dependencies of `node` would create a cycle,
    /// return it as an ordered node list starting at `node`. Each entry is
    /// a dependent of the one before it; `node` would depend on the last.
    ///
    /// The graph is not modified. Dependencies that are not yet nodes are
    /// ignored: a new node has no outgoing edges and cannot close a loop.
    [[nodiscard]] std::optional<std::vector<NodeIndex>>
    cycle_through(NodeIndex node, std::span<const NodeIndex> deps) const;

    /// First cycle found in the whole graph, in edge order, or `nullopt`.
    [[nodiscard]] std::optional<std::vector<NodeIndex>> find_cycle() const;

    /// Every node reachable from `node` along outgoing edges (excluding
    /// `node`), in ascending index order.
    [[nodiscard]] std::vector<NodeIndex> descendants(NodeIndex node) const;

    /// Topological generations of the subgraph induced by `subset`.
    ///
    /// Precondition: the induced subgraph is acyclic. Nodes inside each
    /// generation are in ascending index order.
    [[nodiscard]] std::vector<std::vector<NodeIndex>>
    generations(std::span<const NodeIndex> subset) const;

    /// Generations of the whole graph.
    [[nodiscard]] std::vector<std::vector<NodeIndex>> generations() const;

    [[nodiscard]] std::span<const NodeIndex> predecessors(NodeIndex node) const;
    [[nodiscard]] std::span<const NodeIndex> successors(NodeIndex node) const;

    /// All edges, grouped by target in ascending index order.
    [[nodiscard]] std::vector<Edge> edges() const;

    [[nodiscard]] std::size_t node_count() const noexcept { return in_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }

private:
    std::vector<std::vector<NodeIndex>> in_;   ///< dependencies of each node
    std::vector<std::vector<NodeIndex>> out_;  ///< dependents of each node
    std::size_t                         edge_count_ = 0;
};

} // namespace hypercube::graph
