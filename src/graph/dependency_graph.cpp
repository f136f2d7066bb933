/// @file src/graph/dependency_graph.cpp
/// @brief DependencyGraph — adjacency lists, cycle detection, generations.

#include "hypercube/graph.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <limits>

namespace hypercube::graph {

namespace {

constexpr NodeIndex NO_PARENT = std::numeric_limits<NodeIndex>::max();

/// Remove one occurrence of `value` from `v` (order of the rest preserved).
void erase_one(std::vector<NodeIndex>& v, NodeIndex value) {
    const auto it = std::find(v.begin(), v.end(), value);
    if (it != v.end()) {
        v.erase(it);
    }
}

}  // namespace

// ─── Mutation ─────────────────────────────────────────────────────────────────

void DependencyGraph::ensure_node(NodeIndex node) {
    if (node >= in_.size()) {
        in_.resize(node + 1);
        out_.resize(node + 1);
    }
}

void DependencyGraph::clear_dependencies(NodeIndex node) {
    ensure_node(node);
    for (NodeIndex dep : in_[node]) {
        erase_one(out_[dep], node);
    }
    edge_count_ -= in_[node].size();
    in_[node].clear();
}

void DependencyGraph::set_dependencies(NodeIndex node, std::span<const NodeIndex> deps) {
    clear_dependencies(node);
    for (NodeIndex dep : deps) {
        ensure_node(dep);
        if (std::find(in_[node].begin(), in_[node].end(), dep) != in_[node].end()) {
            continue;
        }
        in_[node].push_back(dep);
        out_[dep].push_back(node);
        ++edge_count_;
    }
}

// ─── Cycle detection ──────────────────────────────────────────────────────────

std::optional<std::vector<NodeIndex>>
DependencyGraph::cycle_through(NodeIndex node, std::span<const NodeIndex> deps) const {
    if (std::find(deps.begin(), deps.end(), node) != deps.end()) {
        return std::vector<NodeIndex>{node};  // self-reference
    }
    if (node >= out_.size()) {
        return std::nullopt;  // new node: no outgoing edges
    }

    // Mark the proposed dependencies, then search downstream from `node`.
    // Reaching one of them means dep → node would close a loop.
    std::vector<bool> is_dep(out_.size(), false);
    bool any = false;
    for (NodeIndex d : deps) {
        if (d < out_.size()) {
            is_dep[d] = true;
            any       = true;
        }
    }
    if (!any) {
        return std::nullopt;
    }

    std::vector<NodeIndex> parent(out_.size(), NO_PARENT);
    std::deque<NodeIndex>  queue{node};
    parent[node] = node;

    while (!queue.empty()) {
        const NodeIndex cur = queue.front();
        queue.pop_front();
        for (NodeIndex next : out_[cur]) {
            if (parent[next] != NO_PARENT) {
                continue;
            }
            parent[next] = cur;
            if (is_dep[next]) {
                // Walk parents back to `node`: node → … → next.
                std::vector<NodeIndex> cycle{next};
                for (NodeIndex p = cur; p != node; p = parent[p]) {
                    cycle.push_back(p);
                }
                cycle.push_back(node);
                std::reverse(cycle.begin(), cycle.end());
                return cycle;
            }
            queue.push_back(next);
        }
    }
    return std::nullopt;
}

std::optional<std::vector<NodeIndex>> DependencyGraph::find_cycle() const {
    enum class Colour : std::uint8_t { White, Grey, Black };
    const std::size_t n = out_.size();
    std::vector<Colour>    colour(n, Colour::White);
    std::vector<NodeIndex> path;

    // Iterative DFS; the explicit stack holds (node, next out-edge to try).
    std::vector<std::pair<NodeIndex, std::size_t>> stack;
    for (NodeIndex root = 0; root < n; ++root) {
        if (colour[root] != Colour::White) {
            continue;
        }
        stack.emplace_back(root, 0);
        colour[root] = Colour::Grey;
        path.push_back(root);

        while (!stack.empty()) {
            auto& [cur, edge] = stack.back();
            if (edge == out_[cur].size()) {
                colour[cur] = Colour::Black;
                path.pop_back();
                stack.pop_back();
                continue;
            }
            const NodeIndex next = out_[cur][edge++];
            if (colour[next] == Colour::Grey) {
                const auto start = std::find(path.begin(), path.end(), next);
                return std::vector<NodeIndex>(start, path.end());
            }
            if (colour[next] == Colour::White) {
                colour[next] = Colour::Grey;
                path.push_back(next);
                stack.emplace_back(next, 0);
            }
        }
    }
    return std::nullopt;
}

// ─── Traversal ────────────────────────────────────────────────────────────────

std::vector<NodeIndex> DependencyGraph::descendants(NodeIndex node) const {
    if (node >= out_.size()) {
        return {};
    }
    std::vector<bool>      seen(out_.size(), false);
    std::vector<NodeIndex> stack{node};
    std::vector<NodeIndex> result;
    seen[node] = true;

    while (!stack.empty()) {
        const NodeIndex cur = stack.back();
        stack.pop_back();
        for (NodeIndex next : out_[cur]) {
            if (!seen[next]) {
                seen[next] = true;
                result.push_back(next);
                stack.push_back(next);
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::vector<NodeIndex>>
DependencyGraph::generations(std::span<const NodeIndex> subset) const {
    const std::size_t n = in_.size();
    std::vector<bool>        member(n, false);
    std::vector<std::size_t> indegree(n, 0);
    for (NodeIndex v : subset) {
        member[v] = true;
    }
    for (NodeIndex v : subset) {
        for (NodeIndex dep : in_[v]) {
            if (member[dep]) {
                ++indegree[v];
            }
        }
    }

    std::vector<NodeIndex> current;
    for (NodeIndex v : subset) {
        if (indegree[v] == 0) {
            current.push_back(v);
        }
    }

    // Kahn layering: a node joins the layer after its last in-subset dependency.
    std::vector<std::vector<NodeIndex>> layers;
    while (!current.empty()) {
        std::sort(current.begin(), current.end());
        std::vector<NodeIndex> next;
        for (NodeIndex v : current) {
            for (NodeIndex succ : out_[v]) {
                if (member[succ] && --indegree[succ] == 0) {
                    next.push_back(succ);
                }
            }
        }
        layers.push_back(std::move(current));
        current = std::move(next);
    }
    return layers;
}

std::vector<std::vector<NodeIndex>> DependencyGraph::generations() const {
    std::vector<NodeIndex> all(in_.size());
    for (NodeIndex v = 0; v < all.size(); ++v) {
        all[v] = v;
    }
    return generations(all);
}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::span<const NodeIndex> DependencyGraph::predecessors(NodeIndex node) const {
    if (node >= in_.size()) {
        return {};
    }
    return in_[node];
}

std::span<const NodeIndex> DependencyGraph::successors(NodeIndex node) const {
    if (node >= out_.size()) {
        return {};
    }
    return out_[node];
}

std::vector<Edge> DependencyGraph::edges() const {
    std::vector<Edge> result;
    result.reserve(edge_count_);
    for (NodeIndex target = 0; target < in_.size(); ++target) {
        for (NodeIndex source : in_[target]) {
            result.push_back(Edge{.source = source, .target = target});
        }
    }
    return result;
}

}  // namespace hypercube::graph
