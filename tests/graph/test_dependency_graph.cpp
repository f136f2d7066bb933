/// @file tests/graph/test_dependency_graph.cpp
/// @brief Tests for DependencyGraph: edges, cycles, descendants, generations.

#include "hypercube/graph.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace hypercube;
using namespace hypercube::graph;

namespace {

using Nodes = std::vector<NodeIndex>;

void depend(DependencyGraph& g, NodeIndex node, Nodes deps) {
    g.set_dependencies(node, deps);
}

/// a(0) → b(1), a → c(2), b → d(3), c → d
DependencyGraph diamond() {
    DependencyGraph g;
    g.ensure_node(3);
    depend(g, 1, {0});
    depend(g, 2, {0});
    depend(g, 3, {1, 2});
    return g;
}

}  // namespace

// ─── Mutation ─────────────────────────────────────────────────────────────────

TEST(DependencyGraph_Edges, EnsureNodeGrowsDensely) {
    DependencyGraph g;
    g.ensure_node(4);
    EXPECT_EQ(g.node_count(), 5u);
    EXPECT_EQ(g.edge_count(), 0u);
}

TEST(DependencyGraph_Edges, DuplicateDependenciesProduceOneEdge) {
    DependencyGraph g;
    depend(g, 1, {0, 0, 0});
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_EQ(g.predecessors(1).size(), 1u);
    EXPECT_EQ(g.successors(0).size(), 1u);
}

TEST(DependencyGraph_Edges, ReassignmentDropsOldIncomingEdges) {
    DependencyGraph g;
    depend(g, 2, {0, 1});
    depend(g, 2, {1});
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_TRUE(g.successors(0).empty());
    ASSERT_EQ(g.predecessors(2).size(), 1u);
    EXPECT_EQ(g.predecessors(2)[0], 1u);
}

TEST(DependencyGraph_Edges, ClearDependencies) {
    auto g = diamond();
    g.clear_dependencies(3);
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_TRUE(g.successors(1).empty());
}

TEST(DependencyGraph_Edges, EdgesGroupedByTarget) {
    const auto g     = diamond();
    const auto edges = g.edges();
    ASSERT_EQ(edges.size(), 4u);
    EXPECT_EQ(edges[0].source, 0u);
    EXPECT_EQ(edges[0].target, 1u);
    EXPECT_EQ(edges[3].source, 2u);
    EXPECT_EQ(edges[3].target, 3u);
}

// ─── Cycles ───────────────────────────────────────────────────────────────────

TEST(DependencyGraph_Cycles, ThreeNodeLoopIsReportedFromTheAssignedNode) {
    // interest(0) depends on debt(1), debt depends on cash(2).
    DependencyGraph g;
    depend(g, 0, {1});
    depend(g, 1, {2});
    const auto cycle = g.cycle_through(2, Nodes{0});
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(*cycle, (Nodes{2, 1, 0}));
    // Nothing was mutated.
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_TRUE(g.predecessors(2).empty());
}

TEST(DependencyGraph_Cycles, SelfReference) {
    DependencyGraph g;
    g.ensure_node(0);
    EXPECT_EQ(g.cycle_through(0, Nodes{0}), (Nodes{0}));
}

TEST(DependencyGraph_Cycles, AcyclicAssignmentIsAccepted) {
    auto g = diamond();
    EXPECT_FALSE(g.cycle_through(3, Nodes{0, 1}).has_value());
    EXPECT_FALSE(g.cycle_through(0, Nodes{}).has_value());
}

TEST(DependencyGraph_Cycles, UnknownDependencyCannotCloseALoop) {
    DependencyGraph g;
    depend(g, 1, {0});
    EXPECT_FALSE(g.cycle_through(0, Nodes{7}).has_value());
}

TEST(DependencyGraph_Cycles, FindCycleOnWholeGraph) {
    auto g = diamond();
    EXPECT_FALSE(g.find_cycle().has_value());

    depend(g, 0, {3});  // close d → a without the local check
    const auto cycle = g.find_cycle();
    ASSERT_TRUE(cycle.has_value());
    ASSERT_GE(cycle->size(), 3u);
    // Every consecutive pair is a real edge, and the last closes the loop.
    for (std::size_t i = 0; i < cycle->size(); ++i) {
        const NodeIndex from = (*cycle)[i];
        const NodeIndex to   = (*cycle)[(i + 1) % cycle->size()];
        const auto succ = g.successors(from);
        EXPECT_NE(std::find(succ.begin(), succ.end(), to), succ.end());
    }
}

// ─── Traversal ────────────────────────────────────────────────────────────────

TEST(DependencyGraph_Traversal, DescendantsAreSortedAndExcludeStart) {
    const auto g = diamond();
    EXPECT_EQ(g.descendants(0), (Nodes{1, 2, 3}));
    EXPECT_EQ(g.descendants(1), (Nodes{3}));
    EXPECT_TRUE(g.descendants(3).empty());
    EXPECT_TRUE(g.descendants(99).empty());
}

TEST(DependencyGraph_Traversal, GenerationsOfDiamond) {
    const auto g = diamond();
    const auto gens = g.generations();
    ASSERT_EQ(gens.size(), 3u);
    EXPECT_EQ(gens[0], (Nodes{0}));
    EXPECT_EQ(gens[1], (Nodes{1, 2}));
    EXPECT_EQ(gens[2], (Nodes{3}));
}

TEST(DependencyGraph_Traversal, GenerationUsesLongestPath) {
    // 0 → 1 → 2 and 0 → 2: node 2 must wait for node 1.
    DependencyGraph g;
    depend(g, 1, {0});
    depend(g, 2, {0, 1});
    const auto gens = g.generations();
    ASSERT_EQ(gens.size(), 3u);
    EXPECT_EQ(gens[2], (Nodes{2}));
}

TEST(DependencyGraph_Traversal, GenerationsOfSubsetIgnoreOutsideEdges) {
    const auto g = diamond();
    const auto gens = g.generations(Nodes{1, 2, 3});
    ASSERT_EQ(gens.size(), 2u);
    EXPECT_EQ(gens[0], (Nodes{1, 2}));
    EXPECT_EQ(gens[1], (Nodes{3}));
}
