/// @file tests/scheduler/test_scheduler.cpp
/// @brief IncrementalScheduler: planning, state machine, failure isolation,
///        pooled waves.

#include "hypercube/scheduler.hpp"
#include "hypercube/graph.hpp"
#include "hypercube/error.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <vector>

using namespace hypercube;
using namespace hypercube::scheduler;

namespace {

using Nodes = std::vector<NodeIndex>;

/// Records evaluation order; optionally fails selected nodes.
class RecordingEvaluator final : public NodeEvaluator {
public:
    std::set<NodeIndex> fail_with_shape;
    std::set<NodeIndex> fail_with_eval;

    void evaluate(NodeIndex node) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            order_.push_back(node);
        }
        if (fail_with_shape.contains(node)) {
            throw ShapeError("shape mismatch");
        }
        if (fail_with_eval.contains(node)) {
            throw EvaluationError("division by zero");
        }
    }

    void reset(NodeIndex node) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        resets_.push_back(node);
    }

    Nodes order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }
    Nodes resets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return resets_;
    }

private:
    mutable std::mutex mutex_;
    Nodes              order_;
    Nodes              resets_;
};

/// input(0) → b(1) → c(2); unrelated input(3) → d(4)
graph::DependencyGraph chain_graph() {
    graph::DependencyGraph g;
    g.set_dependencies(1, Nodes{0});
    g.set_dependencies(2, Nodes{1});
    g.set_dependencies(4, Nodes{3});
    return g;
}

bool is_formula(NodeIndex n) {
    return n != 0 && n != 3;
}

}  // namespace

// ─── Planning ─────────────────────────────────────────────────────────────────

TEST(Scheduler_Plan, AffectedSetIsFormulaDescendantsOnly) {
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 0, .parallel_tier_threshold = 8});
    const auto g    = chain_graph();
    const auto plan = s.plan_from(g, 0, is_formula);
    EXPECT_EQ(plan.affected, (Nodes{1, 2}));
    ASSERT_EQ(plan.tiers.size(), 2u);
    EXPECT_EQ(s.state(), SchedulerState::Tiered);
}

TEST(Scheduler_Plan, ChangedNodeNeverIncluded) {
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 0, .parallel_tier_threshold = 8});
    const auto g    = chain_graph();
    const auto plan = s.plan_from(g, 1, is_formula);
    EXPECT_EQ(plan.affected, (Nodes{2}));
}

TEST(Scheduler_Plan, LeafChangeIsEmptyAndDone) {
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 0, .parallel_tier_threshold = 8});
    const auto g    = chain_graph();
    const auto plan = s.plan_from(g, 2, is_formula);
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(s.state(), SchedulerState::Done);
}

TEST(Scheduler_Plan, PureInputsDownstreamAreSkipped) {
    // 0 → 1 where 1 has no formula (overridden input) → 2
    graph::DependencyGraph g;
    g.set_dependencies(1, Nodes{0});
    g.set_dependencies(2, Nodes{1});
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 0, .parallel_tier_threshold = 8});
    const auto plan = s.plan_from(g, 0, [](NodeIndex n) { return n == 2; });
    EXPECT_EQ(plan.affected, (Nodes{2}));
}

TEST(Scheduler_Plan, FullPlanCoversEveryFormulaNode) {
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 0, .parallel_tier_threshold = 8});
    const auto g    = chain_graph();
    const auto plan = s.plan_full(g, is_formula);
    EXPECT_EQ(plan.affected, (Nodes{1, 4, 2}));
    ASSERT_EQ(plan.tiers.size(), 2u);
    EXPECT_EQ(plan.tiers[0], (Nodes{1, 4}));
}

// ─── Execution ────────────────────────────────────────────────────────────────

TEST(Scheduler_Execute, TiersRunInDependencyOrder) {
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 0, .parallel_tier_threshold = 8});
    RecordingEvaluator ev;
    const auto g      = chain_graph();
    const auto report = s.execute(s.plan_full(g, is_formula), ev);
    EXPECT_EQ(report.evaluated, 3u);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(ev.order(), (Nodes{1, 4, 2}));
    EXPECT_EQ(s.state(), SchedulerState::Done);
}

TEST(Scheduler_Execute, FailureIsContainedToTheNode) {
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 0, .parallel_tier_threshold = 8});
    RecordingEvaluator ev;
    ev.fail_with_shape = {1};
    ev.fail_with_eval  = {4};
    const auto g      = chain_graph();
    const auto report = s.execute(s.plan_full(g, is_formula), ev);

    EXPECT_EQ(report.evaluated, 3u);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].node, 1u);
    EXPECT_TRUE(report.failures[0].shape_error);
    EXPECT_EQ(report.failures[1].node, 4u);
    EXPECT_FALSE(report.failures[1].shape_error);
    EXPECT_EQ(report.failures[1].message, "division by zero");
    // The dependent of the failed node still ran.
    EXPECT_EQ(ev.order().back(), 2u);
    EXPECT_EQ(ev.resets(), (Nodes{1, 4}));
    EXPECT_EQ(s.state(), SchedulerState::PartialFailure);
}

TEST(Scheduler_Execute, WideTierRunsOnThePool) {
    // One input fanning out to 64 formula nodes, then a single sink.
    constexpr NodeIndex FAN = 64;
    graph::DependencyGraph g;
    Nodes all_fan;
    for (NodeIndex n = 1; n <= FAN; ++n) {
        g.set_dependencies(n, Nodes{0});
        all_fan.push_back(n);
    }
    g.set_dependencies(FAN + 1, all_fan);

    IncrementalScheduler s(SchedulerConfig{.worker_threads = 4, .parallel_tier_threshold = 2});
    EXPECT_EQ(s.worker_threads(), 4u);

    RecordingEvaluator ev;
    ev.fail_with_eval = {7, 33};
    const auto plan   = s.plan_from(g, 0, [](NodeIndex n) { return n != 0; });
    const auto report = s.execute(plan, ev);

    EXPECT_EQ(report.evaluated, FAN + 1);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].node, 7u);   // tier order, not completion order
    EXPECT_EQ(report.failures[1].node, 33u);

    auto order = ev.order();
    ASSERT_EQ(order.size(), FAN + 1);
    EXPECT_EQ(order.back(), FAN + 1);  // the sink waits for the whole wave
    std::sort(order.begin(), order.end() - 1);
    for (NodeIndex n = 1; n <= FAN; ++n) {
        EXPECT_EQ(order[n - 1], n);
    }
}

TEST(Scheduler_Config, NoPoolWhenSingleThreaded) {
    IncrementalScheduler s(SchedulerConfig{.worker_threads = 1, .parallel_tier_threshold = 1});
    EXPECT_EQ(s.worker_threads(), 0u);
    EXPECT_EQ(s.state(), SchedulerState::Idle);
}

TEST(Scheduler_State, NamesAreStable) {
    EXPECT_STREQ(to_string(SchedulerState::Idle), "Idle");
    EXPECT_STREQ(to_string(SchedulerState::PartialFailure), "PartialFailure");
}
