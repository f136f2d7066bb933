/// @file src/scheduler/incremental_scheduler.cpp
/// @brief IncrementalScheduler — affected-set planning and tiered waves.

#include "hypercube/scheduler.hpp"
#include "hypercube/graph.hpp"

#define EIGEN_USE_THREADS
#include <unsupported/Eigen/CXX11/ThreadPool>

#include <algorithm>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>

namespace hypercube::scheduler {

namespace {

/// Outcome of one node inside a wave; folded into the report afterwards so
/// that failures are listed in tier order regardless of completion order.
using Slot = std::optional<NodeFailure>;

Slot evaluate_one(NodeIndex node, NodeEvaluator& evaluator) {
    try {
        evaluator.evaluate(node);
        return std::nullopt;
    } catch (const ShapeError& e) {
        evaluator.reset(node);
        return NodeFailure{.node = node, .message = e.what(), .shape_error = true};
    } catch (const std::exception& e) {
        evaluator.reset(node);
        return NodeFailure{.node = node, .message = e.what(), .shape_error = false};
    }
}

}  // namespace

const char* to_string(SchedulerState s) noexcept {
    switch (s) {
        case SchedulerState::Idle:                return "Idle";
        case SchedulerState::AffectedSetComputed: return "AffectedSetComputed";
        case SchedulerState::Tiered:              return "Tiered";
        case SchedulerState::Evaluating:          return "Evaluating";
        case SchedulerState::Done:                return "Done";
        case SchedulerState::PartialFailure:      return "PartialFailure";
    }
    return "Unknown";
}

IncrementalScheduler::IncrementalScheduler(SchedulerConfig config) : config_(config) {
    if (config_.worker_threads > 1) {
        pool_ = std::make_unique<Eigen::ThreadPool>(static_cast<int>(config_.worker_threads));
    }
}

IncrementalScheduler::~IncrementalScheduler() = default;

std::size_t IncrementalScheduler::worker_threads() const noexcept {
    return pool_ ? config_.worker_threads : 0;
}

// ─── Planning ─────────────────────────────────────────────────────────────────

RecomputePlan IncrementalScheduler::plan_from(const graph::DependencyGraph& graph,
                                              NodeIndex changed,
                                              const std::function<bool(NodeIndex)>& has_formula) {
    const std::vector<NodeIndex> downstream = graph.descendants(changed);
    state_ = SchedulerState::AffectedSetComputed;
    RecomputePlan plan = tier(graph, downstream, has_formula);
    state_ = plan.empty() ? SchedulerState::Done : SchedulerState::Tiered;
    return plan;
}

RecomputePlan IncrementalScheduler::plan_full(const graph::DependencyGraph& graph,
                                              const std::function<bool(NodeIndex)>& has_formula) {
    std::vector<NodeIndex> all(graph.node_count());
    for (NodeIndex v = 0; v < all.size(); ++v) {
        all[v] = v;
    }
    state_ = SchedulerState::AffectedSetComputed;
    RecomputePlan plan = tier(graph, all, has_formula);
    state_ = plan.empty() ? SchedulerState::Done : SchedulerState::Tiered;
    return plan;
}

RecomputePlan IncrementalScheduler::tier(const graph::DependencyGraph& graph,
                                         std::span<const NodeIndex> subset,
                                         const std::function<bool(NodeIndex)>& has_formula) {
    std::vector<NodeIndex> formula_nodes;
    formula_nodes.reserve(subset.size());
    std::copy_if(subset.begin(), subset.end(), std::back_inserter(formula_nodes), has_formula);

    RecomputePlan plan;
    plan.tiers = graph.generations(formula_nodes);
    for (const auto& t : plan.tiers) {
        plan.affected.insert(plan.affected.end(), t.begin(), t.end());
    }
    return plan;
}

// ─── Execution ────────────────────────────────────────────────────────────────

BatchReport IncrementalScheduler::execute(const RecomputePlan& plan, NodeEvaluator& evaluator) {
    BatchReport report;
    state_ = SchedulerState::Evaluating;
    for (const auto& t : plan.tiers) {
        run_tier(t, evaluator, report);
    }
    state_ = report.failures.empty() ? SchedulerState::Done : SchedulerState::PartialFailure;
    return report;
}

void IncrementalScheduler::run_tier(std::span<const NodeIndex> tier,
                                    NodeEvaluator& evaluator,
                                    BatchReport& report) {
    std::vector<Slot> slots(tier.size());

    if (!pool_ || tier.size() < config_.parallel_tier_threshold) {
        for (std::size_t i = 0; i < tier.size(); ++i) {
            slots[i] = evaluate_one(tier[i], evaluator);
        }
    } else {
        // One wave: every node of the tier is independent of the others.
        Eigen::Barrier barrier(static_cast<unsigned int>(tier.size()));
        for (std::size_t i = 0; i < tier.size(); ++i) {
            pool_->Schedule([&slots, &evaluator, &barrier, node = tier[i], i] {
                slots[i] = evaluate_one(node, evaluator);
                barrier.Notify();
            });
        }
        barrier.Wait();
    }

    report.evaluated += tier.size();
    for (auto& slot : slots) {
        if (slot) {
            report.failures.push_back(std::move(*slot));
        }
    }
}

} // namespace hypercube::scheduler
