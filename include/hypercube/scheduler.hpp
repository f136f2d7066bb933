#pragma once

/// @file include/hypercube/scheduler.hpp
/// @brief Incremental Scheduler — affected-set planning and tiered execution.
///
/// # Module: Incremental Scheduler
///
/// ## Responsibility
/// Given a changed node, compute the minimal set of formula-bearing nodes
/// downstream of it, group them into dependency-free tiers and evaluate the
/// tiers in sequence, each tier as one concurrent wave on a bounded pool.
///
/// ## State Machine
/// ```
/// Idle → AffectedSetComputed → Tiered → Evaluating → Done | PartialFailure
/// ```
/// `plan_*` leaves the scheduler in `Tiered` (or `Done` for an empty plan);
/// `execute` moves through `Evaluating` to `Done` or `PartialFailure`.
///
/// ## Failure Policy
/// A node whose evaluation throws is recorded as a `NodeError`, its tensor is
/// zeroed through `NodeEvaluator::reset`, and the rest of the tier carries on.
/// One failing formula never aborts the batch.
///
/// ## Concurrency
/// Waves run on an `Eigen::ThreadPool`; the caller blocks on an
/// `Eigen::Barrier` until the wave is complete before releasing the next
/// tier. Tiers below `parallel_tier_threshold` run inline.

#include "hypercube/types.hpp"
#include "hypercube/error.hpp"
#include "hypercube/constants.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace Eigen {
class ThreadPoolInterface;
}  // namespace Eigen

namespace hypercube::graph {
class DependencyGraph;
}  // namespace hypercube::graph

namespace hypercube::scheduler {

/// Scheduler lifecycle for the current batch.
enum class SchedulerState {
    Idle,
    AffectedSetComputed,
    Tiered,
    Evaluating,
    Done,
    PartialFailure,
};

[[nodiscard]] const char* to_string(SchedulerState s) noexcept;

/// The nodes of one batch, grouped into tiers.
struct RecomputePlan {
    std::vector<NodeIndex>              affected;  ///< Tier order, then index order
    std::vector<std::vector<NodeIndex>> tiers;

    [[nodiscard]] bool empty() const noexcept { return affected.empty(); }
};

/// A node that failed during `execute`.
struct NodeFailure {
    NodeIndex   node;
    std::string message;
    bool        shape_error = false;
};

/// Result of executing one plan.
struct BatchReport {
    std::size_t              evaluated = 0;  ///< Nodes attempted
    std::vector<NodeFailure> failures;       ///< In tier order
};

/// Callbacks the scheduler drives for each node.
///
/// `evaluate` may be called concurrently for nodes of the same tier and
/// must only write that node's tensor.
class NodeEvaluator {
public:
    virtual ~NodeEvaluator() = default;

    /// Recompute `node`. Throws EvaluationError / ShapeError on failure.
    virtual void evaluate(NodeIndex node) = 0;

    /// Zero `node`'s tensor after a failed evaluation.
    virtual void reset(NodeIndex node) noexcept = 0;
};

/// Scheduler configuration.
struct SchedulerConfig {
    std::size_t worker_threads          = constants::DEFAULT_WORKER_THREADS;
    std::size_t parallel_tier_threshold = constants::DEFAULT_PARALLEL_TIER_THRESHOLD;
};

/// Plans and executes recompute batches.
class IncrementalScheduler {
public:
    explicit IncrementalScheduler(SchedulerConfig config = SchedulerConfig{});
    ~IncrementalScheduler();

    IncrementalScheduler(const IncrementalScheduler&)            = delete;
    IncrementalScheduler& operator=(const IncrementalScheduler&) = delete;

    /// Plan the batch triggered by a change to `changed`.
    ///
    /// The affected set is every descendant of `changed` that carries a
    /// formula; `changed` itself is never included. Pure inputs are never
    /// recomputed.
    [[nodiscard]] RecomputePlan
    plan_from(const graph::DependencyGraph& graph,
              NodeIndex changed,
              const std::function<bool(NodeIndex)>& has_formula);

    /// Plan a recompute of every formula-bearing node.
    [[nodiscard]] RecomputePlan
    plan_full(const graph::DependencyGraph& graph,
              const std::function<bool(NodeIndex)>& has_formula);

    /// Evaluate `plan` tier by tier.
    BatchReport execute(const RecomputePlan& plan, NodeEvaluator& evaluator);

    [[nodiscard]] SchedulerState state() const noexcept { return state_; }

    /// Number of pool threads (0 when evaluation is always inline).
    [[nodiscard]] std::size_t worker_threads() const noexcept;

private:
    /// Build tiers from the affected nodes, keeping only formula nodes.
    [[nodiscard]] static RecomputePlan
    tier(const graph::DependencyGraph& graph,
         std::span<const NodeIndex> subset,
         const std::function<bool(NodeIndex)>& has_formula);

    /// Evaluate one tier, inline or as a pool wave.
    void run_tier(std::span<const NodeIndex> tier,
                  NodeEvaluator& evaluator,
                  BatchReport& report);

    SchedulerConfig                             config_;
    std::unique_ptr<Eigen::ThreadPoolInterface> pool_;
    SchedulerState                              state_ = SchedulerState::Idle;
};

} // namespace hypercube::scheduler
