#pragma once

/// @file include/hypercube/engine.hpp
/// @brief Core computation engine — public API.
///
/// # Module: Core Engine
///
/// ## Responsibility
/// Maintain a directed graph of named financial metrics wired together by
/// formulas over a multi-dimensional (e.g. geography × product × time) data
/// space, and recompute incrementally when a single input changes:
///
///   define_dimension → add_metric → set_formula → initialize_horizon →
///   update_input → (IncrementalScheduler) → get_results / get_trace
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// engine.initialize_horizon({"2024-01"});
/// engine.add_metric("CAC", "Customer Acquisition Cost");
/// if (auto err = engine.set_formula("customers", "budget / CAC")) {
///     fmt::print(stderr, "{}\n", err->to_string());
/// }
/// auto outcome = engine.update_input("CAC", "2024-01", 200.0, "cfo");
/// // outcome.affected_nodes == {"customers"}
/// ```
///
/// ## Guarantees
/// - The graph is acyclic after every accepted `set_formula`; a rejected
///   assignment leaves the model exactly as it was
/// - Structural and configuration failures are returned, never thrown
/// - Evaluation failures are contained to the failing node
/// - Const queries are safe to call concurrently with each other
///
/// ## NOT Responsible For
/// - Serialising concurrent writers: one writer per engine instance; callers
///   mutating the same model from several threads must lock externally
/// - Persistence, job lifecycle, sampling loops

#include "hypercube/types.hpp"
#include "hypercube/error.hpp"
#include "hypercube/constants.hpp"
#include "hypercube/formula.hpp"
#include "hypercube/graph.hpp"
#include "hypercube/model.hpp"
#include "hypercube/scheduler.hpp"
#include "hypercube/tensor.hpp"
#include "hypercube/trace.hpp"

#include <spdlog/logger.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hypercube::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for one engine instance.
struct EngineConfig {
    /// Model identifier, used to tag log lines.
    std::string model_id = "default";

    /// Bounded worker pool size for tier evaluation (0 or 1 = inline only).
    std::size_t worker_threads = constants::DEFAULT_WORKER_THREADS;

    /// Tiers smaller than this are evaluated on the calling thread.
    std::size_t parallel_tier_threshold = constants::DEFAULT_PARALLEL_TIER_THRESHOLD;

    /// Number of trace entries retained.
    std::size_t trace_capacity = constants::DEFAULT_TRACE_CAPACITY;

    /// Initial state of cycle validation in `set_formula`.
    bool validation_enabled = true;

    /// Logger to use; nullptr selects the default "hypercube" logger.
    std::shared_ptr<spdlog::logger> logger;
};

// ─── Query types ──────────────────────────────────────────────────────────────

/// One non-zero cell of a metric tensor.
struct ResultRecord {
    std::string                                      month;
    double                                           value = 0.0;
    std::vector<std::pair<std::string, std::string>> coords;  ///< (dim, member), declared order

    bool operator==(const ResultRecord&) const = default;
};

/// Sparse results per metric id.
using Results = std::map<MetricId, std::vector<ResultRecord>>;

/// Upstream and downstream neighbours of one metric.
struct DependencyChain {
    MetricId                   node;
    std::vector<MetricId>      depends_on;
    std::vector<MetricId>      impacts;
    std::optional<std::string> formula;  ///< Source text; nullopt for inputs
};

/// Graph node for visualisation.
struct DagNode {
    MetricId    id;
    std::string name;
    std::string type;  ///< "formula" or "input"
};

/// Graph edge for visualisation (dependency → dependent).
struct DagEdge {
    MetricId source;
    MetricId target;
};

/// Whole-graph snapshot for visualisation.
struct DagMetadata {
    std::vector<DagNode> nodes;
    std::vector<DagEdge> edges;
};

/// Result of `update_input` / `full_recompute`.
struct RecomputeOutcome {
    std::vector<MetricId>      affected_nodes;  ///< Recomputed nodes, tier order
    std::size_t                ignored_writes = 0;  ///< Writes outside the horizon
    std::vector<NodeError>     failed_nodes;    ///< Nodes zeroed after a failure
    std::optional<EngineError> error;           ///< Set when the call was rejected

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// ─── Engine ───────────────────────────────────────────────────────────────────

/// Dependency-graph computation engine over dimensional tensors.
class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});
    ~Engine();

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Construction API ─────────────────────────────────────────────────────

    /// Define (or redefine) a dimension with ordered, unique members.
    ///
    /// Redefining with identical members is a no-op. Redefining with
    /// different members zero-resets the tensor of every metric that
    /// declares the dimension (their shape changes).
    ///
    /// # Returns
    /// `Configuration` error for an empty name, no members or duplicates.
    [[nodiscard]] std::optional<EngineError>
    define_dimension(const std::string& name, std::vector<std::string> members);

    /// Register a metric, or update the metadata of an existing one.
    ///
    /// An existing metric keeps its formula. Its dims may only change while
    /// it is a placeholder or has no tensor for the current horizon.
    [[nodiscard]] std::optional<EngineError>
    add_metric(const MetricId& id,
               const std::string& name,
               const std::string& category = constants::DEFAULT_CATEGORY,
               std::vector<std::string> dims = {});

    /// Assign a formula to `id` (auto-created if unknown).
    ///
    /// Unknown identifiers in the formula become placeholder input metrics.
    /// The node's previous incoming edges are replaced by edges from the new
    /// dependencies.
    ///
    /// # Returns
    /// - `InvalidFormula` if the text does not parse
    /// - `CircularDependency` with the cycle and a remediation hint if the
    ///   assignment would close a loop (only while validation is enabled)
    /// On error nothing changes: no edges, no formula, no placeholders.
    [[nodiscard]] std::optional<EngineError>
    set_formula(const MetricId& id, std::string_view expression);

    /// Set the time horizon and (re)allocate every tensor, zero-filled.
    ///
    /// # Returns
    /// `Configuration` error for an empty horizon or duplicate labels.
    [[nodiscard]] std::optional<EngineError>
    initialize_horizon(std::vector<std::string> months);

    /// Enable or disable cycle validation.
    ///
    /// Disabling is for bulk loading. Enabling runs a full-graph pass; if a
    /// cycle is found it is returned and validation stays disabled.
    [[nodiscard]] std::optional<EngineError> set_validation_enabled(bool enabled);

    [[nodiscard]] bool validation_enabled() const noexcept { return validation_enabled_; }

    // ── Recompute API ────────────────────────────────────────────────────────

    /// Write coordinate-scoped input values into `id` and recompute its
    /// formula-bearing descendants.
    ///
    /// Values whose month lies outside the horizon are skipped and counted
    /// in `ignored_writes`. An unknown member of a declared dimension rejects
    /// the whole call before any write. When nothing is downstream no trace
    /// entry is recorded.
    [[nodiscard]] RecomputeOutcome
    update_input(const MetricId& id,
                 std::span<const InputValue> values,
                 const std::string& actor = "system");

    /// Convenience for a single write with no coordinates (broadcasts across
    /// every declared dimension).
    [[nodiscard]] RecomputeOutcome
    update_input(const MetricId& id,
                 const std::string& month,
                 double value,
                 const std::string& actor = "system");

    /// Recompute every formula-bearing node in dependency order.
    [[nodiscard]] RecomputeOutcome full_recompute();

    // ── Query API ────────────────────────────────────────────────────────────

    /// Non-zero cells of every metric, optionally filtered by coordinates.
    ///
    /// A filter entry applies only to metrics that declare that dimension.
    [[nodiscard]] Results get_results(const Coordinates& filter = {}) const;

    /// The most recent `limit` trace entries, oldest first.
    [[nodiscard]] std::vector<trace::TraceEntry>
    get_trace(std::size_t limit = constants::DEFAULT_TRACE_LIMIT) const;

    /// Direct dependencies, direct dependents and formula of `id`.
    [[nodiscard]] std::optional<DependencyChain>
    get_dependency_chain(const MetricId& id) const;

    /// Nodes and edges for visualisation.
    [[nodiscard]] DagMetadata get_dag_metadata() const;

    /// Nodes whose most recent evaluation failed ("stale metrics").
    [[nodiscard]] std::vector<NodeError> get_node_errors() const;

    /// Copy of `id`'s tensor, or `nullopt` if the metric is unknown.
    [[nodiscard]] std::optional<NdArray> get_tensor(const MetricId& id) const;

    /// Metadata of `id`, or `nullopt` if unknown.
    [[nodiscard]] std::optional<model::Metric> get_metric(const MetricId& id) const;

    [[nodiscard]] std::span<const std::string> horizon() const noexcept { return months_; }
    [[nodiscard]] std::size_t metric_count() const noexcept { return registry_.size(); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    [[nodiscard]] scheduler::SchedulerState scheduler_state() const noexcept {
        return scheduler_.state();
    }

private:
    class TensorEvaluator;

    /// Formula attached to one node, with dependencies resolved to indices.
    struct FormulaSlot {
        std::optional<formula::CompiledFormula> compiled;
        std::vector<NodeIndex>                  deps;
    };

    /// Register a brand-new metric and give it a tensor if a horizon is set.
    NodeIndex register_metric(model::Metric metric);

    /// Index of `id`, creating a placeholder input metric if unknown.
    NodeIndex ensure_metric(const MetricId& id);

    /// Tensor shape of `node` for the current horizon.
    [[nodiscard]] Shape shape_of(NodeIndex node) const;

    /// (Re)allocate `node`'s tensor if a horizon is set.
    void allocate(NodeIndex node);

    /// Run `plan` and fold the report into `outcome`.
    void run_plan(const scheduler::RecomputePlan& plan, RecomputeOutcome& outcome);

    /// Write one validated input value.
    void write_input(NodeIndex node,
                     const std::vector<std::optional<std::size_t>>& axis_index,
                     std::size_t month_index,
                     double value);

    [[nodiscard]] bool has_formula(NodeIndex node) const noexcept;

    EngineConfig                                 config_;
    std::shared_ptr<spdlog::logger>              logger_;
    model::DimensionCatalog                      dimensions_;
    model::MetricRegistry                        registry_;
    graph::DependencyGraph                       graph_;
    tensor::TensorStore                          tensors_;
    formula::SafeIdCache                         safe_ids_;
    std::vector<FormulaSlot>                     formulas_;
    std::vector<std::optional<NodeError>>        node_errors_;
    scheduler::IncrementalScheduler              scheduler_;
    trace::ExplainLog                            trace_;
    std::vector<std::string>                     months_;
    std::unordered_map<std::string, std::size_t> month_to_index_;
    bool                                         horizon_initialized_ = false;
    bool                                         validation_enabled_  = true;
};

}  // namespace hypercube::core
