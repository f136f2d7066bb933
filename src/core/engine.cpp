/// @file src/core/engine.cpp
/// @brief Engine — construction, incremental recompute and queries.

#include "hypercube/engine.hpp"
#include "hypercube/log.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <unordered_set>

namespace hypercube::core {

// ─── TensorEvaluator ──────────────────────────────────────────────────────────

/// Evaluates one formula node against the engine's tensors.
///
/// Called concurrently for the nodes of one tier: reads dependency tensors
/// (all from earlier tiers) and stores only into the node's own slot.
class Engine::TensorEvaluator final : public scheduler::NodeEvaluator {
public:
    explicit TensorEvaluator(Engine& engine) : engine_(engine) {}

    void evaluate(NodeIndex node) override {
        const FormulaSlot&   slot   = engine_.formulas_[node];
        const model::Metric& target = engine_.registry_.at(node);
        if (!slot.compiled) {
            throw EvaluationError(fmt::format("'{}' has no formula", target.id));
        }

        std::vector<NdArray> args;
        args.reserve(slot.deps.size());
        for (NodeIndex dep : slot.deps) {
            const model::Metric& source = engine_.registry_.at(dep);
            args.push_back(tensor::align_dependency(engine_.tensors_.read(dep), source.id,
                                                    source.dims, target.dims));
        }

        NdArray result = slot.compiled->evaluate(args);
        engine_.tensors_.store(node, tensor::fit_result(std::move(result),
                                                        engine_.tensors_.read(node).shape));
    }

    void reset(NodeIndex node) noexcept override {
        engine_.tensors_.zero(node);
    }

private:
    Engine& engine_;
};

// ─── Construction ─────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
    , logger_(config_.logger ? config_.logger : log::default_logger())
    , scheduler_(scheduler::SchedulerConfig{
          .worker_threads          = config_.worker_threads,
          .parallel_tier_threshold = config_.parallel_tier_threshold,
      })
    , trace_(config_.trace_capacity)
    , validation_enabled_(config_.validation_enabled) {
    logger_->debug("[{}] engine created (workers={}, parallel tier threshold={})",
                   config_.model_id, scheduler_.worker_threads(),
                   config_.parallel_tier_threshold);
}

Engine::~Engine() = default;

std::optional<EngineError>
Engine::define_dimension(const std::string& name, std::vector<std::string> members) {
    if (name.empty()) {
        return EngineError::configuration("dimension name must not be empty");
    }
    if (auto problem = model::DimensionCatalog::validate_members(members); !problem.empty()) {
        return EngineError::configuration(fmt::format("dimension '{}': {}", name, problem));
    }

    const std::size_t extent = members.size();
    const auto result = dimensions_.define(name, std::move(members));
    if (result == model::DefineResult::Unchanged) {
        return std::nullopt;
    }

    // Tensors declared over this dimension change shape: zero-reset them.
    std::size_t reset = 0;
    for (NodeIndex node = 0; node < registry_.size(); ++node) {
        const auto& dims = registry_.at(node).dims;
        if (tensors_.is_allocated(node) && std::find(dims.begin(), dims.end(), name) != dims.end()) {
            allocate(node);
            ++reset;
        }
    }

    if (result == model::DefineResult::Replaced && reset > 0) {
        logger_->warn("[{}] dimension '{}' redefined with {} members; {} tensor(s) zero-reset",
                      config_.model_id, name, extent, reset);
    } else {
        logger_->info("[{}] dimension '{}' defined with {} members", config_.model_id, name,
                      extent);
    }
    return std::nullopt;
}

std::optional<EngineError> Engine::add_metric(const MetricId& id,
                                              const std::string& name,
                                              const std::string& category,
                                              std::vector<std::string> dims) {
    if (id.empty()) {
        return EngineError::configuration("metric id must not be empty");
    }
    std::unordered_set<std::string> seen;
    for (const auto& d : dims) {
        if (!seen.insert(d).second) {
            return EngineError::configuration(
                fmt::format("metric '{}' declares dimension '{}' twice", id, d));
        }
    }

    const auto existing = registry_.find(id);
    if (!existing) {
        register_metric(model::Metric{
            .id             = id,
            .display_name   = name.empty() ? id : name,
            .category       = category,
            .dims           = std::move(dims),
            .is_calculated  = false,
            .is_placeholder = false,
        });
        return std::nullopt;
    }

    const NodeIndex node   = *existing;
    model::Metric&  metric = registry_.at(node);
    if (metric.dims != dims) {
        if (!metric.is_placeholder && tensors_.is_allocated(node)) {
            return EngineError::configuration(fmt::format(
                "cannot change the dimensions of '{}' once its tensor is allocated", id));
        }
        metric.dims = std::move(dims);
        if (tensors_.is_allocated(node)) {
            allocate(node);
        }
    }
    metric.display_name   = name.empty() ? id : name;
    metric.category       = category;
    metric.is_placeholder = false;
    return std::nullopt;
}

std::optional<EngineError> Engine::set_formula(const MetricId& id, std::string_view expression) {
    if (id.empty()) {
        return EngineError::configuration("metric id must not be empty");
    }
    // A new target must be known to the id cache so that its own name can
    // appear in the text; register it on a scratch copy until accepted.
    std::optional<formula::SafeIdCache> scratch;
    if (!registry_.find(id)) {
        scratch.emplace(safe_ids_);
        scratch->register_id(id);
    }
    const formula::SafeIdCache& ids = scratch ? *scratch : safe_ids_;

    std::optional<formula::CompiledFormula> compiled;
    try {
        compiled.emplace(formula::FormulaCompiler::compile(expression, ids));
    } catch (const formula::FormulaSyntaxError& e) {
        logger_->warn("[{}] invalid formula for '{}': {}", config_.model_id, id, e.what());
        return EngineError{
            .kind       = ErrorKind::InvalidFormula,
            .message    = fmt::format("invalid formula for '{}' at column {}: {}", id,
                                      e.column(), e.what()),
            .cycle      = {},
            .suggestion = {},
        };
    }

    const auto deps_ids = compiled->dependencies();

    // ── Cycle check against the live graph, before anything is mutated ──────
    if (validation_enabled_) {
        std::optional<std::vector<NodeIndex>> cycle;
        if (const auto node = registry_.find(id)) {
            std::vector<NodeIndex> known;
            for (const auto& dep : deps_ids) {
                if (const auto d = registry_.find(dep)) {
                    known.push_back(*d);
                }
            }
            cycle = graph_.cycle_through(*node, known);
        } else if (std::find(deps_ids.begin(), deps_ids.end(), id) != deps_ids.end()) {
            cycle = std::vector<NodeIndex>{};  // self-reference of a new node
        }

        if (cycle) {
            std::vector<MetricId> path;
            for (NodeIndex v : *cycle) {
                path.push_back(registry_.at(v).id);
            }
            if (path.empty()) {
                path.push_back(id);
            }
            logger_->warn("[{}] rejected formula for '{}': cycle {}", config_.model_id, id,
                          fmt::join(path, " -> "));
            return EngineError{
                .kind       = ErrorKind::CircularDependency,
                .message    = fmt::format("formula for '{}' would create a circular dependency",
                                          id),
                .cycle      = std::move(path),
                .suggestion = constants::CYCLE_SUGGESTION,
            };
        }
    }

    // ── Accepted: create missing metrics, then rewire ────────────────────────
    const NodeIndex node = ensure_metric(id);
    std::vector<NodeIndex> deps;
    deps.reserve(deps_ids.size());
    for (const auto& dep : deps_ids) {
        deps.push_back(ensure_metric(dep));
    }
    graph_.set_dependencies(node, deps);

    logger_->debug("[{}] formula for '{}' set to {} ({} dependencies)", config_.model_id, id,
                   compiled->canonical(), deps.size());

    model::Metric& metric = registry_.at(node);
    metric.is_calculated  = true;
    metric.is_placeholder = false;
    formulas_[node]       = FormulaSlot{.compiled = std::move(compiled), .deps = std::move(deps)};
    return std::nullopt;
}

std::optional<EngineError> Engine::initialize_horizon(std::vector<std::string> months) {
    if (months.empty()) {
        return EngineError::configuration("horizon must contain at least one month");
    }
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < months.size(); ++i) {
        if (!index.emplace(months[i], i).second) {
            return EngineError::configuration(
                fmt::format("duplicate month '{}' in horizon", months[i]));
        }
    }

    months_              = std::move(months);
    month_to_index_      = std::move(index);
    horizon_initialized_ = true;
    tensors_.set_horizon(months_.size());
    for (NodeIndex node = 0; node < registry_.size(); ++node) {
        allocate(node);
    }
    std::fill(node_errors_.begin(), node_errors_.end(), std::nullopt);

    logger_->info("[{}] horizon set to {} months ({} .. {}); {} tensors allocated",
                  config_.model_id, months_.size(), months_.front(), months_.back(),
                  registry_.size());
    return std::nullopt;
}

std::optional<EngineError> Engine::set_validation_enabled(bool enabled) {
    if (enabled == validation_enabled_) {
        return std::nullopt;
    }
    if (!enabled) {
        validation_enabled_ = false;
        logger_->info("[{}] cycle validation disabled", config_.model_id);
        return std::nullopt;
    }

    if (const auto cycle = graph_.find_cycle()) {
        std::vector<MetricId> path;
        for (NodeIndex v : *cycle) {
            path.push_back(registry_.at(v).id);
        }
        logger_->warn("[{}] cannot enable validation: cycle {}", config_.model_id,
                      fmt::join(path, " -> "));
        return EngineError{
            .kind       = ErrorKind::CircularDependency,
            .message    = "the graph contains a circular dependency; validation stays disabled",
            .cycle      = std::move(path),
            .suggestion = constants::CYCLE_SUGGESTION,
        };
    }
    validation_enabled_ = true;
    logger_->info("[{}] cycle validation enabled", config_.model_id);
    return std::nullopt;
}

// ─── Recompute ────────────────────────────────────────────────────────────────

RecomputeOutcome Engine::update_input(const MetricId& id,
                                      std::span<const InputValue> values,
                                      const std::string& actor) {
    RecomputeOutcome outcome;
    if (!horizon_initialized_) {
        outcome.error = EngineError::configuration("horizon not initialised");
        return outcome;
    }
    if (!validation_enabled_) {
        outcome.error = EngineError::configuration(
            "recompute refused while cycle validation is disabled");
        return outcome;
    }

    const NodeIndex node = ensure_metric(id);
    const auto&     dims = registry_.at(node).dims;

    // ── Validate every write before touching the tensor ──────────────────────
    struct Write {
        std::vector<std::optional<std::size_t>> axis_index;
        std::size_t                             month_index;
        double                                  value;
    };
    std::vector<Write> writes;
    writes.reserve(values.size());

    for (const auto& v : values) {
        std::vector<std::optional<std::size_t>> axis_index(dims.size());
        for (std::size_t a = 0; a < dims.size(); ++a) {
            const auto c = v.coords.find(dims[a]);
            if (c == v.coords.end()) {
                continue;  // broadcast over this axis
            }
            const auto member = dimensions_.member_index(dims[a], c->second);
            if (!member) {
                outcome.error = EngineError::configuration(
                    dimensions_.contains(dims[a])
                        ? fmt::format("unknown member '{}' of dimension '{}'", c->second, dims[a])
                        : fmt::format("dimension '{}' of '{}' is not defined", dims[a], id));
                return outcome;
            }
            axis_index[a] = *member;
        }

        const auto month = month_to_index_.find(v.month);
        if (month == month_to_index_.end()) {
            ++outcome.ignored_writes;
            continue;
        }
        writes.push_back(Write{.axis_index = std::move(axis_index),
                               .month_index = month->second, .value = v.value});
    }

    for (const auto& w : writes) {
        write_input(node, w.axis_index, w.month_index, w.value);
    }
    if (outcome.ignored_writes > 0) {
        logger_->debug("[{}] '{}': {} write(s) outside the horizon ignored", config_.model_id, id,
                       outcome.ignored_writes);
    }

    // ── Recompute downstream ─────────────────────────────────────────────────
    const auto start = std::chrono::steady_clock::now();
    const auto plan  = scheduler_.plan_from(graph_, node,
                                            [this](NodeIndex n) { return has_formula(n); });
    if (plan.empty()) {
        return outcome;
    }
    run_plan(plan, outcome);
    const std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - start;

    trace_.append(id, actor, outcome.affected_nodes, elapsed.count());
    return outcome;
}

RecomputeOutcome Engine::update_input(const MetricId& id,
                                      const std::string& month,
                                      double value,
                                      const std::string& actor) {
    const InputValue single{.month = month, .coords = {}, .value = value};
    return update_input(id, std::span<const InputValue>(&single, 1), actor);
}

RecomputeOutcome Engine::full_recompute() {
    RecomputeOutcome outcome;
    if (!horizon_initialized_) {
        outcome.error = EngineError::configuration("horizon not initialised");
        return outcome;
    }
    if (!validation_enabled_) {
        outcome.error = EngineError::configuration(
            "recompute refused while cycle validation is disabled");
        return outcome;
    }
    const auto plan = scheduler_.plan_full(graph_, [this](NodeIndex n) { return has_formula(n); });
    if (!plan.empty()) {
        run_plan(plan, outcome);
    }
    return outcome;
}

void Engine::run_plan(const scheduler::RecomputePlan& plan, RecomputeOutcome& outcome) {
    TensorEvaluator evaluator(*this);
    const auto report = scheduler_.execute(plan, evaluator);

    outcome.affected_nodes.reserve(plan.affected.size());
    for (NodeIndex node : plan.affected) {
        outcome.affected_nodes.push_back(registry_.at(node).id);
        node_errors_[node].reset();
    }
    for (const auto& failure : report.failures) {
        NodeError err{.node = registry_.at(failure.node).id, .message = failure.message,
                      .shape_error = failure.shape_error};
        logger_->warn("[{}] evaluation of '{}' failed{}: {}", config_.model_id, err.node,
                      err.shape_error ? " (shape)" : "", err.message);
        node_errors_[failure.node] = err;
        outcome.failed_nodes.push_back(std::move(err));
    }
    logger_->debug("[{}] batch done: {} node(s) in {} tier(s), {} failure(s)", config_.model_id,
                   report.evaluated, plan.tiers.size(), report.failures.size());
}

void Engine::write_input(NodeIndex node,
                         const std::vector<std::optional<std::size_t>>& axis_index,
                         std::size_t month_index,
                         double value) {
    NdArray&          t       = tensors_.write(node);
    const auto        strides = tensor::row_major_strides(t.shape);
    const std::size_t rank    = axis_index.size();

    // Odometer over the non-time axes; fixed axes never advance.
    std::vector<std::size_t> idx(rank);
    for (std::size_t a = 0; a < rank; ++a) {
        idx[a] = axis_index[a].value_or(0);
    }
    for (;;) {
        std::size_t offset = month_index * strides[rank];
        for (std::size_t a = 0; a < rank; ++a) {
            offset += idx[a] * strides[a];
        }
        t.values[static_cast<Eigen::Index>(offset)] = value;

        bool advanced = false;
        for (std::size_t a = rank; a-- > 0;) {
            if (axis_index[a]) {
                continue;
            }
            if (++idx[a] < t.shape[a]) {
                advanced = true;
                break;
            }
            idx[a] = 0;
        }
        if (!advanced) {
            return;
        }
    }
}

// ─── Registration helpers ─────────────────────────────────────────────────────

NodeIndex Engine::register_metric(model::Metric metric) {
    safe_ids_.register_id(metric.id);
    const NodeIndex node = registry_.add(std::move(metric));
    graph_.ensure_node(node);
    tensors_.reserve_slot(node);
    formulas_.emplace_back();
    node_errors_.emplace_back();
    allocate(node);
    return node;
}

NodeIndex Engine::ensure_metric(const MetricId& id) {
    if (const auto node = registry_.find(id)) {
        return *node;
    }
    logger_->debug("[{}] '{}' auto-registered as placeholder input", config_.model_id, id);
    return register_metric(model::Metric{
        .id             = id,
        .display_name   = id,
        .category       = constants::DEFAULT_CATEGORY,
        .dims           = {},
        .is_calculated  = false,
        .is_placeholder = true,
    });
}

Shape Engine::shape_of(NodeIndex node) const {
    Shape shape;
    for (const auto& dim : registry_.at(node).dims) {
        shape.push_back(dimensions_.extent(dim));
    }
    shape.push_back(months_.size());
    return shape;
}

void Engine::allocate(NodeIndex node) {
    if (horizon_initialized_) {
        tensors_.allocate(node, shape_of(node));
    }
}

bool Engine::has_formula(NodeIndex node) const noexcept {
    return formulas_[node].compiled.has_value();
}

// ─── Queries ──────────────────────────────────────────────────────────────────

Results Engine::get_results(const Coordinates& filter) const {
    Results results;
    for (NodeIndex node = 0; node < registry_.size(); ++node) {
        const model::Metric& metric  = registry_.at(node);
        auto&                records = results[metric.id];
        if (!tensors_.is_allocated(node)) {
            continue;
        }

        const NdArray&    t    = tensors_.read(node);
        const std::size_t rank = metric.dims.size();
        std::vector<std::span<const std::string>> labels(rank);
        for (std::size_t a = 0; a < rank; ++a) {
            labels[a] = dimensions_.members(metric.dims[a]);
        }

        // Filter entries that apply to this metric, as (axis, wanted member).
        std::vector<std::pair<std::size_t, const std::string*>> wanted;
        for (const auto& [dim, member] : filter) {
            const auto it = std::find(metric.dims.begin(), metric.dims.end(), dim);
            if (it != metric.dims.end()) {
                wanted.emplace_back(static_cast<std::size_t>(it - metric.dims.begin()), &member);
            }
        }

        std::vector<std::size_t> idx(rank + 1, 0);
        for (Eigen::Index flat = 0; flat < t.values.size(); ++flat) {
            // Unravel the row-major offset into per-axis indices.
            std::size_t rest = static_cast<std::size_t>(flat);
            for (std::size_t a = rank + 1; a-- > 0;) {
                idx[a] = rest % t.shape[a];
                rest /= t.shape[a];
            }

            const double value = t.values[flat];
            if (value == 0.0) {
                continue;
            }
            const bool keep = std::all_of(wanted.begin(), wanted.end(), [&](const auto& w) {
                return idx[w.first] < labels[w.first].size()
                    && labels[w.first][idx[w.first]] == *w.second;
            });
            if (!keep) {
                continue;
            }

            ResultRecord record{.month = months_[idx[rank]], .value = value, .coords = {}};
            for (std::size_t a = 0; a < rank; ++a) {
                if (idx[a] < labels[a].size()) {
                    record.coords.emplace_back(metric.dims[a], labels[a][idx[a]]);
                }
            }
            records.push_back(std::move(record));
        }
    }
    return results;
}

std::vector<trace::TraceEntry> Engine::get_trace(std::size_t limit) const {
    return trace_.recent(limit);
}

std::optional<DependencyChain> Engine::get_dependency_chain(const MetricId& id) const {
    const auto node = registry_.find(id);
    if (!node) {
        return std::nullopt;
    }
    DependencyChain chain{.node = id, .depends_on = {}, .impacts = {}, .formula = std::nullopt};
    for (NodeIndex v : graph_.predecessors(*node)) {
        chain.depends_on.push_back(registry_.at(v).id);
    }
    for (NodeIndex v : graph_.successors(*node)) {
        chain.impacts.push_back(registry_.at(v).id);
    }
    if (const auto& compiled = formulas_[*node].compiled) {
        chain.formula = compiled->source();
    }
    return chain;
}

DagMetadata Engine::get_dag_metadata() const {
    DagMetadata dag;
    dag.nodes.reserve(registry_.size());
    for (NodeIndex node = 0; node < registry_.size(); ++node) {
        const auto& metric = registry_.at(node);
        dag.nodes.push_back(DagNode{.id = metric.id, .name = metric.display_name,
                                    .type = has_formula(node) ? "formula" : "input"});
    }
    for (const auto& e : graph_.edges()) {
        dag.edges.push_back(DagEdge{.source = registry_.at(e.source).id,
                                    .target = registry_.at(e.target).id});
    }
    return dag;
}

std::vector<NodeError> Engine::get_node_errors() const {
    std::vector<NodeError> errors;
    for (const auto& e : node_errors_) {
        if (e) {
            errors.push_back(*e);
        }
    }
    return errors;
}

std::optional<NdArray> Engine::get_tensor(const MetricId& id) const {
    const auto node = registry_.find(id);
    if (!node) {
        return std::nullopt;
    }
    return tensors_.read(*node);
}

std::optional<model::Metric> Engine::get_metric(const MetricId& id) const {
    const auto node = registry_.find(id);
    if (!node) {
        return std::nullopt;
    }
    return registry_.at(*node);
}

}  // namespace hypercube::core
