/// @file src/core/script_runner.cpp
/// @brief ScriptRunner — text commands → Engine calls.

#include "hypercube/script.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>
#include <utility>

namespace hypercube::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
        s.remove_suffix(1);
    }
    return s;
}

/// Split "a,b,c" into {"a","b","c"}, dropping empty pieces.
std::vector<std::string> split_list(std::string_view s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        const std::size_t comma = s.find(',', start);
        const std::string_view piece =
            trim(s.substr(start, comma == std::string_view::npos ? s.size() - start : comma - start));
        if (!piece.empty()) {
            out.emplace_back(piece);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

/// Split "key=value"; nullopt when there is no '=' or the key is empty.
std::optional<std::pair<std::string, std::string>> split_pair(const std::string& word) {
    const std::size_t eq = word.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }
    return std::make_pair(word.substr(0, eq), word.substr(eq + 1));
}

std::optional<double> parse_double(const std::string& s) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

CommandResult fail(std::string message) {
    return CommandResult{.ok = false, .output = fmt::format("error: {}\n", message)};
}

CommandResult fail(const EngineError& err) {
    return fail(err.to_string());
}

CommandResult ok(std::string output = {}) {
    return CommandResult{.ok = true, .output = std::move(output)};
}

std::string format_outcome(const RecomputeOutcome& outcome) {
    std::string out = fmt::format("affected: [{}]\n", fmt::join(outcome.affected_nodes, ", "));
    if (outcome.ignored_writes > 0) {
        out += fmt::format("ignored writes: {}\n", outcome.ignored_writes);
    }
    for (const auto& e : outcome.failed_nodes) {
        out += fmt::format("failed: {}: {}\n", e.node, e.message);
    }
    return out;
}

constexpr std::string_view DEMO_SCRIPT = R"(# Unit economics: marketing_budget / CAC -> customers -> revenue
horizon 2024-01,2024-02
metric CAC name="Customer Acquisition Cost" category=acquisition
metric marketing_budget name="Marketing Budget" category=acquisition
metric ARPU name="Average Revenue Per User" category=revenue
input CAC 2024-01 200
input CAC 2024-02 200
input marketing_budget 2024-01 10000
input ARPU 2024-01 50 @analyst
formula customers marketing_budget / CAC
formula revenue customers * ARPU
recompute
results
input CAC 2024-01 100 @cfo
results
trace 1
chain customers

# Dimensional pricing: revenue by region and product
dimension region US,EU
dimension product basic,pro
metric price dims=product
metric volume dims=region,product
metric product_revenue dims=region,product
formula product_revenue price * volume
input price 2024-01 10 product=basic
input price 2024-01 25 product=pro
input volume 2024-01 100
input volume 2024-01 40 region=EU product=pro
results region=EU

# A loop is rejected and the graph is unchanged
formula CAC revenue / customers
dag
)";

}  // namespace

std::string_view demo_script() noexcept {
    return DEMO_SCRIPT;
}

ScriptRunner::ScriptRunner(Engine& engine) noexcept : engine_(engine) {}

// ─── Tokenizer ────────────────────────────────────────────────────────────────

std::optional<std::vector<std::string>> ScriptRunner::tokenize(std::string_view line) {
    std::vector<std::string> words;
    std::string current;
    bool in_quotes = false;
    bool has_word  = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_word  = true;
        } else if (!in_quotes && std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (has_word) {
                words.push_back(std::move(current));
                current.clear();
                has_word = false;
            }
        } else {
            current.push_back(c);
            has_word = true;
        }
    }
    if (in_quotes) {
        return std::nullopt;
    }
    if (has_word) {
        words.push_back(std::move(current));
    }
    return words;
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

CommandResult ScriptRunner::execute_line(std::string_view line) {
    const std::string_view body = trim(line);
    if (body.empty() || body.front() == '#') {
        return ok();
    }

    const auto words = tokenize(body);
    if (!words) {
        return fail("unterminated quote");
    }
    const std::string& cmd = words->front();

    if (cmd == "dimension")  return cmd_dimension(*words);
    if (cmd == "metric")     return cmd_metric(*words);
    if (cmd == "formula")    return cmd_formula(body, *words);
    if (cmd == "horizon")    return cmd_horizon(*words);
    if (cmd == "input")      return cmd_input(*words);
    if (cmd == "recompute")  return cmd_recompute();
    if (cmd == "results")    return cmd_results(*words);
    if (cmd == "trace")      return cmd_trace(*words);
    if (cmd == "chain")      return cmd_chain(*words);
    if (cmd == "dag")        return cmd_dag();
    if (cmd == "errors")     return cmd_errors();
    if (cmd == "validation") return cmd_validation(*words);
    return fail(fmt::format("unknown command '{}'", cmd));
}

ScriptReport ScriptRunner::run(std::string_view script) {
    ScriptReport report;
    std::size_t line_no = 0;
    while (!script.empty()) {
        const std::size_t nl = script.find('\n');
        const std::string_view line = script.substr(0, nl);
        script.remove_prefix(nl == std::string_view::npos ? script.size() : nl + 1);
        ++line_no;

        const std::string_view body = trim(line);
        if (body.empty() || body.front() == '#') {
            continue;
        }
        ++report.commands;
        const CommandResult result = execute_line(body);
        if (!result.ok) {
            ++report.failures;
            report.output += fmt::format("line {}: ", line_no);
        }
        report.output += result.output;
    }
    return report;
}

// ─── Construction commands ────────────────────────────────────────────────────

CommandResult ScriptRunner::cmd_dimension(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return fail("usage: dimension <name> <member>[,<member>...]");
    }
    if (auto err = engine_.define_dimension(args[1], split_list(args[2]))) {
        return fail(*err);
    }
    return ok();
}

CommandResult ScriptRunner::cmd_metric(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return fail("usage: metric <id> [name=<text>] [category=<text>] [dims=<dim>,...]");
    }
    std::string name     = args[1];
    std::string category = constants::DEFAULT_CATEGORY;
    std::vector<std::string> dims;

    for (std::size_t i = 2; i < args.size(); ++i) {
        const auto kv = split_pair(args[i]);
        if (!kv) {
            return fail(fmt::format("expected key=value, got '{}'", args[i]));
        }
        if (kv->first == "name") {
            name = kv->second;
        } else if (kv->first == "category") {
            category = kv->second;
        } else if (kv->first == "dims") {
            dims = split_list(kv->second);
        } else {
            return fail(fmt::format("unknown metric option '{}'", kv->first));
        }
    }
    if (auto err = engine_.add_metric(args[1], name, category, std::move(dims))) {
        return fail(*err);
    }
    return ok();
}

CommandResult ScriptRunner::cmd_formula(std::string_view line, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return fail("usage: formula <id> <expression>");
    }
    // The expression is the raw remainder of the line after the id.
    std::string_view rest = trim(line);
    rest.remove_prefix(args[0].size());
    rest = trim(rest);
    rest.remove_prefix(std::min(rest.size(), args[1].size()));
    const std::string_view expression = trim(rest);

    if (auto err = engine_.set_formula(args[1], expression)) {
        return fail(*err);
    }
    return ok();
}

CommandResult ScriptRunner::cmd_horizon(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return fail("usage: horizon <month>[,<month>...]");
    }
    if (auto err = engine_.initialize_horizon(split_list(args[1]))) {
        return fail(*err);
    }
    return ok();
}

// ─── Recompute commands ───────────────────────────────────────────────────────

CommandResult ScriptRunner::cmd_input(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        return fail("usage: input <id> <month> <value> [<dim>=<member>...] [@<actor>]");
    }
    const auto value = parse_double(args[3]);
    if (!value) {
        return fail(fmt::format("'{}' is not a number", args[3]));
    }

    InputValue input{.month = args[2], .coords = {}, .value = *value};
    std::string actor = "system";
    for (std::size_t i = 4; i < args.size(); ++i) {
        if (args[i].size() > 1 && args[i].front() == '@') {
            actor = args[i].substr(1);
            continue;
        }
        const auto kv = split_pair(args[i]);
        if (!kv) {
            return fail(fmt::format("expected <dim>=<member>, got '{}'", args[i]));
        }
        input.coords[kv->first] = kv->second;
    }

    const std::vector<InputValue> values{std::move(input)};
    const auto outcome = engine_.update_input(args[1], values, actor);
    if (outcome.error) {
        return fail(*outcome.error);
    }
    return ok(format_outcome(outcome));
}

CommandResult ScriptRunner::cmd_recompute() {
    const auto outcome = engine_.full_recompute();
    if (outcome.error) {
        return fail(*outcome.error);
    }
    return ok(format_outcome(outcome));
}

CommandResult ScriptRunner::cmd_validation(const std::vector<std::string>& args) {
    if (args.size() != 2 || (args[1] != "on" && args[1] != "off")) {
        return fail("usage: validation on|off");
    }
    if (auto err = engine_.set_validation_enabled(args[1] == "on")) {
        return fail(*err);
    }
    return ok();
}

// ─── Query commands ───────────────────────────────────────────────────────────

CommandResult ScriptRunner::cmd_results(const std::vector<std::string>& args) const {
    Coordinates filter;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto kv = split_pair(args[i]);
        if (!kv) {
            return fail(fmt::format("expected <dim>=<member>, got '{}'", args[i]));
        }
        filter[kv->first] = kv->second;
    }

    std::string out;
    for (const auto& [id, records] : engine_.get_results(filter)) {
        if (records.empty()) {
            continue;
        }
        out += fmt::format("{}:\n", id);
        for (const auto& r : records) {
            std::string coords;
            for (const auto& [dim, member] : r.coords) {
                coords += fmt::format(" {}={}", dim, member);
            }
            out += fmt::format("  {}{} = {}\n", r.month, coords, r.value);
        }
    }
    return ok(std::move(out));
}

CommandResult ScriptRunner::cmd_trace(const std::vector<std::string>& args) const {
    std::size_t limit = constants::DEFAULT_TRACE_LIMIT;
    if (args.size() > 1) {
        const std::string& s = args[1];
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), limit);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return fail(fmt::format("'{}' is not a count", s));
        }
    }

    std::string out;
    for (const auto& e : engine_.get_trace(limit)) {
        out += fmt::format("{} {} {} by {}: [{}] in {:.3f} ms\n", e.created_at_iso(), e.id,
                           e.trigger_node_id, e.trigger_user_id,
                           fmt::join(e.affected_nodes, ", "), e.duration_ms);
    }
    return ok(std::move(out));
}

CommandResult ScriptRunner::cmd_chain(const std::vector<std::string>& args) const {
    if (args.size() != 2) {
        return fail("usage: chain <id>");
    }
    const auto chain = engine_.get_dependency_chain(args[1]);
    if (!chain) {
        return fail(EngineError::unknown_metric(args[1]));
    }
    return ok(fmt::format("{}: depends on [{}], impacts [{}], formula: {}\n", chain->node,
                          fmt::join(chain->depends_on, ", "), fmt::join(chain->impacts, ", "),
                          chain->formula.value_or("(input)")));
}

CommandResult ScriptRunner::cmd_dag() const {
    const auto dag = engine_.get_dag_metadata();
    std::string out = fmt::format("{} nodes, {} edges\n", dag.nodes.size(), dag.edges.size());
    for (const auto& n : dag.nodes) {
        out += fmt::format("  {} ({}) \"{}\"\n", n.id, n.type, n.name);
    }
    for (const auto& e : dag.edges) {
        out += fmt::format("  {} -> {}\n", e.source, e.target);
    }
    return ok(std::move(out));
}

CommandResult ScriptRunner::cmd_errors() const {
    std::string out;
    for (const auto& e : engine_.get_node_errors()) {
        out += fmt::format("{}{}: {}\n", e.node, e.shape_error ? " (shape)" : "", e.message);
    }
    return ok(std::move(out));
}

}  // namespace hypercube::core
