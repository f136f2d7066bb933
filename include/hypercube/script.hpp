#pragma once

/// @file include/hypercube/script.hpp
/// @brief Line-oriented command script driver for the engine.
///
/// # Module: ScriptRunner
///
/// ## Responsibility
/// Parse and execute a plain-text command script against an Engine. This is
/// the thin transport used by the `hypercube` CLI and by smoke tests; it
/// never touches the file system.
///
/// ## Commands
/// ```
/// dimension <name> <member>[,<member>...]
/// metric <id> [name=<text>] [category=<text>] [dims=<dim>[,<dim>...]]
/// formula <id> <expression...>
/// horizon <month>[,<month>...]
/// input <id> <month> <value> [<dim>=<member>...] [@<actor>]
/// recompute
/// results [<dim>=<member>...]
/// trace [<limit>]
/// chain <id>
/// dag
/// errors
/// validation on|off
/// ```
/// Blank lines and lines starting with `#` are skipped. Quoted values
/// (`name="Customer Acquisition Cost"`) may contain spaces.
///
/// ## Guarantees
/// - A failing command produces an `error:` line; later commands still run
/// - Never throws on malformed input

#include "hypercube/engine.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hypercube::core {

/// Outcome of executing one script line.
struct CommandResult {
    bool        ok = true;   ///< false if the command failed
    std::string output;      ///< Text to show (may be empty)
};

/// Summary of a whole script run.
struct ScriptReport {
    std::size_t commands = 0;  ///< Non-blank, non-comment lines executed
    std::size_t failures = 0;  ///< Commands that reported an error
    std::string output;        ///< Concatenated command output
};

/// Executes command scripts against a borrowed Engine.
class ScriptRunner {
public:
    explicit ScriptRunner(Engine& engine) noexcept;

    /// Execute one line. Blank and comment lines yield an empty OK result.
    [[nodiscard]] CommandResult execute_line(std::string_view line);

    /// Execute every line of `script`.
    [[nodiscard]] ScriptReport run(std::string_view script);

    /// Split a command line into words, honouring double quotes.
    ///
    /// # Returns
    /// `nullopt` on an unterminated quote.
    [[nodiscard]] static std::optional<std::vector<std::string>>
    tokenize(std::string_view line);

private:
    CommandResult cmd_dimension(const std::vector<std::string>& args);
    CommandResult cmd_metric(const std::vector<std::string>& args);
    CommandResult cmd_formula(std::string_view line, const std::vector<std::string>& args);
    CommandResult cmd_horizon(const std::vector<std::string>& args);
    CommandResult cmd_input(const std::vector<std::string>& args);
    CommandResult cmd_recompute();
    CommandResult cmd_results(const std::vector<std::string>& args) const;
    CommandResult cmd_trace(const std::vector<std::string>& args) const;
    CommandResult cmd_chain(const std::vector<std::string>& args) const;
    CommandResult cmd_dag() const;
    CommandResult cmd_errors() const;
    CommandResult cmd_validation(const std::vector<std::string>& args);

    Engine& engine_;
};

/// Built-in CAC → revenue demonstration script used by `hypercube --demo`.
[[nodiscard]] std::string_view demo_script() noexcept;

}  // namespace hypercube::core
