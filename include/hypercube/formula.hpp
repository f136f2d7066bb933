#pragma once

/// @file include/hypercube/formula.hpp
/// @brief Formula Compiler — formula text → reusable vectorized evaluator.
///
/// # Module: Formula Compiler
///
/// ## Responsibility
/// Turn formula text such as `marketing_budget / CAC` into a
/// `CompiledFormula`: the ordered list of metric ids it references plus a
/// kernel that takes one NdArray per dependency (same order) and returns an
/// NdArray. A formula is compiled once per assignment and reused for every
/// recompute; nothing is re-parsed per time step or per sample.
///
/// ## Identifiers That Are Not Legal In The Grammar
/// Metric ids may contain characters that the expression grammar treats as
/// operators (UUIDs such as `3f9c-…` contain hyphens). `SafeIdCache` gives
/// each such id a reversible safe name when the metric is registered; formula
/// text is rewritten through the cache before parsing and dependency names
/// are mapped back afterwards. The cache belongs to one engine instance.
///
/// ## Grammar
/// ```
/// expr    := term (('+' | '-') term)*
/// term    := unary (('*' | '/') unary)*
/// unary   := ('+' | '-') unary | power
/// power   := primary (('^' | '**') unary)?
/// primary := NUMBER | IDENT | IDENT '(' expr (',' expr)* ')' | '(' expr ')'
/// ```
/// Functions: abs, sqrt, exp, log, min, max, pow (case-insensitive).

#include "hypercube/types.hpp"

#include <functional>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hypercube::formula {

// ─── FormulaSyntaxError ───────────────────────────────────────────────────────

/// Formula text could not be parsed. Carries the 1-based column.
class FormulaSyntaxError : public std::runtime_error {
public:
    FormulaSyntaxError(const std::string& message, std::size_t column)
        : std::runtime_error(message), column_(column) {}

    /// Column where the error was detected (1-based).
    [[nodiscard]] std::size_t column() const noexcept { return column_; }

private:
    std::size_t column_;
};

// ─── SafeIdCache ──────────────────────────────────────────────────────────────

/// Bidirectional map between metric ids and grammar-safe identifiers.
///
/// Ids that already are legal identifiers map to themselves and are only
/// remembered so that no generated safe name can shadow them.
class SafeIdCache {
public:
    /// True if `id` matches `[A-Za-z_][A-Za-z0-9_]*`.
    [[nodiscard]] static bool is_safe_identifier(std::string_view id) noexcept;

    /// Register a metric id and return the name it has in formula text.
    /// Idempotent.
    const std::string& register_id(const MetricId& id);

    /// Formula text after rewriting, plus the names the rewrite introduced.
    struct SafeText {
        std::string text;

        /// Introduced identifier → metric id it stands for. Identifiers
        /// that are not listed name themselves.
        std::unordered_map<std::string, MetricId> originals;

        /// Metric id behind an identifier of `text`.
        [[nodiscard]] MetricId original_of(const std::string& name) const;
    };

    /// Rewrite registered unsafe ids in `expression` to their safe names.
    ///
    /// Matches are taken at identifier boundaries, leftmost then longest, so
    /// `rev-2024 - cost` rewrites `rev-2024` when that id is registered and
    /// leaves the subtraction alone. An identifier typed in the text that
    /// happens to spell a generated name is given a fresh alias, so it still
    /// refers to itself and never to the unsafe id.
    [[nodiscard]] SafeText to_safe_text(std::string_view expression) const;

    /// Original id behind a generated safe name (the name itself otherwise).
    [[nodiscard]] MetricId original_of(std::string_view safe_name) const;

    /// Number of ids that needed a generated safe name.
    [[nodiscard]] std::size_t mangled_count() const noexcept {
        return safe_to_orig_.size();
    }

private:
    /// Generate a fresh safe name for `id` that collides with nothing known.
    [[nodiscard]] std::string mangle(const MetricId& id) const;

    std::unordered_map<std::string, std::string> orig_to_safe_;
    std::unordered_map<std::string, std::string> safe_to_orig_;
    std::unordered_set<std::string>              plain_ids_;
    std::size_t                                  longest_unsafe_ = 0;
};

// ─── CompiledFormula ──────────────────────────────────────────────────────────

/// Vectorized evaluator over ordered dependency arrays.
using Kernel = std::function<NdArray(std::span<const NdArray>)>;

/// The reusable product of compiling one formula.
class CompiledFormula {
public:
    CompiledFormula(std::string source,
                    std::string canonical,
                    std::vector<MetricId> dependencies,
                    Kernel kernel);

    /// Formula text as assigned by the caller.
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

    /// Fully parenthesised rendering over original metric ids.
    [[nodiscard]] const std::string& canonical() const noexcept { return canonical_; }

    /// Referenced metric ids, in order of first appearance, without duplicates.
    [[nodiscard]] std::span<const MetricId> dependencies() const noexcept {
        return dependencies_;
    }

    /// Evaluate with one array per dependency, in `dependencies()` order.
    ///
    /// Throws `EvaluationError` if the argument count is wrong or the result
    /// holds a non-finite value, and `ShapeError` if the arguments cannot be
    /// broadcast together.
    [[nodiscard]] NdArray evaluate(std::span<const NdArray> args) const;

private:
    std::string           source_;
    std::string           canonical_;
    std::vector<MetricId> dependencies_;
    Kernel                kernel_;
};

// ─── FormulaCompiler ──────────────────────────────────────────────────────────

/// Stateless compiler from formula text to CompiledFormula.
class FormulaCompiler {
public:
    FormulaCompiler() = delete;

    /// Compile `text`, resolving identifiers through `ids`.
    ///
    /// Unknown identifiers are not an error here: they are reported as
    /// dependencies and the caller registers them as placeholder inputs.
    ///
    /// Throws `FormulaSyntaxError` on malformed text or unknown functions.
    [[nodiscard]] static CompiledFormula
    compile(std::string_view text, const SafeIdCache& ids);
};

} // namespace hypercube::formula
