/// @file src/formula/safe_id_cache.cpp
/// @brief SafeIdCache — reversible renaming of ids the grammar cannot lex.

#include "hypercube/formula.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace hypercube::formula {

namespace {

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

/// Characters that end a candidate id run in formula text.
bool is_run_break(char c) noexcept {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
        return true;
    }
    switch (c) {
        case '+': case '*': case '/': case '^': case '(': case ')': case ',':
            return true;
        default:
            return false;
    }
}

}  // namespace

bool SafeIdCache::is_safe_identifier(std::string_view id) noexcept {
    if (id.empty() || std::isdigit(static_cast<unsigned char>(id.front())) != 0) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), is_ident_char);
}

const std::string& SafeIdCache::register_id(const MetricId& id) {
    if (const auto it = orig_to_safe_.find(id); it != orig_to_safe_.end()) {
        return it->second;
    }

    if (is_safe_identifier(id)) {
        plain_ids_.insert(id);
        // A generated name may already be using this spelling: move it.
        if (const auto clash = safe_to_orig_.find(id); clash != safe_to_orig_.end()) {
            const MetricId older = clash->second;
            safe_to_orig_.erase(clash);
            std::string renamed   = mangle(older);
            safe_to_orig_[renamed] = older;
            orig_to_safe_[older]   = std::move(renamed);
        }
        return orig_to_safe_.emplace(id, id).first->second;
    }

    std::string safe = mangle(id);
    safe_to_orig_[safe] = id;
    longest_unsafe_     = std::max(longest_unsafe_, id.size());
    return orig_to_safe_.emplace(id, std::move(safe)).first->second;
}

std::string SafeIdCache::mangle(const MetricId& id) const {
    std::string base;
    base.reserve(id.size() + 1);
    for (char c : id) {
        base.push_back(is_ident_char(c) ? c : '_');
    }
    if (base.empty() || std::isdigit(static_cast<unsigned char>(base.front())) != 0) {
        base.insert(base.begin(), '_');
    }

    std::string candidate = base;
    for (std::size_t n = 1; plain_ids_.contains(candidate) || safe_to_orig_.contains(candidate); ++n) {
        candidate = base + "_" + std::to_string(n);
    }
    return candidate;
}

SafeIdCache::SafeText SafeIdCache::to_safe_text(std::string_view expression) const {
    SafeText result;
    if (safe_to_orig_.empty()) {
        result.text = std::string(expression);
        return result;
    }

    // Every identifier run already in the text; aliases must avoid them all.
    std::unordered_set<std::string> typed;
    for (std::size_t i = 0; i < expression.size();) {
        if (!is_ident_char(expression[i])) {
            ++i;
            continue;
        }
        const std::size_t start = i;
        while (i < expression.size() && is_ident_char(expression[i])) {
            ++i;
        }
        typed.emplace(expression.substr(start, i - start));
    }

    std::string& out = result.text;
    out.reserve(expression.size());
    std::unordered_map<std::string, std::string> aliases;  // typed word → alias
    std::size_t i = 0;
    while (i < expression.size()) {
        const bool boundary = i == 0 || !is_ident_char(expression[i - 1]);
        if (boundary && !is_run_break(expression[i])) {
            std::size_t run_end = i;
            while (run_end < expression.size() && !is_run_break(expression[run_end])) {
                ++run_end;
            }

            // Longest registered unsafe id starting here that also ends on
            // an identifier boundary.
            bool matched = false;
            for (std::size_t len = std::min(run_end - i, longest_unsafe_); len > 0; --len) {
                const std::size_t end = i + len;
                if (end < expression.size() && is_ident_char(expression[end])
                    && is_ident_char(expression[end - 1])) {
                    continue;
                }
                const auto it = orig_to_safe_.find(std::string(expression.substr(i, len)));
                if (it == orig_to_safe_.end() || plain_ids_.contains(it->first)) {
                    continue;
                }
                out += it->second;
                result.originals.emplace(it->second, it->first);
                i       = end;
                matched = true;
                break;
            }
            if (matched) {
                continue;
            }
        }

        // No id here: copy a whole identifier (so "ab-c" is never matched
        // inside "xab-c") or a single character.
        if (!is_ident_char(expression[i])) {
            out.push_back(expression[i++]);
            continue;
        }
        const std::size_t start = i;
        while (i < expression.size() && is_ident_char(expression[i])) {
            ++i;
        }
        std::string word(expression.substr(start, i - start));
        if (!safe_to_orig_.contains(word)) {
            out += word;
            continue;
        }

        // The word spells a generated name but was typed as-is.
        auto alias = aliases.find(word);
        if (alias == aliases.end()) {
            std::string candidate;
            for (std::size_t n = 1;; ++n) {
                candidate = word + "_" + std::to_string(n);
                if (!typed.contains(candidate) && !safe_to_orig_.contains(candidate)
                    && !plain_ids_.contains(candidate) && !result.originals.contains(candidate)) {
                    break;
                }
            }
            result.originals.emplace(candidate, word);
            alias = aliases.emplace(word, std::move(candidate)).first;
        }
        out += alias->second;
    }
    return result;
}

MetricId SafeIdCache::SafeText::original_of(const std::string& name) const {
    if (const auto it = originals.find(name); it != originals.end()) {
        return it->second;
    }
    return name;
}

MetricId SafeIdCache::original_of(std::string_view safe_name) const {
    if (const auto it = safe_to_orig_.find(std::string(safe_name)); it != safe_to_orig_.end()) {
        return it->second;
    }
    return MetricId(safe_name);
}

} // namespace hypercube::formula
