/// @file src/model/dimension_catalog.cpp
/// @brief DimensionCatalog — named axes with ordered members.

#include "hypercube/model.hpp"
#include "hypercube/constants.hpp"

#include <fmt/format.h>

#include <unordered_set>

namespace hypercube::model {

// ─── Dimension ────────────────────────────────────────────────────────────────

std::optional<std::size_t> Dimension::index_of(const std::string& member) const {
    const auto it = member_to_index.find(member);
    if (it == member_to_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ─── DimensionCatalog ─────────────────────────────────────────────────────────

std::string DimensionCatalog::validate_members(std::span<const std::string> members) {
    if (members.empty()) {
        return "a dimension needs at least one member";
    }
    std::unordered_set<std::string> seen;
    for (const auto& m : members) {
        if (!seen.insert(m).second) {
            return fmt::format("duplicate member '{}'", m);
        }
    }
    return {};
}

DefineResult DimensionCatalog::define(const std::string& name,
                                      std::vector<std::string> members) {
    auto it = dims_.find(name);
    if (it != dims_.end() && it->second.members == members) {
        return DefineResult::Unchanged;
    }

    Dimension dim{.name = name, .members = std::move(members), .member_to_index = {}};
    dim.member_to_index.reserve(dim.members.size());
    for (std::size_t i = 0; i < dim.members.size(); ++i) {
        dim.member_to_index.emplace(dim.members[i], i);
    }

    if (it == dims_.end()) {
        dims_.emplace(name, std::move(dim));
        return DefineResult::Created;
    }
    it->second = std::move(dim);
    return DefineResult::Replaced;
}

std::optional<std::size_t>
DimensionCatalog::member_index(const std::string& name, const std::string& member) const {
    const auto it = dims_.find(name);
    if (it == dims_.end()) {
        return std::nullopt;
    }
    return it->second.index_of(member);
}

std::span<const std::string> DimensionCatalog::members(const std::string& name) const {
    const auto it = dims_.find(name);
    if (it == dims_.end()) {
        return {};
    }
    return it->second.members;
}

std::size_t DimensionCatalog::extent(const std::string& name) const {
    const auto it = dims_.find(name);
    return it == dims_.end() ? constants::UNKNOWN_DIMENSION_EXTENT : it->second.extent();
}

bool DimensionCatalog::contains(const std::string& name) const {
    return dims_.contains(name);
}

}  // namespace hypercube::model
