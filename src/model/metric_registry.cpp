/// @file src/model/metric_registry.cpp
/// @brief MetricRegistry — node metadata in registration order.

#include "hypercube/model.hpp"

namespace hypercube::model {

NodeIndex MetricRegistry::add(Metric metric) {
    const NodeIndex node = metrics_.size();
    index_.emplace(metric.id, node);
    metrics_.push_back(std::move(metric));
    return node;
}

std::optional<NodeIndex> MetricRegistry::find(std::string_view id) const {
    const auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace hypercube::model
