/// @file src/tensor/tensor_store.cpp
/// @brief TensorStore — per-metric dense storage.

#include "hypercube/tensor.hpp"

namespace hypercube::tensor {

void TensorStore::reserve_slot(NodeIndex node) {
    if (node >= slots_.size()) {
        slots_.resize(node + 1);
    }
}

void TensorStore::allocate(NodeIndex node, const Shape& shape) {
    reserve_slot(node);
    slots_[node].data      = NdArray::zeros(shape);
    slots_[node].allocated = true;
}

void TensorStore::zero(NodeIndex node) noexcept {
    if (node < slots_.size()) {
        slots_[node].data.values.setZero();
    }
}

void TensorStore::store(NodeIndex node, NdArray values) noexcept {
    slots_[node].data = std::move(values);
}

bool TensorStore::is_allocated(NodeIndex node) const noexcept {
    return node < slots_.size() && slots_[node].allocated;
}

const NdArray& TensorStore::read(NodeIndex node) const noexcept {
    if (!is_allocated(node)) {
        return empty_series_;
    }
    return slots_[node].data;
}

NdArray& TensorStore::write(NodeIndex node) noexcept {
    return slots_[node].data;
}

void TensorStore::set_horizon(std::size_t months) {
    horizon_      = months;
    empty_series_ = NdArray::zeros(Shape{months});
}

}  // namespace hypercube::tensor
