/// @file tests/tensor/test_ndarray.cpp
/// @brief Tests for NdArray helpers, broadcasting arithmetic and TensorStore.

#include "hypercube/tensor.hpp"
#include "hypercube/error.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace hypercube;
using namespace hypercube::tensor;

namespace {

NdArray make(Shape shape, std::vector<double> values) {
    NdArray a = NdArray::zeros(shape);
    for (std::size_t i = 0; i < values.size(); ++i) {
        a.values[static_cast<Eigen::Index>(i)] = values[i];
    }
    return a;
}

std::vector<double> to_vector(const NdArray& a) {
    return {a.values.data(), a.values.data() + a.values.size()};
}

}  // namespace

// ─── Shape helpers ────────────────────────────────────────────────────────────

TEST(NdArray_Factories, ScalarHasRankZeroAndOneValue) {
    const auto s = NdArray::scalar(4.5);
    EXPECT_TRUE(s.is_scalar());
    ASSERT_EQ(s.size(), 1u);
    EXPECT_DOUBLE_EQ(s.values(0), 4.5);
}

TEST(NdArray_Factories, ZerosMatchesElementCount) {
    const auto z = NdArray::zeros({2, 3, 4});
    EXPECT_EQ(z.size(), 24u);
    EXPECT_TRUE((z.values == 0.0).all());
}

TEST(Shape_Helpers, ElementCountOfEmptyShapeIsOne) {
    EXPECT_EQ(element_count({}), 1u);
    EXPECT_EQ(element_count({3, 0}), 0u);
}

TEST(Shape_Helpers, RowMajorStrides) {
    EXPECT_EQ(row_major_strides({2, 3, 4}), (std::vector<std::size_t>{12, 4, 1}));
    EXPECT_EQ(row_major_strides({5}), (std::vector<std::size_t>{1}));
}

TEST(Shape_Helpers, BroadcastShapeAlignsTrailingAxes) {
    EXPECT_EQ(broadcast_shape({2, 1, 3}, {4, 3}), (Shape{2, 4, 3}));
    EXPECT_EQ(broadcast_shape({}, {2, 2}), (Shape{2, 2}));
}

TEST(Shape_Helpers, BroadcastShapeRejectsMismatch) {
    EXPECT_FALSE(broadcast_shape({2, 3}, {4, 3}).has_value());
}

TEST(Shape_Helpers, ShapeToString) {
    EXPECT_EQ(shape_to_string({2, 3}), "(2, 3)");
    EXPECT_EQ(shape_to_string({}), "()");
}

TEST(Broadcast_To, RepeatsSizeOneAxes) {
    const auto col = make({2, 1}, {1, 2});
    const auto out = broadcast_to(col, {2, 3});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(to_vector(*out), (std::vector<double>{1, 1, 1, 2, 2, 2}));
}

TEST(Broadcast_To, IncompatibleTargetIsNullopt) {
    EXPECT_FALSE(broadcast_to(make({2}, {1, 2}), {3}).has_value());
}

// ─── apply ────────────────────────────────────────────────────────────────────

TEST(Apply_Binary, SameShapeElementwise) {
    const auto a = make({3}, {1, 2, 3});
    const auto b = make({3}, {10, 20, 30});
    EXPECT_EQ(to_vector(apply(BinaryOp::Add, a, b)), (std::vector<double>{11, 22, 33}));
    EXPECT_EQ(to_vector(apply(BinaryOp::Sub, b, a)), (std::vector<double>{9, 18, 27}));
    EXPECT_EQ(to_vector(apply(BinaryOp::Max, a, make({3}, {2, 2, 2}))),
              (std::vector<double>{2, 2, 3}));
}

TEST(Apply_Binary, ScalarOnEitherSide) {
    const auto a = make({2}, {4, 8});
    EXPECT_EQ(to_vector(apply(BinaryOp::Div, a, NdArray::scalar(2))),
              (std::vector<double>{2, 4}));
    EXPECT_EQ(to_vector(apply(BinaryOp::Div, NdArray::scalar(16), a)),
              (std::vector<double>{4, 2}));
    EXPECT_EQ(to_vector(apply(BinaryOp::Pow, NdArray::scalar(2), make({2}, {3, 4}))),
              (std::vector<double>{8, 16}));
}

TEST(Apply_Binary, OuterBroadcast) {
    const auto col = make({2, 1}, {1, 2});
    const auto row = make({1, 3}, {10, 20, 30});
    const auto out = apply(BinaryOp::Add, col, row);
    EXPECT_EQ(out.shape, (Shape{2, 3}));
    EXPECT_EQ(to_vector(out), (std::vector<double>{11, 21, 31, 12, 22, 32}));
}

TEST(Apply_Binary, IncompatibleShapesThrowShapeError) {
    EXPECT_THROW((void)apply(BinaryOp::Mul, make({2}, {1, 2}), make({3}, {1, 2, 3})),
                 ShapeError);
}

TEST(Apply_Unary, MathFunctions) {
    const auto a = make({2}, {4, 9});
    EXPECT_EQ(to_vector(apply(UnaryOp::Sqrt, a)), (std::vector<double>{2, 3}));
    EXPECT_EQ(to_vector(apply(UnaryOp::Negate, a)), (std::vector<double>{-4, -9}));
    EXPECT_EQ(to_vector(apply(UnaryOp::Abs, make({2}, {-1, 1}))), (std::vector<double>{1, 1}));
    EXPECT_NEAR(apply(UnaryOp::Log, apply(UnaryOp::Exp, make({1}, {1.5}))).values(0), 1.5, 1e-12);
}

TEST(Apply_Unary, DomainErrorsProduceNonFiniteValues) {
    const auto r = apply(UnaryOp::Sqrt, make({1}, {-1}));
    EXPECT_TRUE(std::isnan(r.values(0)));
}

// ─── TensorStore ──────────────────────────────────────────────────────────────

TEST(TensorStore, UnallocatedReadsAsZeroSeries) {
    TensorStore store;
    store.set_horizon(3);
    store.reserve_slot(0);
    EXPECT_FALSE(store.is_allocated(0));
    EXPECT_EQ(store.read(0).shape, (Shape{3}));
    EXPECT_TRUE((store.read(0).values == 0.0).all());
    EXPECT_EQ(store.read(42).shape, (Shape{3}));
}

TEST(TensorStore, AllocateStoreAndZero) {
    TensorStore store;
    store.set_horizon(2);
    store.allocate(1, {2, 2});
    EXPECT_TRUE(store.is_allocated(1));
    EXPECT_EQ(store.size(), 2u);

    store.store(1, make({2, 2}, {1, 2, 3, 4}));
    EXPECT_DOUBLE_EQ(store.read(1).values(3), 4.0);

    store.write(1).values(0) = 7.0;
    EXPECT_DOUBLE_EQ(store.read(1).values(0), 7.0);

    store.zero(1);
    EXPECT_EQ(store.read(1).shape, (Shape{2, 2}));
    EXPECT_TRUE((store.read(1).values == 0.0).all());
}
