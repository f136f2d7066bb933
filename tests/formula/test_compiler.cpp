/// @file tests/formula/test_compiler.cpp
/// @brief CompiledFormula: dependency order, vectorized evaluation, failures.

#include "hypercube/formula.hpp"
#include "hypercube/error.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace hypercube;
using namespace hypercube::formula;

namespace {

NdArray series(std::vector<double> v) {
    NdArray a = NdArray::zeros({v.size()});
    for (std::size_t i = 0; i < v.size(); ++i) {
        a.values[static_cast<Eigen::Index>(i)] = v[i];
    }
    return a;
}

std::vector<double> to_vector(const NdArray& a) {
    return {a.values.data(), a.values.data() + a.values.size()};
}

}  // namespace

TEST(Compiler_Dependencies, FirstAppearanceOrderWithoutDuplicates) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("b + a * b - c / a", ids);
    const std::vector<MetricId> deps(f.dependencies().begin(), f.dependencies().end());
    EXPECT_EQ(deps, (std::vector<MetricId>{"b", "a", "c"}));
}

TEST(Compiler_Dependencies, ConstantFormulaHasNone) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("42", ids);
    EXPECT_TRUE(f.dependencies().empty());
    EXPECT_DOUBLE_EQ(f.evaluate({}).values(0), 42.0);
}

TEST(Compiler_Introspection, KeepsSourceText) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("marketing_budget / CAC", ids);
    EXPECT_EQ(f.source(), "marketing_budget / CAC");
    EXPECT_EQ(f.canonical(), "(marketing_budget / CAC)");
}

TEST(Compiler_Evaluate, WholeSeriesInOneCall) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("budget / CAC", ids);
    const std::vector<NdArray> args{series({10000, 9000, 8000}), series({200, 100, 400})};
    EXPECT_EQ(to_vector(f.evaluate(args)), (std::vector<double>{50, 90, 20}));
}

TEST(Compiler_Evaluate, ReusableAcrossCalls) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("x * 2 + 1", ids);
    EXPECT_EQ(to_vector(f.evaluate(std::vector<NdArray>{series({1, 2})})),
              (std::vector<double>{3, 5}));
    EXPECT_EQ(to_vector(f.evaluate(std::vector<NdArray>{series({10})})),
              (std::vector<double>{21}));
}

TEST(Compiler_Evaluate, WrongArgumentCountThrows) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("a + b", ids);
    EXPECT_THROW((void)f.evaluate(std::vector<NdArray>{series({1})}), EvaluationError);
}

TEST(Compiler_Evaluate, DivisionByZeroIsAnEvaluationError) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("a / b", ids);
    EXPECT_THROW((void)f.evaluate(std::vector<NdArray>{series({1, 1}), series({1, 0})}),
                 EvaluationError);
}

TEST(Compiler_Evaluate, DomainErrorIsAnEvaluationError) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("sqrt(a)", ids);
    EXPECT_THROW((void)f.evaluate(std::vector<NdArray>{series({-4})}), EvaluationError);
}

TEST(Compiler_Evaluate, MisalignedArgumentsThrowShapeError) {
    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("a + b", ids);
    EXPECT_THROW((void)f.evaluate(std::vector<NdArray>{series({1, 2}), series({1, 2, 3})}),
                 ShapeError);
}

TEST(Compiler_Evaluate, BroadcastsAlignedTensors) {
    // price[1, P, T] * volume[G, P, T]
    NdArray price  = NdArray::zeros({1, 2, 1});
    price.values  << 10, 20;
    NdArray volume = NdArray::zeros({2, 2, 1});
    volume.values << 1, 2, 3, 4;

    const SafeIdCache ids;
    const auto f = FormulaCompiler::compile("price * volume", ids);
    const auto r = f.evaluate(std::vector<NdArray>{price, volume});
    EXPECT_EQ(r.shape, (Shape{2, 2, 1}));
    EXPECT_EQ(to_vector(r), (std::vector<double>{10, 40, 30, 80}));
}
