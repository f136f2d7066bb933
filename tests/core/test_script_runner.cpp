/// @file tests/core/test_script_runner.cpp
/// @brief ScriptRunner: tokenizing, command dispatch and the demo script.

#include "hypercube/script.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace hypercube;
using namespace hypercube::core;

namespace {

EngineConfig quiet_config() {
    EngineConfig cfg;
    cfg.worker_threads = 0;
    cfg.logger = std::make_shared<spdlog::logger>(
        "script-test", std::make_shared<spdlog::sinks::null_sink_mt>());
    return cfg;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ─── tokenize ─────────────────────────────────────────────────────────────────

TEST(ScriptRunner_Tokenize, SplitsOnWhitespace) {
    const auto words = ScriptRunner::tokenize("  input  CAC 2024-01   100 ");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (std::vector<std::string>{"input", "CAC", "2024-01", "100"}));
}

TEST(ScriptRunner_Tokenize, QuotedValuesKeepSpaces) {
    const auto words = ScriptRunner::tokenize(R"(metric CAC name="Customer Acquisition Cost")");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 3u);
    EXPECT_EQ((*words)[2], "name=Customer Acquisition Cost");
}

TEST(ScriptRunner_Tokenize, EmptyQuotesYieldEmptyWord) {
    const auto words = ScriptRunner::tokenize(R"(a "" b)");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(*words, (std::vector<std::string>{"a", "", "b"}));
}

TEST(ScriptRunner_Tokenize, UnterminatedQuoteFails) {
    EXPECT_FALSE(ScriptRunner::tokenize(R"(metric x name="oops)").has_value());
}

// ─── Commands ─────────────────────────────────────────────────────────────────

TEST(ScriptRunner_Execute, BlankAndCommentLinesAreNoOps) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    EXPECT_TRUE(runner.execute_line("").ok);
    EXPECT_TRUE(runner.execute_line("   # comment").ok);
    EXPECT_TRUE(runner.execute_line("   ").output.empty());
}

TEST(ScriptRunner_Execute, UnknownCommandFails) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    const auto r = runner.execute_line("explode now");
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(contains(r.output, "unknown command 'explode'"));
}

TEST(ScriptRunner_Execute, BadNumberFails) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    ASSERT_TRUE(runner.execute_line("horizon m1").ok);
    const auto r = runner.execute_line("input a m1 12abc");
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(contains(r.output, "'12abc' is not a number"));
}

TEST(ScriptRunner_Execute, FormulaTakesRestOfLine) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    ASSERT_TRUE(runner.execute_line("horizon m1").ok);
    ASSERT_TRUE(runner.execute_line("formula total   price * (qty + 1)").ok);

    const auto chain = engine.get_dependency_chain("total");
    ASSERT_TRUE(chain.has_value());
    EXPECT_EQ(chain->formula, "price * (qty + 1)");

    ASSERT_TRUE(runner.execute_line("input price m1 4").ok);
    const auto r = runner.execute_line("input qty m1 2 @ops");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.output, "affected: [total]\n");
    EXPECT_EQ(engine.get_trace(1).front().trigger_user_id, "ops");
    EXPECT_TRUE(contains(runner.execute_line("results").output, "total:\n  m1 = 12\n"));
}

TEST(ScriptRunner_Execute, InputWithCoordinatesAndIgnoredMonth) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    ASSERT_TRUE(runner.execute_line("dimension geo US,EU").ok);
    ASSERT_TRUE(runner.execute_line("metric units dims=geo").ok);
    ASSERT_TRUE(runner.execute_line("horizon m1").ok);

    const auto r = runner.execute_line("input units m9 3 geo=EU");
    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(contains(r.output, "ignored writes: 1"));

    ASSERT_TRUE(runner.execute_line("input units m1 3 geo=EU").ok);
    EXPECT_EQ(runner.execute_line("results geo=EU").output, "units:\n  m1 geo=EU = 3\n");
    EXPECT_FALSE(runner.execute_line("input units m1 3 geo=MARS").ok);
}

TEST(ScriptRunner_Execute, MetricOptionsAreValidated) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    EXPECT_FALSE(runner.execute_line("metric x colour=red").ok);
    EXPECT_FALSE(runner.execute_line("metric x loose").ok);
    ASSERT_TRUE(runner.execute_line(R"(metric x name="Long Name" category=ops)").ok);
    EXPECT_EQ(engine.get_metric("x")->display_name, "Long Name");
    EXPECT_EQ(engine.get_metric("x")->category, "ops");
}

TEST(ScriptRunner_Execute, CycleReportsPathAndSuggestion) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    ASSERT_TRUE(runner.execute_line("formula b a + 1").ok);
    const auto r = runner.execute_line("formula a b * 2");
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(contains(r.output, "CircularDependency"));
    EXPECT_TRUE(contains(r.output, "a -> b -> a"));
    EXPECT_TRUE(contains(r.output, "suggestion"));
}

TEST(ScriptRunner_Execute, ChainOfUnknownMetricFails) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    const auto r = runner.execute_line("chain ghost");
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(contains(r.output, "UnknownMetric"));
}

TEST(ScriptRunner_Execute, ValidationToggle) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    EXPECT_FALSE(runner.execute_line("validation maybe").ok);
    ASSERT_TRUE(runner.execute_line("validation off").ok);
    EXPECT_FALSE(engine.validation_enabled());
    ASSERT_TRUE(runner.execute_line("validation on").ok);
    EXPECT_TRUE(engine.validation_enabled());
}

// ─── run ──────────────────────────────────────────────────────────────────────

TEST(ScriptRunner_Run, CountsCommandsAndPrefixesFailures) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    const auto report = runner.run("# setup\nhorizon m1\n\nbogus\ninput a m1 1\n");
    EXPECT_EQ(report.commands, 3u);
    EXPECT_EQ(report.failures, 1u);
    EXPECT_TRUE(contains(report.output, "line 4: error: unknown command 'bogus'"));
}

TEST(ScriptRunner_Run, DemoScriptShowsRevenueAfterCacChange) {
    Engine engine(quiet_config());
    ScriptRunner runner(engine);
    const auto report = runner.run(demo_script());

    // Only the deliberate loop is rejected.
    EXPECT_EQ(report.failures, 1u);
    EXPECT_TRUE(contains(report.output, "CircularDependency"));
    EXPECT_TRUE(contains(report.output, "revenue:\n"));
    EXPECT_TRUE(contains(report.output, "2024-01 = 5000\n"));
    EXPECT_TRUE(contains(report.output, "affected: [customers, revenue]\n"));
    EXPECT_TRUE(engine.get_node_errors().empty());
}
