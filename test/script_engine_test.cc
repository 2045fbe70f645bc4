#include "src/server/script_engine.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using jsgate::EngineLimits;
using jsgate::EvaluationResult;
using jsgate::ScriptEngine;
using testing::HasSubstr;
using namespace std::chrono_literals;

namespace {

EvaluationResult RunScript(const std::string& code, std::chrono::milliseconds budget = 2000ms,
                     EngineLimits limits = {}) {
    ScriptEngine engine(limits);
    std::optional<EvaluationResult> result = engine.Evaluate(code, budget);
    EXPECT_TRUE(result.has_value());
    return result.value_or(EvaluationResult{});
}

} // namespace

// NOLINTNEXTLINE
TEST(script_engine, prints_sum) {
    EvaluationResult result = RunScript("console.log(2 + 2);");
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.output, "4");
    EXPECT_EQ(result.result, "");
}

// NOLINTNEXTLINE
TEST(script_engine, returned_value_becomes_result) {
    EXPECT_EQ(RunScript("return 6 * 7;").result, "42");
    EXPECT_EQ(RunScript("const a = [1, 2, 3];\nreturn a.map(x => x * 2);").result, "2,4,6");
}

// NOLINTNEXTLINE
TEST(script_engine, console_channels_are_ordered) {
    EvaluationResult result = RunScript("console.warn('careful');\nconsole.log('first');\n"
                                  "console.error('broken');\nconsole.log('second', 3);");
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "first\nsecond 3\nWARN: careful\nERROR: broken");
}

// NOLINTNEXTLINE
TEST(script_engine, log_renders_objects_as_json) {
    EvaluationResult result = RunScript("console.log({ a: 1, b: [true, null] });\nconsole.log(null, 'x');");
    EXPECT_EQ(result.output, "{\"a\":1,\"b\":[true,null]}\nnull x");
}

// NOLINTNEXTLINE
TEST(script_engine, infinite_loop_times_out) {
    auto start = std::chrono::steady_clock::now();
    EvaluationResult result = RunScript("while (true) {}", 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, jsgate::kTimeoutMessage);
    EXPECT_EQ(result.result, "");
    EXPECT_LT(elapsed, 2s);
}

// NOLINTNEXTLINE
TEST(script_engine, guest_exception_is_reported_with_output) {
    EvaluationResult result = RunScript("console.log('before');\nthrow new TypeError('bad input');");
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(*result.error, "bad input");
    EXPECT_EQ(result.output, "before");
    EXPECT_EQ(result.result, "");
}

// NOLINTNEXTLINE
TEST(script_engine, syntax_error_is_a_guest_error) {
    EvaluationResult result = RunScript("const = ;");
    ASSERT_FALSE(result.ok());
    EXPECT_FALSE(result.timed_out);
}

// NOLINTNEXTLINE
TEST(script_engine, ambient_globals_are_absent) {
    EvaluationResult result = RunScript(
        "return [typeof globalThis, typeof eval, typeof setTimeout, typeof Promise, "
        "typeof Reflect, typeof Proxy, typeof print].join(',');");
    EXPECT_TRUE(result.ok()) << result.error.value_or("");
    EXPECT_EQ(result.result, "undefined,undefined,undefined,undefined,undefined,undefined,undefined");
}

// NOLINTNEXTLINE
TEST(script_engine, unknown_identifier_is_a_reference_error) {
    EvaluationResult result = RunScript("window.location = 'x';");
    ASSERT_FALSE(result.ok());
    EXPECT_THAT(*result.error, HasSubstr("window"));
}

// NOLINTNEXTLINE
TEST(script_engine, allow_list_is_usable) {
    EvaluationResult result = RunScript(
        "const obj = { a: 1, b: 2 };\n"
        "return [Object.keys(obj).length, Math.sqrt(16), parseInt('12'), isNaN(NaN), "
        "Object.hasOwn(obj, 'a'), typeof Object.getPrototypeOf, JSON.stringify([1])].join(',');");
    EXPECT_TRUE(result.ok()) << result.error.value_or("");
    EXPECT_EQ(result.result, "2,4,12,true,true,undefined,[1]");
}

// NOLINTNEXTLINE
TEST(script_engine, code_runs_in_strict_mode) {
    EvaluationResult result = RunScript("undeclared = 1;");
    EXPECT_FALSE(result.ok());
}

// NOLINTNEXTLINE
TEST(script_engine, nothing_leaks_between_calls) {
    ScriptEngine engine;
    auto first = engine.Evaluate("var leaked = 1;\nMath.leaked = 2;\nreturn leaked;", 1000ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->result, "1");

    auto second = engine.Evaluate("return typeof leaked + ',' + typeof Math.leaked;", 1000ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->result, "undefined,undefined");
}

// NOLINTNEXTLINE
TEST(script_engine, output_is_capped) {
    EngineLimits limits;
    limits.max_output_bytes = 64;
    EvaluationResult result = RunScript("for (let i = 0; i < 100; i++) console.log('line ' + i);", 2000ms, limits);
    EXPECT_TRUE(result.ok());
    EXPECT_LT(result.output.size(), 128u);
    EXPECT_THAT(result.output, HasSubstr("[output truncated]"));
}

// NOLINTNEXTLINE
TEST(script_engine, memory_limit_stops_runaway_allocation) {
    EngineLimits limits;
    limits.memory_bytes = 8 * 1024 * 1024;
    EvaluationResult result = RunScript("const parts = [];\nwhile (true) parts.push('x'.repeat(1024));", 5000ms, limits);
    EXPECT_FALSE(result.ok());
}

// NOLINTNEXTLINE
TEST(script_engine, wrapper_binds_every_capability) {
    std::string wrapped = ScriptEngine::WrapGuestCode(jsgate::CreateSafeContext(), "return 1;");
    EXPECT_THAT(wrapped, HasSubstr("\"use strict\";"));
    EXPECT_THAT(wrapped, HasSubstr("const console = sandbox.console;"));
    EXPECT_THAT(wrapped, HasSubstr("const Object = sandbox.Object;"));
    EXPECT_THAT(wrapped, HasSubstr("return 1;"));
}
