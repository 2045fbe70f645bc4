#include "src/server/isolated_unit.h"

#include <gtest/gtest.h>
#include <thread>

using jsgate::AwaitStatus;
using jsgate::EvaluationResult;
using jsgate::ExecutionRequest;
using jsgate::IsolatedUnit;
using jsgate::ResourceLimits;
using jsgate::UnitState;
using namespace std::chrono_literals;

namespace {

ExecutionRequest Request(const std::string& code, int64_t timeout_ms = 2000) {
    ExecutionRequest request;
    request.code = code;
    request.timeout_ms = timeout_ms;
    return request;
}

std::chrono::steady_clock::time_point In(std::chrono::milliseconds delay) {
    return std::chrono::steady_clock::now() + delay;
}

} // namespace

// NOLINTNEXTLINE
TEST(isolated_unit, completes_and_recycles) {
    IsolatedUnit unit({JSGATE_WORKER_PATH}, ResourceLimits{});
    std::string error;
    ASSERT_TRUE(unit.Start(&error)) << error;
    EXPECT_EQ(unit.state(), UnitState::kIdle);
    pid_t pid = unit.pid();

    ASSERT_TRUE(unit.Dispatch(Request("console.log(2 + 2);\nreturn 'done';"), &error)) << error;
    EXPECT_EQ(unit.state(), UnitState::kDispatched);

    EvaluationResult result;
    ASSERT_EQ(unit.Await(In(5s), &result), AwaitStatus::kResponse);
    EXPECT_EQ(unit.state(), UnitState::kCompleted);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "4");
    EXPECT_EQ(result.result, "done");

    ASSERT_TRUE(unit.Recycle());
    EXPECT_EQ(unit.state(), UnitState::kIdle);

    ASSERT_TRUE(unit.Dispatch(Request("return 1 + 1;"), &error)) << error;
    ASSERT_EQ(unit.Await(In(5s), &result), AwaitStatus::kResponse);
    EXPECT_EQ(result.result, "2");
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(unit.pid(), pid);
    EXPECT_EQ(unit.runs(), 2);
}

// NOLINTNEXTLINE
TEST(isolated_unit, worker_reports_guest_error) {
    IsolatedUnit unit({JSGATE_WORKER_PATH}, ResourceLimits{});
    std::string error;
    ASSERT_TRUE(unit.Start(&error)) << error;
    ASSERT_TRUE(unit.Dispatch(Request("throw new Error('nope');"), &error));

    EvaluationResult result;
    ASSERT_EQ(unit.Await(In(5s), &result), AwaitStatus::kResponse);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "nope");
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.result, "");
}

// NOLINTNEXTLINE
TEST(isolated_unit, worker_timer_fires_before_outer_deadline) {
    IsolatedUnit unit({JSGATE_WORKER_PATH}, ResourceLimits{});
    std::string error;
    ASSERT_TRUE(unit.Start(&error)) << error;
    ASSERT_TRUE(unit.Dispatch(Request("while (true) {}", 200), &error));

    EvaluationResult result;
    ASSERT_EQ(unit.Await(In(5s), &result), AwaitStatus::kResponse);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error.value_or(""), jsgate::kTimeoutMessage);
}

// NOLINTNEXTLINE
TEST(isolated_unit, silent_worker_hits_outer_deadline_and_is_killed) {
    IsolatedUnit unit({"/bin/sleep", "30"}, ResourceLimits{});
    std::string error;
    ASSERT_TRUE(unit.Start(&error)) << error;
    ASSERT_TRUE(unit.Dispatch(Request("return 1;"), &error)) << error;

    auto start = std::chrono::steady_clock::now();
    EvaluationResult result;
    EXPECT_EQ(unit.Await(start + 200ms, &result), AwaitStatus::kTimedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(unit.state(), UnitState::kTimedOut);
    EXPECT_FALSE(unit.alive());
    EXPECT_FALSE(unit.Recycle());
}

// NOLINTNEXTLINE
TEST(isolated_unit, exiting_worker_is_a_transport_failure) {
    IsolatedUnit unit({"/bin/true"}, ResourceLimits{});
    std::string error;
    ASSERT_TRUE(unit.Start(&error)) << error;

    EvaluationResult result;
    if (unit.Dispatch(Request("return 1;"), &error)) {
        EXPECT_EQ(unit.Await(In(2s), &result), AwaitStatus::kTransportFailure);
    }
    EXPECT_FALSE(unit.alive());
    EXPECT_NE(unit.state(), UnitState::kCompleted);
}

// NOLINTNEXTLINE
TEST(isolated_unit, missing_binary_fails_to_start) {
    IsolatedUnit unit({"/nonexistent/jsgate_worker"}, ResourceLimits{});
    std::string error;
    EXPECT_FALSE(unit.Start(&error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(unit.alive());
    EXPECT_FALSE(unit.Dispatch(Request("return 1;"), &error));
}

// NOLINTNEXTLINE
TEST(isolated_unit, dead_idle_worker_is_detected) {
    IsolatedUnit unit({"/bin/true"}, ResourceLimits{});
    std::string error;
    ASSERT_TRUE(unit.Start(&error)) << error;

    auto deadline = In(2s);
    while (unit.CheckAlive() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(unit.CheckAlive());
    EXPECT_FALSE(unit.alive());
}

// NOLINTNEXTLINE
TEST(isolated_unit, reports_cpu_time_of_live_worker) {
    IsolatedUnit unit({JSGATE_WORKER_PATH}, ResourceLimits{});
    std::string error;
    ASSERT_TRUE(unit.Start(&error)) << error;
    ASSERT_TRUE(unit.Dispatch(Request("const end = Date.now() + 300; while (Date.now() < end) {} return 1;"), &error))
        << error;
    EvaluationResult result;
    ASSERT_EQ(unit.Await(In(5s), &result), AwaitStatus::kResponse);

    auto used = unit.CpuTime();
    ASSERT_TRUE(used.has_value());
    EXPECT_GE(*used, 100ms);

    unit.Terminate();
    EXPECT_FALSE(unit.CpuTime().has_value());
}

// NOLINTNEXTLINE
TEST(isolated_unit, bare_command_name_is_not_searched_in_path) {
    IsolatedUnit unit({"sleep", "30"}, ResourceLimits{});
    std::string error;
    EXPECT_FALSE(unit.Start(&error));
    EXPECT_FALSE(unit.alive());
}
