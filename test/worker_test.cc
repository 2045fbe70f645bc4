#include "src/worker/guard.h"
#include "src/worker/worker.h"
#include "src/server/channel.h"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <unistd.h>

using jsgate::FrameChannel;
using jsgate::FrameStatus;
using jsgate::HandleRequest;
using jsgate::PassesWorkerGuard;
using jsgate::ScriptEngine;
using jsgate::WorkerRequest;
using jsgate::WorkerResponse;
using namespace std::chrono_literals;

namespace {

WorkerRequest Request(uint64_t id, const std::string& code, int64_t timeout_ms = 2000) {
    WorkerRequest request;
    request.set_id(id);
    request.set_code(code);
    request.set_timeout_ms(timeout_ms);
    return request;
}

} // namespace

// NOLINTNEXTLINE
TEST(worker_guard, blocks_reduced_deny_list) {
    for (const char* code : {"eval('1')", "Function('x')", "window", "DOCUMENT.title", "fetch('/')",
                             "new XMLHttpRequest()", "require('fs')", "import fs from 'fs'",
                             "postMessage(1)", "close()", "importScripts('a.js')"}) {
        EXPECT_FALSE(PassesWorkerGuard(code)) << code;
    }
}

// NOLINTNEXTLINE
TEST(worker_guard, allows_ordinary_code) {
    EXPECT_TRUE(PassesWorkerGuard("console.log(2 + 2);"));
    EXPECT_TRUE(PassesWorkerGuard("const closed = true; return closed;"));
    // Only a subset of the server deny-list is repeated here.
    EXPECT_TRUE(PassesWorkerGuard("localStorage.getItem('x')"));
}

// NOLINTNEXTLINE
TEST(worker_guard, long_whitespace_run_after_keyword_returns) {
    const std::string spaces(1000000, ' ');
    EXPECT_TRUE(PassesWorkerGuard("// eval" + spaces + "x"));
    EXPECT_FALSE(PassesWorkerGuard("eval" + spaces + "('1')"));
}

// NOLINTNEXTLINE
TEST(worker, response_carries_request_id) {
    ScriptEngine engine;
    WorkerResponse response = HandleRequest(Request(41, "return 'ok';"), engine);
    EXPECT_EQ(response.id(), 41u);
    EXPECT_FALSE(response.has_error());
    EXPECT_EQ(response.result(), "ok");
}

// NOLINTNEXTLINE
TEST(worker, guard_rejection_skips_evaluation) {
    ScriptEngine engine;
    WorkerResponse response = HandleRequest(Request(2, "console.log('x'); fetch('/')"), engine);
    ASSERT_TRUE(response.has_error());
    EXPECT_EQ(response.error(), jsgate::kGuardRejection);
    EXPECT_EQ(response.output(), "");
    EXPECT_EQ(response.result(), "");
}

// NOLINTNEXTLINE
TEST(worker, error_response_has_empty_result_and_keeps_output) {
    ScriptEngine engine;
    WorkerResponse response = HandleRequest(Request(3, "console.error('bad');\nthrow new Error('boom');"), engine);
    ASSERT_TRUE(response.has_error());
    EXPECT_EQ(response.error(), "boom");
    EXPECT_EQ(response.output(), "ERROR: bad");
    EXPECT_EQ(response.result(), "");
    EXPECT_FALSE(response.timed_out());
}

// NOLINTNEXTLINE
TEST(worker, negative_timeout_is_clamped) {
    ScriptEngine engine;
    WorkerResponse response = HandleRequest(Request(4, "while (true) {}", -5), engine);
    EXPECT_TRUE(response.timed_out());
    EXPECT_EQ(response.error(), jsgate::kTimeoutMessage);
}

// NOLINTNEXTLINE
TEST(worker, serve_answers_each_frame_until_closed) {
    int requests[2];
    int responses[2];
    ASSERT_EQ(pipe(requests), 0);
    ASSERT_EQ(pipe(responses), 0);

    int exit_code = -1;
    std::thread server([&] {
        exit_code = jsgate::Serve(requests[0], responses[1], jsgate::EngineLimits{});
    });

    ASSERT_TRUE(FrameChannel::WriteFrame(requests[1], Request(1, "return 1;")));
    ASSERT_TRUE(FrameChannel::WriteFrame(requests[1], Request(2, "console.log('two');")));

    WorkerResponse first;
    WorkerResponse second;
    auto deadline = std::chrono::steady_clock::now() + 5s;
    ASSERT_EQ(FrameChannel::ReadFrame(responses[0], &first, deadline), FrameStatus::kOk);
    ASSERT_EQ(FrameChannel::ReadFrame(responses[0], &second, deadline), FrameStatus::kOk);
    EXPECT_EQ(first.id(), 1u);
    EXPECT_EQ(first.result(), "1");
    EXPECT_EQ(second.id(), 2u);
    EXPECT_EQ(second.output(), "two");

    close(requests[1]);
    server.join();
    EXPECT_EQ(exit_code, 0);
    close(requests[0]);
    close(responses[0]);
    close(responses[1]);
}
