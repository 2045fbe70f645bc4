#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace jsgate {

struct ExecutionRequest {
    std::string code;
    int64_t timeout_ms = 0;
};

// What one evaluation produced, on either side of the worker boundary.
// error is unset on success; on failure result is empty.
struct EvaluationResult {
    std::string result;
    std::string output;
    std::optional<std::string> error;
    bool timed_out = false;

    bool ok() const { return !error.has_value(); }
};

inline int64_t ClampTimeout(int64_t timeout_ms) {
    return timeout_ms < 0 ? 0 : timeout_ms;
}

inline constexpr const char kTimeoutMessage[] = "Execution timeout exceeded";

} // namespace jsgate
