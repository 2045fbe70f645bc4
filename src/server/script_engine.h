#pragma once

#include "src/server/execution.h"
#include "src/server/safe_context.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace jsgate {

struct EngineLimits {
    size_t memory_bytes = 64 * 1024 * 1024;
    size_t stack_bytes = 1024 * 1024;
    // Console output kept per evaluation; the rest is dropped with a marker line.
    size_t max_output_bytes = 1024 * 1024;
};

// Evaluates guest JavaScript against a Safe Context on the calling thread.
//
// Every call builds a fresh QuickJS runtime, strips the interpreter's global
// object and binds a freshly created SafeContext as constants of a strict
// closure around the guest text. Nothing a guest defines outlives the call.
// A QuickJS interrupt handler checks the wall-clock budget; once it passes the
// guest is aborted and the result is marked timed_out.
class ScriptEngine {
public:
    explicit ScriptEngine(EngineLimits limits = {});

    // nullopt when the interpreter itself could not be set up.
    std::optional<EvaluationResult> Evaluate(const std::string& code, std::chrono::milliseconds budget) const;

    const EngineLimits& limits() const { return limits_; }

    // Source of the closure guest text is evaluated in.
    static std::string WrapGuestCode(const SafeContext& context, const std::string& code);

private:
    EngineLimits limits_;
};

} // namespace jsgate
