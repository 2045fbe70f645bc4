#pragma once

#include "src/server/outcome.h"
#include "src/server/rate_limiter.h"
#include "src/server/sandbox.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace jsgate {

struct OrchestratorOptions {
    std::chrono::milliseconds timeout{5000};
    // Added to the inner timeout to form the outer deadline.
    std::chrono::milliseconds timeout_buffer{250};
};

// Drives one submission through busy check, rate gate, validation, isolated
// execution and fallback, and returns exactly one sanitized outcome.
class Orchestrator {
public:
    Orchestrator(RateLimiter& limiter,
                 std::unique_ptr<ExecutionStrategy> isolated,
                 std::unique_ptr<ExecutionStrategy> fallback,
                 OrchestratorOptions options = {});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    ExecutionOutcome RunCode(const std::string& session_id, const std::string& code);

    bool IsExecuting(const std::string& session_id) const;

    const OrchestratorOptions& options() const { return options_; }

private:
    // Marks a session as executing for its lifetime. Settle() clears the mark
    // on the first call only.
    class Submission {
    public:
        Submission(Orchestrator& owner, std::string session_id);
        ~Submission();

        Submission(const Submission&) = delete;
        Submission& operator=(const Submission&) = delete;

        bool Settle();

    private:
        Orchestrator& owner_;
        std::string session_id_;
        std::atomic<bool> settled_{false};
    };

    bool TryBegin(const std::string& session_id);
    void Finish(const std::string& session_id);

    ExecutionOutcome Execute(const std::string& code, std::vector<std::string> warnings);
    static ExecutionOutcome FromEvaluation(const EvaluationResult& evaluation,
                                           std::vector<std::string> warnings);

    RateLimiter& limiter_;
    std::unique_ptr<ExecutionStrategy> isolated_;
    std::unique_ptr<ExecutionStrategy> fallback_;
    OrchestratorOptions options_;

    mutable std::mutex executing_mutex_;
    std::unordered_set<std::string> executing_;
};

} // namespace jsgate
