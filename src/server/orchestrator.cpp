#include "src/server/orchestrator.h"
#include "src/server/logger.h"
#include "src/server/validator.h"

#include <sstream>

namespace jsgate {

namespace {

std::string JoinLines(const std::vector<std::string>& lines) {
    std::ostringstream out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out << "\n";
        out << lines[i];
    }
    return out.str();
}

ExecutionFailure Failure(ErrorKind kind, std::string message) {
    ExecutionFailure failure;
    failure.kind = kind;
    failure.message = std::move(message);
    return failure;
}

} // namespace

Orchestrator::Submission::Submission(Orchestrator& owner, std::string session_id)
    : owner_(owner), session_id_(std::move(session_id)) {}

Orchestrator::Submission::~Submission() {
    Settle();
}

bool Orchestrator::Submission::Settle() {
    bool expected = false;
    if (!settled_.compare_exchange_strong(expected, true)) {
        return false;
    }
    owner_.Finish(session_id_);
    return true;
}

Orchestrator::Orchestrator(RateLimiter& limiter,
                           std::unique_ptr<ExecutionStrategy> isolated,
                           std::unique_ptr<ExecutionStrategy> fallback,
                           OrchestratorOptions options)
    : limiter_(limiter),
      isolated_(std::move(isolated)),
      fallback_(std::move(fallback)),
      options_(options) {}

ExecutionOutcome Orchestrator::RunCode(const std::string& session_id, const std::string& code) {
    if (!TryBegin(session_id)) {
        Logger::Warn("Rejecting submission for ", session_id, ": already executing");
        return SanitizeOutcome(Failure(ErrorKind::kBusy, "Execution already in progress"));
    }
    Submission submission(*this, session_id);

    if (!limiter_.IsAllowed(session_id)) {
        int remaining = limiter_.GetRemaining(session_id);
        Logger::Info("Rate limit exceeded for ", session_id);
        ExecutionFailure failure = Failure(
            ErrorKind::kRateLimitExceeded,
            "Rate limit exceeded. Please wait before running code again. Remaining requests: " +
                std::to_string(remaining));
        failure.remaining = remaining;
        return SanitizeOutcome(std::move(failure));
    }

    ValidationResult validation = ValidateCode(code);
    if (!validation.valid) {
        Logger::Info("Validation rejected submission from ", session_id, " with ",
                     validation.errors.size(), " error(s)");
        ExecutionFailure failure = Failure(
            ErrorKind::kValidationFailed,
            "Security Error: Code validation failed.\n" + JoinLines(validation.errors));
        failure.errors = validation.errors;
        return SanitizeOutcome(std::move(failure));
    }

    ExecutionOutcome outcome = Execute(SanitizeCode(code), std::move(validation.warnings));
    submission.Settle();
    return SanitizeOutcome(std::move(outcome));
}

bool Orchestrator::IsExecuting(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(executing_mutex_);
    return executing_.count(session_id) > 0;
}

bool Orchestrator::TryBegin(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(executing_mutex_);
    return executing_.insert(session_id).second;
}

void Orchestrator::Finish(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(executing_mutex_);
    executing_.erase(session_id);
}

ExecutionOutcome Orchestrator::Execute(const std::string& code, std::vector<std::string> warnings) {
    ExecutionRequest request;
    request.code = code;
    request.timeout_ms = options_.timeout.count();

    // The outer deadline is armed before anything is dispatched.
    auto deadline = std::chrono::steady_clock::now() + options_.timeout + options_.timeout_buffer;

    StrategyResult primary = isolated_->Execute(request, deadline);
    if (primary.status == StrategyStatus::kCompleted) {
        return FromEvaluation(primary.evaluation, std::move(warnings));
    }

    Logger::Warn("Strategy ", isolated_->Name(), " ", StrategyStatusName(primary.status), ": ",
                 primary.detail, ". Falling back to ", fallback_->Name());

    StrategyResult secondary = fallback_->Execute(request, deadline);
    if (secondary.status == StrategyStatus::kCompleted) {
        return FromEvaluation(secondary.evaluation, std::move(warnings));
    }

    Logger::Error("Fallback strategy ", fallback_->Name(), " ", StrategyStatusName(secondary.status),
                  ": ", secondary.detail);
    switch (primary.status) {
        case StrategyStatus::kTimedOut:
            return Failure(ErrorKind::kExecutionTimeout, "Error: Code execution timeout exceeded");
        case StrategyStatus::kTransportFailure:
            return Failure(ErrorKind::kTransportFailure, "Error: Secure worker stopped responding");
        default:
            return Failure(ErrorKind::kIsolationUnavailable, "Error: Secure execution is not available");
    }
}

ExecutionOutcome Orchestrator::FromEvaluation(const EvaluationResult& evaluation,
                                              std::vector<std::string> warnings) {
    if (evaluation.timed_out) {
        return Failure(ErrorKind::kExecutionTimeout, "Error: Code execution timeout exceeded");
    }
    if (evaluation.error) {
        return Failure(ErrorKind::kGuestRuntimeError, "Error: " + *evaluation.error + "\n" + evaluation.output);
    }
    ExecutionSuccess success;
    success.result_text = evaluation.result;
    success.output_text = evaluation.output;
    success.warnings = std::move(warnings);
    return success;
}

} // namespace jsgate
