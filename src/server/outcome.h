#pragma once

#include <string>
#include <variant>
#include <vector>

namespace jsgate {

enum class ErrorKind {
    kRateLimitExceeded,
    kValidationFailed,
    kIsolationUnavailable,
    kExecutionTimeout,
    kGuestRuntimeError,
    kTransportFailure,
    kBusy
};

const char* ErrorKindName(ErrorKind kind);

struct ExecutionSuccess {
    std::string result_text;
    std::string output_text;
    std::vector<std::string> warnings;
};

struct ExecutionFailure {
    ErrorKind kind;
    std::string message;
    // Quota left for the caller; only meaningful for kRateLimitExceeded.
    int remaining = 0;
    // Full ordered validator error list; only set for kValidationFailed.
    std::vector<std::string> errors;
};

// Exactly one terminal outcome per submission.
using ExecutionOutcome = std::variant<ExecutionSuccess, ExecutionFailure>;

inline bool IsSuccess(const ExecutionOutcome& outcome) {
    return std::holds_alternative<ExecutionSuccess>(outcome);
}

// Escapes & < > " ' so the text is safe to embed in markup.
std::string EscapeHtml(const std::string& text);

// Escapes every text field of the outcome.
ExecutionOutcome SanitizeOutcome(ExecutionOutcome outcome);

} // namespace jsgate
