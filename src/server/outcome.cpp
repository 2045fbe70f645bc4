#include "src/server/outcome.h"

namespace jsgate {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kRateLimitExceeded: return "RateLimitExceeded";
        case ErrorKind::kValidationFailed: return "ValidationFailed";
        case ErrorKind::kIsolationUnavailable: return "IsolationUnavailable";
        case ErrorKind::kExecutionTimeout: return "ExecutionTimeout";
        case ErrorKind::kGuestRuntimeError: return "GuestRuntimeError";
        case ErrorKind::kTransportFailure: return "TransportFailure";
        case ErrorKind::kBusy: return "Busy";
    }
    return "Unknown";
}

std::string EscapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#039;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

ExecutionOutcome SanitizeOutcome(ExecutionOutcome outcome) {
    if (auto* success = std::get_if<ExecutionSuccess>(&outcome)) {
        success->result_text = EscapeHtml(success->result_text);
        success->output_text = EscapeHtml(success->output_text);
        for (auto& warning : success->warnings) {
            warning = EscapeHtml(warning);
        }
    } else {
        auto& failure = std::get<ExecutionFailure>(outcome);
        failure.message = EscapeHtml(failure.message);
        for (auto& error : failure.errors) {
            error = EscapeHtml(error);
        }
    }
    return outcome;
}

} // namespace jsgate
