#include "src/server/service.h"
#include "src/server/logger.h"
#include "src/server/security_examples.h"

#include <mutex>
#include <thread>

using grpc::CallbackServerContext;
using grpc::ServerUnaryReactor;
using grpc::Status;
using grpc::StatusCode;

namespace jsgate {

RunFailure::Kind ToProtoKind(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kRateLimitExceeded: return RunFailure::RATE_LIMIT_EXCEEDED;
        case ErrorKind::kValidationFailed: return RunFailure::VALIDATION_FAILED;
        case ErrorKind::kIsolationUnavailable: return RunFailure::ISOLATION_UNAVAILABLE;
        case ErrorKind::kExecutionTimeout: return RunFailure::EXECUTION_TIMEOUT;
        case ErrorKind::kGuestRuntimeError: return RunFailure::GUEST_RUNTIME_ERROR;
        case ErrorKind::kTransportFailure: return RunFailure::TRANSPORT_FAILURE;
        case ErrorKind::kBusy: return RunFailure::BUSY;
    }
    return RunFailure::KIND_UNSPECIFIED;
}

void FillRunResponse(const ExecutionOutcome& outcome, RunResponse* response) {
    if (const auto* success = std::get_if<ExecutionSuccess>(&outcome)) {
        RunSuccess* out = response->mutable_success();
        out->set_result(success->result_text);
        out->set_output(success->output_text);
        for (const auto& warning : success->warnings) {
            out->add_warnings(warning);
        }
        return;
    }
    const auto& failure = std::get<ExecutionFailure>(outcome);
    RunFailure* out = response->mutable_failure();
    out->set_kind(ToProtoKind(failure.kind));
    out->set_message(failure.message);
    out->set_remaining(failure.remaining);
    for (const auto& error : failure.errors) {
        out->add_errors(error);
    }
}

void FillExamples(ListExamplesResponse* response) {
    for (const auto& example : SecurityExamples()) {
        Example* out = response->add_examples();
        out->set_name(example.name);
        out->set_description(example.description);
        out->set_code(example.code);
        switch (example.expectation) {
            case Expectation::kBlocked: out->set_expectation(Example::BLOCKED); break;
            case Expectation::kTimesOut: out->set_expectation(Example::TIMES_OUT); break;
            case Expectation::kRuns: out->set_expectation(Example::RUNS); break;
        }
    }
}

CodeRunnerServiceImpl::CodeRunnerServiceImpl(Orchestrator& orchestrator, int max_concurrent)
    : orchestrator_(orchestrator), max_concurrent_(max_concurrent) {}

ServerUnaryReactor* CodeRunnerServiceImpl::Run(CallbackServerContext* context,
                                               const RunRequest* request,
                                               RunResponse* response) {
    int active = active_runs_.fetch_add(1);
    Logger::Debug("Received Run request. Active runs: ", active + 1);

    if (active >= max_concurrent_) {
        active_runs_.fetch_sub(1);
        Logger::Warn("Too many active runs. Rejecting request.");
        ServerUnaryReactor* reactor = context->DefaultReactor();
        reactor->Finish(Status(StatusCode::RESOURCE_EXHAUSTED, "Too many active executions"));
        return reactor;
    }

    // Execution blocks for up to the outer deadline, so it runs on its own
    // thread instead of a gRPC callback thread.
    class RunReactor : public ServerUnaryReactor {
    public:
        RunReactor(Orchestrator& orchestrator, std::string session_id, std::string code,
                   RunResponse* response, std::atomic<int>& counter)
            : counter_(counter) {
            // Held until worker_thread_ is assigned, so OnDone never sees it unset.
            std::lock_guard<std::mutex> lock(start_mutex_);
            worker_thread_ = std::thread([this, &orchestrator, session_id = std::move(session_id),
                                          code = std::move(code), response]() {
                { std::lock_guard<std::mutex> started(start_mutex_); }
                ExecutionOutcome outcome = orchestrator.RunCode(session_id, code);
                FillRunResponse(outcome, response);
                if (const auto* failure = std::get_if<ExecutionFailure>(&outcome)) {
                    Logger::Info("Run for ", session_id, " failed: ", ErrorKindName(failure->kind));
                } else {
                    Logger::Info("Run for ", session_id, " succeeded");
                }
                Finish(Status::OK);
            });
        }

        void OnDone() override {
            if (worker_thread_.get_id() == std::this_thread::get_id()) {
                worker_thread_.detach();
            } else if (worker_thread_.joinable()) {
                worker_thread_.join();
            }
            counter_.fetch_sub(1);
            delete this;
        }

        void OnCancel() override {
            // The orchestrator settles every submission on its own deadline.
            Logger::Warn("Run cancelled by client");
        }

    private:
        std::mutex start_mutex_;
        std::thread worker_thread_;
        std::atomic<int>& counter_;
    };

    std::string session_id = request->session_id();
    if (session_id.empty()) {
        session_id = context->peer();
    }
    return new RunReactor(orchestrator_, std::move(session_id), request->code(), response, active_runs_);
}

ServerUnaryReactor* CodeRunnerServiceImpl::ListExamples(CallbackServerContext* context,
                                                        const ListExamplesRequest* /*request*/,
                                                        ListExamplesResponse* response) {
    FillExamples(response);
    ServerUnaryReactor* reactor = context->DefaultReactor();
    reactor->Finish(Status::OK);
    return reactor;
}

} // namespace jsgate
