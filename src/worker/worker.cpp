#include "src/worker/worker.h"
#include "src/server/channel.h"
#include "src/server/logger.h"
#include "src/worker/guard.h"

namespace jsgate {

WorkerResponse HandleRequest(const WorkerRequest& request, const ScriptEngine& engine) {
    WorkerResponse response;
    response.set_id(request.id());

    if (!PassesWorkerGuard(request.code())) {
        Logger::Warn("Request ", request.id(), " rejected by worker guard");
        response.set_error(kGuardRejection);
        return response;
    }

    auto budget = std::chrono::milliseconds(ClampTimeout(request.timeout_ms()));
    std::optional<EvaluationResult> evaluation = engine.Evaluate(request.code(), budget);
    if (!evaluation) {
        response.set_error("Interpreter could not be initialised");
        return response;
    }

    response.set_output(evaluation->output);
    response.set_timed_out(evaluation->timed_out);
    if (evaluation->error) {
        response.set_error(*evaluation->error);
    } else {
        response.set_result(evaluation->result);
    }
    return response;
}

int Serve(int in_fd, int out_fd, const EngineLimits& limits) {
    ScriptEngine engine(limits);
    Logger::Info("Worker ready");

    for (;;) {
        WorkerRequest request;
        FrameStatus status = FrameChannel::ReadFrame(in_fd, &request);
        if (status == FrameStatus::kClosed) {
            Logger::Debug("Request channel closed; exiting");
            return 0;
        }
        if (status != FrameStatus::kOk) {
            Logger::Error("Failed to read request: ", FrameStatusName(status));
            return 1;
        }

        Logger::Debug("Evaluating request ", request.id(), " (", request.code().size(), " bytes)");
        WorkerResponse response = HandleRequest(request, engine);
        if (!FrameChannel::WriteFrame(out_fd, response)) {
            Logger::Error("Failed to write response ", request.id());
            return 1;
        }
    }
}

} // namespace jsgate
