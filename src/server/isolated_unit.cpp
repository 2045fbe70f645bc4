#include "src/server/isolated_unit.h"
#include "src/server/logger.h"

#include "proto/worker.pb.h"

namespace jsgate {

const char* UnitStateName(UnitState state) {
    switch (state) {
        case UnitState::kIdle: return "IDLE";
        case UnitState::kDispatched: return "DISPATCHED";
        case UnitState::kCompleted: return "COMPLETED";
        case UnitState::kFailed: return "FAILED";
        case UnitState::kTimedOut: return "TIMED_OUT";
    }
    return "UNKNOWN";
}

IsolatedUnit::IsolatedUnit(std::vector<std::string> command, ResourceLimits limits)
    : command_(std::move(command)), limits_(limits) {}

IsolatedUnit::~IsolatedUnit() {
    if (child_.pid > 0) {
        Process::Shutdown(&child_, std::chrono::milliseconds(50));
    }
}

bool IsolatedUnit::Start(std::string* error) {
    if (alive()) {
        return true;
    }
    SpawnResult spawned = Process::Spawn(command_, limits_);
    if (!spawned.success) {
        *error = spawned.error_message;
        state_ = UnitState::kFailed;
        return false;
    }
    child_ = spawned.child;
    state_ = UnitState::kIdle;
    runs_ = 0;
    Logger::Info("Started isolated unit pid ", child_.pid);
    return true;
}

bool IsolatedUnit::Dispatch(const ExecutionRequest& request, std::string* error) {
    if (state_ != UnitState::kIdle || !alive()) {
        *error = std::string("Unit not ready (") + UnitStateName(state_) + ")";
        return false;
    }

    WorkerRequest message;
    message.set_id(next_id_++);
    message.set_code(request.code);
    message.set_timeout_ms(ClampTimeout(request.timeout_ms));

    if (!FrameChannel::WriteFrame(child_.stdin_fd, message)) {
        *error = "Failed to send request to worker";
        state_ = UnitState::kFailed;
        Terminate();
        return false;
    }
    outstanding_id_ = message.id();
    state_ = UnitState::kDispatched;
    ++runs_;
    return true;
}

AwaitStatus IsolatedUnit::Await(std::chrono::steady_clock::time_point deadline, EvaluationResult* result) {
    if (state_ != UnitState::kDispatched) {
        return AwaitStatus::kTransportFailure;
    }

    for (;;) {
        WorkerResponse response;
        FrameStatus status = FrameChannel::ReadFrame(child_.stdout_fd, &response, deadline);
        if (status == FrameStatus::kTimeout) {
            Logger::Warn("Isolated unit pid ", child_.pid, " did not answer before the deadline");
            state_ = UnitState::kTimedOut;
            Terminate();
            return AwaitStatus::kTimedOut;
        }
        if (status != FrameStatus::kOk) {
            Logger::Warn("Isolated unit pid ", child_.pid, " channel failed: ", FrameStatusName(status));
            state_ = UnitState::kFailed;
            Terminate();
            return AwaitStatus::kTransportFailure;
        }
        if (response.id() != outstanding_id_) {
            Logger::Warn("Dropping stray response ", response.id(), " while waiting for ", outstanding_id_);
            continue;
        }

        result->result = response.result();
        result->output = response.output();
        result->timed_out = response.timed_out();
        if (response.has_error()) {
            result->error = response.error();
            result->result.clear();
        } else {
            result->error.reset();
        }
        state_ = UnitState::kCompleted;
        return AwaitStatus::kResponse;
    }
}

bool IsolatedUnit::Recycle() {
    if (state_ != UnitState::kCompleted || !alive()) {
        return false;
    }
    state_ = UnitState::kIdle;
    outstanding_id_ = 0;
    return true;
}

void IsolatedUnit::Terminate() {
    if (child_.pid > 0) {
        Logger::Debug("Terminating isolated unit pid ", child_.pid);
    }
    Process::Kill(&child_);
}

} // namespace jsgate
