#pragma once

#include "src/server/channel.h"
#include "src/server/execution.h"
#include "src/server/process.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jsgate {

// Lifecycle of one submission on a unit:
//   IDLE -> DISPATCHED -> {COMPLETED, FAILED, TIMED_OUT} -> IDLE
// Only a COMPLETED unit goes back to IDLE (Recycle). FAILED and TIMED_OUT
// units are killed and must be discarded.
enum class UnitState {
    kIdle,
    kDispatched,
    kCompleted,
    kFailed,
    kTimedOut
};

const char* UnitStateName(UnitState state);

enum class AwaitStatus {
    kResponse,
    kTimedOut,
    kTransportFailure
};

// One jsgate_worker process reached only through its stdin/stdout frames.
class IsolatedUnit {
public:
    IsolatedUnit(std::vector<std::string> command, ResourceLimits limits);
    ~IsolatedUnit();

    IsolatedUnit(const IsolatedUnit&) = delete;
    IsolatedUnit& operator=(const IsolatedUnit&) = delete;

    // Spawns the worker. False means isolation is unavailable.
    bool Start(std::string* error);

    // Sends one request. False means the transport failed; the unit is then FAILED.
    bool Dispatch(const ExecutionRequest& request, std::string* error);

    // Waits for the response to the outstanding request until |deadline|.
    // Responses carrying another request's id are stray and dropped. On
    // timeout or transport failure the worker is killed before returning.
    AwaitStatus Await(std::chrono::steady_clock::time_point deadline, EvaluationResult* result);

    // COMPLETED -> IDLE so the worker can take another request.
    bool Recycle();

    void Terminate();

    UnitState state() const { return state_; }
    bool alive() const { return child_.pid > 0; }
    // Reaps a worker that died while idle; false once it is gone.
    bool CheckAlive() { return !Process::HasExited(&child_); }
    int runs() const { return runs_; }
    std::optional<std::chrono::milliseconds> CpuTime() const { return Process::CpuTime(child_); }
    pid_t pid() const { return child_.pid; }

private:
    std::vector<std::string> command_;
    ResourceLimits limits_;
    ChildProcess child_;
    UnitState state_ = UnitState::kIdle;
    uint64_t next_id_ = 1;
    uint64_t outstanding_id_ = 0;
    int runs_ = 0;
};

} // namespace jsgate
