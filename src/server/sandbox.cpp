#include "src/server/sandbox.h"
#include "src/server/logger.h"

namespace jsgate {

const char* StrategyStatusName(StrategyStatus status) {
    switch (status) {
        case StrategyStatus::kCompleted: return "completed";
        case StrategyStatus::kUnavailable: return "unavailable";
        case StrategyStatus::kTransportFailure: return "transport failure";
        case StrategyStatus::kTimedOut: return "timed out";
    }
    return "unknown";
}

IsolatedStrategy::IsolatedStrategy(IsolatedOptions options) : options_(std::move(options)) {}

IsolatedStrategy::~IsolatedStrategy() {
    std::vector<std::unique_ptr<IsolatedUnit>> units;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        units.swap(idle_);
    }
    // Unit destructors shut the workers down.
}

StrategyResult IsolatedStrategy::Execute(const ExecutionRequest& request,
                                         std::chrono::steady_clock::time_point deadline) {
    std::string error;
    std::unique_ptr<IsolatedUnit> unit = Acquire(&error);
    if (!unit) {
        return {StrategyStatus::kUnavailable, {}, error};
    }

    if (!unit->Dispatch(request, &error)) {
        return {StrategyStatus::kTransportFailure, {}, error};
    }

    EvaluationResult evaluation;
    switch (unit->Await(deadline, &evaluation)) {
        case AwaitStatus::kTimedOut:
            return {StrategyStatus::kTimedOut, {}, "No response before the outer deadline"};
        case AwaitStatus::kTransportFailure:
            return {StrategyStatus::kTransportFailure, {}, "Worker channel failed"};
        case AwaitStatus::kResponse:
            break;
    }

    if (evaluation.timed_out) {
        // The worker's own timer fired; do not trust it with another request.
        unit->Terminate();
    } else {
        Release(std::move(unit), std::chrono::milliseconds(ClampTimeout(request.timeout_ms)));
    }
    return {StrategyStatus::kCompleted, std::move(evaluation), ""};
}

size_t IsolatedStrategy::IdleUnits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::unique_ptr<IsolatedUnit> IsolatedStrategy::Acquire(std::string* error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!idle_.empty()) {
            std::unique_ptr<IsolatedUnit> unit = std::move(idle_.back());
            idle_.pop_back();
            if (unit->CheckAlive()) {
                return unit;
            }
            Logger::Warn("Discarding idle unit whose worker exited");
        }
    }

    auto unit = std::make_unique<IsolatedUnit>(options_.worker_command, options_.limits);
    if (!unit->Start(error)) {
        return nullptr;
    }
    return unit;
}

bool IsolatedStrategy::HasCpuBudget(const IsolatedUnit& unit, std::chrono::milliseconds next_run) const {
    auto used = unit.CpuTime();
    if (!used) {
        return false;
    }
    std::chrono::milliseconds limit = std::chrono::seconds(options_.limits.cpu_time_seconds);
    if (*used + next_run >= limit) {
        Logger::Debug("Retiring pid ", unit.pid(), " after ", used->count(), "ms of CPU time");
        return false;
    }
    return true;
}

void IsolatedStrategy::Release(std::unique_ptr<IsolatedUnit> unit, std::chrono::milliseconds next_run) {
    if (!unit->Recycle() || unit->runs() >= options_.max_runs_per_unit || !HasCpuBudget(*unit, next_run)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < options_.max_idle_units) {
        idle_.push_back(std::move(unit));
        return;
    }
    // Pool full: the unit is destroyed once the lock is released.
}

InProcessStrategy::InProcessStrategy(EngineLimits limits) : engine_(limits) {}

StrategyResult InProcessStrategy::Execute(const ExecutionRequest& request,
                                          std::chrono::steady_clock::time_point /*deadline*/) {
    auto evaluation = engine_.Evaluate(request.code, std::chrono::milliseconds(ClampTimeout(request.timeout_ms)));
    if (!evaluation) {
        return {StrategyStatus::kUnavailable, {}, "Interpreter could not be initialised"};
    }
    return {StrategyStatus::kCompleted, std::move(*evaluation), ""};
}

} // namespace jsgate
