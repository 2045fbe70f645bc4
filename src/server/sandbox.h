#pragma once

#include "src/server/execution.h"
#include "src/server/isolated_unit.h"
#include "src/server/process.h"
#include "src/server/script_engine.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace jsgate {

enum class StrategyStatus {
    kCompleted,
    kUnavailable,
    kTransportFailure,
    kTimedOut
};

const char* StrategyStatusName(StrategyStatus status);

struct StrategyResult {
    StrategyStatus status;
    // Only meaningful when status is kCompleted.
    EvaluationResult evaluation;
    // Internal reason for logs; never shown to callers.
    std::string detail;
};

class ExecutionStrategy {
public:
    virtual ~ExecutionStrategy() = default;
    virtual std::string Name() const = 0;
    // |deadline| is the orchestrator's outer timeout.
    virtual StrategyResult Execute(const ExecutionRequest& request,
                                   std::chrono::steady_clock::time_point deadline) = 0;
};

struct IsolatedOptions {
    std::vector<std::string> worker_command;
    ResourceLimits limits;
    size_t max_idle_units = 4;
    int max_runs_per_unit = 100;
};

// Runs requests on pooled jsgate_worker processes. A unit is reused only after
// a clean COMPLETED exchange; any anomaly kills it and the next request gets a
// new one. RLIMIT_CPU accumulates across reuse, so a unit is also retired once
// another full-length run could push it past the limit.
class IsolatedStrategy : public ExecutionStrategy {
public:
    explicit IsolatedStrategy(IsolatedOptions options);
    ~IsolatedStrategy() override;

    std::string Name() const override { return "isolated"; }
    StrategyResult Execute(const ExecutionRequest& request,
                           std::chrono::steady_clock::time_point deadline) override;

    size_t IdleUnits() const;

private:
    std::unique_ptr<IsolatedUnit> Acquire(std::string* error);
    void Release(std::unique_ptr<IsolatedUnit> unit, std::chrono::milliseconds next_run);
    bool HasCpuBudget(const IsolatedUnit& unit, std::chrono::milliseconds next_run) const;

    IsolatedOptions options_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<IsolatedUnit>> idle_;
};

// Evaluates on the caller's thread with no isolation boundary. The engine's
// own budget is the only limit; the outer deadline cannot preempt it.
class InProcessStrategy : public ExecutionStrategy {
public:
    explicit InProcessStrategy(EngineLimits limits = {});

    std::string Name() const override { return "in-process"; }
    StrategyResult Execute(const ExecutionRequest& request,
                           std::chrono::steady_clock::time_point deadline) override;

private:
    ScriptEngine engine_;
};

} // namespace jsgate
