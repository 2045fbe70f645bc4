#pragma once

#include <string>

namespace jsgate {

constexpr char kGuardRejection[] = "Dangerous code pattern detected";

// Second, smaller deny-list applied inside the worker, independent of the
// orchestrator's validator. True when the code may run.
bool PassesWorkerGuard(const std::string& code);

} // namespace jsgate
