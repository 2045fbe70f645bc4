#pragma once

#include "src/server/script_engine.h"

#include "proto/worker.pb.h"

namespace jsgate {

// Answers one request. The response always carries the request's id.
WorkerResponse HandleRequest(const WorkerRequest& request, const ScriptEngine& engine);

// Reads requests from |in_fd| and writes one response each to |out_fd| until
// the orchestrator closes the pipe. Returns the process exit code.
int Serve(int in_fd, int out_fd, const EngineLimits& limits);

} // namespace jsgate
