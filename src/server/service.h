#pragma once

#include "src/server/orchestrator.h"
#include "src/server/outcome.h"

#include <atomic>

#include <grpcpp/grpcpp.h>
#include "proto/sandbox.grpc.pb.h"

namespace jsgate {

RunFailure::Kind ToProtoKind(ErrorKind kind);

// Copies an already sanitized outcome into the wire response.
void FillRunResponse(const ExecutionOutcome& outcome, RunResponse* response);

void FillExamples(ListExamplesResponse* response);

class CodeRunnerServiceImpl final : public CodeRunner::CallbackService {
public:
    CodeRunnerServiceImpl(Orchestrator& orchestrator, int max_concurrent);

    grpc::ServerUnaryReactor* Run(grpc::CallbackServerContext* context,
                                  const RunRequest* request,
                                  RunResponse* response) override;

    grpc::ServerUnaryReactor* ListExamples(grpc::CallbackServerContext* context,
                                           const ListExamplesRequest* request,
                                           ListExamplesResponse* response) override;

    int active() const { return active_runs_.load(); }

private:
    Orchestrator& orchestrator_;
    const int max_concurrent_;
    std::atomic<int> active_runs_{0};
};

} // namespace jsgate
