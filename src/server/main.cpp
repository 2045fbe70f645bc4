#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "absl/flags/parse.h"

#include "src/server/config.h"
#include "src/server/logger.h"
#include "src/server/orchestrator.h"
#include "src/server/sandbox.h"
#include "src/server/security_examples.h"
#include "src/server/service.h"

using grpc::Server;
using grpc::ServerBuilder;
using jsgate::CodeRunnerServiceImpl;
using jsgate::ErrorKind;
using jsgate::ExecutionFailure;
using jsgate::Expectation;
using jsgate::InProcessStrategy;
using jsgate::IsolatedStrategy;
using jsgate::Logger;
using jsgate::Orchestrator;
using jsgate::RateLimiter;
using jsgate::ServerConfig;

namespace {

std::unique_ptr<Orchestrator> MakeOrchestrator(const ServerConfig& config, RateLimiter& limiter) {
    return std::make_unique<Orchestrator>(limiter,
                                          std::make_unique<IsolatedStrategy>(config.isolated),
                                          std::make_unique<InProcessStrategy>(config.engine),
                                          config.orchestrator);
}

bool MatchesExpectation(const jsgate::ExecutionOutcome& outcome, Expectation expectation) {
    const auto* failure = std::get_if<ExecutionFailure>(&outcome);
    switch (expectation) {
        case Expectation::kBlocked: return failure && failure->kind == ErrorKind::kValidationFailed;
        case Expectation::kTimesOut: return failure && failure->kind == ErrorKind::kExecutionTimeout;
        case Expectation::kRuns: return failure == nullptr;
    }
    return false;
}

int RunSelfTest(const ServerConfig& config) {
    const auto& examples = jsgate::SecurityExamples();
    jsgate::RateLimitOptions unlimited = config.rate_limit;
    unlimited.max_requests = static_cast<int>(examples.size());
    RateLimiter limiter(unlimited);
    auto orchestrator = MakeOrchestrator(config, limiter);

    int mismatches = 0;
    for (const auto& example : examples) {
        jsgate::ExecutionOutcome outcome = orchestrator->RunCode("self-test", example.code);
        if (MatchesExpectation(outcome, example.expectation)) {
            Logger::Info("PASS ", example.name, " (", jsgate::ExpectationName(example.expectation), ")");
            continue;
        }
        ++mismatches;
        const auto* failure = std::get_if<ExecutionFailure>(&outcome);
        Logger::Error("FAIL ", example.name, ": expected ", jsgate::ExpectationName(example.expectation),
                      ", got ", failure ? jsgate::ErrorKindName(failure->kind) : "success");
    }
    Logger::Info("Self test finished: ", examples.size() - mismatches, "/", examples.size(), " as expected");
    return mismatches == 0 ? 0 : 1;
}

int RunServer(const ServerConfig& config) {
    RateLimiter limiter(config.rate_limit);
    limiter.StartCleanup(config.cleanup_interval);
    auto orchestrator = MakeOrchestrator(config, limiter);
    CodeRunnerServiceImpl service(*orchestrator, config.max_concurrent);

    ServerBuilder builder;
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        Logger::Error("Failed to start server on ", config.listen_address);
        return 1;
    }
    Logger::Info("Server listening on ", config.listen_address);
    server->Wait();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    absl::ParseCommandLine(argc, argv);

    ServerConfig config = jsgate::LoadServerConfig();
    if (auto error = jsgate::ValidateConfig(config)) {
        Logger::Error("Invalid configuration: ", *error);
        return 2;
    }
    Logger::SetLevel(config.log_level);

    if (config.self_test) {
        return RunSelfTest(config);
    }
    return RunServer(config);
}
