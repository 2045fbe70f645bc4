#pragma once

#include "src/server/logger.h"
#include "src/server/orchestrator.h"
#include "src/server/rate_limiter.h"
#include "src/server/sandbox.h"
#include "src/server/script_engine.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace jsgate {

struct ServerConfig {
    std::string listen_address = "0.0.0.0:50051";
    RateLimitOptions rate_limit;
    std::chrono::milliseconds cleanup_interval{300000};
    OrchestratorOptions orchestrator;
    int max_concurrent = 10;
    IsolatedOptions isolated;
    EngineLimits engine;
    std::string log_level_name = "info";
    LogLevel log_level = LogLevel::INFO;
    bool self_test = false;
};

// Builds the config from the parsed command-line flags. Unknown log level
// names are left for ValidateConfig to report.
ServerConfig LoadServerConfig();

// Error message for the first nonsensical value, or nullopt.
std::optional<std::string> ValidateConfig(const ServerConfig& config);

// argv for one jsgate_worker carrying the engine limits and log level.
std::vector<std::string> WorkerCommand(const std::string& worker_path, const EngineLimits& engine,
                                       const std::string& log_level_name);

} // namespace jsgate
