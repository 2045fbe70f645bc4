#include "src/server/config.h"
#include "src/server/process.h"

#include "absl/flags/flag.h"

ABSL_FLAG(std::string, listen, "0.0.0.0:50051", "Address the gRPC server listens on");
ABSL_FLAG(int, max_requests, 10, "Submissions admitted per identifier within the window");
ABSL_FLAG(int64_t, window_ms, 60000, "Rate limit sliding window in milliseconds");
ABSL_FLAG(int64_t, cleanup_interval_ms, 300000, "Interval between rate record sweeps");
ABSL_FLAG(int64_t, timeout_ms, 5000, "Inner execution timeout per submission");
ABSL_FLAG(int64_t, timeout_buffer_ms, 250, "Extra time before the outer deadline fires");
ABSL_FLAG(int, max_concurrent, 10, "Submissions allowed to execute at once");
ABSL_FLAG(std::string, worker_path, "", "jsgate_worker binary; defaults to the server's directory");
ABSL_FLAG(int, max_idle_units, 4, "Idle worker processes kept for reuse");
ABSL_FLAG(int, max_runs_per_unit, 100, "Submissions a worker serves before it is replaced");
ABSL_FLAG(int, worker_cpu_seconds, 30, "RLIMIT_CPU for each worker process");
ABSL_FLAG(int, worker_memory_mb, 256, "RLIMIT_AS for each worker process");
ABSL_FLAG(int, js_memory_mb, 64, "QuickJS heap limit per evaluation");
ABSL_FLAG(int, js_stack_kb, 1024, "QuickJS stack limit per evaluation");
ABSL_FLAG(std::string, log_level, "info", "debug, info, warn or error");
ABSL_FLAG(bool, self_test, false, "Run the security examples locally and exit");

namespace jsgate {

ServerConfig LoadServerConfig() {
    ServerConfig config;
    config.listen_address = absl::GetFlag(FLAGS_listen);
    config.rate_limit.max_requests = absl::GetFlag(FLAGS_max_requests);
    config.rate_limit.window = std::chrono::milliseconds(absl::GetFlag(FLAGS_window_ms));
    config.cleanup_interval = std::chrono::milliseconds(absl::GetFlag(FLAGS_cleanup_interval_ms));
    config.orchestrator.timeout = std::chrono::milliseconds(absl::GetFlag(FLAGS_timeout_ms));
    config.orchestrator.timeout_buffer = std::chrono::milliseconds(absl::GetFlag(FLAGS_timeout_buffer_ms));
    config.max_concurrent = absl::GetFlag(FLAGS_max_concurrent);

    int js_memory_mb = absl::GetFlag(FLAGS_js_memory_mb);
    int js_stack_kb = absl::GetFlag(FLAGS_js_stack_kb);
    config.engine.memory_bytes = js_memory_mb > 0 ? static_cast<size_t>(js_memory_mb) * 1024 * 1024 : 0;
    config.engine.stack_bytes = js_stack_kb > 0 ? static_cast<size_t>(js_stack_kb) * 1024 : 0;

    config.log_level_name = absl::GetFlag(FLAGS_log_level);
    Logger::ParseLevel(config.log_level_name, &config.log_level);

    std::string worker_path = absl::GetFlag(FLAGS_worker_path);
    if (worker_path.empty()) {
        worker_path = Process::ExecutableDirectory() + "/jsgate_worker";
    }
    config.isolated.worker_command = WorkerCommand(worker_path, config.engine, config.log_level_name);

    int cpu_seconds = absl::GetFlag(FLAGS_worker_cpu_seconds);
    int memory_mb = absl::GetFlag(FLAGS_worker_memory_mb);
    config.isolated.limits.cpu_time_seconds = cpu_seconds > 0 ? static_cast<unsigned long>(cpu_seconds) : 0;
    config.isolated.limits.memory_bytes = memory_mb > 0 ? static_cast<unsigned long>(memory_mb) * 1024 * 1024 : 0;
    int max_idle = absl::GetFlag(FLAGS_max_idle_units);
    config.isolated.max_idle_units = max_idle > 0 ? static_cast<size_t>(max_idle) : 0;
    config.isolated.max_runs_per_unit = absl::GetFlag(FLAGS_max_runs_per_unit);

    config.self_test = absl::GetFlag(FLAGS_self_test);
    return config;
}

std::optional<std::string> ValidateConfig(const ServerConfig& config) {
    if (config.listen_address.empty()) {
        return "--listen must not be empty";
    }
    if (config.rate_limit.max_requests <= 0) {
        return "--max_requests must be positive";
    }
    if (config.rate_limit.window.count() <= 0) {
        return "--window_ms must be positive";
    }
    if (config.cleanup_interval.count() <= 0) {
        return "--cleanup_interval_ms must be positive";
    }
    if (config.orchestrator.timeout.count() < 0) {
        return "--timeout_ms must not be negative";
    }
    if (config.orchestrator.timeout_buffer.count() < 0) {
        return "--timeout_buffer_ms must not be negative";
    }
    if (config.max_concurrent <= 0) {
        return "--max_concurrent must be positive";
    }
    if (config.isolated.max_runs_per_unit <= 0) {
        return "--max_runs_per_unit must be positive";
    }
    if (config.isolated.limits.cpu_time_seconds == 0) {
        return "--worker_cpu_seconds must be positive";
    }
    if (config.isolated.limits.memory_bytes == 0) {
        return "--worker_memory_mb must be positive";
    }
    if (config.engine.memory_bytes == 0) {
        return "--js_memory_mb must be positive";
    }
    if (config.engine.stack_bytes == 0) {
        return "--js_stack_kb must be positive";
    }
    if (config.engine.memory_bytes >= config.isolated.limits.memory_bytes) {
        return "--js_memory_mb must be below --worker_memory_mb";
    }
    if (config.isolated.worker_command.empty() || config.isolated.worker_command[0].empty()) {
        return "No worker binary configured";
    }
    LogLevel ignored;
    if (!Logger::ParseLevel(config.log_level_name, &ignored)) {
        return "--log_level must be one of debug, info, warn, error";
    }
    return std::nullopt;
}

std::vector<std::string> WorkerCommand(const std::string& worker_path, const EngineLimits& engine,
                                       const std::string& log_level_name) {
    return {
        worker_path,
        "--js_memory_mb=" + std::to_string(engine.memory_bytes / (1024 * 1024)),
        "--js_stack_kb=" + std::to_string(engine.stack_bytes / 1024),
        "--log_level=" + log_level_name,
    };
}

} // namespace jsgate
