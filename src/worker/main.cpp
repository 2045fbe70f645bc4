#include "src/server/logger.h"
#include "src/worker/worker.h"

#include <unistd.h>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"

ABSL_FLAG(int, js_memory_mb, 64, "QuickJS heap limit per evaluation");
ABSL_FLAG(int, js_stack_kb, 1024, "QuickJS stack limit per evaluation");
ABSL_FLAG(std::string, log_level, "info", "debug, info, warn or error");

using jsgate::EngineLimits;
using jsgate::Logger;
using jsgate::LogLevel;

int main(int argc, char** argv) {
    absl::ParseCommandLine(argc, argv);

    // stdout carries response frames.
    Logger::SetStderrOnly(true);
    LogLevel level;
    if (!Logger::ParseLevel(absl::GetFlag(FLAGS_log_level), &level)) {
        Logger::Error("Unknown log level: ", absl::GetFlag(FLAGS_log_level));
        return 2;
    }
    Logger::SetLevel(level);

    int memory_mb = absl::GetFlag(FLAGS_js_memory_mb);
    int stack_kb = absl::GetFlag(FLAGS_js_stack_kb);
    if (memory_mb <= 0 || stack_kb <= 0) {
        Logger::Error("--js_memory_mb and --js_stack_kb must be positive");
        return 2;
    }

    EngineLimits limits;
    limits.memory_bytes = static_cast<size_t>(memory_mb) * 1024 * 1024;
    limits.stack_bytes = static_cast<size_t>(stack_kb) * 1024;
    return jsgate::Serve(STDIN_FILENO, STDOUT_FILENO, limits);
}
