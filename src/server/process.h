#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace jsgate {

struct ResourceLimits {
    unsigned long cpu_time_seconds = 30; // Across every run a reused worker serves; see CpuTime
    unsigned long memory_bytes = 256 * 1024 * 1024;
    unsigned long max_processes = 1; // Prevent fork bombs; 0 leaves the limit alone
};

// A child whose stdin and stdout are pipes owned by the parent.
struct ChildProcess {
    pid_t pid = -1;
    int stdin_fd = -1;  // Parent writes requests here
    int stdout_fd = -1; // Parent reads responses here
};

struct SpawnResult {
    bool success;
    ChildProcess child;
    std::string error_message;
};

class Process {
public:
    // Starts argv[0] as given (no PATH search) with resource limits applied in
    // the child before exec. A failed exec is reported here instead of surfacing
    // later as an early exit.
    static SpawnResult Spawn(const std::vector<std::string>& argv, const ResourceLimits& limits);

    // SIGKILL, reap and close both pipes. No-op for a child already released.
    static void Kill(ChildProcess* child);

    // Reaps the child if it has already exited. True when it is gone.
    static bool HasExited(ChildProcess* child);

    // Closes the child's stdin and gives it |grace| to exit before killing it.
    static void Shutdown(ChildProcess* child, std::chrono::milliseconds grace);

    // User plus system CPU time the live child has consumed so far, read from
    // /proc. nullopt when the child is gone or the figure is unreadable.
    static std::optional<std::chrono::milliseconds> CpuTime(const ChildProcess& child);

    // Directory holding the running executable, or "" when unknown.
    static std::string ExecutableDirectory();
};

} // namespace jsgate
