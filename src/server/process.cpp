#include "src/server/process.h"
#include "src/server/logger.h"

#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <mutex>
#include <sys/resource.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace jsgate {

namespace {

// A worker that dies mid-write must not take the parent down with SIGPIPE.
void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int* fd) {
    if (*fd >= 0) {
        close(*fd);
        *fd = -1;
    }
}

void ClosePipe(int pipe_fds[2]) {
    CloseFd(&pipe_fds[0]);
    CloseFd(&pipe_fds[1]);
}

void Reap(pid_t pid) {
    int status;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

} // namespace

SpawnResult Process::Spawn(const std::vector<std::string>& argv, const ResourceLimits& limits) {
    IgnoreSigpipe();
    if (argv.empty()) {
        return {false, {}, "Empty command"};
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1 || pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        pipe2(status_pipe, O_CLOEXEC) == -1) {
        std::string error = strerror(errno);
        ClosePipe(stdin_pipe);
        ClosePipe(stdout_pipe);
        ClosePipe(status_pipe);
        Logger::Error("Failed to create pipes: ", error);
        return {false, {}, "Failed to create pipes: " + error};
    }

    // Built before fork: only async-signal-safe calls are allowed in the child,
    // which is why the exec below is execv and never searches PATH.
    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        std::string error = strerror(errno);
        ClosePipe(stdin_pipe);
        ClosePipe(stdout_pipe);
        ClosePipe(status_pipe);
        Logger::Error("Failed to fork: ", error);
        return {false, {}, "Failed to fork: " + error};
    }

    if (pid == 0) {
        // Child process
        struct rlimit cpu_limit;
        cpu_limit.rlim_cur = limits.cpu_time_seconds;
        cpu_limit.rlim_max = limits.cpu_time_seconds + 1; // Grace period
        setrlimit(RLIMIT_CPU, &cpu_limit);

        struct rlimit mem_limit;
        mem_limit.rlim_cur = limits.memory_bytes;
        mem_limit.rlim_max = limits.memory_bytes;
        setrlimit(RLIMIT_AS, &mem_limit);

        #ifdef __linux__
        if (limits.max_processes > 0) {
            struct rlimit proc_limit;
            proc_limit.rlim_cur = limits.max_processes;
            proc_limit.rlim_max = limits.max_processes;
            setrlimit(RLIMIT_NPROC, &proc_limit);
        }
        #endif

        // dup2 clears O_CLOEXEC on the new descriptors; everything else closes on exec.
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);

        execv(c_argv[0], c_argv.data());
        int exec_errno = errno;
        ssize_t ignored = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127); // Standard exit code for command not found
    }

    // Parent process
    CloseFd(&stdin_pipe[0]);
    CloseFd(&stdout_pipe[1]);
    CloseFd(&status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    CloseFd(&status_pipe[0]);

    if (n > 0) {
        Reap(pid);
        CloseFd(&stdin_pipe[1]);
        CloseFd(&stdout_pipe[0]);
        Logger::Error("Failed to exec ", argv[0], ": ", strerror(exec_errno));
        return {false, {}, std::string("Failed to exec: ") + strerror(exec_errno)};
    }

    ChildProcess child;
    child.pid = pid;
    child.stdin_fd = stdin_pipe[1];
    child.stdout_fd = stdout_pipe[0];
    Logger::Debug("Spawned ", argv[0], " as pid ", pid);
    return {true, child, ""};
}

void Process::Kill(ChildProcess* child) {
    if (child->pid > 0) {
        kill(child->pid, SIGKILL);
        Reap(child->pid);
        Logger::Debug("Killed pid ", child->pid);
        child->pid = -1;
    }
    CloseFd(&child->stdin_fd);
    CloseFd(&child->stdout_fd);
}

bool Process::HasExited(ChildProcess* child) {
    if (child->pid <= 0) {
        return true;
    }
    int status;
    pid_t result = waitpid(child->pid, &status, WNOHANG);
    if (result == 0) {
        return false;
    }
    if (result == child->pid && WIFSIGNALED(status)) {
        Logger::Warn("Worker pid ", child->pid, " died from signal ", WTERMSIG(status));
    }
    child->pid = -1;
    CloseFd(&child->stdin_fd);
    CloseFd(&child->stdout_fd);
    return true;
}

void Process::Shutdown(ChildProcess* child, std::chrono::milliseconds grace) {
    CloseFd(&child->stdin_fd);
    if (child->pid > 0) {
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline) {
            int status;
            pid_t result = waitpid(child->pid, &status, WNOHANG);
            if (result == child->pid || (result == -1 && errno == ECHILD)) {
                child->pid = -1;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    Kill(child);
}

std::optional<std::chrono::milliseconds> Process::CpuTime(const ChildProcess& child) {
    if (child.pid <= 0) {
        return std::nullopt;
    }
    std::ifstream stat("/proc/" + std::to_string(child.pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) {
        return std::nullopt;
    }
    // The command name may contain spaces; fields resume after its closing paren.
    auto paren = line.rfind(')');
    if (paren == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream fields(line.substr(paren + 1));
    std::vector<std::string> tokens{std::istream_iterator<std::string>(fields),
                                    std::istream_iterator<std::string>()};
    // tokens[0] is field 3 (state); utime and stime are fields 14 and 15.
    if (tokens.size() < 13) {
        return std::nullopt;
    }
    long ticks_per_second = sysconf(_SC_CLK_TCK);
    if (ticks_per_second <= 0) {
        return std::nullopt;
    }
    unsigned long long ticks = 0;
    try {
        ticks = std::stoull(tokens[11]) + std::stoull(tokens[12]);
    } catch (const std::exception& e) {
        Logger::Warn("Unreadable CPU time for pid ", child.pid, ": ", e.what());
        return std::nullopt;
    }
    return std::chrono::milliseconds(ticks * 1000 / static_cast<unsigned long long>(ticks_per_second));
}

std::string Process::ExecutableDirectory() {
    char path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len <= 0) {
        return "";
    }
    std::string exe(path, static_cast<size_t>(len));
    auto slash = exe.rfind('/');
    return slash == std::string::npos ? "" : exe.substr(0, slash);
}

} // namespace jsgate
