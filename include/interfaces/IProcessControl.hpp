#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"

namespace interfaces {

    struct SpawnOptions {
        bool new_session = false;    // setsid(): detach from our terminal/process group
        bool silence_output = false; // stdin/stdout/stderr -> /dev/null
    };

    // ============================================================================
    // IProcessControl - the only seam through which the orchestrator touches
    // OS processes (fork/exec, signals, reaping, /proc).
    // ============================================================================
    class IProcessControl {
    public:
        virtual ~IProcessControl() = default;

        // Launch argv[0] (PATH lookup). Fails with ProcessSpawnError if the
        // fork or the exec fails.
        virtual common::Result<pid_t> spawn(const std::vector<std::string>& argv,
                                            const SpawnOptions& options) = 0;

        // Replace the current process image. Never returns on success in the
        // real implementation.
        virtual common::EmptyResult exec_replace(const std::vector<std::string>& argv) = 0;

        // False once the process has exited (our children are reaped here).
        virtual bool is_alive(pid_t pid) = 0;

        virtual common::EmptyResult send_signal(pid_t pid, int signal_number) = 0;

        // Blocks until the process exits or the timeout elapses.
        // Returns true if the process is gone.
        virtual bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) = 0;

        // Blocks until the process exits; returns its exit status
        // (128 + signal for signaled children). Cancelled if the token fires first.
        virtual common::Result<int> wait(pid_t pid, const common::CancellationToken& token) = 0;

        // PIDs (other than our own) whose command line contains every fragment
        virtual std::vector<pid_t> find_processes(const std::vector<std::string>& fragments) = 0;
    };

} // namespace interfaces
