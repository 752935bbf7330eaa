#pragma once

#include "interfaces/IProcessControl.hpp"
#include <map>

namespace platform {
namespace linux_os {

    // fork/exec, waitpid and /proc based process control.
    // Children are reaped lazily by is_alive()/wait(); their status is kept
    // so that a later wait() still reports it.
    class PosixProcessControl : public interfaces::IProcessControl {
    public:
        PosixProcessControl() = default;
        virtual ~PosixProcessControl() = default;

        common::Result<pid_t> spawn(const std::vector<std::string>& argv,
                                    const interfaces::SpawnOptions& options) override;
        common::EmptyResult exec_replace(const std::vector<std::string>& argv) override;
        bool is_alive(pid_t pid) override;
        common::EmptyResult send_signal(pid_t pid, int signal_number) override;
        bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) override;
        common::Result<int> wait(pid_t pid, const common::CancellationToken& token) override;
        std::vector<pid_t> find_processes(const std::vector<std::string>& fragments) override;

        // 128 + signal for signaled children, like a shell
        static int decode_status(int wait_status);

    private:
        // true if reaped now or earlier
        bool try_reap(pid_t pid);

        std::map<pid_t, int> reaped_; // pid -> decoded exit status
    };

} // namespace linux_os
} // namespace platform
