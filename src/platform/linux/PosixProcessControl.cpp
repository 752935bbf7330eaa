#include "PosixProcessControl.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace platform {
namespace linux_os {

    namespace {
        const auto kPollSlice = std::chrono::milliseconds(50);

        std::vector<char*> make_exec_argv(const std::vector<std::string>& argv) {
            std::vector<char*> out;
            out.reserve(argv.size() + 1);
            for (const auto& arg : argv) out.push_back(const_cast<char*>(arg.c_str()));
            out.push_back(nullptr);
            return out;
        }
    }

    int PosixProcessControl::decode_status(int wait_status) {
        if (WIFEXITED(wait_status)) return WEXITSTATUS(wait_status);
        if (WIFSIGNALED(wait_status)) return 128 + WTERMSIG(wait_status);
        return 1;
    }

    common::Result<pid_t> PosixProcessControl::spawn(const std::vector<std::string>& argv,
                                                     const interfaces::SpawnOptions& options) {
        if (argv.empty()) return common::Result<pid_t>::err(common::ErrorCode::ProcessSpawnError, "Empty command");

        // Child reports a failed exec through this pipe; a successful exec
        // closes it (O_CLOEXEC) and the parent reads EOF.
        int error_pipe[2];
        if (pipe2(error_pipe, O_CLOEXEC) != 0) {
            return common::Result<pid_t>::err(common::ErrorCode::ProcessSpawnError,
                "pipe failed: " + std::string(std::strerror(errno)));
        }

        auto exec_argv = make_exec_argv(argv);

        pid_t pid = fork();
        if (pid < 0) {
            int saved = errno;
            close(error_pipe[0]);
            close(error_pipe[1]);
            return common::Result<pid_t>::err(common::ErrorCode::ProcessSpawnError,
                "Fork failed: " + std::string(std::strerror(saved)));
        }
        else if (pid == 0) {
            close(error_pipe[0]);
            if (options.new_session) setsid();
            if (options.silence_output) {
                int null_fd = open("/dev/null", O_RDWR);
                if (null_fd >= 0) {
                    dup2(null_fd, STDIN_FILENO);
                    dup2(null_fd, STDOUT_FILENO);
                    dup2(null_fd, STDERR_FILENO);
                    close(null_fd);
                }
            }
            execvp(exec_argv[0], exec_argv.data());
            int exec_errno = errno;
            ssize_t ignored = write(error_pipe[1], &exec_errno, sizeof(exec_errno));
            (void)ignored;
            _exit(127);
        }

        close(error_pipe[1]);
        int child_errno = 0;
        ssize_t n;
        do {
            n = read(error_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close(error_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            int status = 0;
            waitpid(pid, &status, 0);
            return common::Result<pid_t>::err(common::ErrorCode::ProcessSpawnError,
                "Cannot execute " + argv.front() + ": " + std::strerror(child_errno));
        }

        return common::Result<pid_t>::ok(pid);
    }

    common::EmptyResult PosixProcessControl::exec_replace(const std::vector<std::string>& argv) {
        if (argv.empty()) return common::EmptyResult::err(common::ErrorCode::ProcessSpawnError, "Empty command");

        auto exec_argv = make_exec_argv(argv);
        execvp(exec_argv[0], exec_argv.data());
        return common::EmptyResult::err(common::ErrorCode::ProcessSpawnError,
            "execvp " + argv.front() + " failed: " + std::strerror(errno));
    }

    bool PosixProcessControl::try_reap(pid_t pid) {
        if (reaped_.count(pid)) return true;

        int status = 0;
        pid_t r;
        do {
            r = waitpid(pid, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);

        if (r == pid) {
            reaped_[pid] = decode_status(status);
            return true;
        }
        return false;
    }

    bool PosixProcessControl::is_alive(pid_t pid) {
        if (pid <= 0) return false;
        if (try_reap(pid)) return false;

        // Still our running child, or not our child at all: ask the kernel
        if (kill(pid, 0) == 0) return true;
        return errno == EPERM;
    }

    common::EmptyResult PosixProcessControl::send_signal(pid_t pid, int signal_number) {
        if (pid <= 0) return common::EmptyResult::err(common::ErrorCode::Unknown, "Invalid PID");
        if (kill(pid, signal_number) != 0) {
            return common::EmptyResult::err(common::ErrorCode::Unknown,
                "kill(" + std::to_string(pid) + ", " + std::to_string(signal_number) + "): "
                + std::strerror(errno));
        }
        return common::EmptyResult::success();
    }

    bool PosixProcessControl::wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (is_alive(pid)) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(kPollSlice);
        }
        return true;
    }

    common::Result<int> PosixProcessControl::wait(pid_t pid, const common::CancellationToken& token) {
        while (true) {
            if (try_reap(pid)) return common::Result<int>::ok(reaped_[pid]);

            if (kill(pid, 0) != 0 && errno == ESRCH) {
                return common::Result<int>::err(common::ErrorCode::Unknown,
                    "Process " + std::to_string(pid) + " is not a child of this process");
            }
            if (token.is_cancellation_requested()) {
                return common::Result<int>::err(common::ErrorCode::Cancelled,
                    "Interrupted while waiting for PID " + std::to_string(pid));
            }
            std::this_thread::sleep_for(kPollSlice);
        }
    }

    std::vector<pid_t> PosixProcessControl::find_processes(const std::vector<std::string>& fragments) {
        std::vector<pid_t> out;
        const pid_t self = getpid();

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator("/proc", ec)) {
            std::string pid_str = entry.path().filename().string();
            if (pid_str.empty() || !std::all_of(pid_str.begin(), pid_str.end(), ::isdigit)) continue;

            pid_t pid = static_cast<pid_t>(std::stol(pid_str));
            if (pid == self) continue;

            std::ifstream cmd_file(entry.path() / "cmdline", std::ios::binary);
            if (!cmd_file.good()) continue;
            std::string cmdline((std::istreambuf_iterator<char>(cmd_file)), std::istreambuf_iterator<char>());
            std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
            if (cmdline.empty()) continue;

            bool matches = std::all_of(fragments.begin(), fragments.end(),
                [&cmdline](const std::string& fragment) { return cmdline.find(fragment) != std::string::npos; });
            if (matches) out.push_back(pid);
        }
        return out;
    }

} // namespace linux_os
} // namespace platform
