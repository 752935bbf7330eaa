#include "core/ProcessSupervisor.hpp"
#include <csignal>

namespace core {

    ProcessSupervisor::ProcessSupervisor(interfaces::IProcessControl& control,
                                         ILogger& logger,
                                         std::chrono::milliseconds grace)
        : control_(control), logger_(logger), grace_(grace) {}

    ProcessSupervisor::~ProcessSupervisor() {
        shutdown_all();
    }

    common::Result<pid_t> ProcessSupervisor::spawn(const std::vector<std::string>& argv,
                                                   const std::string& name,
                                                   const interfaces::SpawnOptions& options) {
        auto pid = control_.spawn(argv, options);
        if (pid.is_err()) {
            logger_.error("Failed to start " + name + ": " + pid.error().message);
            return pid;
        }

        register_process(pid.unwrap(), name);
        return pid;
    }

    void ProcessSupervisor::register_process(pid_t pid, const std::string& name) {
        processes_.push_back(common::SupervisedProcess{pid, name, std::chrono::steady_clock::now()});
        logger_.info(name + " PID: " + std::to_string(pid));
    }

    void ProcessSupervisor::shutdown_all() {
        if (processes_.empty()) return;

        logger_.info("Cleaning up...");

        // Reverse registration order: dependents before what they depend on
        while (!processes_.empty()) {
            common::SupervisedProcess process = processes_.back();
            processes_.pop_back();
            stop_one(process);
        }
    }

    void ProcessSupervisor::stop_one(const common::SupervisedProcess& process) {
        if (!control_.is_alive(process.pid)) {
            logger_.debug(process.name + " (PID " + std::to_string(process.pid) + ") already exited");
            return;
        }

        logger_.info("Stopping " + process.name + " (PID " + std::to_string(process.pid) + ")");

        auto term = control_.send_signal(process.pid, SIGTERM);
        if (term.is_err()) {
            // Raced with its exit; nothing left to stop
            logger_.debug(term.error().message);
            return;
        }

        if (control_.wait_for_exit(process.pid, grace_)) return;

        logger_.warn(process.name + " ignored SIGTERM for "
                     + std::to_string(grace_.count()) + " ms, sending SIGKILL");

        auto kill = control_.send_signal(process.pid, SIGKILL);
        if (kill.is_err()) {
            logger_.debug(kill.error().message);
            return;
        }

        if (!control_.wait_for_exit(process.pid, std::chrono::milliseconds(1000))) {
            logger_.error("Could not reap " + process.name + " (PID " + std::to_string(process.pid) + ")");
        }
    }

} // namespace core
