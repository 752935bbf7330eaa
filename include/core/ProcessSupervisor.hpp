#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "common/CaptureTypes.hpp"
#include "common/Result.hpp"
#include "interfaces/IProcessControl.hpp"
#include "core/Logger.hpp"

namespace core {

    // ============================================================================
    // ProcessSupervisor - owns every auxiliary process of the run
    // ============================================================================
    // Processes are registered as they are spawned and torn down in reverse
    // registration order by shutdown_all(): SIGTERM, wait up to the grace
    // period, then SIGKILL. shutdown_all() is idempotent and is the only
    // cleanup path; main() calls it on normal exit, on error and after an
    // interrupt, and the destructor calls it once more.
    //
    // Not thread-safe: only the control thread touches the registry.
    // ============================================================================
    class ProcessSupervisor {
    public:
        ProcessSupervisor(interfaces::IProcessControl& control,
                          ILogger& logger,
                          std::chrono::milliseconds grace = std::chrono::milliseconds(3000));
        ~ProcessSupervisor();

        ProcessSupervisor(const ProcessSupervisor&) = delete;
        ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

        // Spawn and register in one step
        common::Result<pid_t> spawn(const std::vector<std::string>& argv,
                                    const std::string& name,
                                    const interfaces::SpawnOptions& options = {});

        void register_process(pid_t pid, const std::string& name);

        void shutdown_all();

        bool empty() const { return processes_.empty(); }
        size_t size() const { return processes_.size(); }
        const std::vector<common::SupervisedProcess>& processes() const { return processes_; }

    private:
        void stop_one(const common::SupervisedProcess& process);

        interfaces::IProcessControl& control_;
        ILogger& logger_;
        std::chrono::milliseconds grace_;
        std::vector<common::SupervisedProcess> processes_;
    };

} // namespace core
