#pragma once
#include <chrono>
#include <string>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "interfaces/IProcessControl.hpp"
#include "core/ProcessSupervisor.hpp"
#include "core/ReadinessPoller.hpp"
#include "core/Logger.hpp"

namespace core {

    struct CompositorOptions {
        std::string runtime_dir;                  // $XDG_RUNTIME_DIR
        std::string socket_name = "waydroid-stream";
        int width = 1280;
        int height = 720;
        std::string config_dir = "/tmp";
        PollPolicy socket_poll{20, std::chrono::milliseconds(500)};
        std::chrono::milliseconds reap_settle{1000};
    };

    // $XDG_RUNTIME_DIR, or /run/user/<uid> when unset
    std::string default_runtime_dir();

    // ============================================================================
    // CompositorSupervisor - headless weston with a PipeWire output
    // ============================================================================
    // clean_stale_artifacts() and start() are the side-effecting half of the
    // headless backend; the video node it produces is found separately by
    // discover_video_node().
    // ============================================================================
    class CompositorSupervisor {
    public:
        CompositorSupervisor(ProcessSupervisor& supervisor,
                             interfaces::IProcessControl& control,
                             ILogger& logger,
                             Sleeper sleeper,
                             CompositorOptions options);
        ~CompositorSupervisor();

        CompositorSupervisor(const CompositorSupervisor&) = delete;
        CompositorSupervisor& operator=(const CompositorSupervisor&) = delete;

        // Lock file present: kill any weston still bound to our socket name
        // and delete socket + lock.
        void clean_stale_artifacts();

        // Writes the output config, spawns weston (registered with the
        // supervisor) and waits for its socket. Exports WAYLAND_DISPLAY.
        // Errors: ProcessSpawnError, StartupTimeout, Cancelled.
        common::Result<pid_t> start(const common::CancellationToken& token);

        std::string socket_path() const;
        std::string lock_path() const;
        const CompositorOptions& options() const { return options_; }

        static std::string render_config(int width, int height);

    private:
        common::Result<std::string> write_config();

        ProcessSupervisor& supervisor_;
        interfaces::IProcessControl& control_;
        ILogger& logger_;
        Sleeper sleeper_;
        CompositorOptions options_;
        std::string config_path_;
    };

} // namespace core
