#pragma once
#include <chrono>
#include <string>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "interfaces/ICommandRunner.hpp"
#include "interfaces/IAppInventory.hpp"
#include "core/ReadinessPoller.hpp"
#include "core/Logger.hpp"

namespace core {

    // Used when no override is configured and the inventory has no match
    constexpr const char* kFallbackPackage = "com.smallgiantgames.empires";

    // Case-insensitive fragment of the target application's display name
    constexpr const char* kTargetAppFragment = "empire";

    struct AndroidTimings {
        PollPolicy session_start{24, std::chrono::seconds(5)};
        PollPolicy android_ready{30, std::chrono::seconds(2)};
        std::chrono::milliseconds stale_stop_grace{2000};
    };

    // ============================================================================
    // AndroidSession - Waydroid container control through its CLI
    // ============================================================================
    // The session itself is an external collaborator: it is started detached
    // and observed only through `waydroid status`.
    // ============================================================================
    class AndroidSession {
    public:
        AndroidSession(interfaces::ICommandRunner& runner, ILogger& logger,
                       Sleeper sleeper, AndroidTimings timings = {});

        bool is_running();

        // A session left over from an earlier compositor will not render
        // into a new one: stop it and give it time to go down.
        void stop_stale_session();

        // Starts the session if needed and waits for RUNNING.
        // Exhaustion -> StartupTimeout.
        common::EmptyResult ensure_running(const common::CancellationToken& token);

        // Shows the full Android UI and waits for "Android ... ready".
        // Never fatal: a slow boot is logged and the run goes on.
        common::EmptyResult show_full_ui(const common::CancellationToken& token);

        void launch_application(const std::string& package);

    private:
        std::string status_text();

        interfaces::ICommandRunner& runner_;
        ILogger& logger_;
        Sleeper sleeper_;
        AndroidTimings timings_;
    };

    // override if non-empty, else the first inventory record whose name
    // contains kTargetAppFragment, else kFallbackPackage
    std::string resolve_target_package(const std::string& override_package,
                                       interfaces::IAppInventory& inventory,
                                       ILogger& logger);

    // "Android" followed by "ready" on one status line
    bool status_reports_android_ready(const std::string& status_text);

} // namespace core
