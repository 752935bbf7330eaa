#pragma once
#include <chrono>
#include <string>
#include "common/CaptureTypes.hpp"
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "interfaces/IAppInventory.hpp"
#include "core/AndroidSession.hpp"
#include "core/BackendSelector.hpp"
#include "core/Config.hpp"
#include "core/PipelineLauncher.hpp"
#include "core/ProcessSupervisor.hpp"
#include "core/ReadinessPoller.hpp"
#include "core/Logger.hpp"

namespace core {

    struct OrchestratorTimings {
        std::chrono::milliseconds session_settle{2000}; // after the session reports RUNNING
        std::chrono::milliseconds ui_settle{3000};      // after the full UI is up
        std::chrono::milliseconds render_wait{10000};   // after the app launch
    };

    // ============================================================================
    // CaptureOrchestrator - one run, from method name to pipeline handoff
    // ============================================================================
    //   select backend -> [input relay] -> prepare -> [Android bring-up]
    //   -> acquire -> PipelineSpec -> hand_off
    //
    // The method is validated before anything is spawned. Cleanup is left to
    // the ProcessSupervisor owned by the caller, which runs on every path.
    // ============================================================================
    class CaptureOrchestrator {
    public:
        CaptureOrchestrator(const RunConfig& config,
                            BackendSelector& selector,
                            ProcessSupervisor& supervisor,
                            PipelineLauncher& launcher,
                            AndroidSession& android,
                            interfaces::IAppInventory& inventory,
                            ILogger& logger,
                            Sleeper sleeper,
                            OrchestratorTimings timings = {});

        // Exit status of the run's pipeline
        common::Result<int> run(const common::CancellationToken& token);

        common::PipelineSpec make_pipeline_spec(const common::CaptureSession& session) const;

    private:
        void start_input_relay();
        common::EmptyResult bring_up_android(const common::CancellationToken& token);
        common::EmptyResult settle(std::chrono::milliseconds duration, const common::CancellationToken& token);

        const RunConfig& config_;
        BackendSelector& selector_;
        ProcessSupervisor& supervisor_;
        PipelineLauncher& launcher_;
        AndroidSession& android_;
        interfaces::IAppInventory& inventory_;
        ILogger& logger_;
        Sleeper sleeper_;
        OrchestratorTimings timings_;
    };

} // namespace core
