#pragma once
#include <string>
#include <vector>
#include "common/CaptureTypes.hpp"
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "interfaces/IProcessControl.hpp"
#include "core/ProcessSupervisor.hpp"
#include "core/Logger.hpp"

namespace core {

    // Argument list of the external encode/transport pipeline. Element order
    // matters: gst-launch parses it as a pipeline description.
    std::vector<std::string> build_pipeline_arguments(const common::PipelineSpec& spec);

    std::string join_arguments(const std::vector<std::string>& argv);

    // ============================================================================
    // PipelineLauncher - final handoff to gst-launch-1.0 / ffmpeg
    // ============================================================================
    // With nothing supervised the process image is replaced (exec). With
    // dependents alive (weston, input relay) the pipeline is spawned,
    // registered and waited for, so shutdown_all() still runs afterwards.
    // ============================================================================
    class PipelineLauncher {
    public:
        PipelineLauncher(interfaces::IProcessControl& control,
                         ProcessSupervisor& supervisor,
                         ILogger& logger);

        // Exit status of the pipeline (supervised path). The exec path only
        // returns on failure (ProcessSpawnError).
        common::Result<int> hand_off(const common::PipelineSpec& spec,
                                     const common::CancellationToken& token);

    private:
        interfaces::IProcessControl& control_;
        ProcessSupervisor& supervisor_;
        ILogger& logger_;
    };

} // namespace core
