#include "core/CaptureOrchestrator.hpp"
#include <filesystem>

namespace core {

    CaptureOrchestrator::CaptureOrchestrator(const RunConfig& config,
                                             BackendSelector& selector,
                                             ProcessSupervisor& supervisor,
                                             PipelineLauncher& launcher,
                                             AndroidSession& android,
                                             interfaces::IAppInventory& inventory,
                                             ILogger& logger,
                                             Sleeper sleeper,
                                             OrchestratorTimings timings)
        : config_(config), selector_(selector), supervisor_(supervisor), launcher_(launcher),
          android_(android), inventory_(inventory), logger_(logger),
          sleeper_(std::move(sleeper)), timings_(timings) {}

    common::Result<int> CaptureOrchestrator::run(const common::CancellationToken& token) {
        logger_.info("=== Waydroid streaming pipeline ===");
        logger_.info("Receiver: " + config_.receiver_host + ":" + std::to_string(config_.receiver_port));
        logger_.info("Capture:  " + config_.method);
        logger_.info("Encode:   H.264 baseline, " + std::to_string(config_.bitrate_kbps) + " kbps, "
                     + std::to_string(config_.framerate) + " fps");

        auto selected = selector_.select(config_.method);
        if (selected.is_err()) {
            logger_.error(selected.error().message);
            return selected.error();
        }
        auto backend = selected.unwrap();

        if (backend->needs_android_session()) {
            start_input_relay();
        }

        auto prepared = backend->prepare(token);
        if (prepared.is_err()) return prepared.error();

        if (backend->needs_android_session()) {
            auto android = bring_up_android(token);
            if (android.is_err()) return android.error();
        }

        auto session = backend->acquire(token);
        if (session.is_err()) {
            logger_.error(std::string(common::error_code_name(session.error().code)) + ": "
                          + session.error().message);
            return session.error();
        }

        return launcher_.hand_off(make_pipeline_spec(session.unwrap()), token);
    }

    common::PipelineSpec CaptureOrchestrator::make_pipeline_spec(const common::CaptureSession& session) const {
        common::PipelineSpec spec;
        spec.backend = session.backend;
        spec.source_handle = session.source_handle;
        spec.transport_fd = session.transport_fd;
        spec.receiver_host = config_.receiver_host;
        spec.receiver_port = config_.receiver_port;
        spec.framerate = config_.framerate;
        spec.bitrate_kbps = config_.bitrate_kbps;
        spec.capture_width = session.capture_width;
        spec.capture_height = session.capture_height;
        return spec;
    }

    void CaptureOrchestrator::start_input_relay() {
        if (!config_.input_server) {
            logger_.info("Input relay disabled (INPUT_SERVER=0)");
            return;
        }

        std::error_code ec;
        if (!std::filesystem::exists(config_.input_relay_path, ec)) {
            logger_.warn("Input relay not found at " + config_.input_relay_path + ", skipping");
            return;
        }

        logger_.info("Starting input relay on port " + std::to_string(config_.input_port) + "...");
        auto relay = supervisor_.spawn({config_.input_relay_path, "--port", std::to_string(config_.input_port)},
                                       "input relay");
        if (relay.is_err()) {
            logger_.warn("Continuing without input relay");
        }
    }

    common::EmptyResult CaptureOrchestrator::bring_up_android(const common::CancellationToken& token) {
        auto running = android_.ensure_running(token);
        if (running.is_err()) return running;

        auto settled = settle(timings_.session_settle, token);
        if (settled.is_err()) return settled;

        auto ui = android_.show_full_ui(token);
        if (ui.is_err()) return ui;

        settled = settle(timings_.ui_settle, token);
        if (settled.is_err()) return settled;

        android_.launch_application(resolve_target_package(config_.package, inventory_, logger_));

        logger_.info("Waiting " + std::to_string(timings_.render_wait.count() / 1000)
                     + " seconds for the app to render...");
        return settle(timings_.render_wait, token);
    }

    common::EmptyResult CaptureOrchestrator::settle(std::chrono::milliseconds duration,
                                                    const common::CancellationToken& token) {
        sleeper_(duration);
        if (token.is_cancellation_requested()) {
            return common::EmptyResult::err(common::ErrorCode::Cancelled, "Interrupted during Android bring-up");
        }
        return common::EmptyResult::success();
    }

} // namespace core
