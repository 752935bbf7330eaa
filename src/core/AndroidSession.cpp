#include "core/AndroidSession.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace core {

    namespace {
        std::string to_lower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }
    }

    AndroidSession::AndroidSession(interfaces::ICommandRunner& runner, ILogger& logger,
                                   Sleeper sleeper, AndroidTimings timings)
        : runner_(runner), logger_(logger), sleeper_(std::move(sleeper)), timings_(timings) {}

    std::string AndroidSession::status_text() {
        auto status = runner_.run({"waydroid", "status"});
        if (status.is_err()) {
            logger_.debug("waydroid status: " + status.error().message);
            return {};
        }
        return status.unwrap().output;
    }

    bool AndroidSession::is_running() {
        return status_text().find("RUNNING") != std::string::npos;
    }

    void AndroidSession::stop_stale_session() {
        if (!is_running()) return;

        logger_.info("Stopping stale Waydroid session...");
        auto stopped = runner_.run({"waydroid", "session", "stop"});
        if (stopped.is_err()) {
            logger_.warn("waydroid session stop: " + stopped.error().message);
        } else if (stopped.unwrap().exit_status != 0) {
            logger_.warn("waydroid session stop exited with " + std::to_string(stopped.unwrap().exit_status));
        }
        sleeper_(timings_.stale_stop_grace);
    }

    common::EmptyResult AndroidSession::ensure_running(const common::CancellationToken& token) {
        logger_.info("Checking Waydroid status...");
        if (is_running()) {
            logger_.info("Waydroid session already running.");
            return common::EmptyResult::success();
        }

        logger_.info("Starting Waydroid session...");
        auto launched = runner_.launch_detached({"waydroid", "session", "start"});
        if (launched.is_err()) {
            return common::EmptyResult::err(common::ErrorCode::ProcessSpawnError,
                "Cannot start Waydroid session: " + launched.error().message);
        }

        auto running = poll_until_true([this] { return is_running(); },
                                       timings_.session_start, sleeper_, token, "Waydroid session");
        if (running.is_err()) {
            auto total = timings_.session_start.interval * timings_.session_start.max_attempts;
            auto error = retag_timeout(running.error(), common::ErrorCode::StartupTimeout,
                "Waydroid did not start within "
                + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(total).count()) + " s");
            logger_.error(error.message);
            return error;
        }

        logger_.info("Waydroid session is running.");
        return common::EmptyResult::success();
    }

    common::EmptyResult AndroidSession::show_full_ui(const common::CancellationToken& token) {
        logger_.info("Launching Waydroid full UI...");
        auto launched = runner_.launch_detached({"waydroid", "show-full-ui"});
        if (launched.is_err()) {
            logger_.warn("waydroid show-full-ui: " + launched.error().message);
        }

        logger_.info("Waiting for Android to be ready...");
        auto ready = poll_until_true([this] { return status_reports_android_ready(status_text()); },
                                     timings_.android_ready, sleeper_, token, "Android");
        if (ready.is_err()) {
            if (ready.error().code == common::ErrorCode::Cancelled) return ready;
            logger_.warn("Android did not report ready, continuing anyway.");
            return common::EmptyResult::success();
        }

        logger_.info("Android is ready.");
        return common::EmptyResult::success();
    }

    void AndroidSession::launch_application(const std::string& package) {
        logger_.info("Launching package: " + package);
        auto launched = runner_.run({"waydroid", "app", "launch", package});
        if (launched.is_err() || launched.unwrap().exit_status != 0) {
            logger_.warn("Launch command returned an error, the app may still start.");
        }
    }

    // ============================================================================
    // Helpers
    // ============================================================================

    std::string resolve_target_package(const std::string& override_package,
                                       interfaces::IAppInventory& inventory,
                                       ILogger& logger) {
        if (!override_package.empty()) return override_package;

        for (const auto& app : inventory.list_apps()) {
            if (to_lower(app.name).find(kTargetAppFragment) != std::string::npos && !app.package.empty()) {
                logger.info("Found " + app.name + " as " + app.package);
                return app.package;
            }
        }

        logger.info(std::string("Target app not in inventory, using ") + kFallbackPackage);
        return kFallbackPackage;
    }

    bool status_reports_android_ready(const std::string& status_text) {
        std::istringstream lines(status_text);
        std::string line;
        while (std::getline(lines, line)) {
            auto android = line.find("Android");
            if (android != std::string::npos && line.find("ready", android) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

} // namespace core
