#include "common/Cancellation.hpp"
#include "core/BackendSelector.hpp"
#include "core/CaptureBackends.hpp"
#include "core/CaptureOrchestrator.hpp"
#include "core/CompositorSupervisor.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/PipelineLauncher.hpp"
#include "core/ProcessSupervisor.hpp"

#ifdef PLATFORM_LINUX
    #include "platform/linux/GioPortalBus.hpp"
    #include "platform/linux/LinuxX11Backend.hpp"
    #include "platform/linux/PipeWireDumpRegistry.hpp"
    #include "platform/linux/PosixProcessControl.hpp"
    #include "platform/linux/ShellCommandRunner.hpp"
    #include "platform/linux/WaydroidAppInventory.hpp"
#endif

#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace {

    common::CancellationSource g_cancel;

    void on_signal(int signal_number) {
        g_cancel.cancel(signal_number);
    }

    void install_signal_handlers() {
        struct sigaction action;
        memset(&action, 0, sizeof(action));
        action.sa_handler = on_signal;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
    }

    std::string executable_directory(const char* argv0) {
        std::error_code ec;
        auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec) self = std::filesystem::absolute(argv0, ec);
        return self.parent_path().string();
    }

    int interrupted_status(const common::CancellationToken& token) {
        int signal_number = token.signal_number();
        return 128 + (signal_number > 0 ? signal_number : SIGINT);
    }

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto loaded = core::load_config(core::process_environment(), args);
    if (loaded.is_err()) {
        std::cerr << "[droidcast] " << loaded.error().message << "\n\n" << core::usage(argv[0]);
        return 1;
    }
    core::RunConfig config = loaded.unwrap();
    if (config.show_help) {
        std::cout << core::usage(argv[0]);
        return 0;
    }
    if (config.input_relay_path.empty()) {
        config.input_relay_path = executable_directory(argv[0]) + "/droidcast-input-relay";
    }

    core::ConsoleLogger logger("droidcast", config.verbose);
    install_signal_handlers();
    common::CancellationToken token = g_cancel.get_token();
    core::Sleeper sleeper = core::make_interruptible_sleeper(token);

#ifdef PLATFORM_LINUX
    // 1. HAL
    platform::linux_os::PosixProcessControl control;
    platform::linux_os::ShellCommandRunner runner(control);
    platform::linux_os::PipeWireDumpRegistry registry(runner);
    platform::linux_os::WaydroidAppInventory inventory(runner);

    // 2. Core services
    core::ProcessSupervisor supervisor(control, logger);
    core::AndroidSession android(runner, logger, sleeper);
    core::PipelineLauncher launcher(control, supervisor, logger);

    // 3. Backends, built on demand
    core::BackendSelector selector;
    selector.register_backend(common::BackendKind::Portal, [&logger] {
        return std::make_shared<core::PortalBackend>(
            std::make_unique<platform::linux_os::GioPortalBus>(), logger);
    });
    selector.register_backend(common::BackendKind::Headless, [&] {
        core::CompositorOptions options;
        options.runtime_dir = core::default_runtime_dir();
        options.width = config.headless_width;
        options.height = config.headless_height;
        return std::make_shared<core::HeadlessBackend>(
            android,
            std::make_unique<core::CompositorSupervisor>(supervisor, control, logger, sleeper, options),
            registry, logger, sleeper);
    });
    selector.register_backend(common::BackendKind::X11, [&] {
        return std::make_shared<platform::linux_os::LinuxX11Backend>(config.display, logger);
    });
    selector.register_backend(common::BackendKind::Test, [] {
        return std::make_shared<core::TestBackend>();
    });

    // 4. Run
    core::CaptureOrchestrator orchestrator(config, selector, supervisor, launcher,
                                           android, inventory, logger, sleeper);
    int exit_code = 1;
    try {
        auto result = orchestrator.run(token);
        if (result.is_ok()) {
            exit_code = result.unwrap();
        } else if (result.error().code == common::ErrorCode::Cancelled) {
            logger.info("Interrupted, shutting down.");
            exit_code = interrupted_status(token);
        } else {
            logger.error(std::string(common::error_code_name(result.error().code)) + ": "
                         + result.error().message);
            exit_code = 1;
        }
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal: ") + e.what());
        exit_code = 1;
    }

    supervisor.shutdown_all();
    return exit_code;
#else
    logger.error("No platform support compiled in");
    return 1;
#endif
}
