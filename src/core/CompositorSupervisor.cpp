#include "core/CompositorSupervisor.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace core {

    std::string default_runtime_dir() {
        const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
        if (runtime_dir && runtime_dir[0] != '\0') return runtime_dir;
        return "/run/user/" + std::to_string(getuid());
    }

    CompositorSupervisor::CompositorSupervisor(ProcessSupervisor& supervisor,
                                               interfaces::IProcessControl& control,
                                               ILogger& logger,
                                               Sleeper sleeper,
                                               CompositorOptions options)
        : supervisor_(supervisor), control_(control), logger_(logger),
          sleeper_(std::move(sleeper)), options_(std::move(options)) {}

    CompositorSupervisor::~CompositorSupervisor() {
        if (!config_path_.empty()) {
            std::error_code ec;
            fs::remove(config_path_, ec);
        }
    }

    std::string CompositorSupervisor::socket_path() const {
        return (fs::path(options_.runtime_dir) / options_.socket_name).string();
    }

    std::string CompositorSupervisor::lock_path() const {
        return socket_path() + ".lock";
    }

    std::string CompositorSupervisor::render_config(int width, int height) {
        // Single pipewire output: windows only appear on the output they were
        // mapped to, so a second (headless) output would capture nothing.
        std::ostringstream ini;
        ini << "[output]\n"
            << "name=pipewire\n"
            << "mode=" << width << "x" << height << "\n";
        return ini.str();
    }

    void CompositorSupervisor::clean_stale_artifacts() {
        std::error_code ec;
        if (!fs::exists(lock_path(), ec)) return;

        logger_.info("Cleaning stale weston socket...");
        for (pid_t pid : control_.find_processes({"weston", options_.socket_name})) {
            logger_.info("Killing leftover weston (PID " + std::to_string(pid) + ")");
            auto killed = control_.send_signal(pid, SIGKILL);
            if (killed.is_err()) logger_.debug(killed.error().message);
        }
        sleeper_(options_.reap_settle);

        fs::remove(socket_path(), ec);
        fs::remove(lock_path(), ec);
    }

    common::Result<std::string> CompositorSupervisor::write_config() {
        std::string path_template = (fs::path(options_.config_dir) / "droidcast-weston-XXXXXX").string();
        std::vector<char> path(path_template.begin(), path_template.end());
        path.push_back('\0');

        int fd = mkstemp(path.data());
        if (fd < 0) {
            return common::Result<std::string>::err(common::ErrorCode::ProcessSpawnError,
                "Cannot create weston config: " + std::string(std::strerror(errno)));
        }

        const std::string content = render_config(options_.width, options_.height);
        size_t written = 0;
        while (written < content.size()) {
            ssize_t n = ::write(fd, content.data() + written, content.size() - written);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                int saved = errno;
                ::close(fd);
                return common::Result<std::string>::err(common::ErrorCode::ProcessSpawnError,
                    "Cannot write weston config: " + std::string(std::strerror(saved)));
            }
            written += static_cast<size_t>(n);
        }
        ::close(fd);

        return common::Result<std::string>::ok(std::string(path.data()));
    }

    common::Result<pid_t> CompositorSupervisor::start(const common::CancellationToken& token) {
        logger_.info("Starting weston PipeWire compositor ("
                     + std::to_string(options_.width) + "x" + std::to_string(options_.height) + ")...");

        auto config = write_config();
        if (config.is_err()) return config.error();
        config_path_ = config.unwrap();

        auto pid = supervisor_.spawn({
            "weston",
            "--backend=pipewire",
            "--renderer=gl",
            "--config=" + config_path_,
            "--socket=" + options_.socket_name
        }, "weston");
        if (pid.is_err()) {
            return common::Result<pid_t>::err(common::ErrorCode::ProcessSpawnError,
                "Cannot start weston: " + pid.error().message);
        }

        const std::string socket = socket_path();
        auto ready = poll_until_true(
            [&socket] {
                std::error_code ec;
                return fs::exists(socket, ec);
            },
            options_.socket_poll, sleeper_, token, "Weston socket");

        if (ready.is_err()) {
            auto error = retag_timeout(ready.error(), common::ErrorCode::StartupTimeout,
                                       "Weston socket did not appear at " + socket);
            logger_.error(error.message);
            return error;
        }

        logger_.info("Weston socket ready: " + socket);
        setenv("WAYLAND_DISPLAY", options_.socket_name.c_str(), 1);
        return pid;
    }

} // namespace core
