// ============================================================================
// Core Test Program
// ============================================================================
// Exercises the platform-independent pieces against in-memory fakes:
// - Readiness poller (attempt and sleep accounting, timeout, interrupt)
// - Process supervisor (ordering, idempotence, escalation)
// - Backend selector and configuration parsing
// - Pipeline argument lists and the exec/supervise handoff
// - PipeWire node discovery
// - Waydroid session control and target app lookup
// - Input relay decoding and multitouch slot bookkeeping
//
// Run with: ./droidcast_core_test
// Output: Console log with PASS/FAIL for each test
// ============================================================================

#include <algorithm>
#include <csignal>
#include <cstring>
#include <linux/input-event-codes.h>
#include <map>

#include "core/AndroidSession.hpp"
#include "core/BackendSelector.hpp"
#include "core/CaptureBackends.hpp"
#include "core/Config.hpp"
#include "core/InputEventProtocol.hpp"
#include "core/NodeDiscovery.hpp"
#include "core/PipelineLauncher.hpp"
#include "core/PortalStateMachine.hpp"
#include "core/ProcessSupervisor.hpp"
#include "core/ReadinessPoller.hpp"
#include "core/TouchRelay.hpp"

#include "testing/FakeCollaborators.hpp"
#include "testing/FakeProcessControl.hpp"
#include "testing/TestHarness.hpp"

using namespace std::chrono_literals;
using testing::log_test;
using common::BackendKind;
using common::ErrorCode;

namespace {

    core::NullLogger g_logger;

    long index_of(const std::vector<std::string>& argv, const std::string& item) {
        auto it = std::find(argv.begin(), argv.end(), item);
        return it == argv.end() ? -1 : static_cast<long>(it - argv.begin());
    }

    bool contains(const std::vector<std::string>& argv, const std::string& item) {
        return index_of(argv, item) >= 0;
    }

    std::optional<std::string> no_env(const std::string&) { return std::nullopt; }

    core::EnvLookup env_from(std::map<std::string, std::string> values) {
        return [values](const std::string& key) -> std::optional<std::string> {
            auto it = values.find(key);
            if (it == values.end()) return std::nullopt;
            return it->second;
        };
    }

    common::PipelineSpec make_spec(BackendKind backend) {
        common::PipelineSpec spec;
        spec.backend = backend;
        spec.receiver_host = "10.0.0.5";
        spec.receiver_port = 9000;
        spec.framerate = 30;
        spec.bitrate_kbps = 4000;
        return spec;
    }

    testing::FakeCommandRunner::Handler waydroid_status(std::function<std::string()> text) {
        return [text](const std::vector<std::string>& argv) -> common::Result<interfaces::CommandOutput> {
            if (argv.size() == 2 && argv[0] == "waydroid" && argv[1] == "status") {
                return interfaces::CommandOutput{0, text()};
            }
            return interfaces::CommandOutput{0, ""};
        };
    }

    // One wire record, little-endian
    std::vector<uint8_t> encode_record(uint8_t type, uint32_t ts, int16_t a1, int16_t a2, int16_t a3, int16_t a4) {
        std::vector<uint8_t> out{type};
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((ts >> (8 * i)) & 0xFF));
        for (int16_t v : {a1, a2, a3, a4}) {
            uint16_t u = static_cast<uint16_t>(v);
            out.push_back(static_cast<uint8_t>(u & 0xFF));
            out.push_back(static_cast<uint8_t>(u >> 8));
        }
        return out;
    }

} // namespace

// ============================================================================
// Test: Readiness Poller
// ============================================================================

void test_readiness_poller() {
    testing::section("Readiness Poller");
    common::CancellationSource source;

    {
        testing::ManualSleeper sleeper;
        int evaluations = 0;
        auto result = core::poll_until(
            [&]() -> std::optional<int> {
                ++evaluations;
                if (evaluations == 3) return 42;
                return std::nullopt;
            },
            core::PollPolicy{5, 500ms}, sleeper.as_sleeper(), source.get_token(), "probe");

        log_test("Poller: success on attempt 3 returns value",
                 result.is_ok() && result.unwrap() == 42);
        log_test("Poller: 3 evaluations, 2 sleeps",
                 evaluations == 3 && sleeper.sleeps.size() == 2,
                 std::to_string(evaluations) + " evals / " + std::to_string(sleeper.sleeps.size()) + " sleeps");
        log_test("Poller: sleeps use the configured interval",
                 sleeper.sleeps.size() == 2 && sleeper.sleeps[0] == 500ms && sleeper.sleeps[1] == 500ms);
    }

    {
        testing::ManualSleeper sleeper;
        int evaluations = 0;
        auto result = core::poll_until_true([&] { ++evaluations; return true; },
                                            core::PollPolicy{5, 500ms}, sleeper.as_sleeper(),
                                            source.get_token(), "probe");
        log_test("Poller: first-attempt success never sleeps",
                 result.is_ok() && evaluations == 1 && sleeper.sleeps.empty());
    }

    {
        testing::ManualSleeper sleeper;
        int evaluations = 0;
        auto result = core::poll_until_true([&] { ++evaluations; return false; },
                                            core::PollPolicy{4, 250ms}, sleeper.as_sleeper(),
                                            source.get_token(), "probe");
        log_test("Poller: always-false yields Timeout",
                 result.is_err() && result.error().code == ErrorCode::Timeout);
        log_test("Poller: exactly max_attempts evaluations",
                 evaluations == 4 && sleeper.sleeps.size() == 3,
                 std::to_string(evaluations) + " evals / " + std::to_string(sleeper.sleeps.size()) + " sleeps");
    }

    {
        common::CancellationSource interrupt;
        testing::ManualSleeper sleeper;
        sleeper.on_sleep = [&] { interrupt.cancel(SIGINT); };
        int evaluations = 0;
        auto result = core::poll_until_true([&] { ++evaluations; return false; },
                                            core::PollPolicy{10, 100ms}, sleeper.as_sleeper(),
                                            interrupt.get_token(), "probe");
        log_test("Poller: interrupt ends polling with Cancelled",
                 result.is_err() && result.error().code == ErrorCode::Cancelled && evaluations == 1);
        log_test("Cancellation: token remembers the signal",
                 interrupt.get_token().signal_number() == SIGINT);
    }

    {
        auto retagged = core::retag_timeout(common::AppError{ErrorCode::Timeout, "t", ""},
                                            ErrorCode::NodeNotFound, "no node");
        auto untouched = core::retag_timeout(common::AppError{ErrorCode::Cancelled, "c", ""},
                                             ErrorCode::NodeNotFound, "no node");
        log_test("Poller: Timeout retagged, Cancelled kept",
                 retagged.code == ErrorCode::NodeNotFound && untouched.code == ErrorCode::Cancelled);
    }
}

// ============================================================================
// Test: Process Supervisor
// ============================================================================

void test_process_supervisor() {
    testing::section("Process Supervisor");

    {
        testing::FakeProcessControl control;
        core::ProcessSupervisor supervisor(control, g_logger);
        supervisor.shutdown_all();
        supervisor.shutdown_all();
        log_test("Supervisor: shutdown_all on empty registry is a no-op",
                 control.signals.empty() && supervisor.empty());
    }

    {
        testing::FakeProcessControl control;
        core::ProcessSupervisor supervisor(control, g_logger);
        auto first = supervisor.spawn({"weston"}, "weston");
        auto second = supervisor.spawn({"droidcast-input-relay"}, "input relay");
        log_test("Supervisor: spawn registers processes",
                 first.is_ok() && second.is_ok() && supervisor.size() == 2);

        supervisor.shutdown_all();
        bool reverse = control.signals.size() == 2
                    && control.signals[0] == std::make_pair(second.unwrap(), SIGTERM)
                    && control.signals[1] == std::make_pair(first.unwrap(), SIGTERM);
        log_test("Supervisor: SIGTERM in reverse registration order", reverse);
        log_test("Supervisor: registry empty after shutdown", supervisor.empty());

        size_t before = control.signals.size();
        supervisor.shutdown_all();
        log_test("Supervisor: second shutdown_all sends nothing", control.signals.size() == before);
    }

    {
        testing::FakeProcessControl control;
        core::ProcessSupervisor supervisor(control, g_logger);
        auto pid = supervisor.spawn({"weston"}, "weston");
        control.mark_exited(pid.unwrap());
        supervisor.shutdown_all();
        log_test("Supervisor: exited process is never signaled",
                 control.signals_sent_to(pid.unwrap()) == 0 && supervisor.empty());
    }

    {
        testing::FakeProcessControl control;
        control.exits_on_sigterm = false;
        core::ProcessSupervisor supervisor(control, g_logger, 10ms);
        auto pid = supervisor.spawn({"weston"}, "weston");
        supervisor.shutdown_all();
        bool escalated = control.signals.size() == 2
                      && control.signals[0].second == SIGTERM
                      && control.signals[1].second == SIGKILL
                      && !control.is_alive(pid.unwrap());
        log_test("Supervisor: SIGKILL after the grace period", escalated);
    }

    {
        testing::FakeProcessControl control;
        control.failing_commands.insert("weston");
        core::ProcessSupervisor supervisor(control, g_logger);
        auto pid = supervisor.spawn({"weston"}, "weston");
        log_test("Supervisor: spawn failure -> ProcessSpawnError, not registered",
                 pid.is_err() && pid.error().code == ErrorCode::ProcessSpawnError && supervisor.empty());
    }

    {
        testing::FakeProcessControl control;
        pid_t pid = 0;
        {
            core::ProcessSupervisor supervisor(control, g_logger);
            pid = supervisor.spawn({"weston"}, "weston").unwrap();
        }
        log_test("Supervisor: destructor stops what is left",
                 control.signals_sent_to(pid) == 1 && !control.is_alive(pid));
    }
}

// ============================================================================
// Test: Backend Selector
// ============================================================================

void test_backend_selector() {
    testing::section("Backend Selector");

    auto portal = core::parse_method("portal");
    auto headless = core::parse_method("headless");
    auto x11 = core::parse_method("x11");
    auto x11grab = core::parse_method("x11grab");
    auto test = core::parse_method("test");
    log_test("Selector: known methods map to their kinds",
             portal.is_ok() && portal.unwrap() == BackendKind::Portal &&
             headless.is_ok() && headless.unwrap() == BackendKind::Headless &&
             x11.is_ok() && x11.unwrap() == BackendKind::X11 &&
             test.is_ok() && test.unwrap() == BackendKind::Test);
    log_test("Selector: x11grab is an alias of x11",
             x11grab.is_ok() && x11grab.unwrap() == BackendKind::X11);

    bool all_rejected = true;
    for (const char* name : {"", "Portal", "wayland", "vnc", "x12", "test "}) {
        auto kind = core::parse_method(name);
        if (kind.is_ok() || kind.error().code != ErrorCode::ConfigError) all_rejected = false;
    }
    log_test("Selector: unsupported names -> ConfigError", all_rejected);

    core::BackendSelector selector;
    int created = 0;
    selector.register_backend(BackendKind::Test, [&created] {
        ++created;
        return std::make_shared<core::TestBackend>();
    });

    auto missing = selector.select("portal");
    log_test("Selector: unregistered kind -> ConfigError",
             missing.is_err() && missing.error().code == ErrorCode::ConfigError);

    auto unknown = selector.select("bogus");
    log_test("Selector: unknown name builds nothing",
             unknown.is_err() && created == 0);

    auto chosen = selector.select("test");
    log_test("Selector: factory invoked lazily on select",
             chosen.is_ok() && created == 1 && chosen.unwrap()->kind() == BackendKind::Test);

    auto methods = selector.list_methods();
    log_test("Selector: list_methods reports registrations",
             methods.size() == 1 && methods[0] == "test");
}

// ============================================================================
// Test: Configuration
// ============================================================================

void test_config() {
    testing::section("Configuration");

    auto defaults = core::load_config(no_env, {});
    bool ok = defaults.is_ok();
    if (ok) {
        const auto& c = defaults.unwrap();
        ok = c.method == "portal" && c.receiver_host == "192.168.86.29" && c.receiver_port == 9000
          && c.framerate == 30 && c.bitrate_kbps == 4000 && c.headless_width == 1280
          && c.headless_height == 720 && c.input_server && c.input_port == 9001
          && c.package.empty() && c.display == ":0";
    }
    log_test("Config: defaults", ok);

    auto env = core::load_config(env_from({{"STREAM_HOST", "10.1.1.1"}, {"STREAM_PORT", "9100"},
                                           {"CAPTURE_METHOD", "headless"}, {"INPUT_SERVER", "0"},
                                           {"GAME_PACKAGE", "org.example.game"}}), {});
    log_test("Config: environment variables applied",
             env.is_ok() && env.unwrap().receiver_host == "10.1.1.1" && env.unwrap().receiver_port == 9100
             && env.unwrap().method == "headless" && !env.unwrap().input_server
             && env.unwrap().package == "org.example.game");

    auto flags = core::load_config(env_from({{"STREAM_PORT", "9100"}, {"FRAMERATE", "25"}}),
                                   {"--port", "9200", "--method", "test", "--size", "800x600", "--no-input"});
    log_test("Config: flags override environment",
             flags.is_ok() && flags.unwrap().receiver_port == 9200 && flags.unwrap().framerate == 25
             && flags.unwrap().method == "test" && flags.unwrap().headless_width == 800
             && flags.unwrap().headless_height == 600 && !flags.unwrap().input_server);

    auto bad_port = core::load_config(env_from({{"STREAM_PORT", "70000"}}), {});
    auto bad_rate = core::load_config(no_env, {"--framerate", "fast"});
    auto zero_bitrate = core::load_config(no_env, {"--bitrate", "0"});
    auto bad_size = core::load_config(no_env, {"--size", "800"});
    auto missing_value = core::load_config(no_env, {"--host"});
    auto unknown_flag = core::load_config(no_env, {"--turbo", "1"});
    bool all_config_errors = true;
    for (const auto* r : {&bad_port, &bad_rate, &zero_bitrate, &bad_size, &missing_value, &unknown_flag}) {
        if (r->is_ok() || r->error().code != ErrorCode::ConfigError) all_config_errors = false;
    }
    log_test("Config: malformed or out-of-range values -> ConfigError", all_config_errors);

    auto relay_on = core::load_config(env_from({{"INPUT_SERVER", "1"}}), {});
    auto relay_yes = core::load_config(env_from({{"INPUT_SERVER", "yes"}}), {});
    auto relay_true = core::load_config(env_from({{"INPUT_SERVER", "true"}}), {});
    log_test("Config: INPUT_SERVER enables the relay only for 1",
             relay_on.is_ok() && relay_on.unwrap().input_server
             && relay_yes.is_ok() && !relay_yes.unwrap().input_server
             && relay_true.is_ok() && !relay_true.unwrap().input_server);

    auto unknown_method = core::load_config(no_env, {"--method", "vnc"});
    log_test("Config: method name validated by the selector, not the loader", unknown_method.is_ok());

    auto help = core::load_config(no_env, {"--help"});
    log_test("Config: --help requested", help.is_ok() && help.unwrap().show_help);

    log_test("Config: usage lists every method",
             core::usage("droidcast").find("headless | portal | x11 | test") != std::string::npos);
}

// ============================================================================
// Test: Pipeline Launcher
// ============================================================================

void test_pipeline_arguments() {
    testing::section("Pipeline Arguments");

    {
        auto argv = core::build_pipeline_arguments(make_spec(BackendKind::Test));
        std::vector<std::string> expected = {
            "gst-launch-1.0", "-e",
            "videotestsrc", "pattern=ball", "is-live=true", "!",
            "video/x-raw,width=1280,height=720,framerate=30/1", "!",
            "videoconvert", "!",
            "video/x-raw,format=NV12", "!",
            "v4l2h264enc", "extra-controls=controls,video_bitrate=4000000;", "!",
            "video/x-h264,profile=baseline,stream-format=byte-stream", "!",
            "mpegtsmux", "!",
            "tcpclientsink", "host=10.0.0.5", "port=9000"
        };
        log_test("Pipeline: test source argument list", argv == expected, core::join_arguments(argv));
    }

    {
        auto spec = make_spec(BackendKind::Portal);
        spec.source_handle = "57";
        spec.transport_fd = 12;
        auto argv = core::build_pipeline_arguments(spec);
        log_test("Pipeline: portal passes fd and node path",
                 index_of(argv, "pipewiresrc") == 2 && index_of(argv, "fd=12") == 3
                 && index_of(argv, "path=57") == 4);
        log_test("Pipeline: portal has no queue/videorate",
                 !contains(argv, "queue") && !contains(argv, "videorate"));
        log_test("Pipeline: portal ends with the TCP sink",
                 argv.back() == "port=9000" && argv[argv.size() - 2] == "host=10.0.0.5");
    }

    {
        auto spec = make_spec(BackendKind::Headless);
        spec.source_handle = "88";
        auto argv = core::build_pipeline_arguments(spec);
        long queue = index_of(argv, "queue");
        long convert = index_of(argv, "videoconvert");
        long rate = index_of(argv, "videorate");
        log_test("Pipeline: headless has no fd",
                 std::none_of(argv.begin(), argv.end(), [](const std::string& a) { return a.rfind("fd=", 0) == 0; }));
        log_test("Pipeline: headless queue before videoconvert, videorate after",
                 queue > 0 && convert > queue && rate > convert && contains(argv, "leaky=downstream"));
        log_test("Pipeline: framerate caps follow videorate",
                 rate >= 0 && static_cast<size_t>(rate + 2) < argv.size()
                 && argv[rate + 2] == "video/x-raw,format=NV12,framerate=30/1");
    }

    {
        auto spec = make_spec(BackendKind::X11);
        spec.source_handle = ":1";
        spec.bitrate_kbps = 2500;
        auto without_size = core::build_pipeline_arguments(spec);
        spec.capture_width = 1920;
        spec.capture_height = 1080;
        auto with_size = core::build_pipeline_arguments(spec);

        log_test("Pipeline: x11 uses ffmpeg x11grab on the display",
                 without_size.front() == "ffmpeg" && contains(without_size, "x11grab")
                 && index_of(without_size, ":1") == index_of(without_size, "-i") + 1);
        log_test("Pipeline: x11 bitrate, maxrate and doubled bufsize",
                 index_of(without_size, "2500k") == index_of(without_size, "-b:v") + 1
                 && index_of(without_size, "5000k") == index_of(without_size, "-bufsize") + 1);
        log_test("Pipeline: -video_size only with a probed size",
                 !contains(without_size, "-video_size")
                 && index_of(with_size, "1920x1080") == index_of(with_size, "-video_size") + 1
                 && index_of(with_size, "-video_size") < index_of(with_size, "-i"));
        log_test("Pipeline: x11 sends MPEG-TS over TCP",
                 with_size.back() == "tcp://10.0.0.5:9000");
    }
}

void test_pipeline_handoff() {
    testing::section("Pipeline Handoff");
    common::CancellationSource source;

    {
        testing::FakeProcessControl control;
        core::ProcessSupervisor supervisor(control, g_logger);
        core::PipelineLauncher launcher(control, supervisor, g_logger);
        auto result = launcher.hand_off(make_spec(BackendKind::Test), source.get_token());
        log_test("Handoff: nothing supervised -> exec replaces the process",
                 result.is_ok() && control.exec_calls.size() == 1 && control.spawned.empty()
                 && control.exec_calls[0].front() == "gst-launch-1.0");
    }

    {
        testing::FakeProcessControl control;
        control.exec_fails = true;
        core::ProcessSupervisor supervisor(control, g_logger);
        core::PipelineLauncher launcher(control, supervisor, g_logger);
        auto result = launcher.hand_off(make_spec(BackendKind::Test), source.get_token());
        log_test("Handoff: failed exec -> ProcessSpawnError",
                 result.is_err() && result.error().code == ErrorCode::ProcessSpawnError);
    }

    {
        testing::FakeProcessControl control;
        control.exit_status = 3;
        core::ProcessSupervisor supervisor(control, g_logger);
        supervisor.spawn({"weston"}, "weston");
        core::PipelineLauncher launcher(control, supervisor, g_logger);
        auto result = launcher.hand_off(make_spec(BackendKind::Headless), source.get_token());
        log_test("Handoff: dependents alive -> pipeline spawned and supervised",
                 control.exec_calls.empty() && control.spawned.size() == 2 && supervisor.size() == 2
                 && control.spawned[1].argv.front() == "gst-launch-1.0");
        log_test("Handoff: run status is the pipeline's", result.is_ok() && result.unwrap() == 3);
    }
}

// ============================================================================
// Test: Node Discovery
// ============================================================================

void test_node_discovery() {
    testing::section("Node Discovery");

    const std::string dump = R"([
        {"id": 30, "type": "PipeWire:Interface:Node",
         "info": {"props": {"media.class": "Audio/Sink", "node.name": "weston-audio"}}},
        {"id": 41, "type": "PipeWire:Interface:Node",
         "info": {"props": {"media.class": "Video/Source", "node.name": "alsa_camera"}}},
        {"id": 57, "type": "PipeWire:Interface:Node",
         "info": {"props": {"media.class": "Video/Source", "node.name": "weston.pipewire"}}},
        {"id": 58, "type": "PipeWire:Interface:Node",
         "info": {"props": {"media.class": "Video/Source", "node.name": "weston.second"}}},
        {"id": 3, "type": "PipeWire:Interface:Core", "info": null}
    ])";

    auto node = core::find_video_node(dump, "weston");
    log_test("Discovery: first Video node named weston wins", node && *node == 57);
    log_test("Discovery: no match -> empty", !core::find_video_node(dump, "gamescope"));
    log_test("Discovery: malformed dump matches nothing",
             !core::find_video_node("not json", "weston") && !core::find_video_node("{}", "weston")
             && !core::find_video_node(R"([{"id": "x", "info": {"props": {}}}])", "weston"));
    log_test("Discovery: non-string props are skipped",
             !core::find_video_node(R"([{"id": 9, "info": {"props": {"media.class": 5, "node.name": "weston"}}}])", "weston"));

    common::CancellationSource source;
    {
        testing::FakeStreamRegistry registry;
        registry.dumps = {"[]", "[]", dump};
        testing::ManualSleeper sleeper;
        auto found = core::discover_video_node(registry, "weston", core::PollPolicy{20, 500ms},
                                               sleeper.as_sleeper(), source.get_token(), g_logger);
        log_test("Discovery: exactly one match after polling -> its id",
                 found.is_ok() && found.unwrap() == 57 && registry.queries == 3 && sleeper.sleeps.size() == 2);
    }
    {
        testing::FakeStreamRegistry registry;
        registry.dumps = {"[]"};
        testing::ManualSleeper sleeper;
        auto found = core::discover_video_node(registry, "weston", core::PollPolicy{20, 500ms},
                                               sleeper.as_sleeper(), source.get_token(), g_logger);
        log_test("Discovery: no match across all attempts -> NodeNotFound",
                 found.is_err() && found.error().code == ErrorCode::NodeNotFound && registry.queries == 20);
    }
}

// ============================================================================
// Test: Android Session
// ============================================================================

void test_android_session() {
    testing::section("Android Session");
    common::CancellationSource source;

    {
        testing::FakeCommandRunner runner;
        runner.handler = waydroid_status([] { return std::string("Session:\tRUNNING\nContainer:\tRUNNING\n"); });
        testing::ManualSleeper sleeper;
        core::AndroidSession android(runner, g_logger, sleeper.as_sleeper());
        auto result = android.ensure_running(source.get_token());
        log_test("Android: running session is not restarted",
                 result.is_ok() && runner.detached.empty() && sleeper.sleeps.empty());
    }

    {
        testing::FakeCommandRunner runner;
        int polls = 0;
        runner.handler = waydroid_status([&polls] {
            return ++polls >= 3 ? std::string("Session:\tRUNNING\n") : std::string("Session:\tSTOPPED\n");
        });
        testing::ManualSleeper sleeper;
        core::AndroidSession android(runner, g_logger, sleeper.as_sleeper());
        auto result = android.ensure_running(source.get_token());
        bool launched = runner.detached.size() == 1
                     && runner.detached[0] == std::vector<std::string>{"waydroid", "session", "start"};
        log_test("Android: session started detached, then polled", result.is_ok() && launched);
        log_test("Android: session poll uses 5 s interval",
                 !sleeper.sleeps.empty() && sleeper.sleeps[0] == 5000ms);
    }

    {
        testing::FakeCommandRunner runner;
        runner.handler = waydroid_status([] { return std::string("Session:\tSTOPPED\n"); });
        testing::ManualSleeper sleeper;
        core::AndroidTimings timings;
        timings.session_start = core::PollPolicy{3, 10ms};
        core::AndroidSession android(runner, g_logger, sleeper.as_sleeper(), timings);
        auto result = android.ensure_running(source.get_token());
        log_test("Android: never RUNNING -> StartupTimeout",
                 result.is_err() && result.error().code == ErrorCode::StartupTimeout);
    }

    {
        testing::FakeCommandRunner runner;
        runner.handler = waydroid_status([] { return std::string("Session:\tRUNNING\n"); });
        testing::ManualSleeper sleeper;
        core::AndroidTimings timings;
        timings.android_ready = core::PollPolicy{4, 10ms};
        core::AndroidSession android(runner, g_logger, sleeper.as_sleeper(), timings);
        auto result = android.show_full_ui(source.get_token());
        log_test("Android: slow boot is not fatal",
                 result.is_ok() && runner.detached.size() == 1 && sleeper.sleeps.size() == 3);
    }

    {
        testing::FakeCommandRunner runner;
        runner.handler = waydroid_status([] { return std::string("Session:\tRUNNING\n"); });
        testing::ManualSleeper sleeper;
        core::AndroidSession android(runner, g_logger, sleeper.as_sleeper());
        android.stop_stale_session();
        log_test("Android: stale session stopped with a 2 s grace",
                 runner.count_runs({"waydroid", "session", "stop"}) == 1
                 && sleeper.sleeps.size() == 1 && sleeper.sleeps[0] == 2000ms);
    }

    {
        testing::FakeCommandRunner runner;
        runner.handler = [](const std::vector<std::string>&) -> common::Result<interfaces::CommandOutput> {
            return interfaces::CommandOutput{1, "error"};
        };
        testing::ManualSleeper sleeper;
        core::AndroidSession android(runner, g_logger, sleeper.as_sleeper());
        android.launch_application("org.example.game");
        log_test("Android: app launch issued even if it reports an error",
                 runner.count_runs({"waydroid", "app", "launch", "org.example.game"}) == 1);
    }

    log_test("Android: ready line detected",
             core::status_reports_android_ready("Session:\tRUNNING\nAndroid is ready\n")
             && !core::status_reports_android_ready("ready\nAndroid booting\n"));

    {
        testing::FakeAppInventory inventory;
        inventory.apps = {{"Settings", "com.android.settings"},
                          {"Empires & Puzzles", "com.smallgiantgames.empires.beta"}};
        log_test("Target app: override wins without consulting the inventory",
                 core::resolve_target_package("org.override", inventory, g_logger) == "org.override"
                 && inventory.queries == 0);
        log_test("Target app: case-insensitive name match",
                 core::resolve_target_package("", inventory, g_logger) == "com.smallgiantgames.empires.beta");

        testing::FakeAppInventory empty;
        log_test("Target app: fallback constant when nothing matches",
                 core::resolve_target_package("", empty, g_logger) == core::kFallbackPackage);
    }
}

// ============================================================================
// Test: Input Relay
// ============================================================================

void test_input_protocol() {
    testing::section("Input Protocol");

    auto record = encode_record(1, 0x01020304u, 640, 360, 2, -1);
    log_test("Protocol: record is 13 bytes", record.size() == core::kInputEventSize);

    auto events = core::decode_input_datagram(record.data(), record.size());
    log_test("Protocol: fields decoded little-endian",
             events.size() == 1 && events[0].type == 1 && events[0].timestamp == 0x01020304u
             && events[0].arg1 == 640 && events[0].arg2 == 360 && events[0].arg3 == 2 && events[0].arg4 == -1);

    std::vector<uint8_t> datagram = record;
    auto second = encode_record(2, 7, 0, 0, 2, 0);
    datagram.insert(datagram.end(), second.begin(), second.end());
    datagram.insert(datagram.end(), {1, 2, 3, 4, 5});
    auto many = core::decode_input_datagram(datagram.data(), datagram.size());
    log_test("Protocol: trailing partial record ignored", many.size() == 2 && many[1].type == 2);

    log_test("Protocol: short datagram decodes to nothing",
             core::decode_input_datagram(record.data(), 12).empty());
}

void test_touch_relay() {
    testing::section("Touch Relay");

    testing::RecordingTouchDevice device;
    core::TouchRelay relay(device, g_logger);

    auto down0 = relay.handle(core::InputEvent{1, 0, 100, 200, 0, 0});
    log_test("Relay: first finger presses BTN_TOUCH",
             down0.is_ok() && device.contains(EV_KEY, BTN_TOUCH, 1) && device.contains(EV_ABS, ABS_MT_TRACKING_ID, 0));
    log_test("Relay: slot 0 also drives ABS_X/ABS_Y",
             device.contains(EV_ABS, ABS_X, 100) && device.contains(EV_ABS, ABS_Y, 200));
    log_test("Relay: event ends with SYN_REPORT",
             !device.events.empty() && device.events.back() == testing::RecordingTouchDevice::Event{EV_SYN, SYN_REPORT, 0});

    device.events.clear();
    relay.handle(core::InputEvent{1, 0, 300, 400, 1, 0});
    log_test("Relay: second finger does not press BTN_TOUCH again",
             !device.contains(EV_KEY, BTN_TOUCH, 1) && device.contains(EV_ABS, ABS_MT_SLOT, 1)
             && !device.contains(EV_ABS, ABS_X, 300) && relay.active_touches() == 2);

    device.events.clear();
    relay.handle(core::InputEvent{0, 0, 310, 410, 1, 0});
    log_test("Relay: move updates the slot position",
             device.contains(EV_ABS, ABS_MT_POSITION_X, 310) && device.contains(EV_ABS, ABS_MT_POSITION_Y, 410));

    device.events.clear();
    relay.handle(core::InputEvent{2, 0, 0, 0, 1, 0});
    log_test("Relay: lifting one of two fingers keeps BTN_TOUCH",
             device.contains(EV_ABS, ABS_MT_TRACKING_ID, -1) && !device.contains(EV_KEY, BTN_TOUCH, 0)
             && relay.active_touches() == 1 && !relay.slot_active(1));

    device.events.clear();
    relay.handle(core::InputEvent{2, 0, 0, 0, 0, 0});
    log_test("Relay: last finger releases BTN_TOUCH",
             device.contains(EV_KEY, BTN_TOUCH, 0) && relay.active_touches() == 0);

    relay.handle(core::InputEvent{1, 0, 5, 5, 42, 0});
    log_test("Relay: out-of-range slot clamped to 9",
             relay.slot_active(9) && core::TouchRelay::clamp_slot(-3) == 0);

    device.events.clear();
    relay.handle(core::InputEvent{3, 0, KEY_A, 0, 0, 0});
    relay.handle(core::InputEvent{4, 0, KEY_A, 0, 0, 0});
    log_test("Relay: key down/up forwarded",
             device.contains(EV_KEY, KEY_A, 1) && device.contains(EV_KEY, KEY_A, 0));

    uint64_t before = relay.injected_events();
    device.events.clear();
    auto unknown = relay.handle(core::InputEvent{9, 0, 0, 0, 0, 0});
    log_test("Relay: unknown type ignored",
             unknown.is_ok() && device.events.empty() && relay.injected_events() == before);

    device.fails = true;
    auto failed = relay.handle(core::InputEvent{0, 0, 1, 1, 0, 0});
    log_test("Relay: device error reported", failed.is_err());
}

// ============================================================================
// Test: Portal transition function
// ============================================================================

void test_portal_transitions() {
    testing::section("Portal Transitions");
    using common::CaptureState;
    using core::PortalEffect;
    using core::PortalEvent;
    using core::PortalEventKind;

    PortalEvent begin{PortalEventKind::Begin, 0, {}};
    PortalEvent created{PortalEventKind::Response, 0, {}};
    created.results.session_handle = "/org/freedesktop/portal/desktop/session/1_42/droidcast";
    PortalEvent plain_ok{PortalEventKind::Response, 0, {}};
    PortalEvent cancelled{PortalEventKind::Response, 1, {}};
    PortalEvent streams{PortalEventKind::Response, 0, {}};
    streams.results.streams.push_back(interfaces::PortalStream{57, {}});

    auto t1 = core::portal_transition(CaptureState::Idle, begin);
    auto t2 = core::portal_transition(CaptureState::Idle, created);
    auto t3 = core::portal_transition(CaptureState::SessionCreated, plain_ok);
    auto t4 = core::portal_transition(CaptureState::SourcesSelected, streams);
    log_test("Transitions: happy path",
             t1.effect == PortalEffect::CreateSession
             && t2.next == CaptureState::SessionCreated && t2.effect == PortalEffect::SelectSources
             && t3.next == CaptureState::SourcesSelected && t3.effect == PortalEffect::Start
             && t4.next == CaptureState::Started && t4.effect == PortalEffect::OpenRemote);

    auto no_handle = core::portal_transition(CaptureState::Idle, plain_ok);
    log_test("Transitions: CreateSession without handle aborts",
             no_handle.next == CaptureState::Failed && no_handle.effect == PortalEffect::Abort);

    auto empty = core::portal_transition(CaptureState::SourcesSelected, plain_ok);
    log_test("Transitions: zero streams -> AbortNoSource",
             empty.next == CaptureState::Failed && empty.effect == PortalEffect::AbortNoSource);

    auto refused = core::portal_transition(CaptureState::SessionCreated, cancelled);
    log_test("Transitions: non-zero response aborts",
             refused.next == CaptureState::Failed && refused.effect == PortalEffect::Abort);

    auto after_start = core::portal_transition(CaptureState::Started, created);
    auto after_fail = core::portal_transition(CaptureState::Failed, begin);
    log_test("Transitions: terminal states ignore events",
             after_start.next == CaptureState::Started && after_start.effect == PortalEffect::None
             && after_fail.next == CaptureState::Failed && after_fail.effect == PortalEffect::None);

    log_test("Transitions: request path from unique name",
             core::portal_request_path(core::portal_sender_name(":1.42"), "u1")
             == "/org/freedesktop/portal/desktop/request/1_42/u1");
}

int main() {
    std::cout << "droidcast Core Test Suite" << std::endl;
    std::cout << "=========================" << std::endl;

    test_readiness_poller();
    test_process_supervisor();
    test_backend_selector();
    test_config();
    test_pipeline_arguments();
    test_pipeline_handoff();
    test_node_discovery();
    test_android_session();
    test_input_protocol();
    test_touch_relay();
    test_portal_transitions();

    return testing::print_summary();
}
