#include "core/PipelineLauncher.hpp"

namespace core {

    namespace {
        void append(std::vector<std::string>& argv, std::initializer_list<std::string> items) {
            argv.insert(argv.end(), items.begin(), items.end());
        }

        // Shared tail of every gst-launch pipeline: HW H.264 -> MPEG-TS -> TCP
        void append_gst_encoder(std::vector<std::string>& argv, const common::PipelineSpec& spec) {
            const long bitrate_bps = static_cast<long>(spec.bitrate_kbps) * 1000;
            append(argv, {
                "v4l2h264enc", "extra-controls=controls,video_bitrate=" + std::to_string(bitrate_bps) + ";", "!",
                "video/x-h264,profile=baseline,stream-format=byte-stream", "!",
                "mpegtsmux", "!",
                "tcpclientsink", "host=" + spec.receiver_host, "port=" + std::to_string(spec.receiver_port)
            });
        }

        std::string raw_caps(const common::PipelineSpec& spec) {
            return "video/x-raw,format=NV12,framerate=" + std::to_string(spec.framerate) + "/1";
        }
    }

    std::vector<std::string> build_pipeline_arguments(const common::PipelineSpec& spec) {
        std::vector<std::string> argv;

        switch (spec.backend) {
            case common::BackendKind::Portal: {
                argv = {"gst-launch-1.0", "-e", "pipewiresrc"};
                if (spec.transport_fd) argv.push_back("fd=" + std::to_string(*spec.transport_fd));
                append(argv, {
                    "path=" + spec.source_handle, "do-timestamp=true", "keepalive-time=1000", "!",
                    "videoconvert", "!",
                    raw_caps(spec), "!"
                });
                append_gst_encoder(argv, spec);
                break;
            }

            case common::BackendKind::Headless:
                argv = {
                    "gst-launch-1.0", "-e",
                    "pipewiresrc", "path=" + spec.source_handle, "do-timestamp=true", "keepalive-time=1000", "!",
                    "queue", "max-size-buffers=3", "leaky=downstream", "!",
                    "videoconvert", "!",
                    "videorate", "!",
                    raw_caps(spec), "!"
                };
                append_gst_encoder(argv, spec);
                break;

            case common::BackendKind::X11: {
                const std::string bitrate = std::to_string(spec.bitrate_kbps) + "k";
                argv = {
                    "ffmpeg", "-loglevel", "warning", "-stats",
                    "-f", "x11grab", "-framerate", std::to_string(spec.framerate)
                };
                if (spec.capture_width > 0 && spec.capture_height > 0) {
                    append(argv, {"-video_size",
                                  std::to_string(spec.capture_width) + "x" + std::to_string(spec.capture_height)});
                }
                append(argv, {
                    "-i", spec.source_handle,
                    "-c:v", "libx264", "-preset", "ultrafast", "-tune", "zerolatency",
                    "-b:v", bitrate, "-maxrate", bitrate,
                    "-bufsize", std::to_string(spec.bitrate_kbps * 2) + "k",
                    "-g", "60", "-bf", "0", "-profile:v", "baseline",
                    "-f", "mpegts",
                    "tcp://" + spec.receiver_host + ":" + std::to_string(spec.receiver_port)
                });
                break;
            }

            case common::BackendKind::Test:
                argv = {
                    "gst-launch-1.0", "-e",
                    "videotestsrc", "pattern=ball", "is-live=true", "!",
                    "video/x-raw,width=1280,height=720,framerate=" + std::to_string(spec.framerate) + "/1", "!",
                    "videoconvert", "!",
                    "video/x-raw,format=NV12", "!"
                };
                append_gst_encoder(argv, spec);
                break;
        }

        return argv;
    }

    std::string join_arguments(const std::vector<std::string>& argv) {
        std::string line;
        for (const auto& arg : argv) {
            if (!line.empty()) line += ' ';
            line += arg;
        }
        return line;
    }

    PipelineLauncher::PipelineLauncher(interfaces::IProcessControl& control,
                                       ProcessSupervisor& supervisor,
                                       ILogger& logger)
        : control_(control), supervisor_(supervisor), logger_(logger) {}

    common::Result<int> PipelineLauncher::hand_off(const common::PipelineSpec& spec,
                                                   const common::CancellationToken& token) {
        auto argv = build_pipeline_arguments(spec);
        logger_.info("Launching: " + join_arguments(argv));

        if (supervisor_.empty()) {
            auto replaced = control_.exec_replace(argv);
            if (replaced.is_err()) {
                return common::Result<int>::err(common::ErrorCode::ProcessSpawnError,
                    "Cannot exec " + argv.front() + ": " + replaced.error().message);
            }
            return common::Result<int>::ok(0);
        }

        auto pid = supervisor_.spawn(argv, "pipeline");
        if (pid.is_err()) {
            return common::Result<int>::err(common::ErrorCode::ProcessSpawnError,
                "Cannot start " + argv.front() + ": " + pid.error().message);
        }

        auto status = control_.wait(pid.unwrap(), token);
        if (status.is_err()) return status;

        logger_.info("Pipeline exited with status " + std::to_string(status.unwrap()));
        return status;
    }

} // namespace core
