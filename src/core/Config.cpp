#include "core/Config.hpp"
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace core {

    namespace {
        using ConfigResult = common::Result<RunConfig>;

        ConfigResult invalid(const std::string& what, const std::string& value) {
            return ConfigResult::err(common::ErrorCode::ConfigError,
                                     "Invalid " + what + ": '" + value + "'");
        }

        // WxH
        bool parse_size(const std::string& text, int& width, int& height) {
            auto x = text.find('x');
            if (x == std::string::npos) return false;
            auto w = parse_number(text.substr(0, x), 1, 16384);
            auto h = parse_number(text.substr(x + 1), 1, 16384);
            if (!w || !h) return false;
            width = static_cast<int>(*w);
            height = static_cast<int>(*h);
            return true;
        }

        template <typename Target>
        bool assign_number(const std::string& text, long min, long max, Target& target) {
            auto value = parse_number(text, min, max);
            if (!value) return false;
            target = static_cast<Target>(*value);
            return true;
        }
    }

    std::optional<long> parse_number(const std::string& text, long min, long max) {
        if (text.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long value = std::strtol(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0') return std::nullopt;
        if (value < min || value > max) return std::nullopt;
        return value;
    }

    EnvLookup process_environment() {
        return [](const std::string& key) -> std::optional<std::string> {
            const char* value = std::getenv(key.c_str());
            if (!value || value[0] == '\0') return std::nullopt;
            return std::string(value);
        };
    }

    common::Result<RunConfig> load_config(const EnvLookup& env, const std::vector<std::string>& args) {
        RunConfig config;

        // ========== Environment ==========

        if (auto v = env("STREAM_HOST")) config.receiver_host = *v;
        if (auto v = env("STREAM_PORT")) {
            if (!assign_number(*v, 1, 65535, config.receiver_port)) return invalid("STREAM_PORT", *v);
        }
        if (auto v = env("CAPTURE_METHOD")) config.method = *v;
        if (auto v = env("FRAMERATE")) {
            if (!assign_number(*v, 1, 240, config.framerate)) return invalid("FRAMERATE", *v);
        }
        if (auto v = env("BITRATE")) {
            if (!assign_number(*v, 1, 1000000, config.bitrate_kbps)) return invalid("BITRATE", *v);
        }
        if (auto v = env("HEADLESS_WIDTH")) {
            if (!assign_number(*v, 1, 16384, config.headless_width)) return invalid("HEADLESS_WIDTH", *v);
        }
        if (auto v = env("HEADLESS_HEIGHT")) {
            if (!assign_number(*v, 1, 16384, config.headless_height)) return invalid("HEADLESS_HEIGHT", *v);
        }
        // Only "1" enables the relay
        if (auto v = env("INPUT_SERVER")) config.input_server = (*v == "1");
        if (auto v = env("INPUT_PORT")) {
            if (!assign_number(*v, 1, 65535, config.input_port)) return invalid("INPUT_PORT", *v);
        }
        if (auto v = env("GAME_PACKAGE")) config.package = *v;
        if (auto v = env("DROIDCAST_INPUT_RELAY")) config.input_relay_path = *v;
        if (auto v = env("DISPLAY")) config.display = *v;

        // ========== Flags ==========

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];

            if (flag == "-h" || flag == "--help") {
                config.show_help = true;
                return config;
            }
            if (flag == "-v" || flag == "--verbose") {
                config.verbose = true;
                continue;
            }
            if (flag == "--no-input") {
                config.input_server = false;
                continue;
            }

            if (i + 1 >= args.size()) {
                return ConfigResult::err(common::ErrorCode::ConfigError,
                    flag.rfind("--", 0) == 0 ? "Missing value for " + flag : "Unknown argument: " + flag);
            }
            const std::string& value = args[i + 1];

            if (flag == "--host") {
                config.receiver_host = value;
            } else if (flag == "--port") {
                if (!assign_number(value, 1, 65535, config.receiver_port)) return invalid("--port", value);
            } else if (flag == "--method") {
                config.method = value;
            } else if (flag == "--framerate") {
                if (!assign_number(value, 1, 240, config.framerate)) return invalid("--framerate", value);
            } else if (flag == "--bitrate") {
                if (!assign_number(value, 1, 1000000, config.bitrate_kbps)) return invalid("--bitrate", value);
            } else if (flag == "--size") {
                if (!parse_size(value, config.headless_width, config.headless_height)) return invalid("--size", value);
            } else if (flag == "--input-port") {
                if (!assign_number(value, 1, 65535, config.input_port)) return invalid("--input-port", value);
            } else if (flag == "--package") {
                config.package = value;
            } else {
                return ConfigResult::err(common::ErrorCode::ConfigError, "Unknown argument: " + flag);
            }
            ++i;
        }

        if (config.receiver_host.empty()) {
            return ConfigResult::err(common::ErrorCode::ConfigError, "Receiver host must not be empty");
        }

        return config;
    }

    std::string usage(const std::string& program) {
        std::ostringstream text;
        text << "Usage: " << program << " [options]\n"
             << "\n"
             << "Captures the Waydroid display and streams it as H.264/MPEG-TS over TCP.\n"
             << "\n"
             << "Options (environment variable in brackets):\n"
             << "  --method NAME       headless | portal | x11 | test       [CAPTURE_METHOD] (portal)\n"
             << "  --host HOST         receiver address                     [STREAM_HOST] (192.168.86.29)\n"
             << "  --port PORT         receiver TCP port                    [STREAM_PORT] (9000)\n"
             << "  --framerate FPS                                          [FRAMERATE] (30)\n"
             << "  --bitrate KBPS                                           [BITRATE] (4000)\n"
             << "  --size WxH          headless compositor output size      [HEADLESS_WIDTH/HEIGHT] (1280x720)\n"
             << "  --package PKG       Android package to launch            [GAME_PACKAGE]\n"
             << "  --input-port PORT   UDP port of the input relay          [INPUT_PORT] (9001)\n"
             << "  --no-input          do not start the input relay         [INPUT_SERVER=0]\n"
             << "  -v, --verbose       debug logging\n"
             << "  -h, --help          show this help\n";
        return text.str();
    }

} // namespace core
