#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "common/Result.hpp"

namespace core {

    struct RunConfig {
        std::string method = "portal";
        std::string receiver_host = "192.168.86.29";
        uint16_t receiver_port = 9000;
        int framerate = 30;
        int bitrate_kbps = 4000;
        int headless_width = 1280;
        int headless_height = 720;
        bool input_server = true;
        uint16_t input_port = 9001;
        std::string package;            // empty -> app inventory lookup
        std::string input_relay_path;   // empty -> beside our executable
        std::string display = ":0";
        bool verbose = false;
        bool show_help = false;
    };

    using EnvLookup = std::function<std::optional<std::string>(const std::string& key)>;

    // getenv() backed lookup; empty values count as unset
    EnvLookup process_environment();

    // Environment first, then flags (args excludes argv[0]). Values that do
    // not parse or are out of range -> ConfigError. The method name is not
    // validated here; BackendSelector owns that.
    common::Result<RunConfig> load_config(const EnvLookup& env, const std::vector<std::string>& args);

    std::string usage(const std::string& program);

    // Strict decimal parse: the whole string must be a number in [min, max]
    std::optional<long> parse_number(const std::string& text, long min, long max);

} // namespace core
