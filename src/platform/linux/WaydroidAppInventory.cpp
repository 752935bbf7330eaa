#include "WaydroidAppInventory.hpp"
#include <sstream>

namespace platform {
namespace linux_os {

    namespace {
        std::string trim(const std::string& s) {
            auto begin = s.find_first_not_of(" \t\r");
            if (begin == std::string::npos) return {};
            auto end = s.find_last_not_of(" \t\r");
            return s.substr(begin, end - begin + 1);
        }
    }

    WaydroidAppInventory::WaydroidAppInventory(interfaces::ICommandRunner& runner)
        : runner_(runner) {}

    std::vector<interfaces::AppRecord> WaydroidAppInventory::list_apps() {
        auto out = runner_.run({"waydroid", "app", "list"});
        if (out.is_err()) return {};
        return parse_waydroid_app_list(out.unwrap().output);
    }

    std::vector<interfaces::AppRecord> parse_waydroid_app_list(const std::string& text) {
        std::vector<interfaces::AppRecord> apps;
        interfaces::AppRecord current;

        auto flush = [&]() {
            if (!current.name.empty() || !current.package.empty()) apps.push_back(current);
            current = interfaces::AppRecord{};
        };

        std::istringstream lines(text);
        std::string line;
        while (std::getline(lines, line)) {
            line = trim(line);
            if (line.empty()) continue;

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string key = trim(line.substr(0, colon));
            std::string val = trim(line.substr(colon + 1));

            if (key == "Name") {
                // A new block starts with its Name line
                flush();
                current.name = val;
            }
            else if (key == "packageName") {
                current.package = val;
            }
        }
        flush();
        return apps;
    }

} // namespace linux_os
} // namespace platform
