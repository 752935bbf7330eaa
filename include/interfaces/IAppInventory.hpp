#pragma once
#include <string>
#include <vector>

namespace interfaces {

    struct AppRecord {
        std::string name;    // Display name (e.g., "Empires & Puzzles")
        std::string package; // Android package (e.g., "com.smallgiantgames.empires")
    };

    // Applications installed in the Android session
    class IAppInventory {
    public:
        virtual ~IAppInventory() = default;

        // Empty when the inventory cannot be read
        virtual std::vector<AppRecord> list_apps() = 0;
    };

} // namespace interfaces
