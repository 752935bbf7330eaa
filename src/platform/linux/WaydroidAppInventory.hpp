#pragma once

#include "interfaces/IAppInventory.hpp"
#include "interfaces/ICommandRunner.hpp"

namespace platform {
namespace linux_os {

    // `waydroid app list`: blocks of "Name: ..." / "packageName: ..." lines
    class WaydroidAppInventory : public interfaces::IAppInventory {
    public:
        explicit WaydroidAppInventory(interfaces::ICommandRunner& runner);
        virtual ~WaydroidAppInventory() = default;

        std::vector<interfaces::AppRecord> list_apps() override;

    private:
        interfaces::ICommandRunner& runner_;
    };

    std::vector<interfaces::AppRecord> parse_waydroid_app_list(const std::string& text);

} // namespace linux_os
} // namespace platform
