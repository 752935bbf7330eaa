#pragma once

#include "interfaces/IStreamRegistry.hpp"
#include "interfaces/ICommandRunner.hpp"

namespace platform {
namespace linux_os {

    // `pw-dump` stdout, parsed later by core::find_video_node().
    // PipeWire warnings go to stderr and would corrupt the JSON.
    class PipeWireDumpRegistry : public interfaces::IStreamRegistry {
    public:
        explicit PipeWireDumpRegistry(interfaces::ICommandRunner& runner) : runner_(runner) {}

        common::Result<std::string> dump() override {
            auto out = runner_.run({"pw-dump"}, /*merge_stderr=*/false);
            if (out.is_err()) return out.error();
            if (out.unwrap().exit_status != 0) {
                return common::Result<std::string>::err(common::ErrorCode::Unknown,
                    "pw-dump exited with " + std::to_string(out.unwrap().exit_status));
            }
            return out.unwrap().output;
        }

    private:
        interfaces::ICommandRunner& runner_;
    };

} // namespace linux_os
} // namespace platform
