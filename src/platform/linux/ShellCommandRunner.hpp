#pragma once

#include "interfaces/ICommandRunner.hpp"
#include "interfaces/IProcessControl.hpp"

namespace platform {
namespace linux_os {

    // popen() for captured commands, IProcessControl for detached ones
    class ShellCommandRunner : public interfaces::ICommandRunner {
    public:
        explicit ShellCommandRunner(interfaces::IProcessControl& control);
        virtual ~ShellCommandRunner() = default;

        common::Result<interfaces::CommandOutput> run(const std::vector<std::string>& argv,
                                                      bool merge_stderr = true) override;
        common::EmptyResult launch_detached(const std::vector<std::string>& argv) override;

        // Single-quoted for /bin/sh
        static std::string quote(const std::string& arg);

    private:
        interfaces::IProcessControl& control_;
    };

} // namespace linux_os
} // namespace platform
