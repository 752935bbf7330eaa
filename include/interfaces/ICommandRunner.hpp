#pragma once
#include <string>
#include <vector>
#include "common/Result.hpp"

namespace interfaces {

    struct CommandOutput {
        int exit_status = 0;
        std::string output; // stdout, plus stderr when merged
    };

    // Short-lived external commands (waydroid, pw-dump) whose output we parse.
    class ICommandRunner {
    public:
        virtual ~ICommandRunner() = default;

        // Runs to completion and captures output. Fails only if the command
        // could not be started at all. With merge_stderr false, stderr is
        // discarded so that machine-readable output stays parseable.
        virtual common::Result<CommandOutput> run(const std::vector<std::string>& argv,
                                                  bool merge_stderr = true) = 0;

        // Fire-and-forget: started in its own session and never awaited.
        virtual common::EmptyResult launch_detached(const std::vector<std::string>& argv) = 0;
    };

} // namespace interfaces
