#include "ShellCommandRunner.hpp"
#include <cstdio>
#include <sys/wait.h>

namespace platform {
namespace linux_os {

    ShellCommandRunner::ShellCommandRunner(interfaces::IProcessControl& control)
        : control_(control) {}

    std::string ShellCommandRunner::quote(const std::string& arg) {
        std::string out = "'";
        for (char c : arg) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += "'";
        return out;
    }

    common::Result<interfaces::CommandOutput> ShellCommandRunner::run(const std::vector<std::string>& argv,
                                                                      bool merge_stderr) {
        using OutputResult = common::Result<interfaces::CommandOutput>;
        if (argv.empty()) return OutputResult::err(common::ErrorCode::Unknown, "Empty command");

        std::string cmd;
        for (const auto& arg : argv) {
            if (!cmd.empty()) cmd += ' ';
            cmd += quote(arg);
        }
        cmd += merge_stderr ? " 2>&1" : " 2>/dev/null";

        FILE* fp = popen(cmd.c_str(), "r");
        if (!fp) {
            return OutputResult::err(common::ErrorCode::ExternalToolMissing, "popen failed for " + argv.front());
        }

        interfaces::CommandOutput output;
        char buffer[4096];
        size_t n;
        while ((n = fread(buffer, 1, sizeof(buffer), fp)) > 0) {
            output.output.append(buffer, n);
        }

        int status = pclose(fp);
        if (status == -1) {
            return OutputResult::err(common::ErrorCode::Unknown, "pclose failed for " + argv.front());
        }
        output.exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);

        // sh: command not found
        if (output.exit_status == 127) {
            return OutputResult::err(common::ErrorCode::ExternalToolMissing, argv.front() + " not found");
        }
        return output;
    }

    common::EmptyResult ShellCommandRunner::launch_detached(const std::vector<std::string>& argv) {
        interfaces::SpawnOptions options;
        options.new_session = true;
        options.silence_output = true;

        auto pid = control_.spawn(argv, options);
        if (pid.is_err()) return pid.error();
        return common::EmptyResult::success();
    }

} // namespace linux_os
} // namespace platform
