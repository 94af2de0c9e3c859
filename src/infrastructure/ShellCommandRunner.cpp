#include "infrastructure/ShellCommandRunner.hpp"

#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace discarchiver::infrastructure {

bool ShellCommandRunner::isAvailable(const std::string& tool) {
    std::string cmd = "command -v " + Quote(tool) + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

domain::CommandResult ShellCommandRunner::run(const std::vector<std::string>& argv) {
    domain::CommandResult result;
    if (argv.empty()) {
        result.output = "empty command";
        return result;
    }

    std::string cmd = BuildCommandLine(argv) + " 2>&1";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.output = "popen failed to start command";
        return result;
    }

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        // Killed by a signal.
        result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

std::string ShellCommandRunner::Quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string ShellCommandRunner::BuildCommandLine(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += Quote(arg);
    }
    return cmd;
}

} // namespace discarchiver::infrastructure
