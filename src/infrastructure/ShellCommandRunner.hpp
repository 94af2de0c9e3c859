/**
 * @file ShellCommandRunner.hpp
 * @brief CommandRunner backed by the POSIX shell.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/CommandRunner.hpp"

namespace discarchiver::infrastructure {

class ShellCommandRunner : public domain::CommandRunner {
public:
    ShellCommandRunner() = default;
    ~ShellCommandRunner() override = default;

    bool isAvailable(const std::string& tool) override;
    domain::CommandResult run(const std::vector<std::string>& argv) override;

    /** @brief Quotes one argument for /bin/sh (single quotes, embedded quotes escaped). */
    static std::string Quote(const std::string& arg);

    /** @brief Joins argv into a shell command line with every element quoted. */
    static std::string BuildCommandLine(const std::vector<std::string>& argv);
};

} // namespace discarchiver::infrastructure
