/**
 * @file CommandRunner.hpp
 * @brief Interface for locating and running external tools.
 */

#pragma once

#include <string>
#include <vector>

namespace discarchiver::domain {

/**
 * @struct CommandResult
 * @brief Outcome of one external process invocation.
 */
struct CommandResult {
    int exitCode = -1;   ///< Process exit status; -1 when the process could not be started.
    std::string output;  ///< Combined stdout/stderr.

    bool succeeded() const { return exitCode == 0; }
};

/**
 * @class CommandRunner
 * @brief Abstract gateway to the host's executables.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /** @brief Returns true if the named tool can be found on the host. */
    virtual bool isAvailable(const std::string& tool) = 0;

    /**
     * @brief Runs a command synchronously.
     * @param argv Program name followed by its arguments (no shell interpretation).
     * @return Exit code and captured output.
     */
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

} // namespace discarchiver::domain
