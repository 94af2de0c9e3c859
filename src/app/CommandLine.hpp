/**
 * @file CommandLine.hpp
 * @brief Parsing of the discarchiver command line.
 */

#pragma once

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace discarchiver::app {

/**
 * @struct CommandLineOptions
 * @brief Parsed arguments.
 *
 * Setting overrides are collected as a JSON object with the same keys as the
 * config file, so they can be applied last with ConfigLoader::ApplyJson.
 */
struct CommandLineOptions {
    nlohmann::json overrides = nlohmann::json::object();
    std::string configPath; ///< --config; empty means search the default locations.
    std::string select;     ///< --select; empty means prompt interactively.
    bool plan = false;
    bool help = false;
    bool version = false;
    std::string error;      ///< Non-empty if the arguments were invalid.
};

class CommandLine {
public:
    static CommandLineOptions Parse(int argc, const char* const* argv);
    static void PrintUsage(std::ostream& out);
};

} // namespace discarchiver::app
