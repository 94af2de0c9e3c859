/**
 * @file DiscArchiverApp.hpp
 * @brief Main application class for DiscArchiver.
 */

#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "app/CommandLine.hpp"
#include "domain/AssetSource.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace discarchiver::app {

/**
 * @class DiscArchiverApp
 * @brief Composition root: resolves settings, wires the services and runs one archival session.
 *
 * Exit codes: 0 completed, 1 invalid arguments/selection or inventory failure,
 * 2 completed but at least one chunk was not archived, 130 cancelled.
 */
class DiscArchiverApp {
public:
    DiscArchiverApp(std::istream& in = std::cin, std::ostream& out = std::cout);

    /**
     * @brief Runs the session described by the command line.
     * @return Process exit code.
     */
    int Run(int argc, const char* const* argv);

private:
    /** @brief Defaults < config file < environment < command line. */
    bool ResolveSettings(const CommandLineOptions& options, infrastructure::Settings& settings);

    std::unique_ptr<domain::AssetSource> MakeAssetSource(const infrastructure::Settings& settings) const;

    /** @brief Reads the menu answer from --select or the input stream. */
    std::string ReadChoice(const std::string& preset);

    std::istream& m_in;
    std::ostream& m_out;
};

} // namespace discarchiver::app
