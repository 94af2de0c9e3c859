/**
 * @file CommandLine.cpp
 * @brief Implementation of CommandLine.
 */
#include "app/CommandLine.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace discarchiver::app {

using infrastructure::ConfigLoader;

CommandLineOptions CommandLine::Parse(int argc, const char* const* argv) {
    CommandLineOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Accept both "--flag value" and "--flag=value".
        std::string inlineValue;
        bool hasInline = false;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            hasInline = true;
        }

        auto takeValue = [&](std::string& out) -> bool {
            if (hasInline) {
                out = inlineValue;
                return true;
            }
            if (i + 1 >= argc) {
                opts.error = "Missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.version = true;
        } else if (arg == "--dry-run") {
            opts.overrides["dry_run"] = true;
        } else if (arg == "--use-links") {
            opts.overrides["use_links"] = true;
        } else if (arg == "--plan") {
            opts.plan = true;
        } else if (arg == "--backup-dir") {
            if (!takeValue(value)) break;
            opts.overrides["backup_dir"] = value;
        } else if (arg == "--state-file") {
            if (!takeValue(value)) break;
            opts.overrides["state_file"] = value;
        } else if (arg == "--assets-json") {
            if (!takeValue(value)) break;
            opts.overrides["assets_json"] = value;
        } else if (arg == "--config") {
            if (!takeValue(value)) break;
            opts.configPath = value;
        } else if (arg == "--select") {
            if (!takeValue(value)) break;
            opts.select = value;
        } else if (arg == "--capacity") {
            if (!takeValue(value)) break;
            auto parsed = ConfigLoader::ParseUnsigned(value);
            if (!parsed || *parsed == 0) {
                opts.error = "Invalid --capacity '" + value + "': expected a positive number of bytes";
                break;
            }
            opts.overrides["capacity"] = *parsed;
        } else if (arg == "--threads") {
            if (!takeValue(value)) break;
            auto parsed = ConfigLoader::ParseUnsigned(value);
            if (!parsed || *parsed == 0 || *parsed > 1024) {
                opts.error = "Invalid --threads '" + value + "': expected 1-1024";
                break;
            }
            opts.overrides["threads"] = static_cast<int>(*parsed);
        } else {
            opts.error = "Unknown argument: " + arg;
            break;
        }
    }

    return opts;
}

void CommandLine::PrintUsage(std::ostream& out) {
    out << "Usage: discarchiver [options]\n"
        << "\n"
        << "Packs the Immich library into DVD-sized chunks and writes one ISO image per chunk.\n"
        << "\n"
        << "Options:\n"
        << "  --backup-dir <dir>     Directory for staging folders and ISO images (default: ./immich_backups)\n"
        << "  --state-file <file>    Progress state file (default: ./immich_backup_state.json)\n"
        << "  --capacity <bytes>     Disc capacity in bytes (default: 4700000000)\n"
        << "  --threads <n>          Parallel copy threads (default: 4)\n"
        << "  --dry-run              Do not copy files or create ISOs\n"
        << "  --use-links            Use hard links instead of copying when possible\n"
        << "  --assets-json <file>   Read the asset list from an exported JSON file\n"
        << "  --config <file>        Config file (default: ./discarchiver.json, then\n"
        << "                         $XDG_CONFIG_HOME/discarchiver/discarchiver.json)\n"
        << "  --select <choice>      Answer the menu non-interactively: all, resume, <n> or q\n"
        << "  --plan                 Print the packing summary and exit\n"
        << "  -h, --help             Show this help\n"
        << "  -v, --version          Show the version\n"
        << "\n"
        << "Priority: command line > environment (DISCARCHIVER_*) > config file > defaults.\n";
}

} // namespace discarchiver::app
