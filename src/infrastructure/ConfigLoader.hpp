/**
 * @file ConfigLoader.hpp
 * @brief Resolution of run settings from defaults, a JSON config file, the environment
 *        and command-line overrides.
 *
 * Priority: command line > environment > config file > defaults.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace discarchiver::infrastructure {

/**
 * @struct Settings
 * @brief Every tunable of an archival run.
 */
struct Settings {
    std::string backupDir = "./immich_backups";
    std::string stateFile = "./immich_backup_state.json";
    std::uint64_t capacity = 4700000000ULL; ///< Single-layer DVD-R, decimal gigabytes.
    bool dryRun = false;
    bool useLinks = false;
    int threads = 4;
    int progressInterval = 100;
    std::string containerUploadPath = "/usr/src/app/upload";
    std::string hostUploadPath = "/mnt/backup/immich-app/library";
    std::string postgresContainer = "immich_postgres";
    std::string postgresUser = "postgres";
    std::string postgresDatabase = "immich";
    std::string archivePrefix = "immich_backup";
    std::string assetsJson; ///< When set, the inventory is read from this file instead of the database.
};

/**
 * @class ConfigError
 * @brief A setting has the wrong type or an out-of-range value.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class ConfigLoader {
public:
    /** @brief File name searched in the working directory and the config home. */
    static constexpr const char* kConfigFilename = "discarchiver.json";

    /**
     * @brief Locates the config file.
     * @param explicitPath Path given with --config; returned as-is when non-empty.
     * @return The first existing candidate, or nullopt.
     */
    static std::optional<std::filesystem::path> FindConfigFile(const std::string& explicitPath);

    /**
     * @brief Applies a JSON config file on top of settings.
     *
     * Read or parse errors are reported as warnings and leave settings untouched.
     * @return True if the file was applied.
     */
    static bool ApplyFile(const std::filesystem::path& path, Settings& settings);

    /** @brief Applies DISCARCHIVER_* environment variables. Invalid values are warned about and skipped. */
    static void ApplyEnvironment(Settings& settings);

    /**
     * @brief Applies a JSON object of snake_case keys on top of settings.
     * @throws ConfigError on a type mismatch. Unknown keys only produce a warning.
     */
    static void ApplyJson(const nlohmann::json& overrides, Settings& settings);

    /** @brief Checks cross-field constraints. Returns an error message, or nullopt when valid. */
    static std::optional<std::string> Validate(const Settings& settings);

    /** @brief Parses a base-10 unsigned integer; rejects signs, blanks and trailing garbage. */
    static std::optional<std::uint64_t> ParseUnsigned(const std::string& text);
};

} // namespace discarchiver::infrastructure
