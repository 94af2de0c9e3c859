/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <vector>

namespace discarchiver::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void AssignString(const json& value, const std::string& key, std::string& target) {
    if (!value.is_string()) {
        throw ConfigError("Setting '" + key + "' must be a string");
    }
    target = value.get<std::string>();
}

void AssignBool(const json& value, const std::string& key, bool& target) {
    if (!value.is_boolean()) {
        throw ConfigError("Setting '" + key + "' must be true or false");
    }
    target = value.get<bool>();
}

void AssignInt(const json& value, const std::string& key, int& target) {
    if (!value.is_number_integer() || value.get<std::int64_t>() < 1 ||
        value.get<std::int64_t>() > std::numeric_limits<int>::max()) {
        throw ConfigError("Setting '" + key + "' must be a positive integer");
    }
    target = static_cast<int>(value.get<std::int64_t>());
}

void AssignCapacity(const json& value, const std::string& key, std::uint64_t& target) {
    if (value.is_number_unsigned()) {
        target = value.get<std::uint64_t>();
    } else if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        target = static_cast<std::uint64_t>(value.get<std::int64_t>());
    } else {
        throw ConfigError("Setting '" + key + "' must be a non-negative integer (bytes)");
    }
}

} // namespace

std::optional<fs::path> ConfigLoader::FindConfigFile(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        return fs::path(explicitPath);
    }

    const std::vector<fs::path> candidates = {
        fs::current_path() / kConfigFilename,
        PathUtils::GetConfigHome() / "discarchiver" / kConfigFilename,
    };
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool ConfigLoader::ApplyFile(const fs::path& path, Settings& settings) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Warning: cannot open config file " << path.string() << std::endl;
        return false;
    }

    Settings candidate = settings;
    try {
        json j = json::parse(f);
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] Warning: " << path.string() << " is not a JSON object; ignoring it." << std::endl;
            return false;
        }
        ApplyJson(j, candidate);
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Warning: error reading " << path.string() << ": " << e.what() << std::endl;
        return false;
    } catch (const ConfigError& e) {
        std::cerr << "[ConfigLoader] Warning: " << path.string() << ": " << e.what() << std::endl;
        return false;
    }

    settings = candidate;
    std::cout << "[ConfigLoader] Loaded config from " << path.string() << std::endl;
    return true;
}

void ConfigLoader::ApplyEnvironment(Settings& settings) {
    auto get = [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value && *value) return std::string(value);
        return std::nullopt;
    };

    if (auto v = get("DISCARCHIVER_BACKUP_DIR")) settings.backupDir = *v;
    if (auto v = get("DISCARCHIVER_STATE_FILE")) settings.stateFile = *v;
    if (auto v = get("DISCARCHIVER_POSTGRES_CONTAINER")) settings.postgresContainer = *v;
    if (auto v = get("DISCARCHIVER_HOST_UPLOAD_PATH")) settings.hostUploadPath = *v;

    if (auto v = get("DISCARCHIVER_CAPACITY")) {
        if (auto parsed = ParseUnsigned(*v)) {
            settings.capacity = *parsed;
        } else {
            std::cerr << "[ConfigLoader] Warning: ignoring invalid DISCARCHIVER_CAPACITY='" << *v << "'" << std::endl;
        }
    }
    if (auto v = get("DISCARCHIVER_THREADS")) {
        auto parsed = ParseUnsigned(*v);
        if (parsed && *parsed >= 1 && *parsed <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            settings.threads = static_cast<int>(*parsed);
        } else {
            std::cerr << "[ConfigLoader] Warning: ignoring invalid DISCARCHIVER_THREADS='" << *v << "'" << std::endl;
        }
    }
}

void ConfigLoader::ApplyJson(const json& overrides, Settings& settings) {
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "backup_dir") AssignString(value, key, settings.backupDir);
        else if (key == "state_file") AssignString(value, key, settings.stateFile);
        else if (key == "capacity") AssignCapacity(value, key, settings.capacity);
        else if (key == "dry_run") AssignBool(value, key, settings.dryRun);
        else if (key == "use_links") AssignBool(value, key, settings.useLinks);
        else if (key == "threads") AssignInt(value, key, settings.threads);
        else if (key == "progress_interval") AssignInt(value, key, settings.progressInterval);
        else if (key == "container_upload_path") AssignString(value, key, settings.containerUploadPath);
        else if (key == "host_upload_path") AssignString(value, key, settings.hostUploadPath);
        else if (key == "postgres_container") AssignString(value, key, settings.postgresContainer);
        else if (key == "postgres_user") AssignString(value, key, settings.postgresUser);
        else if (key == "postgres_database") AssignString(value, key, settings.postgresDatabase);
        else if (key == "archive_prefix") AssignString(value, key, settings.archivePrefix);
        else if (key == "assets_json") AssignString(value, key, settings.assetsJson);
        else {
            std::cerr << "[ConfigLoader] Warning: unknown setting '" << key << "'" << std::endl;
        }
    }
}

std::optional<std::string> ConfigLoader::Validate(const Settings& settings) {
    if (settings.capacity == 0) {
        return std::string("capacity must be greater than zero");
    }
    if (settings.threads < 1) {
        return std::string("threads must be at least 1");
    }
    if (settings.progressInterval < 1) {
        return std::string("progress_interval must be at least 1");
    }
    if (settings.backupDir.empty()) {
        return std::string("backup_dir must not be empty");
    }
    if (settings.stateFile.empty()) {
        return std::string("state_file must not be empty");
    }
    return std::nullopt;
}

std::optional<std::uint64_t> ConfigLoader::ParseUnsigned(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace discarchiver::infrastructure
