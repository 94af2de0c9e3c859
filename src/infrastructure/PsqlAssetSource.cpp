/**
 * @file PsqlAssetSource.cpp
 * @brief Implementation of the inventory adapters.
 */

#include "infrastructure/PsqlAssetSource.hpp"
#include "infrastructure/AssetJson.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace discarchiver::infrastructure {

const char* PsqlAssetSource::kInventoryQuery =
    "SELECT json_agg(t) FROM ("
    "SELECT a.id, a.\"originalPath\", a.\"originalFileName\", a.\"fileCreatedAt\", e.\"fileSizeInByte\" "
    "FROM asset a JOIN asset_exif e ON a.id = e.\"assetId\" "
    "ORDER BY a.\"fileCreatedAt\" ASC"
    ") t;";

PsqlAssetSource::PsqlAssetSource(std::shared_ptr<domain::CommandRunner> runner,
                                 const std::string& container,
                                 const std::string& user,
                                 const std::string& database)
    : m_runner(std::move(runner))
    , m_container(container)
    , m_user(user)
    , m_database(database)
{}

std::vector<std::string> PsqlAssetSource::buildCommand() const {
    return {"docker", "exec", m_container,
            "psql", "-U", m_user, "-d", m_database, "-t", "-A",
            "-c", kInventoryQuery};
}

std::vector<domain::AssetRecord> PsqlAssetSource::fetchAssets() {
    std::cout << "[AssetSource] Fetching asset list from database..." << std::endl;

    auto result = m_runner->run(buildCommand());
    if (!result.succeeded()) {
        std::cerr << "[AssetSource] Error running inventory query in container " << m_container
                  << " (exit " << result.exitCode << ")" << std::endl;
        std::cerr << "[AssetSource] Output: " << result.output << std::endl;
        throw domain::AssetSourceError("Inventory query failed with exit code " + std::to_string(result.exitCode));
    }

    auto records = AssetJson::ParseArray(result.output);
    AssetJson::WarnOnOrdering(records);
    return records;
}

JsonFileAssetSource::JsonFileAssetSource(const std::string& path) : m_path(path) {}

std::vector<domain::AssetRecord> JsonFileAssetSource::fetchAssets() {
    std::cout << "[AssetSource] Reading asset list from " << m_path << "..." << std::endl;

    std::ifstream f(m_path);
    if (!f.is_open()) {
        throw domain::AssetSourceError("Cannot open inventory file: " + m_path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    auto records = AssetJson::ParseArray(buffer.str());
    AssetJson::WarnOnOrdering(records);
    return records;
}

} // namespace discarchiver::infrastructure
