/**
 * @file PsqlAssetSource.hpp
 * @brief Asset inventory read from the Immich Postgres database through `docker exec psql`.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/AssetSource.hpp"
#include "domain/CommandRunner.hpp"

namespace discarchiver::infrastructure {

class PsqlAssetSource : public domain::AssetSource {
public:
    PsqlAssetSource(std::shared_ptr<domain::CommandRunner> runner,
                    const std::string& container,
                    const std::string& user,
                    const std::string& database);
    ~PsqlAssetSource() override = default;

    std::vector<domain::AssetRecord> fetchAssets() override;

    /** @brief The full command line handed to the runner. */
    std::vector<std::string> buildCommand() const;

    /** @brief Query returning one JSON array of rows ordered by creation time. */
    static const char* kInventoryQuery;

private:
    std::shared_ptr<domain::CommandRunner> m_runner;
    std::string m_container;
    std::string m_user;
    std::string m_database;
};

/**
 * @class JsonFileAssetSource
 * @brief Reads a previously exported inventory (same JSON shape as the database query).
 */
class JsonFileAssetSource : public domain::AssetSource {
public:
    explicit JsonFileAssetSource(const std::string& path);
    ~JsonFileAssetSource() override = default;

    std::vector<domain::AssetRecord> fetchAssets() override;

private:
    std::string m_path;
};

} // namespace discarchiver::infrastructure
