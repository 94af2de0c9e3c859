/**
 * @file AssetSource.hpp
 * @brief Interface for the asset inventory.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/AssetRecord.hpp"

namespace discarchiver::domain {

/**
 * @class AssetSourceError
 * @brief Raised when the inventory cannot be queried or returns malformed records.
 *
 * This is the only failure that aborts a run.
 */
class AssetSourceError : public std::runtime_error {
public:
    explicit AssetSourceError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class AssetSource
 * @brief Abstract provider of asset records ordered by creation timestamp (ascending).
 */
class AssetSource {
public:
    virtual ~AssetSource() = default;

    /**
     * @brief Fetches the complete ordered inventory.
     * @return Records ordered by createdAt; empty when the inventory is empty.
     * @throws AssetSourceError on query or validation failure.
     */
    virtual std::vector<AssetRecord> fetchAssets() = 0;
};

} // namespace discarchiver::domain
