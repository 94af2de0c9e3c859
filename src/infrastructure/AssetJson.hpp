/**
 * @file AssetJson.hpp
 * @brief Validation of raw inventory JSON into strongly typed AssetRecords.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/AssetRecord.hpp"

namespace discarchiver::infrastructure {

class AssetJson {
public:
    /**
     * @brief Parses a JSON array of inventory rows.
     *
     * Each row carries id, originalPath, originalFileName, fileCreatedAt and
     * fileSizeInByte. Blank text or a JSON null yields an empty list.
     *
     * @throws domain::AssetSourceError if the text is not valid JSON or a row is malformed.
     */
    static std::vector<domain::AssetRecord> ParseArray(const std::string& text);

    /** @brief Logs a warning for every record that breaks createdAt ordering. Returns the count. */
    static size_t WarnOnOrdering(const std::vector<domain::AssetRecord>& records);
};

} // namespace discarchiver::infrastructure
