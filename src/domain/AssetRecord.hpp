/**
 * @file AssetRecord.hpp
 * @brief Domain value object describing one media item of the inventory.
 */

#pragma once
#include <cstdint>
#include <string>

namespace discarchiver::domain {

/**
 * @struct AssetRecord
 * @brief Immutable description of a media asset as reported by the asset source.
 *
 * Records are produced once at the source boundary and consumed read-only.
 * The source yields them ordered by createdAt (ascending).
 */
struct AssetRecord {
    std::string id;            ///< Opaque unique identifier.
    std::string sourcePath;    ///< Location of the backing file in the foreign namespace.
    std::string displayName;   ///< Name used for the materialized file.
    std::string createdAt;     ///< ISO-8601 creation timestamp.
    std::uint64_t sizeBytes = 0; ///< Absent sizes are stored as zero.

    /** @brief Date part (YYYY-MM-DD) of the creation timestamp. */
    std::string createdDate() const {
        auto pos = createdAt.find('T');
        return pos == std::string::npos ? createdAt : createdAt.substr(0, pos);
    }
};

} // namespace discarchiver::domain
