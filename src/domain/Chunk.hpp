/**
 * @file Chunk.hpp
 * @brief Domain entity for a capacity-bounded group of assets.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "domain/AssetRecord.hpp"

namespace discarchiver::domain {

/**
 * @struct Chunk
 * @brief One disc worth of assets, sealed by the BinPacker.
 *
 * sizeBytes never exceeds the packing capacity unless the chunk holds a
 * single asset that is larger than the capacity on its own.
 */
struct Chunk {
    int ordinal = 0;                  ///< 1-based, sequential.
    std::vector<AssetRecord> assets;  ///< Members in source order.
    std::uint64_t sizeBytes = 0;      ///< Sum of member sizes.
    std::string startDate;            ///< Date of the first member.
    std::string endDate;              ///< Date of the last member.
};

} // namespace discarchiver::domain
