/**
 * @file BinPacker.hpp
 * @brief Greedy, order-preserving partitioning of assets into disc-sized chunks.
 */

#pragma once
#include <cstdint>
#include <vector>
#include "domain/AssetRecord.hpp"
#include "domain/Chunk.hpp"

namespace discarchiver::application {

/**
 * @class BinPacker
 * @brief Splits an ordered asset stream into sequential chunks of bounded size.
 *
 * Single forward pass with no backtracking and no re-sorting. A chunk is
 * sealed as soon as the next asset would push it over capacity. An asset
 * larger than the capacity is never split or dropped; it ends up alone in
 * its own chunk.
 */
class BinPacker {
public:
    /**
     * @param capacity Maximum cumulative size per chunk, in bytes.
     * @throws std::invalid_argument if capacity is zero.
     */
    explicit BinPacker(std::uint64_t capacity);

    /**
     * @brief Packs the assets, which must already be ordered by creation time.
     * @return Chunks numbered from 1 that together contain every asset exactly once.
     */
    std::vector<domain::Chunk> pack(const std::vector<domain::AssetRecord>& assets) const;

    std::uint64_t capacity() const { return m_capacity; }

private:
    std::uint64_t m_capacity;
};

} // namespace discarchiver::application
