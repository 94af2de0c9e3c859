/**
 * @file BinPacker.cpp
 * @brief Implementation of the BinPacker class.
 */
#include "application/BinPacker.hpp"
#include <stdexcept>

namespace discarchiver::application {

namespace {

void Seal(domain::Chunk& acc, std::vector<domain::Chunk>& out) {
    acc.ordinal = static_cast<int>(out.size()) + 1;
    acc.startDate = acc.assets.front().createdDate();
    acc.endDate = acc.assets.back().createdDate();
    out.push_back(std::move(acc));
    acc = domain::Chunk{};
}

} // namespace

BinPacker::BinPacker(std::uint64_t capacity) : m_capacity(capacity) {
    if (m_capacity == 0) {
        throw std::invalid_argument("BinPacker capacity must be greater than zero");
    }
}

std::vector<domain::Chunk> BinPacker::pack(const std::vector<domain::AssetRecord>& assets) const {
    std::vector<domain::Chunk> chunks;
    domain::Chunk acc;

    for (const auto& asset : assets) {
        bool overflows = acc.sizeBytes > m_capacity || asset.sizeBytes > m_capacity - acc.sizeBytes;
        if (!acc.assets.empty() && overflows) {
            Seal(acc, chunks);
        }
        acc.assets.push_back(asset);
        acc.sizeBytes += asset.sizeBytes;
    }

    if (!acc.assets.empty()) {
        Seal(acc, chunks);
    }
    return chunks;
}

} // namespace discarchiver::application
