/**
 * @file ProgressState.hpp
 * @brief Resumption record for the archival run.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace discarchiver::domain {

struct ProgressState {
    std::optional<std::string> lastAssetId;
    int currentChunk = 1;               ///< Chunk last worked on, or the first one not archived yet.
    std::uint64_t currentChunkSize = 0;
    std::set<int> archivedChunks;       ///< Ordinals whose archive image was written.

    /** @brief True if the chunk's archive was written in an earlier session. */
    bool isArchived(int ordinal) const { return archivedChunks.count(ordinal) > 0; }

    bool operator==(const ProgressState& other) const {
        return lastAssetId == other.lastAssetId &&
               currentChunk == other.currentChunk &&
               currentChunkSize == other.currentChunkSize &&
               archivedChunks == other.archivedChunks;
    }
    bool operator!=(const ProgressState& other) const { return !(*this == other); }
};

} // namespace discarchiver::domain
