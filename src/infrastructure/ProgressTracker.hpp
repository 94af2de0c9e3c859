/**
 * @file ProgressTracker.hpp
 * @brief Lock-guarded, persisted record of archival progress.
 */

#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include "domain/Chunk.hpp"
#include "domain/ProgressState.hpp"

namespace discarchiver::infrastructure {

/**
 * @class ProgressTracker
 * @brief Owns the ProgressState and persists it on every mutation.
 *
 * Updates may arrive from several materialization workers at once. Each
 * update replaces the state and writes it to disk inside one critical
 * section, so no write is lost; the last caller to enter wins.
 */
class ProgressTracker {
public:
    explicit ProgressTracker(const std::string& stateFile);

    /**
     * @brief Loads the persisted state.
     *
     * A missing file yields defaults. An unreadable or corrupt file yields
     * defaults and a warning; the run is never aborted.
     */
    void load();

    /** @brief Writes the current state to disk. Returns false on failure (already logged). */
    bool save();

    /**
     * @brief Replaces the state and persists it immediately.
     * @param assetId Identifier of the asset that was just placed.
     * @param size Size of that asset (informational).
     * @param chunkOrdinal Chunk being materialized.
     * @param chunkAccumSize Bytes placed so far in that chunk.
     */
    void update(const std::string& assetId, std::uint64_t size, int chunkOrdinal, std::uint64_t chunkAccumSize);

    /**
     * @brief Records a fully archived chunk.
     *
     * The cursor moves to the lowest ordinal that has no archive yet, so
     * archiving chunks out of order never hides an earlier one.
     */
    void markChunkArchived(const domain::Chunk& chunk);

    /** @brief Snapshot of the current state. */
    domain::ProgressState state() const;

    const std::string& stateFile() const { return m_stateFile; }

private:
    bool persistLocked();

    std::string m_stateFile;
    domain::ProgressState m_state;
    mutable std::mutex m_mutex;
};

} // namespace discarchiver::infrastructure
