/**
 * @file BackupOrchestrator.hpp
 * @brief Sequences materialization, archiving and cleanup for each selected chunk.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>
#include "application/ArchiveBuilder.hpp"
#include "application/Materializer.hpp"
#include "domain/Chunk.hpp"
#include "infrastructure/ProgressTracker.hpp"

namespace discarchiver::application {

struct OrchestratorOptions {
    std::filesystem::path backupDir;
    std::string archivePrefix = "immich_backup";
    MaterializeOptions materialize;
};

/**
 * @struct ChunkOutcome
 * @brief What happened to one chunk.
 */
struct ChunkOutcome {
    int ordinal = 0;
    size_t placed = 0;
    size_t failed = 0;
    std::vector<std::string> failedAssetIds;
    bool stagingFailed = false; ///< Staging directory could not be created; nothing was attempted.
    bool archived = false;
    bool cleanedUp = false;
    bool cancelled = false;
    bool dryRun = false;
};

struct RunSummary {
    std::vector<ChunkOutcome> chunks;

    size_t totalPlaced() const;
    size_t totalFailed() const;
    /** @brief True if every attempted chunk was archived (or, in a dry run, fully resolved). */
    bool allSucceeded() const;
};

/**
 * @class BackupOrchestrator
 * @brief Processes chunks strictly one after another.
 *
 * Only one chunk's staging directory exists at a time. The staging
 * directory is deleted only after its archive was built successfully.
 */
class BackupOrchestrator {
public:
    BackupOrchestrator(Materializer& materializer,
                       ArchiveBuilder& archiveBuilder,
                       infrastructure::ProgressTracker& tracker,
                       const std::atomic<bool>& cancelled,
                       OrchestratorOptions options);

    RunSummary process(const std::vector<domain::Chunk>& chunks);

    ChunkOutcome processChunk(const domain::Chunk& chunk);

    std::filesystem::path stagingDirFor(const domain::Chunk& chunk) const;
    std::filesystem::path archivePathFor(const domain::Chunk& chunk) const;

private:
    Materializer& m_materializer;
    ArchiveBuilder& m_archiveBuilder;
    infrastructure::ProgressTracker& m_tracker;
    const std::atomic<bool>& m_cancelled;
    OrchestratorOptions m_options;
};

} // namespace discarchiver::application
