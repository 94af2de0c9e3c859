/**
 * @file BackupOrchestrator.cpp
 * @brief Implementation of BackupOrchestrator.
 */
#include "application/BackupOrchestrator.hpp"
#include "application/ChunkMenu.hpp"
#include <iostream>
#include <system_error>

namespace discarchiver::application {

namespace fs = std::filesystem;

size_t RunSummary::totalPlaced() const {
    size_t n = 0;
    for (const auto& c : chunks) n += c.placed;
    return n;
}

size_t RunSummary::totalFailed() const {
    size_t n = 0;
    for (const auto& c : chunks) n += c.failed;
    return n;
}

bool RunSummary::allSucceeded() const {
    for (const auto& c : chunks) {
        if (c.cancelled || c.stagingFailed || c.failed > 0) return false;
        if (!c.dryRun && !c.archived) return false;
    }
    return true;
}

BackupOrchestrator::BackupOrchestrator(Materializer& materializer,
                                       ArchiveBuilder& archiveBuilder,
                                       infrastructure::ProgressTracker& tracker,
                                       const std::atomic<bool>& cancelled,
                                       OrchestratorOptions options)
    : m_materializer(materializer)
    , m_archiveBuilder(archiveBuilder)
    , m_tracker(tracker)
    , m_cancelled(cancelled)
    , m_options(std::move(options))
{}

fs::path BackupOrchestrator::stagingDirFor(const domain::Chunk& chunk) const {
    return m_options.backupDir / ("DVD_" + std::to_string(chunk.ordinal));
}

fs::path BackupOrchestrator::archivePathFor(const domain::Chunk& chunk) const {
    return m_options.backupDir / (m_options.archivePrefix + "_dvd_" + std::to_string(chunk.ordinal) + "_" +
                                  chunk.startDate + "_" + chunk.endDate + ".iso");
}

RunSummary BackupOrchestrator::process(const std::vector<domain::Chunk>& chunks) {
    RunSummary summary;
    for (const auto& chunk : chunks) {
        if (m_cancelled.load()) {
            std::cout << "[Orchestrator] Cancelled; skipping remaining chunks." << std::endl;
            break;
        }
        summary.chunks.push_back(processChunk(chunk));
    }
    return summary;
}

ChunkOutcome BackupOrchestrator::processChunk(const domain::Chunk& chunk) {
    ChunkOutcome outcome;
    outcome.ordinal = chunk.ordinal;

    const bool dryRun = m_options.materialize.dryRun;
    outcome.dryRun = dryRun;
    const fs::path stagingDir = stagingDirFor(chunk);

    if (!dryRun) {
        std::error_code ec;
        fs::create_directories(stagingDir, ec);
        if (ec) {
            std::cerr << "[Orchestrator] Cannot create staging directory " << stagingDir.string()
                      << ": " << ec.message() << std::endl;
            outcome.stagingFailed = true;
            outcome.failed = chunk.assets.size();
            return outcome;
        }
    }

    std::cout << "\nProcessing DVD " << chunk.ordinal << " (" << chunk.assets.size() << " assets, "
              << ChunkMenu::FormatBytes(chunk.sizeBytes) << ")..." << std::endl;

    auto results = m_materializer.materialize(chunk, stagingDir, m_options.materialize);
    for (const auto& result : results) {
        if (result.success) {
            ++outcome.placed;
            continue;
        }
        if (result.reason == FailureReason::Cancelled) {
            outcome.cancelled = true;
        }
        ++outcome.failed;
        outcome.failedAssetIds.push_back(result.asset.id);
        std::cerr << "  Failed to copy asset " << result.asset.id << " (" << ToString(result.reason);
        if (!result.message.empty()) std::cerr << ": " << result.message;
        std::cerr << ")" << std::endl;
    }

    std::cout << "[Orchestrator] DVD " << chunk.ordinal << ": " << outcome.placed << " placed, "
              << outcome.failed << " failed." << std::endl;

    if (dryRun) {
        return outcome;
    }

    if (outcome.cancelled || m_cancelled.load()) {
        outcome.cancelled = true;
        std::cout << "[Orchestrator] Cancelled; staging directory " << stagingDir.string()
                  << " kept for the next run." << std::endl;
        return outcome;
    }

    outcome.archived = m_archiveBuilder.build(stagingDir, archivePathFor(chunk));
    if (!outcome.archived && m_cancelled.load()) {
        outcome.cancelled = true;
        std::cout << "[Orchestrator] Cancelled while building the archive; staging directory "
                  << stagingDir.string() << " kept for the next run." << std::endl;
        return outcome;
    }
    if (!outcome.archived) {
        std::cerr << "[Orchestrator] Archive for DVD " << chunk.ordinal << " failed; keeping "
                  << stagingDir.string() << " for manual recovery." << std::endl;
        return outcome;
    }

    std::cout << "[Orchestrator] Cleaning up temporary directory " << stagingDir.string() << "..." << std::endl;
    std::error_code ec;
    fs::remove_all(stagingDir, ec);
    if (ec) {
        std::cerr << "[Orchestrator] Warning: could not remove " << stagingDir.string() << ": " << ec.message() << std::endl;
    } else {
        outcome.cleanedUp = true;
    }

    m_tracker.markChunkArchived(chunk);
    return outcome;
}

} // namespace discarchiver::application
