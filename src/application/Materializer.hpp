/**
 * @file Materializer.hpp
 * @brief Concurrent placement of a chunk's files into its staging directory.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "application/WorkerPool.hpp"
#include "domain/Chunk.hpp"
#include "infrastructure/PathMapper.hpp"
#include "infrastructure/ProgressTracker.hpp"

namespace discarchiver::application {

/**
 * @enum FailureReason
 * @brief Why an asset could not be placed.
 */
enum class FailureReason {
    None,          ///< Placed (or would be placed, in a dry run).
    UnmappedPath,  ///< Source path lacks the expected foreign prefix.
    SourceMissing, ///< Mapped path does not exist on this host.
    IoError,       ///< Link and copy both failed.
    Cancelled      ///< Skipped because the run was cancelled.
};

const char* ToString(FailureReason reason);

/**
 * @struct MaterializeResult
 * @brief Outcome for one asset, tagged with the record it came from.
 */
struct MaterializeResult {
    domain::AssetRecord asset;
    bool success = false;
    FailureReason reason = FailureReason::None;
    std::filesystem::path target; ///< Final path inside the staging directory (empty if never resolved).
    std::string message;
    bool reused = false;          ///< The file was already staged by an earlier run.
};

struct MaterializeOptions {
    bool dryRun = false;
    bool useLinks = false;
    int progressInterval = 100;
};

/** @brief A reserved filename, and whether it refers to a file staged earlier. */
struct ClaimedName {
    std::string name;
    bool reused = false;
};

/**
 * @class ClaimedNames
 * @brief Per-chunk registry of target filenames.
 *
 * claim() checks and reserves a name in one critical section, so two
 * workers can never both take the same name. Names are compared without
 * regard to case, since the image is read on case-insensitive systems.
 */
class ClaimedNames {
public:
    /**
     * @param directory Staging directory whose existing files also count as taken.
     * @param checkDisk False in dry runs, where nothing is written.
     */
    ClaimedNames(std::filesystem::path directory, bool checkDisk);

    /**
     * @brief Reserves a filename for one asset.
     *
     * Candidates are preferred, then <stem>_<assetId><ext>, then
     * <stem>_<assetId>_<n><ext> for n = 2, 3, ... A candidate already on
     * disk is handed back with reused set when it holds the same file as
     * source (same inode, or same size and modification time); otherwise
     * it is skipped.
     */
    ClaimedName claim(const std::string& preferred,
                      const std::string& assetId,
                      const std::string& ext,
                      const std::filesystem::path& source = {});

private:
    std::filesystem::path m_directory;
    std::unordered_map<std::string, std::string> m_onDisk; ///< Folded name -> actual name.
    std::unordered_set<std::string> m_claimed;             ///< Folded names.
    std::mutex m_mutex;
};

/**
 * @class Materializer
 * @brief Links or copies every asset of a chunk into a staging directory.
 *
 * Individual failures never abort the chunk; they come back as results.
 * materialize() returns only after every asset has been attempted.
 */
class Materializer {
public:
    /**
     * @param mapper Resolves source paths to local files.
     * @param pool Worker pool shared across chunks.
     * @param tracker Progress tracker updated after each placement; may be null.
     * @param cancelled Set externally to stop starting new placements.
     */
    Materializer(infrastructure::PathMapper mapper,
                 WorkerPool& pool,
                 infrastructure::ProgressTracker* tracker,
                 const std::atomic<bool>& cancelled);

    /**
     * @brief Places all assets of the chunk.
     * @param chunk Chunk to materialize.
     * @param stagingDir Destination directory; must exist unless options.dryRun is set.
     * @param options Dry-run, hard-link preference and progress logging interval.
     * @return One result per asset, in completion order.
     */
    std::vector<MaterializeResult> materialize(const domain::Chunk& chunk,
                                               const std::filesystem::path& stagingDir,
                                               const MaterializeOptions& options);

    /**
     * @brief Output filename for an asset: the display name, plus the source
     *        extension unless the name already ends with it (case-insensitive).
     */
    static std::string TargetFilename(const std::string& displayName, const std::string& ext);

private:
    MaterializeResult placeAsset(const domain::AssetRecord& asset,
                                 const std::filesystem::path& stagingDir,
                                 ClaimedNames& names,
                                 const MaterializeOptions& options);

    bool copyFile(const std::filesystem::path& source,
                  const std::filesystem::path& target,
                  std::string& error) const;

    infrastructure::PathMapper m_mapper;
    WorkerPool& m_pool;
    infrastructure::ProgressTracker* m_tracker;
    const std::atomic<bool>& m_cancelled;
};

} // namespace discarchiver::application
