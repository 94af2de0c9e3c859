/**
 * @file ChunkMenu.hpp
 * @brief Console presentation of the packing plan and parsing of the chunk selection.
 */

#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "domain/AssetRecord.hpp"
#include "domain/Chunk.hpp"
#include "domain/ProgressState.hpp"

namespace discarchiver::application {

/**
 * @struct Selection
 * @brief Which chunks the user asked for.
 */
struct Selection {
    enum class Kind {
        All,     ///< Every chunk.
        Single,  ///< One chunk by ordinal.
        Resume,  ///< Every chunk not recorded as archived.
        Quit,    ///< Nothing; exit normally.
        Invalid  ///< Unparseable or out of range; aborts the run.
    };

    Kind kind = Kind::Invalid;
    int ordinal = 0;
    std::string error;
};

class ChunkMenu {
public:
    /** @brief Human-readable size with 1024-based units and two decimals, e.g. "4.38 GB". */
    static std::string FormatBytes(std::uint64_t bytes);

    /** @brief Prints one row per chunk: ordinal, date range, size, asset count. */
    static void RenderTable(const std::vector<domain::Chunk>& chunks, std::ostream& out);

    /** @brief Prints the accepted answers for the selection prompt. */
    static void RenderOptions(const domain::ProgressState& state, std::ostream& out);

    /** @brief Prints totals and the number of discs the inventory needs. */
    static void RenderPlanSummary(const std::vector<domain::AssetRecord>& assets,
                                  const std::vector<domain::Chunk>& chunks,
                                  std::uint64_t capacity,
                                  std::ostream& out);

    /**
     * @brief Interprets an answer: "q", "all", "resume" or a chunk number.
     * @param input Raw user input; surrounding whitespace and case are ignored.
     * @param chunkCount Number of available chunks.
     */
    static Selection ParseSelection(const std::string& input, size_t chunkCount);

    /** @brief Resolves a valid selection to the chunks to process, in order. */
    static std::vector<domain::Chunk> SelectChunks(const Selection& selection,
                                                   const std::vector<domain::Chunk>& chunks,
                                                   const domain::ProgressState& state);
};

} // namespace discarchiver::application
