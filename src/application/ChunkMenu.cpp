/**
 * @file ChunkMenu.cpp
 * @brief Implementation of ChunkMenu.
 */
#include "application/ChunkMenu.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace discarchiver::application {

namespace {

std::string Normalize(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out = begin < end ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

} // namespace

std::string ChunkMenu::FormatBytes(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    for (const char* unit : kUnits) {
        if (size < 1024.0) {
            out << size << " " << unit;
            return out.str();
        }
        size /= 1024.0;
    }
    out << size << " PB";
    return out.str();
}

void ChunkMenu::RenderTable(const std::vector<domain::Chunk>& chunks, std::ostream& out) {
    out << "\nAvailable DVDs for backup:\n";
    out << std::left << std::setw(6) << "DVD #" << " | " << std::setw(25) << "Date Range" << " | "
        << std::setw(10) << "Size" << " | " << std::setw(6) << "Assets" << "\n";
    out << std::string(55, '-') << "\n";
    for (const auto& chunk : chunks) {
        out << std::left << std::setw(6) << chunk.ordinal << " | "
            << chunk.startDate << " to " << std::setw(10) << chunk.endDate << " | "
            << std::setw(10) << FormatBytes(chunk.sizeBytes) << " | "
            << std::setw(6) << chunk.assets.size() << "\n";
    }
    out << std::right;
}

void ChunkMenu::RenderOptions(const domain::ProgressState& state, std::ostream& out) {
    out << "\nOptions:\n";
    out << "  [number]  - Backup a specific DVD\n";
    out << "  all       - Backup all DVDs\n";
    out << "  resume    - Backup every DVD not archived yet";
    if (!state.archivedChunks.empty()) {
        out << " (" << state.archivedChunks.size() << " done, next DVD " << state.currentChunk << ")";
    }
    if (state.lastAssetId) {
        out << " (last asset " << *state.lastAssetId << ")";
    }
    out << "\n";
    out << "  q         - Quit\n";
}

void ChunkMenu::RenderPlanSummary(const std::vector<domain::AssetRecord>& assets,
                                  const std::vector<domain::Chunk>& chunks,
                                  std::uint64_t capacity,
                                  std::ostream& out) {
    std::uint64_t total = 0;
    for (const auto& asset : assets) total += asset.sizeBytes;

    double exact = capacity > 0 ? static_cast<double>(total) / static_cast<double>(capacity) : 0.0;

    out << "\n======== Backup Plan Summary ========\n";
    out << "Total Assets:      " << assets.size() << "\n";
    out << "Total Backup Size: " << FormatBytes(total) << "\n";
    out << "DVD Capacity:      " << FormatBytes(capacity) << "\n";
    out << "-------------------------------------\n";
    out << "DVDs needed:       " << chunks.size() << "\n";
    out << "(Exact calculation: " << std::fixed << std::setprecision(2) << exact << " DVDs)\n";
    out << "=====================================\n";
    out.unsetf(std::ios_base::floatfield);
}

Selection ChunkMenu::ParseSelection(const std::string& input, size_t chunkCount) {
    Selection selection;
    std::string choice = Normalize(input);

    if (choice == "q") {
        selection.kind = Selection::Kind::Quit;
        return selection;
    }
    if (choice == "all") {
        selection.kind = Selection::Kind::All;
        return selection;
    }
    if (choice == "resume") {
        selection.kind = Selection::Kind::Resume;
        return selection;
    }

    bool numeric = !choice.empty() && choice.size() <= 9 &&
                   std::all_of(choice.begin(), choice.end(), [](unsigned char c) { return std::isdigit(c); });
    if (!numeric) {
        selection.error = "Invalid input.";
        return selection;
    }

    int ordinal = std::stoi(choice);
    if (ordinal < 1 || static_cast<size_t>(ordinal) > chunkCount) {
        selection.error = "Invalid DVD number.";
        return selection;
    }

    selection.kind = Selection::Kind::Single;
    selection.ordinal = ordinal;
    return selection;
}

std::vector<domain::Chunk> ChunkMenu::SelectChunks(const Selection& selection,
                                                   const std::vector<domain::Chunk>& chunks,
                                                   const domain::ProgressState& state) {
    std::vector<domain::Chunk> selected;
    switch (selection.kind) {
        case Selection::Kind::All:
            selected = chunks;
            break;
        case Selection::Kind::Single:
            if (selection.ordinal >= 1 && static_cast<size_t>(selection.ordinal) <= chunks.size()) {
                selected.push_back(chunks[static_cast<size_t>(selection.ordinal) - 1]);
            }
            break;
        case Selection::Kind::Resume:
            for (const auto& chunk : chunks) {
                if (!state.isArchived(chunk.ordinal)) selected.push_back(chunk);
            }
            break;
        case Selection::Kind::Quit:
        case Selection::Kind::Invalid:
            break;
    }
    return selected;
}

} // namespace discarchiver::application
