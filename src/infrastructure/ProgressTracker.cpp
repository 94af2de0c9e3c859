/**
 * @file ProgressTracker.cpp
 * @brief Implementation of ProgressTracker.
 */

#include "infrastructure/ProgressTracker.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace discarchiver::infrastructure {

ProgressTracker::ProgressTracker(const std::string& stateFile) : m_stateFile(stateFile) {}

void ProgressTracker::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = domain::ProgressState{};

    std::error_code ec;
    if (!fs::exists(m_stateFile, ec)) {
        return;
    }

    try {
        std::ifstream f(m_stateFile);
        if (!f.is_open()) {
            std::cerr << "[ProgressTracker] Warning: could not open state file " << m_stateFile
                      << ". Starting fresh." << std::endl;
            return;
        }

        json j = json::parse(f);
        domain::ProgressState loaded;
        if (j.contains("last_asset_id") && j["last_asset_id"].is_string()) {
            loaded.lastAssetId = j["last_asset_id"].get<std::string>();
        }
        loaded.currentChunk = j.value("current_dvd", 1);
        loaded.currentChunkSize = j.value("current_dvd_size", std::uint64_t{0});
        if (loaded.currentChunk < 1) {
            loaded.currentChunk = 1;
        }
        if (j.contains("archived_dvds")) {
            for (int ordinal : j.at("archived_dvds").get<std::vector<int>>()) {
                if (ordinal >= 1) loaded.archivedChunks.insert(ordinal);
            }
        } else {
            // Older state files only carry the cursor; everything before it was archived.
            for (int ordinal = 1; ordinal < loaded.currentChunk; ++ordinal) {
                loaded.archivedChunks.insert(ordinal);
            }
        }
        m_state = loaded;
    } catch (const std::exception& e) {
        std::cerr << "[ProgressTracker] Warning: could not load state file: " << e.what()
                  << ". Starting fresh." << std::endl;
        m_state = domain::ProgressState{};
    }
}

bool ProgressTracker::save() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return persistLocked();
}

void ProgressTracker::update(const std::string& assetId, std::uint64_t /*size*/, int chunkOrdinal, std::uint64_t chunkAccumSize) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.lastAssetId = assetId;
    m_state.currentChunk = chunkOrdinal;
    m_state.currentChunkSize = chunkAccumSize;
    persistLocked();
}

void ProgressTracker::markChunkArchived(const domain::Chunk& chunk) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!chunk.assets.empty()) {
        m_state.lastAssetId = chunk.assets.back().id;
    }
    m_state.archivedChunks.insert(chunk.ordinal);
    int next = 1;
    while (m_state.archivedChunks.count(next) > 0) {
        ++next;
    }
    m_state.currentChunk = next;
    m_state.currentChunkSize = 0;
    persistLocked();
}

domain::ProgressState ProgressTracker::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool ProgressTracker::persistLocked() {
    json j;
    if (m_state.lastAssetId) {
        j["last_asset_id"] = *m_state.lastAssetId;
    } else {
        j["last_asset_id"] = nullptr;
    }
    j["current_dvd"] = m_state.currentChunk;
    j["current_dvd_size"] = m_state.currentChunkSize;
    j["archived_dvds"] = std::vector<int>(m_state.archivedChunks.begin(), m_state.archivedChunks.end());

    fs::path finalPath = m_stateFile;
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[ProgressTracker] Warning: could not create state directory: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[ProgressTracker] Warning: failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << j.dump();
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[ProgressTracker] Warning: write failed: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[ProgressTracker] Warning: could not replace state file: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace discarchiver::infrastructure
