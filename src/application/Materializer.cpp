/**
 * @file Materializer.cpp
 * @brief Implementation of Materializer and ClaimedNames.
 */
#include "application/Materializer.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <system_error>

namespace discarchiver::application {

namespace fs = std::filesystem;

namespace {

// Keeps names inside the staging directory.
std::string SanitizeFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        out.push_back(ch == '/' || ch == '\0' ? '_' : ch);
    }
    if (out.empty() || out == "." || out == "..") {
        out = "_" + out;
    }
    return out;
}

std::string FoldCase(const std::string& name) {
    std::string out = name;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

// Hidden ".<name>.part" files are copies that never completed.
bool IsPartialName(const std::string& name) {
    return name.size() > 6 && name.front() == '.' && infrastructure::PathUtils::EndsWithIgnoreCase(name, ".part");
}

bool SameContents(const fs::path& a, const fs::path& b) {
    std::ifstream fa(a, std::ios::binary);
    std::ifstream fb(b, std::ios::binary);
    if (!fa.is_open() || !fb.is_open()) {
        return false;
    }
    std::vector<char> bufA(64 * 1024);
    std::vector<char> bufB(64 * 1024);
    while (fa && fb) {
        fa.read(bufA.data(), static_cast<std::streamsize>(bufA.size()));
        fb.read(bufB.data(), static_cast<std::streamsize>(bufB.size()));
        if (fa.gcount() != fb.gcount() ||
            !std::equal(bufA.begin(), bufA.begin() + fa.gcount(), bufB.begin())) {
            return false;
        }
    }
    return fa.eof() && fb.eof();
}

// A staged file counts as this asset's when it is the source itself (hard link)
// or a complete copy of it: same size, same modification time, same bytes.
bool SameFile(const fs::path& staged, const fs::path& source) {
    std::error_code ec;
    if (fs::equivalent(staged, source, ec) && !ec) {
        return true;
    }
    ec.clear();
    auto stagedSize = fs::file_size(staged, ec);
    if (ec) return false;
    auto sourceSize = fs::file_size(source, ec);
    if (ec || stagedSize != sourceSize) return false;
    auto stagedTime = fs::last_write_time(staged, ec);
    if (ec) return false;
    auto sourceTime = fs::last_write_time(source, ec);
    if (ec || stagedTime != sourceTime) return false;
    return SameContents(staged, source);
}

void RemoveStalePartials(const fs::path& dir) {
    std::error_code ec;
    std::vector<fs::path> stale;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (IsPartialName(it->path().filename().string())) {
            stale.push_back(it->path());
        }
    }
    for (const auto& path : stale) {
        std::error_code removeEc;
        fs::remove(path, removeEc);
        if (removeEc) {
            std::cerr << "[Materializer] Warning: could not remove " << path.string() << ": " << removeEc.message() << std::endl;
        }
    }
}

void SplitName(const std::string& name, const std::string& ext, std::string& stem, std::string& suffix) {
    if (!ext.empty() && infrastructure::PathUtils::EndsWithIgnoreCase(name, ext) && name.size() > ext.size()) {
        stem = name.substr(0, name.size() - ext.size());
        suffix = ext;
        return;
    }
    fs::path p(name);
    stem = p.stem().string();
    suffix = p.extension().string();
}

} // namespace

const char* ToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::None: return "ok";
        case FailureReason::UnmappedPath: return "source path outside mapped prefix";
        case FailureReason::SourceMissing: return "source file missing";
        case FailureReason::IoError: return "I/O error";
        case FailureReason::Cancelled: return "cancelled";
    }
    return "unknown";
}

ClaimedNames::ClaimedNames(fs::path directory, bool checkDisk)
    : m_directory(std::move(directory)) {
    if (!checkDisk) {
        return;
    }
    std::error_code ec;
    for (fs::directory_iterator it(m_directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (IsPartialName(name)) {
            continue;
        }
        m_onDisk.emplace(FoldCase(name), name);
    }
}

ClaimedName ClaimedNames::claim(const std::string& preferred,
                                const std::string& assetId,
                                const std::string& ext,
                                const fs::path& source) {
    std::string stem;
    std::string suffix;
    SplitName(preferred, ext, stem, suffix);
    const std::string base = stem + "_" + SanitizeFilename(assetId);

    std::unique_lock<std::mutex> lock(m_mutex);
    std::string candidate = preferred;
    for (int n = 1;; ++n) {
        if (n == 2) {
            candidate = base + suffix;
        } else if (n > 2) {
            candidate = base + "_" + std::to_string(n - 1) + suffix;
        }

        std::string key = FoldCase(candidate);
        if (m_claimed.count(key) > 0) {
            continue;
        }
        auto existing = m_onDisk.find(key);
        if (existing == m_onDisk.end()) {
            m_claimed.insert(key);
            return {candidate, false};
        }
        if (source.empty()) {
            continue;
        }

        // Comparing file contents is slow; other workers may claim meanwhile.
        const std::string onDiskName = existing->second;
        lock.unlock();
        bool same = SameFile(m_directory / onDiskName, source);
        lock.lock();
        if (same && m_claimed.insert(key).second) {
            return {onDiskName, true};
        }
    }
}

Materializer::Materializer(infrastructure::PathMapper mapper,
                           WorkerPool& pool,
                           infrastructure::ProgressTracker* tracker,
                           const std::atomic<bool>& cancelled)
    : m_mapper(std::move(mapper)), m_pool(pool), m_tracker(tracker), m_cancelled(cancelled) {}

std::string Materializer::TargetFilename(const std::string& displayName, const std::string& ext) {
    std::string name = SanitizeFilename(displayName);
    if (infrastructure::PathUtils::EndsWithIgnoreCase(name, ext)) {
        return name;
    }
    return name + ext;
}

std::vector<MaterializeResult> Materializer::materialize(const domain::Chunk& chunk,
                                                         const fs::path& stagingDir,
                                                         const MaterializeOptions& options) {
    if (!options.dryRun) {
        RemoveStalePartials(stagingDir);
    }
    ClaimedNames names(stagingDir, !options.dryRun);
    std::atomic<size_t> succeeded{0};
    std::atomic<std::uint64_t> placedBytes{0};
    const size_t total = chunk.assets.size();
    const size_t interval = options.progressInterval > 0 ? static_cast<size_t>(options.progressInterval) : 100;

    std::vector<std::future<MaterializeResult>> pending;
    pending.reserve(total);

    try {
        for (const auto& asset : chunk.assets) {
            pending.push_back(m_pool.submit([&, asset]() {
                MaterializeResult result = placeAsset(asset, stagingDir, names, options);
                if (!result.success) {
                    return result;
                }

                size_t done = ++succeeded;
                std::uint64_t accumulated = placedBytes += asset.sizeBytes;
                if (m_tracker && !options.dryRun) {
                    m_tracker->update(asset.id, asset.sizeBytes, chunk.ordinal, accumulated);
                }
                if (done % interval == 0) {
                    std::ostringstream line;
                    line << "  Progress: " << done << "/" << total << " files copied...\n";
                    std::cout << line.str() << std::flush;
                }
                return result;
            }));
        }
    } catch (const std::exception& e) {
        // Queued tasks reference this frame; let them finish before unwinding.
        std::cerr << "[Materializer] Could not schedule chunk " << chunk.ordinal << ": " << e.what() << std::endl;
        for (auto& f : pending) f.wait();
        throw;
    }

    std::vector<MaterializeResult> results;
    results.reserve(total);
    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            results.push_back(pending[i].get());
        } catch (const std::exception& e) {
            MaterializeResult failed;
            failed.asset = chunk.assets[i];
            failed.reason = FailureReason::IoError;
            failed.message = e.what();
            std::cerr << "[Materializer] Unexpected error for asset " << failed.asset.id << ": " << e.what() << std::endl;
            results.push_back(std::move(failed));
        }
    }
    return results;
}

MaterializeResult Materializer::placeAsset(const domain::AssetRecord& asset,
                                           const fs::path& stagingDir,
                                           ClaimedNames& names,
                                           const MaterializeOptions& options) {
    MaterializeResult result;
    result.asset = asset;

    if (m_cancelled.load()) {
        result.reason = FailureReason::Cancelled;
        return result;
    }

    auto local = m_mapper.map(asset.sourcePath);
    if (!local) {
        result.reason = FailureReason::UnmappedPath;
        result.message = asset.sourcePath;
        return result;
    }

    std::error_code ec;
    if (!fs::exists(*local, ec)) {
        result.reason = FailureReason::SourceMissing;
        result.message = local->string();
        return result;
    }

    std::string ext = local->extension().string();
    ClaimedName claimed = names.claim(TargetFilename(asset.displayName, ext), asset.id, ext, *local);
    result.target = stagingDir / claimed.name;

    if (options.dryRun || claimed.reused) {
        result.reused = claimed.reused;
        result.success = true;
        return result;
    }

    if (options.useLinks) {
        fs::create_hard_link(*local, result.target, ec);
        if (!ec) {
            result.success = true;
            return result;
        }
    }

    std::string error;
    if (!copyFile(*local, result.target, error)) {
        std::ostringstream line;
        line << "[Materializer] Error copying " << local->string() << " to " << result.target.string()
             << ": " << error << "\n";
        std::cerr << line.str() << std::flush;
        result.reason = FailureReason::IoError;
        result.message = error;
        return result;
    }

    result.success = true;
    return result;
}

bool Materializer::copyFile(const fs::path& source, const fs::path& target, std::string& error) const {
    // Copy under a hidden name first so an interrupted copy never leaves a truncated final file.
    fs::path partial = target.parent_path() / ("." + target.filename().string() + ".part");
    std::error_code ec;

    fs::copy_file(source, partial, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = ec.message();
        std::error_code ignored;
        fs::remove(partial, ignored);
        return false;
    }

    auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(partial, mtime, ec);
    }
    if (!ec) {
        auto perms = fs::status(source, ec).permissions();
        if (!ec) {
            fs::permissions(partial, perms, fs::perm_options::replace, ec);
        }
    }
    if (ec) {
        error = "could not preserve metadata: " + ec.message();
        std::error_code ignored;
        fs::remove(partial, ignored);
        return false;
    }

    fs::rename(partial, target, ec);
    if (ec) {
        error = ec.message();
        std::error_code ignored;
        fs::remove(partial, ignored);
        return false;
    }
    return true;
}

} // namespace discarchiver::application
