#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

#include "application/Materializer.hpp"
#include "application/WorkerPool.hpp"
#include "infrastructure/PathMapper.hpp"
#include "infrastructure/ProgressTracker.hpp"

namespace fs = std::filesystem;
using namespace discarchiver;
using application::FailureReason;
using application::MaterializeOptions;
using application::Materializer;

namespace {

const std::string kForeign = "/usr/src/app/upload";

struct Fixture {
    fs::path root;
    fs::path library;
    fs::path staging;

    Fixture(const std::string& name) {
        root = fs::temp_directory_path() / ("discarchiver_" + name + "_" + std::to_string(::getpid()));
        fs::remove_all(root);
        library = root / "library";
        staging = root / "DVD_1";
        fs::create_directories(library / "upload");
    }
    ~Fixture() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    domain::AssetRecord addAsset(const std::string& id, const std::string& displayName,
                                 const std::string& fileName, const std::string& content) {
        std::ofstream(library / "upload" / fileName) << content;
        domain::AssetRecord a;
        a.id = id;
        a.sourcePath = kForeign + "/upload/" + fileName;
        a.displayName = displayName;
        a.createdAt = "2024-05-01T08:00:00.000Z";
        a.sizeBytes = content.size();
        return a;
    }

    infrastructure::PathMapper mapper() const {
        return infrastructure::PathMapper(kForeign, library.string());
    }
};

std::string ReadAll(const fs::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

size_t CountFiles(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++n;
    }
    return n;
}

void TestTargetFilename() {
    assert(Materializer::TargetFilename("IMG_0001", ".jpg") == "IMG_0001.jpg");
    assert(Materializer::TargetFilename("IMG_0001.JPG", ".jpg") == "IMG_0001.JPG");
    assert(Materializer::TargetFilename("clip.mov", ".mp4") == "clip.mov.mp4");
    assert(Materializer::TargetFilename("noext", "") == "noext");
    assert(Materializer::TargetFilename("a/b", ".png") == "a_b.png");
}

void TestClaimedNames() {
    application::ClaimedNames names("/nonexistent", false);
    assert(names.claim("photo.jpg", "id1", ".jpg").name == "photo.jpg");
    assert(names.claim("photo.jpg", "id2", ".jpg").name == "photo_id2.jpg");
    // Names differing only in case collide on the disc.
    assert(names.claim("PHOTO.JPG", "id3", ".jpg").name == "PHOTO_id3.JPG");
    assert(names.claim("photo.jpg", "id2", ".jpg").name == "photo_id2_2.jpg");
    assert(!names.claim("other.jpg", "id4", ".jpg").reused);
}

void TestRerunReusesStagedFiles() {
    for (bool useLinks : {false, true}) {
        Fixture fx(useLinks ? "rerun_links" : "rerun_copy");
        fs::create_directories(fx.staging);

        domain::Chunk chunk;
        chunk.ordinal = 2;
        chunk.assets.push_back(fx.addAsset("r1", "beach.jpg", "r1.jpg", "sand"));
        chunk.assets.push_back(fx.addAsset("r2", "beach.jpg", "r2.jpg", "waves"));
        chunk.assets.push_back(fx.addAsset("r3", "BEACH.JPG", "r3.jpg", "sunset"));

        std::atomic<bool> cancelled{false};
        application::WorkerPool pool(3);
        Materializer materializer(fx.mapper(), pool, nullptr, cancelled);
        MaterializeOptions options;
        options.useLinks = useLinks;

        auto first = materializer.materialize(chunk, fx.staging, options);
        for (const auto& r : first) {
            assert(r.success && !r.reused);
        }
        assert(CountFiles(fx.staging) == chunk.assets.size());

        // An interrupted copy from the previous session.
        std::ofstream(fx.staging / ".beach_r9.jpg.part") << "trunc";

        for (int run = 0; run < 2; ++run) {
            auto again = materializer.materialize(chunk, fx.staging, options);
            assert(again.size() == chunk.assets.size());
            for (const auto& r : again) {
                assert(r.success && r.reused);
                assert(ReadAll(r.target) == ReadAll(fx.library / "upload" / (r.asset.id + ".jpg")));
            }
            assert(CountFiles(fx.staging) == chunk.assets.size());
        }
        assert(!fs::exists(fx.staging / ".beach_r9.jpg.part"));
    }
    std::cout << "[PASS] Re-running a kept staging directory adds no files." << std::endl;
}

void TestChangedSourceIsNotReused() {
    Fixture fx("changed");
    fs::create_directories(fx.staging);

    domain::Chunk chunk;
    chunk.ordinal = 1;
    chunk.assets.push_back(fx.addAsset("e1", "edit.png", "e1.png", "v1"));

    std::atomic<bool> cancelled{false};
    application::WorkerPool pool(1);
    Materializer materializer(fx.mapper(), pool, nullptr, cancelled);
    assert(materializer.materialize(chunk, fx.staging, MaterializeOptions{})[0].target == fx.staging / "edit.png");

    // The source was edited since it was staged: keep the stale copy, stage the new one beside it.
    std::ofstream(fx.library / "upload" / "e1.png") << "version two";
    auto results = materializer.materialize(chunk, fx.staging, MaterializeOptions{});
    assert(results[0].success && !results[0].reused);
    assert(results[0].target == fx.staging / "edit_e1.png");
    assert(ReadAll(results[0].target) == "version two");

    // A third pass finds the new copy.
    results = materializer.materialize(chunk, fx.staging, MaterializeOptions{});
    assert(results[0].reused && results[0].target == fx.staging / "edit_e1.png");
    assert(CountFiles(fx.staging) == 2);
}

void TestStoppedPoolPropagatesError() {
    Fixture fx("stopped");
    fs::create_directories(fx.staging);

    domain::Chunk chunk;
    chunk.ordinal = 1;
    chunk.assets.push_back(fx.addAsset("s1", "s1", "s1.jpg", "x"));

    std::atomic<bool> cancelled{false};
    application::WorkerPool pool(1);
    pool.shutdown();
    Materializer materializer(fx.mapper(), pool, nullptr, cancelled);

    bool threw = false;
    try {
        materializer.materialize(chunk, fx.staging, MaterializeOptions{});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(CountFiles(fx.staging) == 0);
}

void TestCollidingNamesUnderConcurrency() {
    Fixture fx("collide");
    fs::create_directories(fx.staging);

    domain::Chunk chunk;
    chunk.ordinal = 1;
    const int kAssets = 64;
    for (int i = 0; i < kAssets; ++i) {
        // Every asset wants "IMG_0001.jpg".
        std::string id = "id" + std::to_string(i);
        chunk.assets.push_back(fx.addAsset(id, "IMG_0001.jpg", id + ".jpg", "content-" + id));
        chunk.sizeBytes += chunk.assets.back().sizeBytes;
    }

    std::atomic<bool> cancelled{false};
    application::WorkerPool pool(8);
    infrastructure::ProgressTracker tracker((fx.root / "state.json").string());
    Materializer materializer(fx.mapper(), pool, &tracker, cancelled);

    MaterializeOptions options;
    options.progressInterval = 16;
    auto results = materializer.materialize(chunk, fx.staging, options);

    assert(results.size() == static_cast<size_t>(kAssets));
    std::set<fs::path> targets;
    for (const auto& r : results) {
        assert(r.success);
        assert(r.reason == FailureReason::None);
        targets.insert(r.target);
        assert(ReadAll(r.target) == "content-" + r.asset.id);
    }
    assert(targets.size() == static_cast<size_t>(kAssets));
    assert(CountFiles(fx.staging) == static_cast<size_t>(kAssets));
    assert(targets.count(fx.staging / "IMG_0001.jpg") == 1);

    // Every update was persisted; the final record belongs to chunk 1.
    infrastructure::ProgressTracker reloaded(tracker.stateFile());
    reloaded.load();
    assert(reloaded.state().currentChunk == 1);
    assert(reloaded.state().lastAssetId.has_value());
    assert(reloaded.state().currentChunkSize <= chunk.sizeBytes);
    std::cout << "[PASS] " << kAssets << " colliding assets landed on distinct paths." << std::endl;
}

void TestExistingFileIsNotOverwritten() {
    Fixture fx("existing");
    fs::create_directories(fx.staging);
    std::ofstream(fx.staging / "holiday.png") << "left over";

    domain::Chunk chunk;
    chunk.ordinal = 1;
    chunk.assets.push_back(fx.addAsset("abc", "holiday", "x.png", "new"));

    std::atomic<bool> cancelled{false};
    application::WorkerPool pool(2);
    Materializer materializer(fx.mapper(), pool, nullptr, cancelled);
    auto results = materializer.materialize(chunk, fx.staging, MaterializeOptions{});

    assert(results.size() == 1 && results[0].success);
    assert(results[0].target == fx.staging / "holiday_abc.png");
    assert(ReadAll(fx.staging / "holiday.png") == "left over");
    assert(ReadAll(fx.staging / "holiday_abc.png") == "new");
}

void TestFailuresDoNotAbortChunk() {
    Fixture fx("failures");
    fs::create_directories(fx.staging);

    domain::Chunk chunk;
    chunk.ordinal = 3;
    chunk.assets.push_back(fx.addAsset("good", "good.jpg", "good.jpg", "ok"));

    domain::AssetRecord unmapped;
    unmapped.id = "unmapped";
    unmapped.sourcePath = "/elsewhere/file.jpg";
    unmapped.displayName = "file.jpg";
    chunk.assets.push_back(unmapped);

    domain::AssetRecord missing;
    missing.id = "missing";
    missing.sourcePath = kForeign + "/upload/does-not-exist.jpg";
    missing.displayName = "gone.jpg";
    chunk.assets.push_back(missing);

    std::atomic<bool> cancelled{false};
    application::WorkerPool pool(3);
    Materializer materializer(fx.mapper(), pool, nullptr, cancelled);
    auto results = materializer.materialize(chunk, fx.staging, MaterializeOptions{});

    assert(results.size() == 3);
    for (const auto& r : results) {
        if (r.asset.id == "good") {
            assert(r.success);
        } else if (r.asset.id == "unmapped") {
            assert(!r.success && r.reason == FailureReason::UnmappedPath);
        } else {
            assert(!r.success && r.reason == FailureReason::SourceMissing);
        }
    }
    assert(CountFiles(fx.staging) == 1);
}

void TestDryRunWritesNothing() {
    Fixture fx("dryrun");
    domain::Chunk chunk;
    chunk.ordinal = 1;
    for (int i = 0; i < 10; ++i) {
        std::string id = "d" + std::to_string(i);
        chunk.assets.push_back(fx.addAsset(id, "same.heic", id + ".heic", "x"));
    }
    domain::AssetRecord missing;
    missing.id = "missing";
    missing.sourcePath = kForeign + "/upload/nope.heic";
    missing.displayName = "nope";
    chunk.assets.push_back(missing);

    std::atomic<bool> cancelled{false};
    application::WorkerPool pool(4);
    fs::path statePath = fx.root / "state.json";
    infrastructure::ProgressTracker tracker(statePath.string());
    Materializer materializer(fx.mapper(), pool, &tracker, cancelled);

    MaterializeOptions options;
    options.dryRun = true;
    auto results = materializer.materialize(chunk, fx.staging, options);

    size_t ok = 0;
    std::set<fs::path> targets;
    for (const auto& r : results) {
        if (r.success) {
            ++ok;
            targets.insert(r.target);
        }
    }
    assert(ok == 10);
    assert(targets.size() == 10);
    assert(!fs::exists(fx.staging));
    assert(!fs::exists(statePath));
}

void TestHardLinkPreference() {
    Fixture fx("links");
    fs::create_directories(fx.staging);

    domain::Chunk chunk;
    chunk.ordinal = 1;
    chunk.assets.push_back(fx.addAsset("l1", "video", "v.mp4", "frames"));

    std::atomic<bool> cancelled{false};
    application::WorkerPool pool(1);
    Materializer materializer(fx.mapper(), pool, nullptr, cancelled);
    MaterializeOptions options;
    options.useLinks = true;
    auto results = materializer.materialize(chunk, fx.staging, options);

    assert(results.size() == 1 && results[0].success);
    assert(results[0].target == fx.staging / "video.mp4");
    // Same filesystem, so the link should have been possible.
    assert(fs::hard_link_count(results[0].target) == 2);
}

void TestCancellationSkipsPendingWork() {
    Fixture fx("cancel");
    fs::create_directories(fx.staging);

    domain::Chunk chunk;
    chunk.ordinal = 1;
    for (int i = 0; i < 5; ++i) {
        std::string id = "c" + std::to_string(i);
        chunk.assets.push_back(fx.addAsset(id, id, id + ".jpg", "x"));
    }

    std::atomic<bool> cancelled{true};
    application::WorkerPool pool(2);
    Materializer materializer(fx.mapper(), pool, nullptr, cancelled);
    auto results = materializer.materialize(chunk, fx.staging, MaterializeOptions{});

    assert(results.size() == 5);
    for (const auto& r : results) {
        assert(!r.success && r.reason == FailureReason::Cancelled);
    }
    assert(CountFiles(fx.staging) == 0);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Materializer Concurrency Test..." << std::endl;

    TestTargetFilename();
    TestClaimedNames();
    TestCollidingNamesUnderConcurrency();
    TestExistingFileIsNotOverwritten();
    TestFailuresDoNotAbortChunk();
    TestDryRunWritesNothing();
    TestHardLinkPreference();
    TestCancellationSkipsPendingWork();
    TestRerunReusesStagedFiles();
    TestChangedSourceIsNotReused();
    TestStoppedPoolPropagatesError();

    std::cout << "[PASS] Materializer Concurrency Test." << std::endl;
    return 0;
}
