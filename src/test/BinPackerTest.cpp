#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/BinPacker.hpp"

using discarchiver::application::BinPacker;
using discarchiver::domain::AssetRecord;
using discarchiver::domain::Chunk;

namespace {

std::vector<AssetRecord> MakeAssets(const std::vector<std::uint64_t>& sizes) {
    std::vector<AssetRecord> assets;
    for (size_t i = 0; i < sizes.size(); ++i) {
        AssetRecord a;
        a.id = "asset-" + std::to_string(i);
        a.sourcePath = "/usr/src/app/upload/" + a.id + ".jpg";
        a.displayName = a.id + ".jpg";
        // One asset per day, days 10..
        a.createdAt = "2023-01-" + std::to_string(10 + i) + "T12:00:00.000Z";
        a.sizeBytes = sizes[i];
        assets.push_back(a);
    }
    return assets;
}

std::vector<std::uint64_t> ChunkSizes(const std::vector<Chunk>& chunks) {
    std::vector<std::uint64_t> sizes;
    for (const auto& c : chunks) sizes.push_back(c.sizeBytes);
    return sizes;
}

void CheckPartition(const std::vector<AssetRecord>& input, const std::vector<Chunk>& chunks, std::uint64_t capacity) {
    std::vector<std::string> flattened;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        assert(chunk.ordinal == static_cast<int>(i) + 1);
        assert(!chunk.assets.empty());

        std::uint64_t sum = 0;
        for (const auto& a : chunk.assets) {
            sum += a.sizeBytes;
            flattened.push_back(a.id);
        }
        assert(sum == chunk.sizeBytes);
        assert(chunk.sizeBytes <= capacity || chunk.assets.size() == 1);
        assert(chunk.startDate == chunk.assets.front().createdDate());
        assert(chunk.endDate == chunk.assets.back().createdDate());
    }

    assert(flattened.size() == input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        assert(flattened[i] == input[i].id);
    }
}

void TestThreeAssetsThatEachFillMoreThanHalf() {
    auto assets = MakeAssets({3000, 3000, 3000});
    BinPacker packer(5000);
    auto chunks = packer.pack(assets);
    assert(chunks.size() == 3);
    assert((ChunkSizes(chunks) == std::vector<std::uint64_t>{3000, 3000, 3000}));
    CheckPartition(assets, chunks, 5000);
}

void TestSmallAssetsShareOneChunk() {
    auto assets = MakeAssets({1000, 1000, 1000});
    auto chunks = BinPacker(5000).pack(assets);
    assert(chunks.size() == 1);
    assert(chunks[0].sizeBytes == 3000);
    assert(chunks[0].assets.size() == 3);
    assert(chunks[0].startDate == "2023-01-10");
    assert(chunks[0].endDate == "2023-01-12");
}

void TestOversizedAssetIsPlacedAlone() {
    auto single = MakeAssets({9000});
    auto chunks = BinPacker(5000).pack(single);
    assert(chunks.size() == 1);
    assert(chunks[0].sizeBytes == 9000);
    assert(chunks[0].assets.size() == 1);

    auto mixed = MakeAssets({1000, 9000, 1000, 1000});
    chunks = BinPacker(5000).pack(mixed);
    assert((ChunkSizes(chunks) == std::vector<std::uint64_t>{1000, 9000, 2000}));
    CheckPartition(mixed, chunks, 5000);
}

void TestExactFitDoesNotSeal() {
    auto assets = MakeAssets({2500, 2500, 1});
    auto chunks = BinPacker(5000).pack(assets);
    assert((ChunkSizes(chunks) == std::vector<std::uint64_t>{5000, 1}));
}

void TestEmptyAndZeroSized() {
    assert(BinPacker(5000).pack({}).empty());

    auto assets = MakeAssets({0, 0, 4999, 0, 2});
    auto chunks = BinPacker(5000).pack(assets);
    assert(chunks.size() == 2);
    assert(chunks[0].assets.size() == 4);
    assert(chunks[0].sizeBytes == 4999);
    assert(chunks[1].assets.size() == 1);
    CheckPartition(assets, chunks, 5000);
}

void TestGreedyDoesNotReorder() {
    // A later small asset must not be pulled back into an earlier chunk.
    auto assets = MakeAssets({4000, 2000, 500, 4600, 100});
    auto chunks = BinPacker(5000).pack(assets);
    assert((ChunkSizes(chunks) == std::vector<std::uint64_t>{4000, 2500, 4700}));
    CheckPartition(assets, chunks, 5000);
}

void TestZeroCapacityRejected() {
    bool threw = false;
    try {
        BinPacker packer(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting BinPacker Test..." << std::endl;

    TestThreeAssetsThatEachFillMoreThanHalf();
    TestSmallAssetsShareOneChunk();
    TestOversizedAssetIsPlacedAlone();
    TestExactFitDoesNotSeal();
    TestEmptyAndZeroSized();
    TestGreedyDoesNotReorder();
    TestZeroCapacityRejected();

    std::cout << "[PASS] BinPacker Test." << std::endl;
    return 0;
}
