/**
 * @file AssetJson.cpp
 * @brief Implementation of AssetJson.
 */

#include "infrastructure/AssetJson.hpp"
#include "domain/AssetSource.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace discarchiver::infrastructure {

namespace {

std::string RequireString(const json& row, const char* key, size_t index) {
    if (!row.contains(key) || !row[key].is_string()) {
        throw domain::AssetSourceError("Asset row " + std::to_string(index) + ": missing or non-string field '" + key + "'");
    }
    return row[key].get<std::string>();
}

domain::AssetRecord ParseRow(const json& row, size_t index) {
    if (!row.is_object()) {
        throw domain::AssetSourceError("Asset row " + std::to_string(index) + " is not an object");
    }

    domain::AssetRecord record;
    record.id = RequireString(row, "id", index);
    if (record.id.empty()) {
        throw domain::AssetSourceError("Asset row " + std::to_string(index) + " has an empty id");
    }
    record.sourcePath = RequireString(row, "originalPath", index);
    record.createdAt = RequireString(row, "fileCreatedAt", index);

    if (row.contains("originalFileName") && row["originalFileName"].is_string()) {
        record.displayName = row["originalFileName"].get<std::string>();
    }
    if (record.displayName.empty()) {
        record.displayName = record.id;
    }

    if (row.contains("fileSizeInByte") && !row["fileSizeInByte"].is_null()) {
        const auto& size = row["fileSizeInByte"];
        if (size.is_number_unsigned()) {
            record.sizeBytes = size.get<std::uint64_t>();
        } else if (size.is_number_integer() && size.get<std::int64_t>() >= 0) {
            record.sizeBytes = static_cast<std::uint64_t>(size.get<std::int64_t>());
        } else {
            throw domain::AssetSourceError("Asset " + record.id + " has an invalid fileSizeInByte");
        }
    }

    return record;
}

} // namespace

std::vector<domain::AssetRecord> AssetJson::ParseArray(const std::string& text) {
    std::vector<domain::AssetRecord> records;

    bool blank = std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return records;
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw domain::AssetSourceError(std::string("Inventory output is not valid JSON: ") + e.what());
    }

    if (j.is_null()) {
        return records;
    }
    if (!j.is_array()) {
        throw domain::AssetSourceError("Inventory output is not a JSON array");
    }

    records.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        records.push_back(ParseRow(j[i], i));
    }
    return records;
}

size_t AssetJson::WarnOnOrdering(const std::vector<domain::AssetRecord>& records) {
    size_t violations = 0;
    for (size_t i = 1; i < records.size(); ++i) {
        if (records[i].createdAt < records[i - 1].createdAt) {
            ++violations;
            std::cerr << "[AssetSource] Warning: asset " << records[i].id
                      << " is out of creation order (" << records[i].createdAt
                      << " after " << records[i - 1].createdAt << ")" << std::endl;
        }
    }
    return violations;
}

} // namespace discarchiver::infrastructure
