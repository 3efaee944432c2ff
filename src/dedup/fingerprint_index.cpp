// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/dedup/fingerprint_index.h>
#include <recall/store/json_file.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace recall::dedup {

using json = nlohmann::json;

namespace {

std::string stringOr(const json& j, const char* key, std::string fallback) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

} // namespace

FingerprintIndex FingerprintIndex::load(const std::filesystem::path& path) {
    FingerprintIndex index;
    auto doc = store::readJsonFile(path);
    if (!doc) {
        return index;
    }
    if (!doc->is_object()) {
        spdlog::warn("Fingerprint index {} is not a JSON object; starting empty", path.string());
        return index;
    }

    for (auto it = doc->begin(); it != doc->end(); ++it) {
        if (!it->is_object()) {
            spdlog::warn("Ignoring malformed index entry {}", it.key());
            continue;
        }
        IndexEntry entry;
        entry.firstSeen = stringOr(*it, "first_seen", "");
        auto src = it->find("source");
        if (src != it->end() && src->is_string()) {
            entry.source = src->get<std::string>();
        }
        entry.normalizedPreview = stringOr(*it, "normalized", "");
        index.entries_.emplace(it.key(), std::move(entry));
    }
    return index;
}

Result<void> FingerprintIndex::save(const std::filesystem::path& path) const {
    json doc = json::object();
    for (const auto& [fp, entry] : entries_) {
        doc[fp] = {{"first_seen", entry.firstSeen},
                   {"source", entry.source ? json(*entry.source) : json(nullptr)},
                   {"normalized", entry.normalizedPreview}};
    }
    return store::writeJsonFile(path, doc);
}

const IndexEntry* FingerprintIndex::find(const Fingerprint& fp) const {
    auto it = entries_.find(fp);
    return it == entries_.end() ? nullptr : &it->second;
}

bool FingerprintIndex::insert(const Fingerprint& fp, IndexEntry entry) {
    return entries_.try_emplace(fp, std::move(entry)).second;
}

} // namespace recall::dedup
