// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace recall::dedup {

// First-seen metadata recorded for a fingerprint
struct IndexEntry {
    std::string firstSeen;
    std::optional<std::string> source;
    std::string normalizedPreview;
};

/**
 * Fingerprint -> first-seen metadata, persisted as a JSON object:
 *   { "<sha256>": {"first_seen": ..., "source": ..., "normalized": ...}, ... }
 *
 * Derived cache: it can always be rebuilt from the fact store and notes.
 */
class FingerprintIndex {
public:
    FingerprintIndex() = default;

    // Missing or malformed files load as an empty index
    static FingerprintIndex load(const std::filesystem::path& path);
    Result<void> save(const std::filesystem::path& path) const;

    bool contains(const Fingerprint& fp) const { return entries_.contains(fp); }
    const IndexEntry* find(const Fingerprint& fp) const;

    // Insert when absent; returns false and leaves the existing entry alone otherwise
    bool insert(const Fingerprint& fp, IndexEntry entry);

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    const std::map<Fingerprint, IndexEntry>& entries() const noexcept { return entries_; }

private:
    std::map<Fingerprint, IndexEntry> entries_;
};

} // namespace recall::dedup
