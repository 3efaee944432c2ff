// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>
#include <recall/store/entity_key.h>
#include <recall/store/fact.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace recall::store {

// A free-text note keyed by date (memory/<date>.md)
struct NoteDocument {
    std::string date;
    std::filesystem::path path;
    std::string content;
};

/**
 * An items.json array as read: the fact records, plus any elements that are not
 * records, kept with their array position so a rewrite puts them back.
 */
struct FactFile {
    std::vector<Fact> facts;
    std::vector<std::pair<size_t, nlohmann::json>> unparsed;
};

/**
 * File-backed per-entity fact collections rooted at a workspace directory.
 *
 * Layout:
 *   <root>/life/areas/<type>/<name>/items.json   facts (JSON array)
 *   <root>/life/areas/<type>/<name>/summary.md   optional entity summary
 *   <root>/memory/<YYYY-MM-DD>.md                note documents
 *
 * loadFacts never fails: a missing or corrupt items.json is an empty collection.
 * Write paths go through readFactFile and refuse a corrupt file with InvalidData
 * rather than replacing it. There is no locking; callers must serialize writers
 * of the same entity.
 */
class FactStore {
public:
    explicit FactStore(std::filesystem::path workspaceRoot);

    const std::filesystem::path& root() const noexcept { return root_; }
    std::filesystem::path entitiesDir() const;
    std::filesystem::path notesDir() const;
    std::filesystem::path entityDir(const EntityKey& key) const;
    std::filesystem::path itemsPath(const EntityKey& key) const;

    // Path relative to the workspace root, '/'-separated; absolute path if outside it
    std::string relativeSource(const std::filesystem::path& p) const;

    // Every entity directory holding an items.json, ordered by path
    std::vector<EntityKey> listEntities() const;

    bool hasEntity(const EntityKey& key) const;

    // Key of an existing entity as spelled on disk, else the normalized key for a new one
    Result<EntityKey> resolveKey(std::string_view key) const;

    std::vector<Fact> loadFacts(const EntityKey& key) const;

    // Missing file is an empty FactFile; malformed JSON or a non-array is InvalidData
    Result<FactFile> readFactFile(const EntityKey& key) const;
    Result<void> writeFactFile(const EntityKey& key, const FactFile& file) const;

    // Create the entity directory with an empty items.json and a stub summary.md
    Result<void> ensureEntity(const EntityKey& key) const;

    /**
     * Append a fact, filling defaults: a fresh 8-hex id when empty (unique within the
     * entity), today's date as timestamp when empty. Status is forced to active and
     * supersededBy cleared. InvalidData when the existing items.json is corrupt.
     * Returns the stored record.
     */
    Result<Fact> appendFact(const EntityKey& key, Fact fact) const;

    std::optional<std::string> loadSummary(const EntityKey& key) const;

    // memory/*.md ordered by file name
    std::vector<NoteDocument> loadNotes() const;

private:
    std::filesystem::path root_;
};

} // namespace recall::store
