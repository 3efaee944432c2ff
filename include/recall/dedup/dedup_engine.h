// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/time_parser.h>
#include <recall/core/types.h>
#include <recall/crypto/hasher.h>
#include <recall/dedup/fingerprint_index.h>
#include <recall/store/fact_store.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::dedup {

struct DuplicateCheck {
    bool isDuplicate = false;
    Fingerprint fingerprint;
    std::optional<std::string> firstSeen;
    std::optional<std::string> originalSource;
};

struct DuplicateRecord {
    std::string originalSource;
    std::string duplicateSource;
    std::string contentPreview;
    Fingerprint fingerprint;
};

struct RebuildReport {
    size_t totalProcessed = 0;
    std::vector<DuplicateRecord> duplicates;
    size_t indexSize = 0;
};

struct IndexStats {
    size_t totalEntries = 0;
    size_t itemsEntries = 0;
    size_t noteEntries = 0;
    size_t otherEntries = 0;
    std::filesystem::path indexPath;
    std::uintmax_t fileBytes = 0;
};

enum class IngestStatus { Written, ExactDuplicate, NearDuplicate };

inline constexpr const char* ingestStatusToString(IngestStatus s) noexcept {
    switch (s) {
        case IngestStatus::Written:
            return "written";
        case IngestStatus::ExactDuplicate:
            return "exact_duplicate";
        case IngestStatus::NearDuplicate:
            return "near_duplicate";
    }
    return "unknown";
}

// Outcome of a guarded fact write; duplicates are outcomes, not errors
struct IngestOutcome {
    IngestStatus status = IngestStatus::Written;
    Fingerprint fingerprint;
    std::optional<store::Fact> stored;
    std::optional<std::string> matchedFactId;
    std::optional<std::string> firstSeen;
    std::optional<std::string> originalSource;
};

/**
 * Exact duplicate detection over normalized content fingerprints (SHA-256),
 * plus the ingestion gate that layers the fuzzy near-duplicate check on top.
 *
 * The index lives at <workspace>/.memory-hashes.json and is loaded lazily on
 * first use; registerContent writes through. Single writer only.
 */
class DedupEngine {
public:
    static constexpr const char* kIndexFileName = ".memory-hashes.json";
    // Note paragraphs shorter than this are not indexed during a rebuild
    static constexpr size_t kMinParagraphLength = 20;

    explicit DedupEngine(const store::FactStore& store,
                         std::unique_ptr<crypto::IContentHasher> hasher = crypto::createSHA256Hasher(),
                         core::ClockFn clock = core::systemNow);

    std::filesystem::path indexPath() const;

    Fingerprint fingerprint(std::string_view text);

    // Read-only lookup against the index
    DuplicateCheck checkDuplicate(std::string_view text);

    /**
     * Record @p text as seen. Idempotent: a known fingerprint keeps its original
     * firstSeen/source. Returns the fingerprint.
     */
    Result<Fingerprint> registerContent(std::string_view text,
                                        std::optional<std::string> source = std::nullopt);

    /**
     * Recompute the index from scratch: active facts of every entity (path order),
     * then every paragraph of every note (file name order). The first occurrence of
     * a fingerprint wins; later ones are reported as duplicates. The new index
     * replaces the persisted one.
     */
    Result<RebuildReport> rebuildIndex();

    IndexStats stats();

    // Delete the persisted index. Returns false when there was nothing to delete.
    Result<bool> clean();

    /**
     * Guarded append: fingerprint check, then near-duplicate check against the
     * entity's active facts, then append and register. An empty timestamp is stamped
     * with the engine clock's date. InvalidArgument for empty text.
     */
    Result<IngestOutcome> ingestFact(const store::EntityKey& key, store::Fact fact);

    const FingerprintIndex& index();

private:
    void ensureLoaded();

    const store::FactStore& store_;
    std::unique_ptr<crypto::IContentHasher> hasher_;
    core::ClockFn clock_;
    std::optional<FingerprintIndex> index_;
};

} // namespace recall::dedup
