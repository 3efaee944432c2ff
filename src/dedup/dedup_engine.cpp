// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/dedup/dedup_engine.h>
#include <recall/dedup/near_duplicate.h>
#include <recall/dedup/text_normalizer.h>

#include <spdlog/spdlog.h>

#include <string>

namespace recall::dedup {

namespace fs = std::filesystem;

namespace {

// Paragraphs are separated by blank lines ("\n\n"); each is stripped
std::vector<std::string> splitParagraphs(std::string_view content) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= content.size()) {
        auto next = content.find("\n\n", pos);
        auto piece = content.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                         : next - pos);
        out.emplace_back(common::trimView(piece));
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 2;
    }
    return out;
}

} // namespace

DedupEngine::DedupEngine(const store::FactStore& store,
                         std::unique_ptr<crypto::IContentHasher> hasher, core::ClockFn clock)
    : store_(store), hasher_(std::move(hasher)), clock_(std::move(clock)) {
    if (!hasher_) {
        hasher_ = crypto::createSHA256Hasher();
    }
    if (!clock_) {
        clock_ = core::systemNow;
    }
}

fs::path DedupEngine::indexPath() const {
    return store_.root() / kIndexFileName;
}

void DedupEngine::ensureLoaded() {
    if (!index_) {
        index_ = FingerprintIndex::load(indexPath());
        spdlog::debug("Loaded fingerprint index with {} entries", index_->size());
    }
}

const FingerprintIndex& DedupEngine::index() {
    ensureLoaded();
    return *index_;
}

Fingerprint DedupEngine::fingerprint(std::string_view text) {
    return hasher_->hashText(normalize(text));
}

DuplicateCheck DedupEngine::checkDuplicate(std::string_view text) {
    ensureLoaded();
    DuplicateCheck check;
    check.fingerprint = fingerprint(text);
    if (const auto* entry = index_->find(check.fingerprint)) {
        check.isDuplicate = true;
        check.firstSeen = entry->firstSeen;
        check.originalSource = entry->source;
    }
    return check;
}

Result<Fingerprint> DedupEngine::registerContent(std::string_view text,
                                                 std::optional<std::string> source) {
    ensureLoaded();
    auto fp = fingerprint(text);
    IndexEntry entry{core::TimeParser::formatLocalDateTime(clock_()), std::move(source),
                     normalizedPreview(text)};
    if (!index_->insert(fp, std::move(entry))) {
        return fp;
    }
    if (auto saved = index_->save(indexPath()); !saved) {
        return saved.error();
    }
    return fp;
}

Result<RebuildReport> DedupEngine::rebuildIndex() {
    FingerprintIndex fresh;
    RebuildReport report;
    const auto today = core::TimeParser::formatDate(clock_());

    auto record = [&](std::string_view text, const std::string& source,
                      const std::string& firstSeen) {
        ++report.totalProcessed;
        auto fp = fingerprint(text);
        if (const auto* existing = fresh.find(fp)) {
            report.duplicates.push_back(DuplicateRecord{existing->source.value_or(""), source,
                                                        common::previewText(text, kPreviewLength),
                                                        fp});
            return;
        }
        fresh.insert(fp, IndexEntry{firstSeen, source, normalizedPreview(text)});
    };

    for (const auto& key : store_.listEntities()) {
        const auto source = store_.relativeSource(store_.itemsPath(key));
        for (const auto& fact : store_.loadFacts(key)) {
            if (!fact.isActive() || fact.fact.empty()) {
                continue;
            }
            record(fact.fact, source, fact.timestamp.empty() ? today : fact.timestamp);
        }
    }

    for (const auto& note : store_.loadNotes()) {
        const auto source = store_.relativeSource(note.path);
        for (const auto& para : splitParagraphs(note.content)) {
            if (para.size() < kMinParagraphLength) {
                continue;
            }
            record(para, source, note.date);
        }
    }

    if (auto saved = fresh.save(indexPath()); !saved) {
        return saved.error();
    }
    report.indexSize = fresh.size();
    index_ = std::move(fresh);
    spdlog::info("Rebuilt fingerprint index: {} processed, {} duplicates, {} unique",
                 report.totalProcessed, report.duplicates.size(), report.indexSize);
    return report;
}

IndexStats DedupEngine::stats() {
    ensureLoaded();
    IndexStats s;
    s.indexPath = indexPath();
    s.totalEntries = index_->size();
    for (const auto& [fp, entry] : index_->entries()) {
        const auto& src = entry.source;
        if (src && src->find("items.json") != std::string::npos) {
            ++s.itemsEntries;
        } else if (src && src->find(".md") != std::string::npos) {
            ++s.noteEntries;
        } else {
            ++s.otherEntries;
        }
    }
    std::error_code ec;
    if (fs::exists(s.indexPath, ec)) {
        auto bytes = fs::file_size(s.indexPath, ec);
        s.fileBytes = ec ? 0 : bytes;
    }
    return s;
}

Result<bool> DedupEngine::clean() {
    std::error_code ec;
    bool removed = fs::remove(indexPath(), ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Failed to remove " + indexPath().string() + ": " + ec.message()};
    }
    index_ = FingerprintIndex{};
    return removed;
}

Result<IngestOutcome> DedupEngine::ingestFact(const store::EntityKey& key, store::Fact fact) {
    if (common::trimView(fact.fact).empty()) {
        return Error{ErrorCode::InvalidArgument, "Fact text must not be empty"};
    }

    IngestOutcome outcome;
    auto check = checkDuplicate(fact.fact);
    outcome.fingerprint = check.fingerprint;
    if (check.isDuplicate) {
        outcome.status = IngestStatus::ExactDuplicate;
        outcome.firstSeen = check.firstSeen;
        outcome.originalSource = check.originalSource;
        spdlog::debug("Skipping exact duplicate for {} (first seen {})", key.str(),
                      check.firstSeen.value_or("?"));
        return outcome;
    }

    const auto existing = store_.loadFacts(key);
    if (auto match = findNearDuplicate(fact.fact, existing)) {
        outcome.status = IngestStatus::NearDuplicate;
        outcome.matchedFactId = std::move(match);
        spdlog::debug("Skipping near duplicate of {} in {}", *outcome.matchedFactId, key.str());
        return outcome;
    }

    if (fact.timestamp.empty()) {
        fact.timestamp = core::TimeParser::formatDate(clock_());
    }
    auto stored = store_.appendFact(key, std::move(fact));
    if (!stored) {
        return stored.error();
    }
    auto registered =
        registerContent(stored.value().fact, store_.relativeSource(store_.itemsPath(key)));
    if (!registered) {
        return registered.error();
    }
    outcome.status = IngestStatus::Written;
    outcome.stored = std::move(stored).value();
    return outcome;
}

} // namespace recall::dedup
