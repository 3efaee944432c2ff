// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/salience/salience_scorer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace recall::salience {

SalienceScorer::SalienceScorer(int decayWindowDays, core::ClockFn clock)
    : decayWindowDays_(decayWindowDays > 0 ? decayWindowDays : kDefaultDecayWindowDays),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = core::systemNow;
    }
}

double SalienceScorer::recencyWeight(std::string_view lastAccessed) const {
    auto date = core::TimeParser::parseDate(lastAccessed);
    if (!date) {
        return kUnparsableRecencyWeight;
    }
    auto days = std::max<std::int64_t>(0, core::TimeParser::daysSince(*date, clock_()));
    if (days >= decayWindowDays_) {
        return 0.0;
    }
    return std::exp(-static_cast<double>(days) / (static_cast<double>(decayWindowDays_) / 3.0));
}

double SalienceScorer::frequencyWeight(std::int64_t accessCount) {
    return std::log(static_cast<double>(std::max<std::int64_t>(0, accessCount)) + 1.0);
}

double SalienceScorer::score(std::string_view lastAccessed, std::int64_t accessCount) const {
    return recencyWeight(lastAccessed) * frequencyWeight(accessCount);
}

ScoreBreakdown SalienceScorer::explain(std::string_view lastAccessed,
                                       std::int64_t accessCount) const {
    ScoreBreakdown b;
    b.recencyWeight = recencyWeight(lastAccessed);
    b.frequencyWeight = frequencyWeight(accessCount);
    b.score = b.recencyWeight * b.frequencyWeight;
    return b;
}

double SalienceScorer::score(const store::Fact& fact) const {
    return score(fact.effectiveLastAccessed(), fact.effectiveAccessCount());
}

std::vector<ScoredFact> SalienceScorer::rankByScore(const std::vector<store::Fact>& facts,
                                                    std::optional<size_t> limit) const {
    std::vector<ScoredFact> ranked;
    ranked.reserve(facts.size());
    for (const auto& f : facts) {
        ranked.push_back(ScoredFact{f, score(f)});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ScoredFact& a, const ScoredFact& b) { return a.score > b.score; });
    if (limit && ranked.size() > *limit) {
        ranked.resize(*limit);
    }
    return ranked;
}

Result<store::Fact> SalienceScorer::recordAccess(const store::FactStore& store,
                                                 const store::EntityKey& key,
                                                 std::string_view factId) const {
    if (!store.hasEntity(key)) {
        return Error{ErrorCode::NotFound, "Unknown entity '" + key.str() + "'"};
    }
    auto file = store.readFactFile(key);
    if (!file) {
        return file.error();
    }
    auto& facts = file.value().facts;
    auto it = std::find_if(facts.begin(), facts.end(),
                           [&](const store::Fact& f) { return f.id == factId; });
    if (it == facts.end()) {
        return Error{ErrorCode::NotFound,
                     "Fact '" + std::string(factId) + "' not found in " + key.str()};
    }

    it->lastAccessed = core::TimeParser::formatLocalDateTime(clock_());
    it->accessCount = it->effectiveAccessCount() + 1;
    store::Fact updated = *it;

    if (auto saved = store.writeFactFile(key, file.value()); !saved) {
        return saved.error();
    }
    spdlog::debug("Recorded access to {} in {} (count {})", updated.id, key.str(),
                  *updated.accessCount);
    return updated;
}

MigrationReport SalienceScorer::migrate(const store::FactStore& store) const {
    MigrationReport report;
    const auto today = core::TimeParser::formatDate(clock_());

    for (const auto& key : store.listEntities()) {
        const auto path = store.itemsPath(key);
        auto file = store.readFactFile(key);
        if (!file) {
            spdlog::warn("{}", file.error().message);
            report.errors.push_back("Error reading " + store.relativeSource(path));
            continue;
        }
        ++report.filesProcessed;

        size_t changed = 0;
        for (auto& f : file.value().facts) {
            bool modified = false;
            if (!f.lastAccessed) {
                f.lastAccessed = f.timestamp.empty() ? today : f.timestamp;
                modified = true;
            }
            if (!f.accessCount) {
                f.accessCount = 1;
                modified = true;
            }
            if (modified) {
                ++changed;
            }
        }
        if (changed == 0) {
            continue;
        }
        if (auto saved = store.writeFactFile(key, file.value()); !saved) {
            report.errors.push_back(saved.error().message);
            continue;
        }
        report.factsUpdated += changed;
    }

    spdlog::info("Salience migration: {} files, {} facts updated, {} errors",
                 report.filesProcessed, report.factsUpdated, report.errors.size());
    return report;
}

SalienceStats SalienceScorer::stats(const store::FactStore& store) const {
    SalienceStats s;
    double scoreSum = 0.0;
    double countSum = 0.0;

    for (const auto& key : store.listEntities()) {
        for (const auto& f : store.loadFacts(key)) {
            ++s.totalFacts;
            if (!f.hasSalienceFields()) {
                continue;
            }
            ++s.factsWithSalience;
            const double sc = score(*f.lastAccessed, *f.accessCount);
            scoreSum += sc;
            countSum += static_cast<double>(*f.accessCount);
            s.maxScore = s.factsWithSalience == 1 ? sc : std::max(s.maxScore, sc);
            if (sc > kHighSalienceThreshold) {
                ++s.highSalience;
            } else if (sc < kLowSalienceThreshold) {
                ++s.lowSalience;
            }
        }
    }

    if (s.factsWithSalience > 0) {
        const auto n = static_cast<double>(s.factsWithSalience);
        s.averageAccessCount = countSum / n;
        s.averageScore = scoreSum / n;
    }
    return s;
}

} // namespace recall::salience
