// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/time_parser.h>
#include <recall/core/types.h>
#include <recall/store/fact_store.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recall::salience {

inline constexpr int kDefaultDecayWindowDays = 365;
// Weight used when lastAccessed cannot be parsed
inline constexpr double kUnparsableRecencyWeight = 0.1;
inline constexpr double kHighSalienceThreshold = 1.0;
inline constexpr double kLowSalienceThreshold = 0.1;

struct ScoredFact {
    store::Fact fact;
    double score = 0.0;
};

struct ScoreBreakdown {
    double recencyWeight = 0.0;
    double frequencyWeight = 0.0;
    double score = 0.0;
};

struct MigrationReport {
    size_t filesProcessed = 0;
    size_t factsUpdated = 0;
    std::vector<std::string> errors;
};

struct SalienceStats {
    size_t totalFacts = 0;
    size_t factsWithSalience = 0;
    // The averages and maximum cover facts with salience data only
    double averageAccessCount = 0.0;
    double averageScore = 0.0;
    double maxScore = 0.0;
    size_t highSalience = 0;
    size_t lowSalience = 0;
};

/**
 * Time-and-frequency importance of facts:
 *
 *   recency   = 0 when age >= window, else exp(-age / (window / 3))
 *   frequency = ln(accessCount + 1)
 *   score     = recency * frequency
 *
 * Age is counted in whole local calendar days; dates in the future count as
 * age 0. Only the date part of lastAccessed is used.
 */
class SalienceScorer {
public:
    explicit SalienceScorer(int decayWindowDays = kDefaultDecayWindowDays,
                            core::ClockFn clock = core::systemNow);

    int decayWindowDays() const noexcept { return decayWindowDays_; }

    double recencyWeight(std::string_view lastAccessed) const;
    static double frequencyWeight(std::int64_t accessCount);
    double score(std::string_view lastAccessed, std::int64_t accessCount) const;
    ScoreBreakdown explain(std::string_view lastAccessed, std::int64_t accessCount) const;

    // Legacy records score with their timestamp and a count of 1
    double score(const store::Fact& fact) const;

    // Highest score first; equal scores keep input order
    std::vector<ScoredFact> rankByScore(const std::vector<store::Fact>& facts,
                                        std::optional<size_t> limit = std::nullopt) const;

    /**
     * Mark a fact as accessed now: lastAccessed becomes the local date-time and
     * accessCount grows by one. NotFound for an unknown entity or fact id.
     */
    Result<store::Fact> recordAccess(const store::FactStore& store, const store::EntityKey& key,
                                     std::string_view factId) const;

    // Fill in missing lastAccessed (fact timestamp or today) and accessCount (1)
    MigrationReport migrate(const store::FactStore& store) const;

    SalienceStats stats(const store::FactStore& store) const;

private:
    int decayWindowDays_;
    core::ClockFn clock_;
};

} // namespace recall::salience
