// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace recall::store {

enum class FactStatus { Active, Superseded, Unknown };

inline constexpr const char* factStatusToString(FactStatus s) noexcept {
    switch (s) {
        case FactStatus::Active:
            return "active";
        case FactStatus::Superseded:
            return "superseded";
        case FactStatus::Unknown:
            return "unknown";
    }
    return "unknown";
}

/**
 * One piece of information attached to an entity (a record of items.json).
 *
 * lastAccessed/accessCount are optional on disk; legacy records lacking them
 * default to the creation timestamp and a count of 1.
 */
struct Fact {
    std::string id;
    std::string fact;
    std::string category;
    std::string type;
    std::string timestamp;
    FactStatus status = FactStatus::Active;
    std::optional<std::string> supersededBy;
    std::optional<std::string> lastAccessed;
    std::optional<std::int64_t> accessCount;

    // Status text as found on disk when it was neither "active" nor "superseded"
    std::optional<std::string> rawStatus;
    // The record as read from disk. Unknown fields, and known fields whose value is
    // left unchanged, are written back from here verbatim.
    nlohmann::json raw = nlohmann::json::object();

    bool isActive() const noexcept { return status == FactStatus::Active; }

    std::string effectiveLastAccessed() const {
        if (lastAccessed) {
            return *lastAccessed;
        }
        return timestamp.empty() ? std::string("1970-01-01") : timestamp;
    }

    std::int64_t effectiveAccessCount() const noexcept { return accessCount.value_or(1); }

    bool hasSalienceFields() const noexcept {
        return lastAccessed.has_value() && accessCount.has_value();
    }
};

// Decode one items.json record; InvalidData when the element is not an object
Result<Fact> factFromJson(const nlohmann::json& j);

nlohmann::json factToJson(const Fact& f);

} // namespace recall::store
