// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>

#include <compare>
#include <functional>
#include <string>
#include <string_view>

namespace recall::store {

/**
 * Stable identity of an entity, serialized as "type/name" (e.g. "people/john-smith").
 *
 * Names are normalized exactly once, when a new entity is created from caller
 * input: lowercase, spaces become hyphens, periods are dropped. Keys discovered
 * on disk are taken verbatim, and lookups try the verbatim form first
 * (FactStore::resolveKey) so an existing entity is never renamed.
 */
struct EntityKey {
    std::string type;
    std::string name;

    std::string str() const { return type + "/" + name; }

    // Parse and normalize caller input; InvalidArgument unless it has the form "type/name"
    static Result<EntityKey> parse(std::string_view key);

    // Split "type/name" as given, only trimming surrounding whitespace
    static Result<EntityKey> parseVerbatim(std::string_view key);

    // Build from on-disk components without normalization
    static EntityKey fromStored(std::string type, std::string name) {
        return EntityKey{std::move(type), std::move(name)};
    }

    static std::string normalizeName(std::string_view name);

    auto operator<=>(const EntityKey&) const = default;
};

} // namespace recall::store

template <> struct std::hash<recall::store::EntityKey> {
    size_t operator()(const recall::store::EntityKey& k) const noexcept {
        return std::hash<std::string>{}(k.type) ^ (std::hash<std::string>{}(k.name) << 1);
    }
};
