// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/store/entity_key.h>

#include <algorithm>
#include <cctype>

namespace recall::store {

namespace {

std::string trimmed(std::string_view s) {
    auto first = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); })
                    .base();
    return first < last ? std::string(first, last) : std::string{};
}

} // namespace

std::string EntityKey::normalizeName(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : trimmed(name)) {
        if (c == '.') {
            continue;
        }
        if (c == ' ') {
            out.push_back('-');
        } else {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

namespace {

Result<EntityKey> splitKey(std::string_view key, bool normalize) {
    auto slash = key.find('/');
    if (slash == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument,
                     "Entity key '" + std::string(key) + "' must have the form type/name"};
    }

    EntityKey out;
    if (normalize) {
        out.type = EntityKey::normalizeName(key.substr(0, slash));
        out.name = EntityKey::normalizeName(key.substr(slash + 1));
    } else {
        out.type = trimmed(key.substr(0, slash));
        out.name = trimmed(key.substr(slash + 1));
    }

    if (out.type.empty() || out.name.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Entity key '" + std::string(key) + "' has an empty type or name"};
    }
    if (out.name.find('/') != std::string::npos) {
        return Error{ErrorCode::InvalidArgument,
                     "Entity key '" + std::string(key) + "' must contain exactly one '/'"};
    }
    return out;
}

} // namespace

Result<EntityKey> EntityKey::parse(std::string_view key) {
    return splitKey(key, true);
}

Result<EntityKey> EntityKey::parseVerbatim(std::string_view key) {
    return splitKey(key, false);
}

} // namespace recall::store
