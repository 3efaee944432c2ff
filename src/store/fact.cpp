// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/store/fact.h>

#include <algorithm>
#include <cmath>

namespace recall::store {

using json = nlohmann::json;

namespace {

// Strings pass through; numbers are rendered; anything else is treated as absent
std::optional<std::string> scalarText(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number()) {
        return it->dump();
    }
    return std::nullopt;
}

std::optional<std::int64_t> countField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return static_cast<std::int64_t>(it->get<std::uint64_t>());
    }
    if (it->is_number_integer()) {
        return std::max<std::int64_t>(0, it->get<std::int64_t>());
    }
    if (it->is_number_float()) {
        double v = it->get<double>();
        return v > 0.0 ? static_cast<std::int64_t>(std::floor(v)) : 0;
    }
    return std::nullopt;
}

// A known field keeps its raw value when it still decodes to @p value
void putText(json& j, const json& raw, const char* key, const std::string& value) {
    if (raw.contains(key) && scalarText(raw, key).value_or("") == value) {
        return;
    }
    j[key] = value;
}

void putOptionalText(json& j, const json& raw, const char* key,
                     const std::optional<std::string>& value, bool nullWhenAbsent) {
    if (raw.contains(key) && scalarText(raw, key) == value) {
        return;
    }
    if (value) {
        j[key] = *value;
    } else if (nullWhenAbsent) {
        j[key] = nullptr;
    } else {
        j.erase(key);
    }
}

} // namespace

Result<Fact> factFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "fact record is not a JSON object"};
    }

    Fact f;
    f.id = scalarText(j, "id").value_or("");
    f.fact = scalarText(j, "fact").value_or("");
    f.category = scalarText(j, "category").value_or("");
    f.type = scalarText(j, "type").value_or("");
    f.timestamp = scalarText(j, "timestamp").value_or("");
    f.supersededBy = scalarText(j, "supersededBy");
    f.lastAccessed = scalarText(j, "lastAccessed");
    f.accessCount = countField(j, "accessCount");

    auto status = scalarText(j, "status");
    if (status && *status == "active") {
        f.status = FactStatus::Active;
    } else if (status && *status == "superseded") {
        f.status = FactStatus::Superseded;
    } else {
        f.status = FactStatus::Unknown;
        f.rawStatus = status;
    }

    f.raw = j;
    return f;
}

json factToJson(const Fact& f) {
    const json& raw = f.raw.is_object() ? f.raw : json::object();
    json j = raw;
    putText(j, raw, "id", f.id);
    putText(j, raw, "fact", f.fact);
    putText(j, raw, "category", f.category);
    putText(j, raw, "type", f.type);
    putText(j, raw, "timestamp", f.timestamp);

    std::optional<std::string> status;
    switch (f.status) {
        case FactStatus::Active:
        case FactStatus::Superseded:
            status = factStatusToString(f.status);
            break;
        case FactStatus::Unknown:
            status = f.rawStatus;
            break;
    }
    putOptionalText(j, raw, "status", status, false);
    putOptionalText(j, raw, "supersededBy", f.supersededBy, true);
    putOptionalText(j, raw, "lastAccessed", f.lastAccessed, false);

    if (!raw.contains("accessCount") || countField(raw, "accessCount") != f.accessCount) {
        if (f.accessCount) {
            j["accessCount"] = *f.accessCount;
        } else {
            j.erase("accessCount");
        }
    }
    return j;
}

} // namespace recall::store
