// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

namespace recall::store {

// Parse a JSON file. Missing files yield an empty optional; unreadable or malformed
// files are InvalidData. Write paths use this to refuse overwriting a damaged file.
Result<std::optional<nlohmann::json>> parseJsonFile(const std::filesystem::path& path);

// Parse a JSON file. Missing files yield nullopt silently; unreadable or malformed
// files yield nullopt with a warning so callers can recover with an empty collection.
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path);

// Write @p value (indented) through a sibling temp file and rename it into place,
// creating parent directories as needed.
Result<void> writeJsonFile(const std::filesystem::path& path, const nlohmann::json& value,
                           int indent = 2);

} // namespace recall::store
