// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace recall::config {

inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

inline std::optional<std::string> get_env(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

// "true"/"1"/"yes"/"on" (case-insensitive) -> true, "false"/"0"/"no"/"off" -> false
std::optional<bool> parse_bool(std::string_view s);

// Read every key of a simple TOML file into "section.key" -> value (quotes and inline
// comments stripped). A missing or unreadable file yields an empty map.
std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path);

// Parse a single value from a TOML config file; empty string when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/recall or ~/.config/recall
std::filesystem::path get_config_dir();

// Standard config path, or @p override_path when non-empty
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace recall::config
