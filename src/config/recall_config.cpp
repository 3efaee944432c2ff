// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/config/config_helpers.h>
#include <recall/config/recall_config.h>

#include <spdlog/spdlog.h>

#include <map>

namespace recall::config {

namespace {

Result<double> toDouble(const std::string& key, const std::string& raw) {
    try {
        size_t pos = 0;
        double v = std::stod(raw, &pos);
        if (pos != raw.size()) {
            return Error{ErrorCode::InvalidArgument, key + ": trailing characters in '" + raw + "'"};
        }
        return v;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, key + ": not a number: '" + raw + "'"};
    }
}

Result<long> toLong(const std::string& key, const std::string& raw) {
    try {
        size_t pos = 0;
        long v = std::stol(raw, &pos);
        if (pos != raw.size()) {
            return Error{ErrorCode::InvalidArgument, key + ": trailing characters in '" + raw + "'"};
        }
        return v;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, key + ": not an integer: '" + raw + "'"};
    }
}

Result<void> setPort(RecallConfig& cfg, const std::string& key, const std::string& raw) {
    auto v = toLong(key, raw);
    if (!v) {
        return v.error();
    }
    if (v.value() < 1 || v.value() > 65535) {
        return Error{ErrorCode::InvalidArgument, key + ": port out of range: " + raw};
    }
    cfg.semantic.port = static_cast<std::uint16_t>(v.value());
    return {};
}

Result<void> setEnabled(RecallConfig& cfg, const std::string& key, const std::string& raw) {
    auto b = parse_bool(raw);
    if (!b) {
        return Error{ErrorCode::InvalidArgument, key + ": expected true/false, got '" + raw + "'"};
    }
    cfg.semantic.enabled = *b;
    return {};
}

Result<void> applyFile(RecallConfig& cfg, const std::map<std::string, std::string>& values) {
    auto get = [&](const char* k) -> const std::string* {
        auto it = values.find(k);
        return (it == values.end() || it->second.empty()) ? nullptr : &it->second;
    };

    if (auto* v = get("core.workspace")) {
        cfg.workspaceRoot = expand_tilde(*v);
    }
    if (auto* v = get("core.log_level")) {
        cfg.logLevel = *v;
    }
    if (auto* v = get("semantic.enabled")) {
        if (auto r = setEnabled(cfg, "semantic.enabled", *v); !r) {
            return r;
        }
    }
    if (auto* v = get("semantic.host")) {
        cfg.semantic.host = *v;
    }
    if (auto* v = get("semantic.port")) {
        if (auto r = setPort(cfg, "semantic.port", *v); !r) {
            return r;
        }
    }
    if (auto* v = get("semantic.timeout_ms")) {
        auto ms = toLong("semantic.timeout_ms", *v);
        if (!ms) {
            return ms.error();
        }
        cfg.semantic.timeout = std::chrono::milliseconds(ms.value());
    }
    if (auto* v = get("graph.depth")) {
        auto d = toLong("graph.depth", *v);
        if (!d) {
            return d.error();
        }
        cfg.traversalDepth = static_cast<int>(d.value());
    }
    if (auto* v = get("salience.decay_days")) {
        auto d = toLong("salience.decay_days", *v);
        if (!d) {
            return d.error();
        }
        cfg.decayWindowDays = static_cast<int>(d.value());
    }
    if (auto* v = get("search.vector_weight")) {
        auto w = toDouble("search.vector_weight", *v);
        if (!w) {
            return w.error();
        }
        cfg.vectorWeight = w.value();
    }
    if (auto* v = get("search.keyword_weight")) {
        auto w = toDouble("search.keyword_weight", *v);
        if (!w) {
            return w.error();
        }
        cfg.keywordWeight = w.value();
    }
    if (auto* v = get("search.limit")) {
        auto l = toLong("search.limit", *v);
        if (!l) {
            return l.error();
        }
        if (l.value() < 1) {
            return Error{ErrorCode::InvalidArgument, "search.limit must be positive"};
        }
        cfg.searchLimit = static_cast<std::size_t>(l.value());
    }
    return {};
}

} // namespace

Result<void> RecallConfig::validate() const {
    if (vectorWeight < 0.0 || vectorWeight > 1.0) {
        return Error{ErrorCode::InvalidArgument, "vector weight must be within [0,1]"};
    }
    if (keywordWeight < 0.0 || keywordWeight > 1.0) {
        return Error{ErrorCode::InvalidArgument, "keyword weight must be within [0,1]"};
    }
    if (traversalDepth < 1) {
        return Error{ErrorCode::InvalidArgument, "traversal depth must be at least 1"};
    }
    if (decayWindowDays <= 0) {
        return Error{ErrorCode::InvalidArgument, "decay window must be a positive number of days"};
    }
    if (semantic.port == 0) {
        return Error{ErrorCode::InvalidArgument, "semantic search port must be within 1-65535"};
    }
    if (searchLimit == 0) {
        return Error{ErrorCode::InvalidArgument, "search limit must be positive"};
    }
    return {};
}

Result<void> applyEnvironment(RecallConfig& cfg) {
    if (auto v = get_env("RECALL_WORKSPACE_DIR")) {
        cfg.workspaceRoot = expand_tilde(*v);
    }
    if (auto v = get_env("RECALL_LOG_LEVEL")) {
        cfg.logLevel = *v;
    }
    if (auto v = get_env("RECALL_SEMANTIC_ENABLED")) {
        if (auto r = setEnabled(cfg, "RECALL_SEMANTIC_ENABLED", *v); !r) {
            return r;
        }
    }
    if (auto v = get_env("RECALL_SEMANTIC_HOST")) {
        cfg.semantic.host = *v;
    }
    if (auto v = get_env("RECALL_SEMANTIC_PORT")) {
        if (auto r = setPort(cfg, "RECALL_SEMANTIC_PORT", *v); !r) {
            return r;
        }
    }
    return {};
}

Result<RecallConfig> loadConfig(const std::filesystem::path& configPath) {
    RecallConfig cfg;

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        spdlog::debug("Loading config from {}", configPath.string());
        if (auto r = applyFile(cfg, parse_simple_toml(configPath)); !r) {
            return Error{r.error().code, configPath.string() + ": " + r.error().message};
        }
    }

    if (auto r = applyEnvironment(cfg); !r) {
        return r.error();
    }
    return cfg;
}

} // namespace recall::config
