// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/store/json_file.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace recall::store {

namespace fs = std::filesystem;

Result<std::optional<nlohmann::json>> parseJsonFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::optional<nlohmann::json>{};
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::InvalidData, "Cannot open " + path.string()};
    }

    auto parsed = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, "Malformed JSON in " + path.string()};
    }
    return std::optional<nlohmann::json>(std::move(parsed));
}

std::optional<nlohmann::json> readJsonFile(const fs::path& path) {
    auto parsed = parseJsonFile(path);
    if (!parsed) {
        spdlog::warn("{}; treating as empty", parsed.error().message);
        return std::nullopt;
    }
    return std::move(parsed).value();
}

Result<void> writeJsonFile(const fs::path& path, const nlohmann::json& value, int indent) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError, "Cannot create directory " +
                                                    path.parent_path().string() + ": " +
                                                    ec.message()};
        }
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot open " + tmp.string() + " for writing"};
        }
        out << value.dump(indent) << '\n';
        if (!out) {
            return Error{ErrorCode::WriteError, "Failed writing " + tmp.string()};
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(tmp, ec);
        return Error{ErrorCode::WriteError, "Cannot replace " + path.string() + ": " + reason};
    }
    return {};
}

} // namespace recall::store
