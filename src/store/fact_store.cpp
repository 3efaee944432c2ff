// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/core/time_parser.h>
#include <recall/store/fact_store.h>
#include <recall/store/json_file.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <unordered_set>

namespace recall::store {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kItemsFile = "items.json";
constexpr const char* kSummaryFile = "summary.md";

std::optional<std::string> readText(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string generateId(const std::unordered_set<std::string>& taken) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;
    for (;;) {
        auto id = fmt::format("{:08x}", dist(rng));
        if (!taken.contains(id)) {
            return id;
        }
    }
}

} // namespace

FactStore::FactStore(fs::path workspaceRoot) : root_(std::move(workspaceRoot)) {}

fs::path FactStore::entitiesDir() const {
    return root_ / "life" / "areas";
}

fs::path FactStore::notesDir() const {
    return root_ / "memory";
}

fs::path FactStore::entityDir(const EntityKey& key) const {
    return entitiesDir() / key.type / key.name;
}

fs::path FactStore::itemsPath(const EntityKey& key) const {
    return entityDir(key) / kItemsFile;
}

std::string FactStore::relativeSource(const fs::path& p) const {
    std::error_code ec;
    auto rel = fs::relative(p, root_, ec);
    if (ec || rel.empty() || *rel.begin() == "..") {
        return p.generic_string();
    }
    return rel.generic_string();
}

std::vector<EntityKey> FactStore::listEntities() const {
    std::vector<std::pair<fs::path, EntityKey>> found;
    std::error_code ec;
    const auto base = entitiesDir();
    if (!fs::is_directory(base, ec)) {
        return {};
    }

    for (const auto& typeDir : fs::directory_iterator(base, ec)) {
        if (!typeDir.is_directory(ec)) {
            continue;
        }
        std::error_code inner;
        for (const auto& entityDir : fs::directory_iterator(typeDir.path(), inner)) {
            if (!entityDir.is_directory(inner)) {
                continue;
            }
            if (fs::is_regular_file(entityDir.path() / kItemsFile, inner)) {
                found.emplace_back(entityDir.path(),
                                   EntityKey::fromStored(typeDir.path().filename().string(),
                                                         entityDir.path().filename().string()));
            }
        }
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<EntityKey> keys;
    keys.reserve(found.size());
    for (auto& [path, key] : found) {
        keys.push_back(std::move(key));
    }
    return keys;
}

bool FactStore::hasEntity(const EntityKey& key) const {
    std::error_code ec;
    return fs::is_regular_file(itemsPath(key), ec);
}

Result<EntityKey> FactStore::resolveKey(std::string_view key) const {
    auto verbatim = EntityKey::parseVerbatim(key);
    if (!verbatim) {
        return verbatim.error();
    }
    if (hasEntity(verbatim.value())) {
        return verbatim;
    }
    return EntityKey::parse(key);
}

Result<FactFile> FactStore::readFactFile(const EntityKey& key) const {
    const auto path = itemsPath(key);
    auto doc = parseJsonFile(path);
    if (!doc) {
        return doc.error();
    }
    FactFile file;
    if (!doc.value()) {
        return file;
    }
    const auto& arr = *doc.value();
    if (!arr.is_array()) {
        return Error{ErrorCode::InvalidData, path.string() + " is not a JSON array"};
    }

    file.facts.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        auto f = factFromJson(arr[i]);
        if (!f) {
            spdlog::warn("Skipping record {} in {}: {}", i, path.string(), f.error().message);
            file.unparsed.emplace_back(i, arr[i]);
            continue;
        }
        file.facts.push_back(std::move(f).value());
    }
    return file;
}

std::vector<Fact> FactStore::loadFacts(const EntityKey& key) const {
    auto file = readFactFile(key);
    if (!file) {
        spdlog::warn("{}; treating as empty", file.error().message);
        return {};
    }
    return std::move(file).value().facts;
}

Result<void> FactStore::writeFactFile(const EntityKey& key, const FactFile& file) const {
    json arr = json::array();
    auto fact = file.facts.begin();
    auto other = file.unparsed.begin();
    while (fact != file.facts.end() || other != file.unparsed.end()) {
        if (other != file.unparsed.end() &&
            (other->first <= arr.size() || fact == file.facts.end())) {
            arr.push_back(other->second);
            ++other;
        } else {
            arr.push_back(factToJson(*fact));
            ++fact;
        }
    }
    return writeJsonFile(itemsPath(key), arr);
}

Result<void> FactStore::ensureEntity(const EntityKey& key) const {
    std::error_code ec;
    const auto dir = entityDir(key);
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot create entity directory " + dir.string() + ": " + ec.message()};
    }

    if (!fs::exists(dir / kItemsFile, ec)) {
        if (auto r = writeJsonFile(dir / kItemsFile, json::array()); !r) {
            return r;
        }
    }

    if (!fs::exists(dir / kSummaryFile, ec)) {
        std::ofstream out(dir / kSummaryFile);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot create " + (dir / kSummaryFile).string()};
        }
        out << "# " << key.name << "\n\n*Auto-created entity*\n";
    }
    return {};
}

Result<Fact> FactStore::appendFact(const EntityKey& key, Fact fact) const {
    if (auto r = ensureEntity(key); !r) {
        return r.error();
    }

    auto file = readFactFile(key);
    if (!file) {
        return file.error();
    }
    auto& facts = file.value().facts;

    std::unordered_set<std::string> ids;
    for (const auto& f : facts) {
        ids.insert(f.id);
    }
    if (fact.id.empty()) {
        fact.id = generateId(ids);
    } else if (ids.contains(fact.id)) {
        return Error{ErrorCode::InvalidArgument,
                     "Fact id '" + fact.id + "' already exists in " + key.str()};
    }
    if (fact.timestamp.empty()) {
        fact.timestamp = core::TimeParser::formatDate(core::systemNow());
    }
    fact.status = FactStatus::Active;
    fact.rawStatus.reset();
    fact.supersededBy.reset();

    facts.push_back(fact);
    if (auto r = writeFactFile(key, file.value()); !r) {
        return r.error();
    }
    spdlog::debug("Appended fact {} to {}", fact.id, key.str());
    return fact;
}

std::optional<std::string> FactStore::loadSummary(const EntityKey& key) const {
    return readText(entityDir(key) / kSummaryFile);
}

std::vector<NoteDocument> FactStore::loadNotes() const {
    std::vector<NoteDocument> notes;
    std::error_code ec;
    const auto dir = notesDir();
    if (!fs::is_directory(dir, ec)) {
        return notes;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".md") {
            continue;
        }
        auto content = readText(entry.path());
        if (!content) {
            spdlog::warn("Cannot read note {}; skipping", entry.path().string());
            continue;
        }
        notes.push_back(NoteDocument{entry.path().stem().string(), entry.path(), std::move(*content)});
    }

    std::sort(notes.begin(), notes.end(),
              [](const NoteDocument& a, const NoteDocument& b) { return a.path < b.path; });
    return notes;
}

} // namespace recall::store
