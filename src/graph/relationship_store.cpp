// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/graph/relationship_store.h>
#include <recall/store/json_file.h>

#include <spdlog/spdlog.h>

namespace recall::graph {

using json = nlohmann::json;

namespace {

std::optional<Relationship> relationshipFromJson(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto text = [&](const char* key) -> std::optional<std::string> {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    };

    auto from = text("from");
    auto to = text("to");
    auto relation = text("relation");
    if (!from || !to || !relation) {
        return std::nullopt;
    }
    Relationship rel{std::move(*from), std::move(*to), std::move(*relation),
                     text("since").value_or(""), text("source")};
    return rel;
}

json relationshipToJson(const Relationship& rel) {
    json j = {{"from", rel.from}, {"to", rel.to}, {"relation", rel.relation}, {"since", rel.since}};
    if (rel.source) {
        j["source"] = *rel.source;
    }
    return j;
}

} // namespace

RelationshipStore::RelationshipStore(const std::filesystem::path& workspaceRoot)
    : path_(workspaceRoot / kFileName) {}

RelationshipSet RelationshipStore::load() const {
    RelationshipSet set;
    auto doc = store::readJsonFile(path_);
    if (!doc) {
        return set;
    }
    if (!doc->is_object()) {
        spdlog::warn("{} is not a JSON object; starting with no relationships", path_.string());
        return set;
    }

    if (auto v = doc->find("version"); v != doc->end() && v->is_number_integer()) {
        set.version = v->get<int>();
    }
    if (auto seq = doc->find("behavioral_sequences"); seq != doc->end() && seq->is_array()) {
        set.behavioralSequences = *seq;
    }

    auto rels = doc->find("relationships");
    if (rels == doc->end() || !rels->is_array()) {
        return set;
    }
    size_t dropped = 0;
    for (const auto& element : *rels) {
        if (auto rel = relationshipFromJson(element)) {
            set.relationships.push_back(std::move(*rel));
        } else {
            ++dropped;
        }
    }
    if (dropped > 0) {
        spdlog::warn("Dropped {} malformed relationship records from {}", dropped, path_.string());
    }
    return set;
}

Result<void> RelationshipStore::save(const RelationshipSet& set) const {
    json rels = json::array();
    for (const auto& rel : set.relationships) {
        rels.push_back(relationshipToJson(rel));
    }
    json doc = {{"version", set.version},
                {"relationships", std::move(rels)},
                {"behavioral_sequences", set.behavioralSequences}};
    return store::writeJsonFile(path_, doc);
}

} // namespace recall::graph
