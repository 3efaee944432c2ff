// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/config/recall_config.h>
#include <recall/core/types.h>
#include <recall/search/search_result.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace recall::search {

// Characters of hit content kept in a vector result
inline constexpr size_t kVectorContentLength = 300;

/**
 * Client for an external semantic (vector) search service.
 *
 * search() never fails: a disabled, unreachable or misbehaving service
 * yields an empty list.
 */
class ISemanticSearchClient {
public:
    virtual ~ISemanticSearchClient() = default;
    virtual std::vector<SearchResult> search(std::string_view query, size_t limit) = 0;
};

/**
 * Decode a service response of the form
 *   {"results": [{"content", "score", "source", "id", "timestamp"}, ...]}
 * into vector results. InvalidData for a body that is not such an object.
 */
Result<std::vector<SearchResult>> parseSemanticResponse(std::string_view body);

// POSTs query/limit form data to http://<host>:<port>/search
class HttpSemanticSearchClient : public ISemanticSearchClient {
public:
    explicit HttpSemanticSearchClient(config::SemanticSearchConfig config);

    std::vector<SearchResult> search(std::string_view query, size_t limit) override;

    std::string endpoint() const;

private:
    Result<std::string> post(const std::string& body) const;

    config::SemanticSearchConfig config_;
};

std::unique_ptr<ISemanticSearchClient>
createSemanticSearchClient(const config::SemanticSearchConfig& config);

} // namespace recall::search
