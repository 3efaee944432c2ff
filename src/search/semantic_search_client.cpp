// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/search/semantic_search_client.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace recall::search {

using json = nlohmann::json;

namespace {

size_t writeCallback(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

    std::string escape(std::string_view s) const {
        char* out = curl_easy_escape(curl_, s.data(), static_cast<int>(s.size()));
        if (!out) {
            return {};
        }
        std::string escaped(out);
        curl_free(out);
        return escaped;
    }

private:
    CURL* curl_;
};

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

} // namespace

Result<std::vector<SearchResult>> parseSemanticResponse(std::string_view body) {
    auto doc = json::parse(body.begin(), body.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::InvalidData, "Semantic search response is not a JSON object"};
    }

    std::vector<SearchResult> results;
    auto hits = doc.find("results");
    if (hits == doc.end()) {
        return results;
    }
    if (!hits->is_array()) {
        return Error{ErrorCode::InvalidData, "Semantic search 'results' is not an array"};
    }

    for (const auto& hit : *hits) {
        if (!hit.is_object()) {
            continue;
        }
        SearchResult r;
        r.type = kVectorMatch;
        auto source = stringField(hit, "source");
        r.entity = source.empty() ? "unknown" : source;
        r.content = common::utf8Prefix(stringField(hit, "content"), kVectorContentLength);
        if (auto s = hit.find("score"); s != hit.end() && s->is_number()) {
            r.score = s->get<double>();
        }
        r.finalScore = r.score;
        r.timestamp = stringField(hit, "timestamp");
        r.category = "semantic";
        r.source = "semantic#" + stringField(hit, "id");
        r.searchType = SearchPath::Vector;
        results.push_back(std::move(r));
    }
    return results;
}

HttpSemanticSearchClient::HttpSemanticSearchClient(config::SemanticSearchConfig config)
    : config_(std::move(config)) {}

std::string HttpSemanticSearchClient::endpoint() const {
    return "http://" + config_.host + ":" + std::to_string(config_.port) + "/search";
}

Result<std::string> HttpSemanticSearchClient::post(const std::string& body) const {
    CurlHandle curl;
    if (!curl) {
        return Error{ErrorCode::NetworkError, "Failed to initialize cURL"};
    }

    const auto url = endpoint();
    std::string responseData;
    long httpCode = 0;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseData);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl.get());
    curl_slist_free_all(headers);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error{ErrorCode::Timeout, "Semantic search timed out"};
    }
    if (res != CURLE_OK) {
        return Error{ErrorCode::NetworkError,
                     std::string("HTTP request failed: ") + curl_easy_strerror(res)};
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode >= 400) {
        return Error{ErrorCode::NetworkError, "HTTP error " + std::to_string(httpCode)};
    }
    return responseData;
}

std::vector<SearchResult> HttpSemanticSearchClient::search(std::string_view query, size_t limit) {
    if (!config_.enabled) {
        return {};
    }

    std::string body;
    {
        CurlHandle encoder;
        if (!encoder) {
            spdlog::debug("Semantic search unavailable: cURL init failed");
            return {};
        }
        body = "query=" + encoder.escape(query) + "&limit=" + std::to_string(limit) +
               "&type=semantic";
    }

    auto response = post(body);
    if (!response) {
        spdlog::debug("Semantic search unavailable at {}: {}", endpoint(),
                      response.error().message);
        return {};
    }

    auto parsed = parseSemanticResponse(response.value());
    if (!parsed) {
        spdlog::debug("Ignoring semantic search response: {}", parsed.error().message);
        return {};
    }
    return std::move(parsed).value();
}

std::unique_ptr<ISemanticSearchClient>
createSemanticSearchClient(const config::SemanticSearchConfig& config) {
    return std::make_unique<HttpSemanticSearchClient>(config);
}

} // namespace recall::search
