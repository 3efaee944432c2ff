// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <recall/common/text_utils.h>
#include <recall/dedup/text_normalizer.h>

#include <regex>

namespace recall::dedup {

namespace {

const std::regex& whitespaceRun() {
    static const std::regex re(R"(\s+)");
    return re;
}

const std::regex& punctuationRun() {
    static const std::regex re(R"([.!?,;:]+)");
    return re;
}

const std::regex& stopWords() {
    static const std::regex re(R"(\b(a|an|the|in|on|at|to|for|of|with|by)\b)");
    return re;
}

} // namespace

std::string normalize(std::string_view text) {
    std::string s = common::toLowerAscii(text);
    s = std::regex_replace(s, whitespaceRun(), " ");
    s = std::string(common::trimView(s));
    s = std::regex_replace(s, punctuationRun(), "");
    s = std::regex_replace(s, stopWords(), "");
    return std::string(common::trimView(s));
}

std::string normalizedPreview(std::string_view text) {
    return common::previewText(normalize(text), kPreviewLength);
}

} // namespace recall::dedup
