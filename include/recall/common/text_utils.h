// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace recall::common {

inline std::string toLowerAscii(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Split on runs of ASCII whitespace, dropping empty tokens
inline std::vector<std::string> splitWhitespace(std::string_view s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        }
        if (i > start) {
            out.emplace_back(s.substr(start, i - start));
        }
    }
    return out;
}

// Number of UTF-8 code points (continuation bytes are not counted)
inline size_t utf8Length(std::string_view s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

// Byte offset of the @p codepoints-th code point, or s.size() when the string is shorter
inline size_t utf8Offset(std::string_view s, size_t codepoints) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (seen == codepoints) {
                return i;
            }
            ++seen;
        }
    }
    return s.size();
}

// First @p maxCodepoints code points of @p s
inline std::string utf8Prefix(std::string_view s, size_t maxCodepoints) {
    return std::string(s.substr(0, utf8Offset(s, maxCodepoints)));
}

// First @p maxCodepoints code points, with "..." appended when anything was cut
inline std::string previewText(std::string_view s, size_t maxCodepoints) {
    auto cut = utf8Offset(s, maxCodepoints);
    if (cut >= s.size()) {
        return std::string(s);
    }
    return std::string(s.substr(0, cut)) + "...";
}

} // namespace recall::common
