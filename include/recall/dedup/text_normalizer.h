// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <string>
#include <string_view>

namespace recall::dedup {

/**
 * Canonical form used for content fingerprints.
 *
 * Steps, in order: ASCII lowercase; collapse whitespace runs to one space and trim;
 * delete every run of . ! ? , ; : characters; delete the stop words
 * a, an, the, in, on, at, to, for, of, with, by (whole words only); trim.
 *
 * Stop-word removal leaves its surrounding spaces in place, so
 * "Met with John Smith." and "met with   john smith" both become "met  john smith".
 * Existing fingerprint indexes depend on this exact form.
 */
std::string normalize(std::string_view text);

// Number of code points kept in an index entry's normalized preview
inline constexpr size_t kPreviewLength = 100;

// normalize(text) cut to kPreviewLength code points, "..." appended when cut
std::string normalizedPreview(std::string_view text);

} // namespace recall::dedup
