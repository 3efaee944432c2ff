// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#include <catch2/catch_test_macros.hpp>

#include <recall/crypto/hasher.h>

using namespace recall;
using namespace recall::crypto;

TEST_CASE("SHA256Hasher produces known digests", "[unit][crypto][sha256]") {
    CHECK(SHA256Hasher::hash("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(SHA256Hasher::hash("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256Hasher streams updates", "[unit][crypto][sha256]") {
    SHA256Hasher hasher;
    hasher.init();
    const std::string a = "ab";
    const std::string b = "c";
    hasher.update(std::as_bytes(std::span<const char>(a.data(), a.size())));
    hasher.update(std::as_bytes(std::span<const char>(b.data(), b.size())));
    CHECK(hasher.finalize() == SHA256Hasher::hash("abc"));
}

TEST_CASE("Content hasher is reusable and hex encoded", "[unit][crypto][sha256]") {
    auto hasher = createSHA256Hasher();
    auto first = hasher->hashText("met  john smith");
    auto second = hasher->hashText("met  john smith");
    CHECK(first == second);
    CHECK(first.size() == HASH_STRING_SIZE);
    CHECK(first.find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(hasher->hashText("other") != first);
}
