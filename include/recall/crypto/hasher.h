// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Recall Contributors

#pragma once

#include <recall/core/types.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace recall::crypto {

// Interface for streaming content hashers producing lowercase hex digests
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    std::string hashText(std::string_view text) {
        init();
        update(std::as_bytes(std::span<const char>(text.data(), text.size())));
        return finalize();
    }
};

// SHA-256 implementation backed by OpenSSL EVP
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    // One-shot hashing
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace recall::crypto
