//
//  sha1_digest.hpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <openssl/evp.h>

inline constexpr size_t kSha1Size = 20;

using Sha1Digest = std::array<uint8_t, kSha1Size>;

// Incremental SHA-1 over OpenSSL EVP. Once an OpenSSL call fails the hasher
// stays failed and finish() returns nullopt.
class Sha1Hasher {
   public:
    Sha1Hasher();

    Sha1Hasher(const Sha1Hasher &) = delete;
    Sha1Hasher &operator=(const Sha1Hasher &) = delete;

    bool update(const uint8_t *data, size_t size);
    bool update(const std::vector<uint8_t> &data) { return update(data.data(), data.size()); }

    // Produces the digest; the hasher cannot be updated afterwards.
    std::optional<Sha1Digest> finish();

    bool ok() const { return ok_; }

   private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
    bool ok_ = false;
};

// One-shot digest.
std::optional<Sha1Digest> sha1_digest(const uint8_t *data, size_t size);
