//
//  sha1_digest.cpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#include "sha1_digest.hpp"

Sha1Hasher::Sha1Hasher() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) == 1;
}

bool Sha1Hasher::update(const uint8_t *data, size_t size) {
    if (!ok_) {
        return false;
    }
    if (size > 0 && EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        ok_ = false;
    }
    return ok_;
}

std::optional<Sha1Digest> Sha1Hasher::finish() {
    if (!ok_) {
        return std::nullopt;
    }
    ok_ = false;
    Sha1Digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1 || len != kSha1Size) {
        return std::nullopt;
    }
    return digest;
}

std::optional<Sha1Digest> sha1_digest(const uint8_t *data, size_t size) {
    Sha1Hasher hasher;
    if (!hasher.update(data, size)) {
        return std::nullopt;
    }
    return hasher.finish();
}
