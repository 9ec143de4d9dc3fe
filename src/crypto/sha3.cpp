// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <crypto/sha3.h>

#include <openssl/evp.h>

#include <stdexcept>

void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    // Validate inputs
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("SHA3_256: data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument("SHA3_256: hash output buffer is NULL");
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("SHA3_256: EVP_MD_CTX_new failed");
    }

    unsigned int outLen = 0;
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha3_256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, hash, &outLen) == 1;

    EVP_MD_CTX_free(ctx);

    if (!ok || outLen != 32) {
        throw std::runtime_error("SHA3_256: OpenSSL digest failed");
    }
}

uint256 SHA3_256(const std::vector<uint8_t>& data) {
    uint256 result;
    SHA3_256(data.data(), data.size(), result.data);
    return result;
}
