// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_CRYPTO_SHA3_H
#define SEEDLINE_CRYPTO_SHA3_H

#include <stdint.h>
#include <stdlib.h>

#include <uint256.h>

#include <vector>

/**
 * SHA-3 (Keccak, NIST FIPS 202) hashing
 *
 * Content fingerprints and generator position digests are SHA3-256.
 * Backed by the OpenSSL EVP digest API.
 */

/**
 * Compute SHA3-256 hash of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 * @throws std::invalid_argument on null buffers, std::runtime_error if OpenSSL fails
 */
void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]);

/** Convenience overload returning the digest as a uint256 */
uint256 SHA3_256(const std::vector<uint8_t>& data);

#endif // SEEDLINE_CRYPTO_SHA3_H
