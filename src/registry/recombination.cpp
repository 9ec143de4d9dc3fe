// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <registry/recombination.h>
#include <crypto/sha3.h>

#include <algorithm>
#include <stdexcept>

bool CheckRecombination(const CSeedCode& parentA, const CSeedCode& parentB,
                        const CSeedCode& candidate, CRegistryStatus& status) {
    if (parentA.size() != parentB.size() || candidate.size() != parentA.size()) {
        return status.Invalid(RegistryError::VALIDATION_FAILURE, "code-length-mismatch",
                              "parents " + std::to_string(parentA.size()) + "/" +
                              std::to_string(parentB.size()) + ", candidate " +
                              std::to_string(candidate.size()));
    }

    for (size_t i = 0; i < candidate.size(); i++) {
        uint8_t lo = std::min(parentA[i], parentB[i]);
        uint8_t hi = std::max(parentA[i], parentB[i]);
        if (candidate[i] < lo || candidate[i] > hi) {
            return status.InvalidRange(CRangeViolation(i, lo, candidate[i], hi));
        }
    }

    return true;
}

uint256 DeriveGeneratorSeed(const std::vector<uint8_t>& context, const Account& caller) {
    std::vector<uint8_t> material;
    material.reserve(context.size() + caller.size());
    material.insert(material.end(), context.begin(), context.end());
    material.insert(material.end(), caller.begin(), caller.end());
    return SHA3_256(material);
}

uint32_t CPseudoRandomGenerator::PositionValue(const uint256& seed, uint32_t position, uint32_t span) {
    if (span == 0) {
        throw std::invalid_argument("PositionValue: span must be positive");
    }

    uint8_t buffer[36];
    std::copy(seed.begin(), seed.end(), buffer);
    buffer[32] = static_cast<uint8_t>(position >> 24);
    buffer[33] = static_cast<uint8_t>(position >> 16);
    buffer[34] = static_cast<uint8_t>(position >> 8);
    buffer[35] = static_cast<uint8_t>(position);

    uint8_t digest[32];
    SHA3_256(buffer, sizeof(buffer), digest);

    // Big-endian 256-bit integer modulo span, one byte at a time
    uint32_t remainder = 0;
    for (int i = 0; i < 32; i++) {
        remainder = ((remainder << 8) | digest[i]) % span;
    }
    return remainder;
}

CSeedCode CPseudoRandomGenerator::Propose(const CSeedCode& parentA, const CSeedCode& parentB,
                                          const uint256& seed) const {
    if (parentA.size() != parentB.size()) {
        throw std::invalid_argument("CPseudoRandomGenerator: parent code lengths differ");
    }

    CSeedCode child(parentA.size());
    for (size_t i = 0; i < parentA.size(); i++) {
        uint32_t lo = std::min(parentA[i], parentB[i]);
        uint32_t hi = std::max(parentA[i], parentB[i]);
        child[i] = static_cast<uint8_t>(lo + PositionValue(seed, static_cast<uint32_t>(i), hi - lo + 1));
    }
    return child;
}
