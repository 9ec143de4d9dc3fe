// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_REGISTRY_RECOMBINATION_H
#define SEEDLINE_REGISTRY_RECOMBINATION_H

#include <primitives/seed.h>
#include <registry/registry_status.h>
#include <uint256.h>

#include <string>
#include <vector>

/**
 * CheckRecombination - envelope rule for derived codes
 *
 * For every position i, candidate[i] must lie in
 * [min(a[i], b[i]), max(a[i], b[i])]. Stops at the first violating
 * position and reports it through status (VALIDATION_FAILURE with a
 * CRangeViolation). Codes of different lengths are rejected with reason
 * "code-length-mismatch".
 *
 * Pure function, used for both creation and mutation.
 *
 * @return true if the candidate is inside the envelope everywhere
 */
bool CheckRecombination(const CSeedCode& parentA, const CSeedCode& parentB,
                        const CSeedCode& candidate, CRegistryStatus& status);

/**
 * IRecombinationGenerator - pluggable recombination policy
 *
 * Proposes a child code for two parents. Installed into CSeedRegistry by
 * the controlling authority and swappable over the registry's lifetime.
 * The registry re-validates every proposal, so implementations that do not
 * guarantee the envelope are still safe to install.
 */
class IRecombinationGenerator {
public:
    virtual ~IRecombinationGenerator() = default;

    /** Short policy name for logs */
    virtual std::string GetName() const = 0;

    /**
     * Account that acts for this generator. It may mutate records that
     * opted in to unsigned mutation without the owner's authorization.
     */
    virtual Account GetOperator() const = 0;

    /**
     * Propose a child code
     *
     * @param parentA First parent code
     * @param parentB Second parent code (same length as parentA)
     * @param seed Unpredictable seed (see DeriveGeneratorSeed)
     */
    virtual CSeedCode Propose(const CSeedCode& parentA, const CSeedCode& parentB,
                              const uint256& seed) const = 0;
};

/**
 * Combine environment entropy with the caller identity
 *
 * seed = SHA3-256(context || caller). The context is whatever the ledger
 * reports as unpredictable (e.g. the current round identifier).
 *
 * NOT cryptographically secure randomness: anyone who can influence or
 * withhold the context (a block producer) can bias or discard outcomes.
 * Production deployments should install a verifiable-randomness generator.
 */
uint256 DeriveGeneratorSeed(const std::vector<uint8_t>& context, const Account& caller);

/**
 * CPseudoRandomGenerator - default recombination policy
 *
 * For position i: d = SHA3-256(seed || i as 4-byte big-endian), read as a
 * 256-bit big-endian integer; child[i] = lo + d mod (hi - lo + 1). Always
 * inside the envelope by construction, and deterministic in
 * (parentA, parentB, seed).
 */
class CPseudoRandomGenerator : public IRecombinationGenerator {
public:
    explicit CPseudoRandomGenerator(const Account& op) : m_operator(op) {}

    std::string GetName() const override { return "pseudo-random"; }
    Account GetOperator() const override { return m_operator; }

    /** @throws std::invalid_argument if the parents differ in length */
    CSeedCode Propose(const CSeedCode& parentA, const CSeedCode& parentB,
                      const uint256& seed) const override;

    /** Position-local digest reduced modulo span (span in [1, 256]) */
    static uint32_t PositionValue(const uint256& seed, uint32_t position, uint32_t span);

private:
    Account m_operator;
};

#endif // SEEDLINE_REGISTRY_RECOMBINATION_H
