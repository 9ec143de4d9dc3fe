// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_PRIMITIVES_SEED_H
#define SEEDLINE_PRIMITIVES_SEED_H

#include <amount.h>
#include <uint256.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

/** Account identity as seen by the ownership ledger (20-byte address) */
typedef std::array<uint8_t, 20> Account;

/** Hex rendering of an account (40 chars) */
std::string AccountToHex(const Account& account);

/** Identifier of a seed record. 0 is never allocated. */
typedef uint64_t SeedId;

static const SeedId NULL_SEED_ID = 0;

/**
 * Lifecycle kind of a seed record
 *
 * FOUNDER_PENDING -> FOUNDER on consolidation. DERIVED records are
 * created in final form and are the only kind that can be mutated.
 */
enum class SeedKind : uint8_t {
    FOUNDER_PENDING = 0,
    FOUNDER = 1,
    DERIVED = 2
};

const char* SeedKindToString(SeedKind kind);

/**
 * CSeedCode - the heritable content of one record
 *
 * Fixed-length ordered sequence of small unsigned integers. The length is
 * a registry parameter; two codes are only comparable when their lengths
 * match.
 */
class CSeedCode {
public:
    CSeedCode() {}
    explicit CSeedCode(size_t length) : m_values(length, 0) {}
    explicit CSeedCode(const std::vector<uint8_t>& values) : m_values(values) {}

    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }

    uint8_t operator[](size_t i) const { return m_values[i]; }
    uint8_t& operator[](size_t i) { return m_values[i]; }

    const std::vector<uint8_t>& Values() const { return m_values; }

    /** SHA3-256 over the element sequence in order */
    uint256 GetHash() const;

    /** Hex rendering of the raw elements (for logs and the inspector) */
    std::string ToHex() const;

    bool operator==(const CSeedCode& other) const { return m_values == other.m_values; }
    bool operator!=(const CSeedCode& other) const { return m_values != other.m_values; }

private:
    std::vector<uint8_t> m_values;
};

/**
 * CSeed - one registry record
 *
 * `owner` is a snapshot taken from the ownership ledger when the record is
 * read; the registry never writes it.
 */
class CSeed {
public:
    SeedId nId;
    SeedKind kind;
    CSeedCode code;
    uint256 hashContent;          // SHA3-256 of code, empty for FOUNDER_PENDING
    uint32_t nMutations;
    bool fAllowUnsignedMutation;
    Account owner;
    uint64_t nCreated;            // sequence marker at creation/consolidation
    uint64_t nUpdated;            // sequence marker at last write
    CAmount nBreedingFee;         // owed to the owner when others recombine with this record

    CSeed() { SetNull(); }

    void SetNull() {
        nId = NULL_SEED_ID;
        kind = SeedKind::FOUNDER_PENDING;
        code = CSeedCode();
        hashContent.SetNull();
        nMutations = 0;
        fAllowUnsignedMutation = false;
        owner.fill(0);
        nCreated = 0;
        nUpdated = 0;
        nBreedingFee = 0;
    }

    bool IsNull() const { return nId == NULL_SEED_ID; }
    bool HasCode() const { return kind != SeedKind::FOUNDER_PENDING; }

    std::string ToString() const;
};

#endif // SEEDLINE_PRIMITIVES_SEED_H
