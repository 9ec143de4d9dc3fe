// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_REGISTRY_REGISTRY_STATUS_H
#define SEEDLINE_REGISTRY_REGISTRY_STATUS_H

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Outcome classes of a registry write
 *
 * Every rejected operation reports exactly one of these. A rejected
 * operation never leaves partial state behind.
 */
enum class RegistryError {
    NONE,                 // Success
    AUTHORIZATION,        // Caller lacks role, ownership or holdings margin
    STATE_CONFLICT,       // Wrong record kind or registry flag for this operation
    VALIDATION_FAILURE,   // Candidate code outside the parents' envelope (see CRangeViolation)
    DUPLICATE_CONTENT,    // Candidate fingerprint already reserved
    EXTERNAL_FAILURE,     // Ledger lookup or settlement failed or was rejected
    REENTRANCY_REJECTED   // Nested call while another write is in flight
};

const char* RegistryErrorToString(RegistryError error);

/**
 * First position where a candidate code left the [min, max] envelope of
 * its two parents.
 */
struct CRangeViolation {
    size_t nIndex;
    uint8_t nMin;
    uint8_t nValue;
    uint8_t nMax;

    CRangeViolation() : nIndex(0), nMin(0), nValue(0), nMax(0) {}
    CRangeViolation(size_t index, uint8_t min, uint8_t value, uint8_t max)
        : nIndex(index), nMin(min), nValue(value), nMax(max) {}

    std::string ToString() const;
};

/**
 * CRegistryStatus - result holder for registry operations
 *
 * Callers pass one in; on failure the operation fills the error class, a
 * short machine-readable reason ("era-not-ready", "duplicate-code", ...)
 * and an optional human-readable detail.
 */
class CRegistryStatus {
public:
    CRegistryStatus() : m_error(RegistryError::NONE) {}

    /** Record a failure. Always returns false so callers can `return status.Invalid(...)`. */
    bool Invalid(RegistryError error, const std::string& reason, const std::string& detail = "");

    /** Record a range failure with its diagnostics */
    bool InvalidRange(const CRangeViolation& violation, const std::string& detail = "");

    bool IsValid() const { return m_error == RegistryError::NONE; }
    bool IsInvalid() const { return m_error != RegistryError::NONE; }

    RegistryError GetError() const { return m_error; }
    const std::string& GetReason() const { return m_reason; }
    const std::string& GetDetail() const { return m_detail; }
    const CRangeViolation& GetViolation() const { return m_violation; }

    void Clear();

    std::string ToString() const;

private:
    RegistryError m_error;
    std::string m_reason;
    std::string m_detail;
    CRangeViolation m_violation;
};

#endif // SEEDLINE_REGISTRY_REGISTRY_STATUS_H
