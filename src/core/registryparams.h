// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_CORE_REGISTRYPARAMS_H
#define SEEDLINE_CORE_REGISTRYPARAMS_H

#include <amount.h>
#include <primitives/seed.h>

#include <cstdint>
#include <string>

class CConfigParser;

namespace Seedline {

enum Profile {
    STANDARD,   // 256-element codes
    EXTENDED    // 300-element codes
};

/**
 * Registry-wide constants fixed at construction time
 *
 * Built from a profile factory and then overridden from seedline.conf.
 */
class RegistryParams {
public:
    Profile profile;

    // Record layout
    uint32_t codeLength;            // Elements per code
    uint32_t founderSlots;          // FounderPending slots materialized by Initialize

    // Fees
    CAmount derivationFee;          // Paid by the creator of each derived record, accrues to the authority
    Account registryAccount;        // Ledger account that holds accrued fees

    // Policies
    bool releaseOnReconsolidate;    // Re-consolidation frees the founder's previous fingerprint
    bool generatorExclusive;        // Once a generator is installed, submitted codes are rejected
    bool mintingOpen;               // Initial value of the minting flag

    static constexpr uint32_t MAX_CODE_LENGTH = 4096;

    // Factory methods
    static RegistryParams Standard();
    static RegistryParams Extended();

    /**
     * Build params from configuration
     *
     * Keys: profile, codelength, founderslots, derivationfee, registryaccount,
     * releaseonreconsolidate, generatorexclusive, mintingopen.
     *
     * @param config Loaded configuration
     * @param[out] params Resulting parameters
     * @param[out] error Reason on failure
     * @return false if any value is out of range or malformed
     */
    static bool FromConfig(const CConfigParser& config, RegistryParams& params, std::string& error);

    const char* GetProfileName() const {
        return profile == STANDARD ? "standard" : "extended";
    }
};

/** Parse a 40-character hex account */
bool ParseAccount(const std::string& hex, Account& account);

} // namespace Seedline

#endif // SEEDLINE_CORE_REGISTRYPARAMS_H
