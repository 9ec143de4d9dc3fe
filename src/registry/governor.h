// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_REGISTRY_GOVERNOR_H
#define SEEDLINE_REGISTRY_GOVERNOR_H

#include <primitives/seed.h>
#include <registry/ledger.h>
#include <registry/registry_state.h>
#include <registry/registry_status.h>

#include <cstdint>

/**
 * COwnershipGovernor - registry-level control succession
 *
 * Succession by comparative founder holdings:
 *
 *   OpenGate (authority, founding era complete, one-way)
 *   Claim    (gate open, claimant holds strictly more founders than the
 *             authority; pays out the authority's accrued balance)
 *     -> pending: Confirm by the new authority (terminal), or
 *                 Rollback by the immediately preceding authority while it
 *                 still holds strictly more founders than the current one
 *
 * Every transition is split into Check* (reads state and the ledger,
 * builds the settlement, never writes) and Apply* (writes state, cannot
 * fail). CSeedRegistry runs the settlement between the two.
 *
 * Thread Safety: Not thread-safe; driven by CSeedRegistry.
 */
class COwnershipGovernor {
public:
    explicit COwnershipGovernor(ISeedLedger& ledger) : m_ledger(ledger) {}

    /**
     * Count consolidated founders held by two accounts in one pass
     * @return false (EXTERNAL_FAILURE) if an owner lookup fails
     */
    bool CompareHoldings(const CRegistryState& state, const Account& challenger,
                         const Account& incumbent, uint32_t& nChallenger,
                         uint32_t& nIncumbent, CRegistryStatus& status) const;

    /** Founders held by one account */
    bool CountFounders(const CRegistryState& state, const Account& account,
                       uint32_t& nCount, CRegistryStatus& status) const;

    bool CheckOpenGate(const CRegistryState& state, const Account& caller,
                       CRegistryStatus& status) const;
    void ApplyOpenGate(CRegistryState& state) const;

    bool CheckClaim(const CRegistryState& state, const Account& caller,
                    const Account& registryAccount, CSettlement& settlement,
                    CRegistryStatus& status) const;
    void ApplyClaim(CRegistryState& state, const Account& caller) const;

    bool CheckRollback(const CRegistryState& state, const Account& caller,
                       const Account& registryAccount, CSettlement& settlement,
                       CRegistryStatus& status) const;
    void ApplyRollback(CRegistryState& state) const;

    bool CheckConfirm(const CRegistryState& state, const Account& caller,
                      CRegistryStatus& status) const;
    void ApplyConfirm(CRegistryState& state) const;

private:
    ISeedLedger& m_ledger;
};

#endif // SEEDLINE_REGISTRY_GOVERNOR_H
