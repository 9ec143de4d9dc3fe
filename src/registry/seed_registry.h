// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_REGISTRY_SEED_REGISTRY_H
#define SEEDLINE_REGISTRY_SEED_REGISTRY_H

#include <amount.h>
#include <core/registryparams.h>
#include <primitives/seed.h>
#include <registry/governor.h>
#include <registry/ledger.h>
#include <registry/recombination.h>
#include <registry/registry_state.h>
#include <registry/registry_status.h>
#include <uint256.h>

#include <memory>
#include <string>
#include <vector>

/**
 * CSeedRegistry
 *
 * Registry of genetically linked records. Founders are materialized as
 * pending slots and consolidated by the controlling authority; derived
 * records are created by recombining two founders and may later be
 * mutated against a second record. Content uniqueness is enforced through
 * CHashIndex, the per-position envelope through CheckRecombination.
 *
 * Every write:
 * - takes the calling account explicitly,
 * - returns true on success and optionally copies the resulting record
 *   into `out`,
 * - on failure fills `status` with one RegistryError and leaves the state
 *   exactly as it was.
 *
 * All checks and ledger reads happen first, then at most one
 * ISeedLedger::Settle call, then the state writes (which cannot fail). A
 * busy flag is held for the whole operation; any nested write (for
 * example from inside Settle) is rejected with REENTRANCY_REJECTED.
 *
 * Thread Safety: Not thread-safe. Operations must be serialized by the
 * caller; the registry models a single-writer execution log.
 */
class CSeedRegistry
{
public:
    CSeedRegistry(const Seedline::RegistryParams& params, ISeedLedger& ledger);
    ~CSeedRegistry() = default;

    // Prevent copying
    CSeedRegistry(const CSeedRegistry&) = delete;
    CSeedRegistry& operator=(const CSeedRegistry&) = delete;

    /**
     * Initialize - materialize founder slots
     *
     * Mints params.founderSlots records (ids 1..N) to `authority` through
     * one settlement and makes `authority` the controlling account.
     * Allowed once.
     */
    bool Initialize(const Account& authority, CRegistryStatus& status);

    // ------------------------------------------------------------------
    // Creation
    // ------------------------------------------------------------------

    /**
     * Consolidate - write a founder's code
     *
     * Authority only. Allowed on a FOUNDER_PENDING slot, or on a FOUNDER
     * while the ownership gate is still closed (the new code overwrites).
     * Consolidating the last pending slot completes the founding era.
     *
     * Fails with AUTHORIZATION, STATE_CONFLICT, VALIDATION_FAILURE
     * (wrong code length) or DUPLICATE_CONTENT.
     */
    bool Consolidate(const Account& caller, SeedId id, const CSeedCode& code,
                     CRegistryStatus& status, CSeed* out = nullptr);

    /**
     * CreateDerived - recombine two founders into a new record owned by `to`
     *
     * With a generator installed the code comes from the generator and
     * `code` must be empty (when generatorExclusive). Without one, `code`
     * is the caller's candidate. Either way it is checked against the
     * parents' current codes.
     *
     * Fees: the parents' breeding fees (to their owners, unless the caller
     * owns them) and the derivation fee (to the registry account).
     *
     * Fails with STATE_CONFLICT (minting closed, era not ready, wrong
     * parent kind), VALIDATION_FAILURE, DUPLICATE_CONTENT or
     * EXTERNAL_FAILURE.
     */
    bool CreateDerived(const Account& caller, const Account& to, SeedId parentA, SeedId parentB,
                       const CSeedCode& code, CRegistryStatus& status, CSeed* out = nullptr);

    // ------------------------------------------------------------------
    // Mutation
    // ------------------------------------------------------------------

    /**
     * Mutate - replace a derived record's code
     *
     * The candidate must lie inside the envelope of the record's current
     * code and the mutator's current code (the mutator may be of any
     * consolidated kind). Caller must own the record, unless the record
     * allows unsigned mutation and the caller is the installed
     * generator's operator. The old fingerprint stays reserved.
     */
    bool Mutate(const Account& caller, SeedId id, SeedId mutatorId, const CSeedCode& code,
                CRegistryStatus& status, CSeed* out = nullptr);

    /** Owner-only opt-in for generator-driven mutation */
    bool SetUnsignedMutation(const Account& caller, SeedId id, bool fAllow, CRegistryStatus& status);

    /** Owner-only fee charged to other accounts that recombine with this record */
    bool SetBreedingFee(const Account& caller, SeedId id, CAmount nFee, CRegistryStatus& status);

    // ------------------------------------------------------------------
    // Administration (authority only)
    // ------------------------------------------------------------------

    bool SetMintingOpen(const Account& caller, bool fOpen, CRegistryStatus& status);

    /** Explicitly end the founding era before every slot is consolidated */
    bool CompleteFoundingEra(const Account& caller, CRegistryStatus& status);

    /**
     * Install or swap the recombination generator
     *
     * A generator can be replaced but never removed; passing nullptr is
     * rejected with STATE_CONFLICT.
     */
    bool SetGenerator(const Account& caller, std::shared_ptr<IRecombinationGenerator> generator,
                      CRegistryStatus& status);

    // ------------------------------------------------------------------
    // Governance
    // ------------------------------------------------------------------

    bool OpenGate(const Account& caller, CRegistryStatus& status);
    bool Claim(const Account& caller, CRegistryStatus& status);
    bool Rollback(const Account& caller, CRegistryStatus& status);
    bool Confirm(const Account& caller, CRegistryStatus& status);

    // ------------------------------------------------------------------
    // Reads
    // ------------------------------------------------------------------

    /**
     * Snapshot of one record, owner filled from the ledger
     * @return false if the id is unknown or the owner lookup fails
     */
    bool GetSeed(SeedId id, CSeed& out) const;

    bool HashExists(const uint256& hash) const;
    bool CodeExists(const CSeedCode& code) const;

    bool IsInitialized() const { return m_state.fInitialized; }
    bool IsGateOpen() const { return m_state.fGateOpen; }
    bool IsMintingOpen() const { return m_state.fMintingOpen; }
    bool IsFoundingEraComplete() const { return m_state.fFoundingEraComplete; }
    bool IsSuccessionPending() const { return m_state.fSuccessionPending; }
    bool HasGenerator() const { return m_generator != nullptr; }

    Account GetAuthority() const { return m_state.authority; }
    CAmount GetAccruedBalance() const { return m_state.nAccruedBalance; }
    size_t GetSeedCount() const { return m_state.mapSeeds.size(); }

    /** Consolidated founders currently held by `account` */
    bool CountFoundersOwnedBy(const Account& account, uint32_t& nCount) const;

    const Seedline::RegistryParams& GetParams() const { return m_params; }

    // ------------------------------------------------------------------
    // Persistence hooks
    // ------------------------------------------------------------------

    const CRegistryState& GetState() const { return m_state; }

    /**
     * Replace the in-memory state (after CSeedDB::ReadState)
     *
     * Rejected while an operation is in flight or if the state does not
     * fit the params (founder count, code length).
     */
    bool LoadState(const CRegistryState& state, std::string& error);

private:
    /** Scoped busy flag. Acquired() is false if another write is in flight. */
    class CReentrancyGuard {
    public:
        explicit CReentrancyGuard(bool& fBusy) : m_fBusy(fBusy), m_fAcquired(!fBusy) {
            if (m_fAcquired) m_fBusy = true;
        }
        ~CReentrancyGuard() {
            if (m_fAcquired) m_fBusy = false;
        }
        CReentrancyGuard(const CReentrancyGuard&) = delete;
        CReentrancyGuard& operator=(const CReentrancyGuard&) = delete;

        bool Acquired() const { return m_fAcquired; }

    private:
        bool& m_fBusy;
        bool m_fAcquired;
    };

    // Operation bodies (run under the guard)
    bool ConsolidateImpl(const Account& caller, SeedId id, const CSeedCode& code,
                         CRegistryStatus& status, CSeed* out);
    bool CreateDerivedImpl(const Account& caller, const Account& to, SeedId parentA, SeedId parentB,
                           const CSeedCode& code, CRegistryStatus& status, CSeed* out);
    bool MutateImpl(const Account& caller, SeedId id, SeedId mutatorId, const CSeedCode& code,
                    CRegistryStatus& status, CSeed* out);

    /** Log a rejected write and pass the failure through */
    bool Reject(const char* operation, const CRegistryStatus& status) const;

    bool RequireInitialized(CRegistryStatus& status) const;
    bool RequireAuthority(const Account& caller, CRegistryStatus& status) const;
    bool RequireOwner(const Account& caller, SeedId id, CRegistryStatus& status) const;

    /** Ledger owner lookup mapped to EXTERNAL_FAILURE */
    bool ResolveOwner(SeedId id, Account& owner, CRegistryStatus& status) const;

    /** Run the settlement (skipped when empty) */
    bool Settle(const CSettlement& settlement, CRegistryStatus& status);

    /**
     * Pick the candidate code: the generator's proposal if one is
     * installed, otherwise the submitted code.
     */
    bool ObtainCandidate(const Account& caller, const CSeedCode& codeA, const CSeedCode& codeB,
                         const CSeedCode& submitted, CSeedCode& candidate,
                         CRegistryStatus& status) const;

    /** Add a record's breeding fee to the settlement unless caller owns it */
    bool ChargeBreedingFee(const Account& caller, const CSeed& seed, CSettlement& settlement,
                           CRegistryStatus& status) const;

    /** Non-decreasing sequence marker for the next write */
    uint64_t NextMarker() const;

    /** Mark the founding era complete once every founder slot is consolidated */
    void UpdateFoundingEra();

    Seedline::RegistryParams m_params;
    ISeedLedger& m_ledger;
    COwnershipGovernor m_governor;
    std::shared_ptr<IRecombinationGenerator> m_generator;
    CRegistryState m_state;
    bool m_fBusy;
};

#endif // SEEDLINE_REGISTRY_SEED_REGISTRY_H
