// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <registry/seed_registry.h>
#include <util/logging.h>

#include <algorithm>
#include <exception>

namespace {

bool IsNullAccount(const Account& account) {
    return std::all_of(account.begin(), account.end(), [](uint8_t b) { return b == 0; });
}

} // namespace

CSeedRegistry::CSeedRegistry(const Seedline::RegistryParams& params, ISeedLedger& ledger)
    : m_params(params),
      m_ledger(ledger),
      m_governor(ledger),
      m_fBusy(false)
{
}

// ============================================================================
// Helpers
// ============================================================================

bool CSeedRegistry::Reject(const char* operation, const CRegistryStatus& status) const {
    LogPrintRegistry(DEBUG, "%s rejected: %s", operation, status.ToString().c_str());
    return false;
}

bool CSeedRegistry::RequireInitialized(CRegistryStatus& status) const {
    if (!m_state.fInitialized) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "not-initialized");
    }
    return true;
}

bool CSeedRegistry::RequireAuthority(const Account& caller, CRegistryStatus& status) const {
    if (caller != m_state.authority) {
        return status.Invalid(RegistryError::AUTHORIZATION, "not-authority");
    }
    return true;
}

bool CSeedRegistry::ResolveOwner(SeedId id, Account& owner, CRegistryStatus& status) const {
    if (!m_ledger.OwnerOf(id, owner)) {
        return status.Invalid(RegistryError::EXTERNAL_FAILURE, "owner-lookup-failed",
                              "seed " + std::to_string(id));
    }
    return true;
}

bool CSeedRegistry::RequireOwner(const Account& caller, SeedId id, CRegistryStatus& status) const {
    Account owner;
    if (!ResolveOwner(id, owner, status)) {
        return false;
    }
    if (owner != caller) {
        return status.Invalid(RegistryError::AUTHORIZATION, "not-owner");
    }
    return true;
}

bool CSeedRegistry::Settle(const CSettlement& settlement, CRegistryStatus& status) {
    if (settlement.IsEmpty()) {
        return true;
    }
    if (!MoneyRange(settlement.GetTotal())) {
        return status.Invalid(RegistryError::VALIDATION_FAILURE, "settlement-out-of-range");
    }

    std::string error;
    if (!m_ledger.Settle(settlement, error)) {
        return status.Invalid(RegistryError::EXTERNAL_FAILURE, "settlement-failed", error);
    }
    return true;
}

bool CSeedRegistry::ObtainCandidate(const Account& caller, const CSeedCode& codeA,
                                    const CSeedCode& codeB, const CSeedCode& submitted,
                                    CSeedCode& candidate, CRegistryStatus& status) const {
    if (m_generator) {
        if (!submitted.empty() && m_params.generatorExclusive) {
            return status.Invalid(RegistryError::STATE_CONFLICT, "generator-installed",
                                  "submitted codes are not accepted");
        }

        uint256 seed = DeriveGeneratorSeed(m_ledger.GetUnpredictableContext(), caller);
        try {
            candidate = m_generator->Propose(codeA, codeB, seed);
        } catch (const std::exception& e) {
            return status.Invalid(RegistryError::EXTERNAL_FAILURE, "generator-failed", e.what());
        }

        LogPrintRecombination(DEBUG, "%s proposed %s for %s",
                              m_generator->GetName().c_str(),
                              candidate.GetHash().GetHex().substr(0, 16).c_str(),
                              AccountToHex(caller).c_str());
        return true;
    }

    // A generator was installed before a restart but has not been re-attached
    if (m_state.fGeneratorInstalled && m_params.generatorExclusive) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "generator-missing");
    }
    if (submitted.empty()) {
        return status.Invalid(RegistryError::VALIDATION_FAILURE, "missing-code");
    }

    candidate = submitted;
    return true;
}

bool CSeedRegistry::ChargeBreedingFee(const Account& caller, const CSeed& seed,
                                      CSettlement& settlement, CRegistryStatus& status) const {
    if (seed.nBreedingFee <= 0) {
        return true;
    }

    Account owner;
    if (!ResolveOwner(seed.nId, owner, status)) {
        return false;
    }
    if (owner != caller) {
        settlement.AddTransfer(caller, owner, seed.nBreedingFee);
    }
    return true;
}

uint64_t CSeedRegistry::NextMarker() const {
    return std::max(m_ledger.GetHeight(), m_state.nLastMarker);
}

void CSeedRegistry::UpdateFoundingEra() {
    if (m_state.fFoundingEraComplete) {
        return;
    }

    for (SeedId id = 1; id <= m_state.nFounderSlots; id++) {
        const CSeed* seed = m_state.Find(id);
        if (!seed || seed->kind != SeedKind::FOUNDER) {
            return;
        }
    }

    m_state.fFoundingEraComplete = true;
    LogPrintRegistry(INFO, "Founding era complete (%u founders consolidated)", m_state.nFounderSlots);
}

// ============================================================================
// Initialization
// ============================================================================

bool CSeedRegistry::Initialize(const Account& authority, CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("initialize", status);
    }

    if (m_state.fInitialized) {
        status.Invalid(RegistryError::STATE_CONFLICT, "already-initialized");
        return Reject("initialize", status);
    }
    if (IsNullAccount(authority)) {
        status.Invalid(RegistryError::AUTHORIZATION, "null-authority");
        return Reject("initialize", status);
    }

    // Founder slots are ids 1..N
    SeedId nNextId = m_ledger.GetNextId();
    if (nNextId != 1) {
        LogPrintRegistry(ERROR, "Ledger would allocate founder slot 1 as id %llu",
                         static_cast<unsigned long long>(nNextId));
        status.Invalid(RegistryError::EXTERNAL_FAILURE, "id-allocation-mismatch");
        return Reject("initialize", status);
    }

    CSettlement settlement;
    settlement.vMints.assign(m_params.founderSlots, authority);
    settlement.nFirstMintId = 1;

    if (!Settle(settlement, status)) {
        return Reject("initialize", status);
    }

    uint64_t marker = NextMarker();
    for (SeedId id = 1; id <= m_params.founderSlots; id++) {
        CSeed seed;
        seed.nId = id;
        seed.kind = SeedKind::FOUNDER_PENDING;
        seed.nCreated = marker;
        seed.nUpdated = marker;
        m_state.mapSeeds[id] = seed;
    }
    m_state.nFounderSlots = m_params.founderSlots;
    m_state.nLastId = m_params.founderSlots;
    m_state.nLastMarker = marker;
    m_state.authority = authority;
    m_state.fMintingOpen = m_params.mintingOpen;
    m_state.fInitialized = true;

    LogPrintRegistry(INFO, "Registry initialized: %u founder slots, %u-element codes, authority %s",
                     m_params.founderSlots, m_params.codeLength, AccountToHex(authority).c_str());
    return true;
}

// ============================================================================
// Consolidation
// ============================================================================

bool CSeedRegistry::Consolidate(const Account& caller, SeedId id, const CSeedCode& code,
                                CRegistryStatus& status, CSeed* out) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("consolidate", status);
    }
    if (!ConsolidateImpl(caller, id, code, status, out)) {
        return Reject("consolidate", status);
    }
    return true;
}

bool CSeedRegistry::ConsolidateImpl(const Account& caller, SeedId id, const CSeedCode& code,
                                    CRegistryStatus& status, CSeed* out) {
    if (!RequireInitialized(status) || !RequireAuthority(caller, status)) {
        return false;
    }

    CSeed* seed = m_state.Find(id);
    if (!seed || !m_state.IsFounderSlot(id)) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "unknown-founder",
                              "seed " + std::to_string(id));
    }
    if (seed->kind == SeedKind::FOUNDER && m_state.fGateOpen) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "consolidation-closed");
    }
    if (seed->kind == SeedKind::DERIVED) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "wrong-kind");
    }
    if (code.size() != m_params.codeLength) {
        return status.Invalid(RegistryError::VALIDATION_FAILURE, "code-length-mismatch",
                              std::to_string(code.size()) + " != " + std::to_string(m_params.codeLength));
    }

    uint256 hash = code.GetHash();
    bool fReconsolidation = seed->kind == SeedKind::FOUNDER;
    bool fSameCode = fReconsolidation && seed->hashContent == hash;
    if (!fSameCode && m_state.hashIndex.Contains(hash)) {
        return status.Invalid(RegistryError::DUPLICATE_CONTENT, "duplicate-code", hash.GetHex());
    }

    Account owner;
    if (out && !ResolveOwner(id, owner, status)) {
        return false;
    }

    // Checks done; nothing below can fail
    uint64_t marker = NextMarker();
    if (fReconsolidation && !fSameCode && m_params.releaseOnReconsolidate) {
        m_state.hashIndex.Release(seed->hashContent);
    }
    m_state.hashIndex.Reserve(hash);

    seed->code = code;
    seed->hashContent = hash;
    seed->kind = SeedKind::FOUNDER;
    seed->nCreated = marker;
    seed->nUpdated = marker;
    m_state.nLastMarker = marker;

    UpdateFoundingEra();

    LogPrintRegistry(INFO, "%s founder %llu (%s)",
                     fReconsolidation ? "Re-consolidated" : "Consolidated",
                     static_cast<unsigned long long>(id), hash.GetHex().substr(0, 16).c_str());

    if (out) {
        *out = *seed;
        out->owner = owner;
    }
    return true;
}

// ============================================================================
// Derived creation
// ============================================================================

bool CSeedRegistry::CreateDerived(const Account& caller, const Account& to, SeedId parentA,
                                  SeedId parentB, const CSeedCode& code,
                                  CRegistryStatus& status, CSeed* out) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("create-derived", status);
    }
    if (!CreateDerivedImpl(caller, to, parentA, parentB, code, status, out)) {
        return Reject("create-derived", status);
    }
    return true;
}

bool CSeedRegistry::CreateDerivedImpl(const Account& caller, const Account& to, SeedId parentA,
                                      SeedId parentB, const CSeedCode& code,
                                      CRegistryStatus& status, CSeed* out) {
    if (!RequireInitialized(status)) {
        return false;
    }
    if (!m_state.fMintingOpen) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "minting-closed");
    }
    if (!m_state.fFoundingEraComplete) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "era-not-ready");
    }
    if (IsNullAccount(to)) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "null-recipient");
    }

    const CSeed* seedA = m_state.Find(parentA);
    const CSeed* seedB = m_state.Find(parentB);
    if (!seedA || !seedB) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "unknown-seed");
    }
    if (seedA->kind != SeedKind::FOUNDER || seedB->kind != SeedKind::FOUNDER) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "wrong-parent-kind");
    }

    CSeedCode candidate;
    if (!ObtainCandidate(caller, seedA->code, seedB->code, code, candidate, status)) {
        return false;
    }
    if (!CheckRecombination(seedA->code, seedB->code, candidate, status)) {
        return false;
    }

    uint256 hash = candidate.GetHash();
    if (m_state.hashIndex.Contains(hash)) {
        return status.Invalid(RegistryError::DUPLICATE_CONTENT, "duplicate-code", hash.GetHex());
    }

    CAmount nAccrued = m_state.nAccruedBalance + m_params.derivationFee;
    if (!MoneyRange(nAccrued)) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "accrued-balance-overflow");
    }

    SeedId id = m_ledger.GetNextId();
    if (id <= m_state.nLastId || m_state.Find(id)) {
        LogPrintRegistry(ERROR, "Ledger would allocate non-increasing id %llu (last %llu)",
                         static_cast<unsigned long long>(id),
                         static_cast<unsigned long long>(m_state.nLastId));
        return status.Invalid(RegistryError::EXTERNAL_FAILURE, "id-allocation-mismatch");
    }

    CSettlement settlement;
    if (!ChargeBreedingFee(caller, *seedA, settlement, status)) {
        return false;
    }
    if (parentB != parentA && !ChargeBreedingFee(caller, *seedB, settlement, status)) {
        return false;
    }
    settlement.AddTransfer(caller, m_params.registryAccount, m_params.derivationFee);
    settlement.vMints.push_back(to);
    settlement.nFirstMintId = id;

    if (!Settle(settlement, status)) {
        return false;
    }

    uint64_t marker = NextMarker();
    m_state.hashIndex.Reserve(hash);

    CSeed& seed = m_state.mapSeeds[id];
    seed.nId = id;
    seed.kind = SeedKind::DERIVED;
    seed.code = candidate;
    seed.hashContent = hash;
    seed.nCreated = marker;
    seed.nUpdated = marker;

    m_state.nLastId = id;
    m_state.nLastMarker = marker;
    m_state.nAccruedBalance = nAccrued;

    LogPrintRegistry(INFO, "Derived %llu from %llu x %llu for %s (%s)",
                     static_cast<unsigned long long>(id),
                     static_cast<unsigned long long>(parentA),
                     static_cast<unsigned long long>(parentB),
                     AccountToHex(to).c_str(), hash.GetHex().substr(0, 16).c_str());

    if (out) {
        *out = seed;
        out->owner = to;
    }
    return true;
}

// ============================================================================
// Mutation
// ============================================================================

bool CSeedRegistry::Mutate(const Account& caller, SeedId id, SeedId mutatorId,
                           const CSeedCode& code, CRegistryStatus& status, CSeed* out) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("mutate", status);
    }
    if (!MutateImpl(caller, id, mutatorId, code, status, out)) {
        return Reject("mutate", status);
    }
    return true;
}

bool CSeedRegistry::MutateImpl(const Account& caller, SeedId id, SeedId mutatorId,
                               const CSeedCode& code, CRegistryStatus& status, CSeed* out) {
    if (!RequireInitialized(status)) {
        return false;
    }

    CSeed* seed = m_state.Find(id);
    if (!seed) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "unknown-seed",
                              "seed " + std::to_string(id));
    }
    if (seed->kind != SeedKind::DERIVED) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "wrong-kind");
    }

    Account owner;
    if (!ResolveOwner(id, owner, status)) {
        return false;
    }
    bool fDelegated = false;
    if (caller != owner) {
        bool fOperator = m_generator && caller == m_generator->GetOperator();
        if (!seed->fAllowUnsignedMutation || !fOperator) {
            return status.Invalid(RegistryError::AUTHORIZATION, "not-owner");
        }
        fDelegated = true;
    }

    const CSeed* mutator = m_state.Find(mutatorId);
    if (!mutator) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "unknown-seed",
                              "mutator " + std::to_string(mutatorId));
    }
    if (!mutator->HasCode()) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "mutator-pending");
    }

    CSeedCode candidate;
    if (!ObtainCandidate(caller, seed->code, mutator->code, code, candidate, status)) {
        return false;
    }
    if (!CheckRecombination(seed->code, mutator->code, candidate, status)) {
        return false;
    }

    uint256 hash = candidate.GetHash();
    if (m_state.hashIndex.Contains(hash)) {
        return status.Invalid(RegistryError::DUPLICATE_CONTENT, "duplicate-code", hash.GetHex());
    }

    CSettlement settlement;
    if (mutatorId != id && !ChargeBreedingFee(caller, *mutator, settlement, status)) {
        return false;
    }

    if (!Settle(settlement, status)) {
        return false;
    }

    // The previous fingerprint stays reserved
    uint64_t marker = NextMarker();
    m_state.hashIndex.Reserve(hash);
    seed->code = candidate;
    seed->hashContent = hash;
    seed->nMutations++;
    seed->nUpdated = marker;
    m_state.nLastMarker = marker;

    LogPrintRegistry(INFO, "Mutated %llu with %llu%s (mutation %u, %s)",
                     static_cast<unsigned long long>(id),
                     static_cast<unsigned long long>(mutatorId),
                     fDelegated ? " via generator operator" : "",
                     seed->nMutations, hash.GetHex().substr(0, 16).c_str());

    if (out) {
        *out = *seed;
        out->owner = owner;
    }
    return true;
}

bool CSeedRegistry::SetUnsignedMutation(const Account& caller, SeedId id, bool fAllow,
                                        CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("set-unsigned-mutation", status);
    }

    CSeed* seed = m_state.Find(id);
    if (!RequireInitialized(status)) {
        return Reject("set-unsigned-mutation", status);
    }
    if (!seed) {
        status.Invalid(RegistryError::STATE_CONFLICT, "unknown-seed", "seed " + std::to_string(id));
        return Reject("set-unsigned-mutation", status);
    }
    if (!RequireOwner(caller, id, status)) {
        return Reject("set-unsigned-mutation", status);
    }

    seed->fAllowUnsignedMutation = fAllow;
    LogPrintRegistry(INFO, "Unsigned mutation %s for %llu",
                     fAllow ? "enabled" : "disabled", static_cast<unsigned long long>(id));
    return true;
}

bool CSeedRegistry::SetBreedingFee(const Account& caller, SeedId id, CAmount nFee,
                                   CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("set-breeding-fee", status);
    }

    CSeed* seed = m_state.Find(id);
    if (!RequireInitialized(status)) {
        return Reject("set-breeding-fee", status);
    }
    if (!seed) {
        status.Invalid(RegistryError::STATE_CONFLICT, "unknown-seed", "seed " + std::to_string(id));
        return Reject("set-breeding-fee", status);
    }
    if (!MoneyRange(nFee)) {
        status.Invalid(RegistryError::VALIDATION_FAILURE, "fee-out-of-range");
        return Reject("set-breeding-fee", status);
    }
    if (!RequireOwner(caller, id, status)) {
        return Reject("set-breeding-fee", status);
    }

    seed->nBreedingFee = nFee;
    LogPrintRegistry(DEBUG, "Breeding fee for %llu set to %lld",
                     static_cast<unsigned long long>(id), static_cast<long long>(nFee));
    return true;
}

// ============================================================================
// Administration
// ============================================================================

bool CSeedRegistry::SetMintingOpen(const Account& caller, bool fOpen, CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("set-minting-open", status);
    }
    if (!RequireInitialized(status) || !RequireAuthority(caller, status)) {
        return Reject("set-minting-open", status);
    }

    m_state.fMintingOpen = fOpen;
    LogPrintRegistry(INFO, "Minting %s", fOpen ? "opened" : "closed");
    return true;
}

bool CSeedRegistry::CompleteFoundingEra(const Account& caller, CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("complete-founding-era", status);
    }
    if (!RequireInitialized(status) || !RequireAuthority(caller, status)) {
        return Reject("complete-founding-era", status);
    }
    if (m_state.fFoundingEraComplete) {
        status.Invalid(RegistryError::STATE_CONFLICT, "era-complete");
        return Reject("complete-founding-era", status);
    }

    m_state.fFoundingEraComplete = true;
    LogPrintRegistry(INFO, "Founding era completed by authority");
    return true;
}

bool CSeedRegistry::SetGenerator(const Account& caller,
                                 std::shared_ptr<IRecombinationGenerator> generator,
                                 CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("set-generator", status);
    }
    if (!RequireInitialized(status) || !RequireAuthority(caller, status)) {
        return Reject("set-generator", status);
    }
    if (!generator) {
        status.Invalid(RegistryError::STATE_CONFLICT, "generator-required");
        return Reject("set-generator", status);
    }

    LogPrintRecombination(INFO, "Generator %s installed (replaces %s), operator %s",
                          generator->GetName().c_str(),
                          m_generator ? m_generator->GetName().c_str() : "none",
                          AccountToHex(generator->GetOperator()).c_str());
    m_generator = std::move(generator);
    m_state.fGeneratorInstalled = true;
    return true;
}

// ============================================================================
// Governance
// ============================================================================

bool CSeedRegistry::OpenGate(const Account& caller, CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("open-gate", status);
    }
    if (!RequireInitialized(status) || !m_governor.CheckOpenGate(m_state, caller, status)) {
        return Reject("open-gate", status);
    }

    m_governor.ApplyOpenGate(m_state);
    return true;
}

bool CSeedRegistry::Claim(const Account& caller, CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("claim", status);
    }

    CSettlement settlement;
    if (!RequireInitialized(status) ||
        !m_governor.CheckClaim(m_state, caller, m_params.registryAccount, settlement, status)) {
        return Reject("claim", status);
    }

    if (!Settle(settlement, status)) {
        return Reject("claim", status);
    }

    m_governor.ApplyClaim(m_state, caller);
    return true;
}

bool CSeedRegistry::Rollback(const Account& caller, CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("rollback", status);
    }

    CSettlement settlement;
    if (!RequireInitialized(status) ||
        !m_governor.CheckRollback(m_state, caller, m_params.registryAccount, settlement, status)) {
        return Reject("rollback", status);
    }

    if (!Settle(settlement, status)) {
        return Reject("rollback", status);
    }

    m_governor.ApplyRollback(m_state);
    return true;
}

bool CSeedRegistry::Confirm(const Account& caller, CRegistryStatus& status) {
    CReentrancyGuard guard(m_fBusy);
    if (!guard.Acquired()) {
        status.Invalid(RegistryError::REENTRANCY_REJECTED, "reentrant-call");
        return Reject("confirm", status);
    }
    if (!RequireInitialized(status) || !m_governor.CheckConfirm(m_state, caller, status)) {
        return Reject("confirm", status);
    }

    m_governor.ApplyConfirm(m_state);
    return true;
}

// ============================================================================
// Reads
// ============================================================================

bool CSeedRegistry::GetSeed(SeedId id, CSeed& out) const {
    const CSeed* seed = m_state.Find(id);
    if (!seed) {
        return false;
    }

    Account owner;
    if (!m_ledger.OwnerOf(id, owner)) {
        return false;
    }

    out = *seed;
    out.owner = owner;
    return true;
}

bool CSeedRegistry::HashExists(const uint256& hash) const {
    return m_state.hashIndex.Contains(hash);
}

bool CSeedRegistry::CodeExists(const CSeedCode& code) const {
    return m_state.hashIndex.Contains(code.GetHash());
}

bool CSeedRegistry::CountFoundersOwnedBy(const Account& account, uint32_t& nCount) const {
    CRegistryStatus status;
    return m_governor.CountFounders(m_state, account, nCount, status);
}

// ============================================================================
// Persistence hooks
// ============================================================================

bool CSeedRegistry::LoadState(const CRegistryState& state, std::string& error) {
    if (m_fBusy) {
        error = "operation in flight";
        return false;
    }

    if (state.fInitialized) {
        if (state.nFounderSlots != m_params.founderSlots) {
            error = "founder slot count " + std::to_string(state.nFounderSlots) +
                    " does not match params (" + std::to_string(m_params.founderSlots) + ")";
            return false;
        }
        for (SeedId id = 1; id <= state.nFounderSlots; id++) {
            if (!state.Find(id)) {
                error = "founder slot " + std::to_string(id) + " missing";
                return false;
            }
        }
    }
    for (const auto& entry : state.mapSeeds) {
        const CSeed& seed = entry.second;
        if (seed.HasCode() && seed.code.size() != m_params.codeLength) {
            error = "seed " + std::to_string(entry.first) + " has code length " +
                    std::to_string(seed.code.size());
            return false;
        }
    }

    m_state = state;
    LogPrintRegistry(INFO, "Loaded registry state: %zu records, %zu reserved fingerprints",
                     m_state.mapSeeds.size(), m_state.hashIndex.Size());
    return true;
}
