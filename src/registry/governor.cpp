// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <registry/governor.h>
#include <util/logging.h>

bool COwnershipGovernor::CompareHoldings(const CRegistryState& state, const Account& challenger,
                                         const Account& incumbent, uint32_t& nChallenger,
                                         uint32_t& nIncumbent, CRegistryStatus& status) const {
    nChallenger = 0;
    nIncumbent = 0;

    for (SeedId id = 1; id <= state.nFounderSlots; id++) {
        const CSeed* seed = state.Find(id);
        if (!seed || seed->kind != SeedKind::FOUNDER) {
            continue;  // Pending slots do not count
        }

        Account owner;
        if (!m_ledger.OwnerOf(id, owner)) {
            return status.Invalid(RegistryError::EXTERNAL_FAILURE, "owner-lookup-failed",
                                  "founder " + std::to_string(id));
        }
        if (owner == challenger) nChallenger++;
        if (owner == incumbent) nIncumbent++;
    }
    return true;
}

bool COwnershipGovernor::CountFounders(const CRegistryState& state, const Account& account,
                                       uint32_t& nCount, CRegistryStatus& status) const {
    uint32_t nUnused = 0;
    return CompareHoldings(state, account, account, nCount, nUnused, status);
}

bool COwnershipGovernor::CheckOpenGate(const CRegistryState& state, const Account& caller,
                                       CRegistryStatus& status) const {
    if (caller != state.authority) {
        return status.Invalid(RegistryError::AUTHORIZATION, "not-authority");
    }
    if (state.fGateOpen) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "gate-open");
    }
    if (!state.fFoundingEraComplete) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "era-not-ready");
    }
    return true;
}

void COwnershipGovernor::ApplyOpenGate(CRegistryState& state) const {
    state.fGateOpen = true;
    LogPrintGovernance(INFO, "Ownership gate opened by %s", AccountToHex(state.authority).c_str());
}

bool COwnershipGovernor::CheckClaim(const CRegistryState& state, const Account& caller,
                                    const Account& registryAccount, CSettlement& settlement,
                                    CRegistryStatus& status) const {
    if (!state.fGateOpen) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "gate-closed");
    }
    if (caller == state.authority) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "already-authority");
    }

    uint32_t nClaimant = 0;
    uint32_t nAuthority = 0;
    if (!CompareHoldings(state, caller, state.authority, nClaimant, nAuthority, status)) {
        return false;
    }
    if (nClaimant <= nAuthority) {
        return status.Invalid(RegistryError::AUTHORIZATION, "insufficient-holdings",
                              std::to_string(nClaimant) + " <= " + std::to_string(nAuthority));
    }

    settlement.AddTransfer(registryAccount, state.authority, state.nAccruedBalance);
    return true;
}

void COwnershipGovernor::ApplyClaim(CRegistryState& state, const Account& caller) const {
    LogPrintGovernance(INFO, "Control claimed by %s from %s (paid out %lld)",
                       AccountToHex(caller).c_str(), AccountToHex(state.authority).c_str(),
                       static_cast<long long>(state.nAccruedBalance));
    state.previousAuthority = state.authority;
    state.authority = caller;
    state.fSuccessionPending = true;
    state.nAccruedBalance = 0;
}

bool COwnershipGovernor::CheckRollback(const CRegistryState& state, const Account& caller,
                                       const Account& registryAccount, CSettlement& settlement,
                                       CRegistryStatus& status) const {
    if (!state.fSuccessionPending) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "succession-confirmed");
    }
    if (caller != state.previousAuthority) {
        return status.Invalid(RegistryError::AUTHORIZATION, "not-previous-authority");
    }

    uint32_t nPrevious = 0;
    uint32_t nCurrent = 0;
    if (!CompareHoldings(state, caller, state.authority, nPrevious, nCurrent, status)) {
        return false;
    }
    if (nPrevious <= nCurrent) {
        return status.Invalid(RegistryError::AUTHORIZATION, "insufficient-holdings",
                              std::to_string(nPrevious) + " <= " + std::to_string(nCurrent));
    }

    // The outgoing authority keeps what accrued under it
    settlement.AddTransfer(registryAccount, state.authority, state.nAccruedBalance);
    return true;
}

void COwnershipGovernor::ApplyRollback(CRegistryState& state) const {
    LogPrintGovernance(INFO, "Succession rolled back: %s restored over %s",
                       AccountToHex(state.previousAuthority).c_str(),
                       AccountToHex(state.authority).c_str());
    state.authority = state.previousAuthority;
    state.previousAuthority.fill(0);
    state.fSuccessionPending = false;
    state.nAccruedBalance = 0;
}

bool COwnershipGovernor::CheckConfirm(const CRegistryState& state, const Account& caller,
                                      CRegistryStatus& status) const {
    if (caller != state.authority) {
        return status.Invalid(RegistryError::AUTHORIZATION, "not-authority");
    }
    if (!state.fSuccessionPending) {
        return status.Invalid(RegistryError::STATE_CONFLICT, "nothing-to-confirm");
    }
    return true;
}

void COwnershipGovernor::ApplyConfirm(CRegistryState& state) const {
    LogPrintGovernance(INFO, "Succession confirmed by %s", AccountToHex(state.authority).c_str());
    state.previousAuthority.fill(0);
    state.fSuccessionPending = false;
}
