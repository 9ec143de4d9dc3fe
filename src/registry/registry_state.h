// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_REGISTRY_REGISTRY_STATE_H
#define SEEDLINE_REGISTRY_REGISTRY_STATE_H

#include <amount.h>
#include <primitives/seed.h>
#include <registry/hash_index.h>

#include <cstdint>
#include <map>

/**
 * CRegistryState - the registry's whole mutable state
 *
 * Records, the fingerprint index, lifecycle flags and succession fields
 * live in this one aggregate. Operations receive it by exclusive
 * reference; CSeedDB persists it as a unit.
 */
class CRegistryState {
public:
    std::map<SeedId, CSeed> mapSeeds;
    CHashIndex hashIndex;

    // Lifecycle flags
    bool fInitialized;
    bool fMintingOpen;
    bool fFoundingEraComplete;
    bool fGateOpen;                 // One-way
    bool fGeneratorInstalled;       // One-way; survives restarts even though the generator object does not

    uint32_t nFounderSlots;         // Founders are ids 1..nFounderSlots
    SeedId nLastId;                 // Highest id handed out by the ledger
    uint64_t nLastMarker;           // Last created/updated marker written

    // Succession
    Account authority;
    Account previousAuthority;      // Meaningful only while fSuccessionPending
    bool fSuccessionPending;        // Claimed but not yet confirmed
    CAmount nAccruedBalance;        // Fees owed to the current authority

    CRegistryState() { SetNull(); }

    void SetNull() {
        mapSeeds.clear();
        hashIndex.Clear();
        fInitialized = false;
        fMintingOpen = false;
        fFoundingEraComplete = false;
        fGateOpen = false;
        fGeneratorInstalled = false;
        nFounderSlots = 0;
        nLastId = NULL_SEED_ID;
        nLastMarker = 0;
        authority.fill(0);
        previousAuthority.fill(0);
        fSuccessionPending = false;
        nAccruedBalance = 0;
    }

    bool IsFounderSlot(SeedId id) const { return id >= 1 && id <= nFounderSlots; }

    const CSeed* Find(SeedId id) const {
        auto it = mapSeeds.find(id);
        return it == mapSeeds.end() ? nullptr : &it->second;
    }

    CSeed* Find(SeedId id) {
        auto it = mapSeeds.find(id);
        return it == mapSeeds.end() ? nullptr : &it->second;
    }
};

#endif // SEEDLINE_REGISTRY_REGISTRY_STATE_H
