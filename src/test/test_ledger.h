// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_TEST_TEST_LEDGER_H
#define SEEDLINE_TEST_TEST_LEDGER_H

#include <registry/ledger.h>
#include <primitives/seed.h>

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

/** Account filled with one byte value */
inline Account MakeAccount(uint8_t fill) {
    Account account;
    account.fill(fill);
    return account;
}

/** Code of `length` elements, all equal to `value` */
inline CSeedCode MakeCode(size_t length, uint8_t value) {
    return CSeedCode(std::vector<uint8_t>(length, value));
}

/**
 * In-memory ownership ledger for tests
 *
 * Tracks owners and balances, allocates ids sequentially, records every
 * settlement it applied, and can be told to fail, to misreport its next id,
 * or to call back into the registry from inside Settle.
 */
class CTestLedger : public ISeedLedger {
public:
    std::map<SeedId, Account> mapOwners;
    std::map<Account, CAmount> mapBalances;
    std::vector<CSettlement> vSettlements;   // Applied settlements, in order

    SeedId nNextId{1};
    SeedId nAdvertisedNextId{0};             // GetNextId answer when non-zero
    uint64_t nHeight{0};
    std::vector<uint8_t> vContext{0x01, 0x02, 0x03};

    // Failure injection
    bool fFailSettle{false};
    std::set<SeedId> setBrokenOwners;        // OwnerOf fails for these ids
    std::function<void()> onSettle;          // Runs at the start of Settle

    bool OwnerOf(SeedId id, Account& owner) const override {
        if (setBrokenOwners.count(id)) {
            return false;
        }
        auto it = mapOwners.find(id);
        if (it == mapOwners.end()) {
            return false;
        }
        owner = it->second;
        return true;
    }

    std::vector<uint8_t> GetUnpredictableContext() const override { return vContext; }

    uint64_t GetHeight() const override { return nHeight; }

    SeedId GetNextId() const override { return nAdvertisedNextId ? nAdvertisedNextId : nNextId; }

    bool Settle(const CSettlement& settlement, std::string& error) override {
        if (onSettle) {
            onSettle();
        }
        if (fFailSettle) {
            error = "injected settlement failure";
            return false;
        }
        if (!settlement.vMints.empty() && settlement.nFirstMintId != nNextId) {
            error = "next id is " + std::to_string(nNextId);
            return false;
        }

        std::map<Account, CAmount> balances = mapBalances;
        for (const auto& transfer : settlement.vTransfers) {
            if (balances[transfer.from] < transfer.nAmount) {
                error = "insufficient funds";
                return false;
            }
            balances[transfer.from] -= transfer.nAmount;
            balances[transfer.to] += transfer.nAmount;
        }
        mapBalances = balances;

        for (const Account& recipient : settlement.vMints) {
            mapOwners[nNextId++] = recipient;
        }

        vSettlements.push_back(settlement);
        return true;
    }

    // Test helpers
    void Fund(const Account& account, CAmount amount) { mapBalances[account] += amount; }

    CAmount GetBalance(const Account& account) const {
        auto it = mapBalances.find(account);
        return it == mapBalances.end() ? 0 : it->second;
    }

    void TransferSeed(SeedId id, const Account& to) { mapOwners[id] = to; }
};

#endif // SEEDLINE_TEST_TEST_LEDGER_H
