// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_REGISTRY_LEDGER_H
#define SEEDLINE_REGISTRY_LEDGER_H

#include <amount.h>
#include <primitives/seed.h>

#include <cstdint>
#include <string>
#include <vector>

/** One value movement requested by a registry operation */
struct CValueTransfer {
    Account from;
    Account to;
    CAmount nAmount;

    CValueTransfer(const Account& fromIn, const Account& toIn, CAmount amount)
        : from(fromIn), to(toIn), nAmount(amount) {}
};

/**
 * Everything one registry operation asks of the ledger
 *
 * Applied by a single ISeedLedger::Settle call. Transfers and mints are
 * all-or-nothing. Mints take the consecutive ids starting at nFirstMintId.
 */
struct CSettlement {
    std::vector<CValueTransfer> vTransfers;
    std::vector<Account> vMints;            // New records, one recipient each, in order
    SeedId nFirstMintId{0};                 // Id of vMints[0]; unused without mints

    bool IsEmpty() const { return vTransfers.empty() && vMints.empty(); }

    void AddTransfer(const Account& from, const Account& to, CAmount amount) {
        if (amount > 0) {
            vTransfers.emplace_back(from, to, amount);
        }
    }

    CAmount GetTotal() const {
        CAmount total = 0;
        for (const auto& transfer : vTransfers) {
            total += transfer.nAmount;
        }
        return total;
    }
};

/**
 * ISeedLedger - external ownership and value collaborator
 *
 * The registry owns record content; the ledger owns who holds each record,
 * balances, and identifier allocation. Implementations must not call back
 * into the registry (such calls are rejected).
 */
class ISeedLedger {
public:
    virtual ~ISeedLedger() = default;

    /**
     * Current holder of a record
     * @return false if the ledger cannot answer (unknown id, backend failure)
     */
    virtual bool OwnerOf(SeedId id, Account& owner) const = 0;

    /** Non-reproducible seed material (e.g. current round identifier) */
    virtual std::vector<uint8_t> GetUnpredictableContext() const = 0;

    /** Current sequence marker (block height or logical clock) */
    virtual uint64_t GetHeight() const = 0;

    /** Identifier the next mint would receive */
    virtual SeedId GetNextId() const = 0;

    /**
     * Apply a settlement atomically
     *
     * Mints take ids settlement.nFirstMintId, nFirstMintId + 1, ... and
     * assign each new record to its recipient. If those are not the ids the
     * ledger would allocate next, the whole settlement is refused.
     *
     * @param settlement Transfers and mints to apply
     * @param[out] error Reason on failure
     * @return false if nothing was applied
     */
    virtual bool Settle(const CSettlement& settlement, std::string& error) = 0;
};

#endif // SEEDLINE_REGISTRY_LEDGER_H
