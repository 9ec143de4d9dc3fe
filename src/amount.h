// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_AMOUNT_H
#define SEEDLINE_AMOUNT_H

#include <cstdint>

typedef int64_t CAmount;

static const CAmount COIN = 100000000;
static const CAmount CENT = 1000000;

// Upper bound for any single fee or accrued balance held by the registry.
// Keeps fee sums (two parent fees + derivation fee) clear of int64 overflow.
static const CAmount MAX_MONEY = 21000000 * COIN;

inline bool MoneyRange(CAmount nValue) {
    return (nValue >= 0 && nValue <= MAX_MONEY);
}

#endif // SEEDLINE_AMOUNT_H
