// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_REGISTRY_HASH_INDEX_H
#define SEEDLINE_REGISTRY_HASH_INDEX_H

#include <uint256.h>

#include <set>
#include <vector>

/**
 * CHashIndex - global content uniqueness index
 *
 * Holds every code fingerprint that has ever been written to a record.
 * Entries are never released by mutation: a retired code stays reserved
 * so it cannot be resurrected by a later record. The only release path is
 * re-consolidation of a founder when the registry is configured for it.
 *
 * Thread Safety: Not thread-safe. Owned by CRegistryState and only touched
 * from inside a serialized registry operation.
 */
class CHashIndex {
public:
    CHashIndex() = default;

    /**
     * Reserve a fingerprint
     * @return false if the fingerprint was already reserved (index unchanged)
     */
    bool Reserve(const uint256& hash);

    /** True if the fingerprint has been reserved */
    bool Contains(const uint256& hash) const;

    /**
     * Release a fingerprint (re-consolidation policy only)
     * @return true if it was present
     */
    bool Release(const uint256& hash);

    size_t Size() const { return m_reserved.size(); }

    /** All reserved fingerprints in index order */
    std::vector<uint256> GetAll() const;

    void Clear() { m_reserved.clear(); }

private:
    std::set<uint256> m_reserved;
};

#endif // SEEDLINE_REGISTRY_HASH_INDEX_H
