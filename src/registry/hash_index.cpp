// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <registry/hash_index.h>

bool CHashIndex::Reserve(const uint256& hash) {
    return m_reserved.insert(hash).second;
}

bool CHashIndex::Contains(const uint256& hash) const {
    return m_reserved.find(hash) != m_reserved.end();
}

bool CHashIndex::Release(const uint256& hash) {
    return m_reserved.erase(hash) > 0;
}

std::vector<uint256> CHashIndex::GetAll() const {
    return std::vector<uint256>(m_reserved.begin(), m_reserved.end());
}
