// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <primitives/seed.h>
#include <crypto/sha3.h>
#include <util/strencodings.h>

#include <sstream>

std::string AccountToHex(const Account& account) {
    return HexStr(account.data(), account.size());
}

const char* SeedKindToString(SeedKind kind) {
    switch (kind) {
        case SeedKind::FOUNDER_PENDING: return "founder-pending";
        case SeedKind::FOUNDER: return "founder";
        case SeedKind::DERIVED: return "derived";
    }
    return "unknown";
}

uint256 CSeedCode::GetHash() const {
    return SHA3_256(m_values);
}

std::string CSeedCode::ToHex() const {
    return HexStr(m_values);
}

std::string CSeed::ToString() const {
    std::ostringstream oss;
    oss << "CSeed(id=" << nId
        << ", kind=" << SeedKindToString(kind)
        << ", hash=" << (HasCode() ? hashContent.GetHex().substr(0, 16) : std::string("-"))
        << ", mutations=" << nMutations
        << ", unsigned=" << (fAllowUnsignedMutation ? 1 : 0)
        << ", owner=" << AccountToHex(owner)
        << ", created=" << nCreated
        << ", updated=" << nUpdated
        << ", fee=" << nBreedingFee
        << ")";
    return oss.str();
}
