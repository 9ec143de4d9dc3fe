// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <uint256.h>
#include <util/strencodings.h>

#include <iomanip>
#include <ostream>
#include <sstream>

std::string uint256::GetHex() const {
    std::stringstream ss;
    for (int i = 31; i >= 0; i--) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

bool uint256::SetHex(const std::string& str) {
    memset(data, 0, 32);

    // Exactly 64 hex characters, most significant byte first (mirrors GetHex)
    if (str.size() != 64) {
        return false;
    }
    for (size_t i = 0; i < 32; i++) {
        size_t strPos = 62 - (i * 2);
        int8_t high = HexDigit(str[strPos]);
        int8_t low = HexDigit(str[strPos + 1]);
        if (high < 0 || low < 0) {
            memset(data, 0, 32);
            return false;
        }
        data[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}
