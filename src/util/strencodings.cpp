// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <util/strencodings.h>

std::string HexStr(const uint8_t* data, size_t len) {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexmap[(data[i] >> 4) & 0x0F]);
        result.push_back(hexmap[data[i] & 0x0F]);
    }
    return result;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

std::vector<uint8_t> ParseHex(const std::string& str) {
    if (!IsHex(str)) {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> result;
    result.reserve(str.size() / 2);

    for (size_t i = 0; i < str.size(); i += 2) {
        int8_t high = HexDigit(str[i]);
        int8_t low = HexDigit(str[i + 1]);
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return result;
}

bool IsHex(const std::string& str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (HexDigit(c) < 0) {
            return false;
        }
    }
    return true;
}
