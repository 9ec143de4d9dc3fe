// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_UINT256_H
#define SEEDLINE_UINT256_H

#include <cstring>
#include <cstdint>
#include <string>
#include <iosfwd>

/** 256-bit hash (content fingerprint) */
class uint256 {
public:
    uint8_t data[32];

    uint256() { memset(data, 0, 32); }

    bool IsNull() const {
        for (int i = 0; i < 32; i++)
            if (data[i] != 0) return false;
        return true;
    }

    void SetNull() { memset(data, 0, 32); }

    // Byte-wise (memcmp) order. Only meaningful for ordered containers.
    bool operator<(const uint256& other) const {
        return memcmp(data, other.data, 32) < 0;
    }

    bool operator==(const uint256& other) const {
        return memcmp(data, other.data, 32) == 0;
    }

    bool operator!=(const uint256& other) const {
        return memcmp(data, other.data, 32) != 0;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + 32; }
    const uint8_t* end() const { return data + 32; }

    std::string GetHex() const;
    bool SetHex(const std::string& str);
};

// Stream output operator for Boost.Test (defined in uint256.cpp)
std::ostream& operator<<(std::ostream& os, const uint256& h);

#endif // SEEDLINE_UINT256_H
