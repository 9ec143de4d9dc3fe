// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_UTIL_STRENCODINGS_H
#define SEEDLINE_UTIL_STRENCODINGS_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * Hex encoding helpers
 *
 * Used for fingerprints, accounts and code dumps in logs, config values
 * and database keys.
 */

/** Lowercase hex of a byte range */
std::string HexStr(const uint8_t* data, size_t len);

std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to bytes
 * @return empty vector if the string is not valid hex
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/** Even length, hex digits only */
bool IsHex(const std::string& str);

/**
 * Convert single hex character to its numeric value
 * @return -1 for a non-hex character
 */
inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

#endif // SEEDLINE_UTIL_STRENCODINGS_H
