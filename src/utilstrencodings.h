// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef PAIRMINT_UTILSTRENCODINGS_H
#define PAIRMINT_UTILSTRENCODINGS_H

#include <stdint.h>
#include <string>
#include <vector>

signed char HexDigit(char c);
char HexChar(unsigned int nibble);
bool IsHex(const std::string& str);

/** Remove unsafe chars. Printable ascii only, used before echoing user input into logs. */
std::string SanitizeString(const std::string& str);

int64_t atoi64(const std::string& str);

/**
 * Convert decimal string to unsigned 64-bit integer with strict parse error feedback.
 * Leading sign characters are rejected.
 */
bool ParseUInt64(const std::string& str, uint64_t* out);

/**
 * Tests if the given character is a whitespace character. The whitespace characters
 * are: space, form-feed ('\f'), newline ('\n'), carriage return ('\r'), horizontal
 * tab ('\t'), and vertical tab ('\v').
 *
 * This function is locale independent.
 */
constexpr inline bool IsSpace(char c) noexcept
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}

constexpr inline bool IsDigit(char c)
{
    return c >= '0' && c <= '9';
}

/** Locale independent tolower for ASCII characters. */
constexpr char ToLower(char c)
{
    return (c >= 'A' && c <= 'Z' ? (c - 'A') + 'a' : c);
}

std::string ToLower(const std::string& str);

template<typename T>
std::string HexStr(const T itbegin, const T itend)
{
    std::string rv;
    rv.reserve((itend - itbegin) * 2);
    for (T it = itbegin; it < itend; ++it) {
        unsigned char val = (unsigned char)(*it);
        rv.push_back(HexChar(val >> 4));
        rv.push_back(HexChar(val & 15));
    }
    return rv;
}

#endif // PAIRMINT_UTILSTRENCODINGS_H
