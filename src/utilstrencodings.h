// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef STEALTH_UTILSTRENCODINGS_H
#define STEALTH_UTILSTRENCODINGS_H

#include <stdint.h>
#include <string>
#include <vector>

signed char HexDigit(char c);
bool IsHex(const std::string& str);
std::vector<unsigned char> ParseHex(const char* psz);
std::vector<unsigned char> ParseHex(const std::string& str);

/**
 * Strict hex decoding used at the API boundary: an optional "0x"/"0X" prefix
 * followed by an even number of hex digits, nothing else. Returns false and
 * leaves vchOut empty on any other input.
 */
bool TryParseHex(const std::string& str, std::vector<unsigned char>& vchOut);

int atoi(const std::string& str);
int64_t atoi64(const std::string& str);

/**
 * Format a paragraph of text to a fixed width, adding spaces for
 * indentation to any added line.
 */
std::string FormatParagraph(const std::string& in, size_t width = 79, size_t indent = 0);

/** True if str starts with "0x" or "0X". */
bool HasHexPrefix(const std::string& str);
/** Returns str without a leading "0x"/"0X". */
std::string StripHexPrefix(const std::string& str);
/** ASCII lower-casing; other bytes are left untouched. */
std::string ToLower(const std::string& str);

template<typename T>
std::string HexStr(const T itbegin, const T itend, bool fSpaces=false)
{
    std::string rv;
    static const char hexmap[16] = { '0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };
    rv.reserve((itend-itbegin)*3);
    for(T it = itbegin; it < itend; ++it)
    {
        unsigned char val = (unsigned char)(*it);
        if(fSpaces && it != itbegin)
            rv.push_back(' ');
        rv.push_back(hexmap[val>>4]);
        rv.push_back(hexmap[val&15]);
    }

    return rv;
}

template<typename T>
inline std::string HexStr(const T& vch, bool fSpaces=false)
{
    return HexStr(vch.begin(), vch.end(), fSpaces);
}

/** Canonical wire form: lowercase hex with a "0x" prefix. */
template<typename T>
inline std::string HexStrPrefixed(const T& vch)
{
    return "0x" + HexStr(vch.begin(), vch.end());
}

#endif // STEALTH_UTILSTRENCODINGS_H
