// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_ADDRESS_H
#define STEALTH_ADDRESS_H

#include <string.h>
#include <string>
#include <vector>

class CPubKey;

/**
 * 20-byte account identifier: the trailing 20 bytes of the Keccak-256 hash of
 * an uncompressed public key with its 0x04 prefix dropped.
 */
class CAccountID
{
public:
    static constexpr unsigned int WIDTH = 20;

private:
    unsigned char data[WIDTH];

public:
    CAccountID()
    {
        memset(data, 0, sizeof(data));
    }

    explicit CAccountID(const std::vector<unsigned char>& vch);

    bool IsNull() const;
    void SetNull() { memset(data, 0, sizeof(data)); }

    friend inline bool operator==(const CAccountID& a, const CAccountID& b) { return memcmp(a.data, b.data, sizeof(a.data)) == 0; }
    friend inline bool operator!=(const CAccountID& a, const CAccountID& b) { return memcmp(a.data, b.data, sizeof(a.data)) != 0; }
    friend inline bool operator<(const CAccountID& a, const CAccountID& b) { return memcmp(a.data, b.data, sizeof(a.data)) < 0; }

    /** Lowercase hex with a 0x prefix. */
    std::string ToString() const;

    /** Mixed-case EIP-55 checksum rendering with a 0x prefix. */
    std::string ToChecksumString() const;

    /**
     * Parse "0x" followed by exactly 40 hex digits, in any case. The checksum
     * of mixed-case input is not enforced.
     */
    bool SetString(const std::string& str);

    unsigned char* begin() { return &data[0]; }
    unsigned char* end() { return &data[WIDTH]; }
    const unsigned char* begin() const { return &data[0]; }
    const unsigned char* end() const { return &data[WIDTH]; }
    unsigned int size() const { return sizeof(data); }
};

/** Derive the account identifier of a public key in either encoding. Fails on an invalid point. */
bool GetAccountID(const CPubKey& pubkey, CAccountID& idOut);

/** True for "0x" followed by exactly 40 hex digits. */
bool IsValidAccountString(const std::string& str);

#endif // STEALTH_ADDRESS_H
