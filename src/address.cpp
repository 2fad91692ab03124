// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "address.h"

#include "crypto/keccak.h"
#include "pubkey.h"
#include "utilstrencodings.h"

#include <ctype.h>

CAccountID::CAccountID(const std::vector<unsigned char>& vch)
{
    if (vch.size() == sizeof(data))
        memcpy(data, vch.data(), sizeof(data));
    else
        SetNull();
}

bool CAccountID::IsNull() const
{
    for (unsigned int i = 0; i < WIDTH; i++)
        if (data[i] != 0)
            return false;
    return true;
}

std::string CAccountID::ToString() const
{
    return HexStrPrefixed(*this);
}

std::string CAccountID::ToChecksumString() const
{
    std::string hex = HexStr(begin(), end());
    unsigned char hash[CKeccak256::OUTPUT_SIZE];
    Keccak256(hash, (const unsigned char*)hex.data(), hex.size());
    for (size_t i = 0; i < hex.size(); i++) {
        unsigned char nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
        if (nibble >= 8)
            hex[i] = toupper(hex[i]);
    }
    return "0x" + hex;
}

bool CAccountID::SetString(const std::string& str)
{
    if (!IsValidAccountString(str))
        return false;
    std::vector<unsigned char> vch = ParseHex(str.substr(2));
    memcpy(data, vch.data(), sizeof(data));
    return true;
}

bool GetAccountID(const CPubKey& pubkey, CAccountID& idOut)
{
    CPubKey full = pubkey;
    if (!full.Decompress())
        return false;
    unsigned char hash[CKeccak256::OUTPUT_SIZE];
    Keccak256(hash, full.begin() + 1, full.size() - 1);
    memcpy(idOut.begin(), hash + CKeccak256::OUTPUT_SIZE - CAccountID::WIDTH, CAccountID::WIDTH);
    return true;
}

bool IsValidAccountString(const std::string& str)
{
    if (str.size() != 2 + 2 * CAccountID::WIDTH || !HasHexPrefix(str))
        return false;
    for (size_t i = 2; i < str.size(); i++)
        if (HexDigit(str[i]) < 0)
            return false;
    return true;
}
