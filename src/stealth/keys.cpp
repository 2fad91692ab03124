// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stealth/keys.h"

#include "random.h"
#include "stealth/defs.h"
#include "utilstrencodings.h"

namespace stealth {

CStealthKeyPair::CStealthKeyPair(CKey const & privkey)
: privkey(privkey)
{
    if (privkey.IsValid())
        pubkey = privkey.GetPubKey();
}

CKey const & CStealthKeyPair::getPrivKey() const
{
    return privkey;
}

CPubKey const & CStealthKeyPair::getPubKey() const
{
    return pubkey;
}

bool CStealthKeyPair::IsValid() const
{
    return privkey.IsValid() && pubkey.IsCompressed();
}

CStealthKeys::CStealthKeys(CStealthKeyPair const & spending, CStealthKeyPair const & viewing)
: spending(spending), viewing(viewing)
{}

CStealthKeyPair const & CStealthKeys::getSpending() const
{
    return spending;
}

CStealthKeyPair const & CStealthKeys::getViewing() const
{
    return viewing;
}

CStealthKeys GenerateStealthKeys(CRandomSource & rng)
{
    CKey spendKey, viewKey;
    spendKey.MakeNewKey(rng, true);
    viewKey.MakeNewKey(rng, true);
    LogStealth("Generated stealth keys, viewing public key %s\n", HexStr(viewKey.GetPubKey()));
    return CStealthKeys(CStealthKeyPair(spendKey), CStealthKeyPair(viewKey));
}

}
