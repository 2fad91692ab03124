// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stealth/spendkey.h"

#include "stealth/derivation.h"
#include "stealth/secretpoint.h"

namespace stealth {

StealthErrorCode DeriveSpendingKey(
        Bytes const & spendingPrivateKey,
        Bytes const & viewingPrivateKey,
        CAccountID const & stealthAddress,
        Bytes const & ephemeralPublicKey,
        boost::optional<Bytes> const & viewingPublicKey,
        CKey & keyOut)
{
    if (spendingPrivateKey.size() != PrivateKeySize)
        return StealthErrorCode::INVALID_KEY_LENGTH;

    CSharedSecret secret;
    StealthErrorCode code = ComputeSharedSecret(viewingPrivateKey, ephemeralPublicKey, secret);
    if (code != StealthErrorCode::OK)
        return code;

    CPubKey viewingPubKey;
    if (viewingPublicKey) {
        if (!ParsePublicKey(*viewingPublicKey, viewingPubKey))
            return StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT;
    } else {
        CKey viewingKey;
        viewingKey.Set(viewingPrivateKey.begin(), viewingPrivateKey.end(), true);
        viewingPubKey = viewingKey.GetPubKey();
    }

    CKey stealthKey;
    code = DeriveStealthScalar(secret, viewingPubKey, stealthKey);
    if (code != StealthErrorCode::OK)
        return code;

    CAccountID derived;
    if (!GetAccountID(stealthKey.GetPubKey(), derived) || derived != stealthAddress) {
        LogStealth("Derived address %s does not match %s\n", derived.ToString(), stealthAddress.ToString());
        return StealthErrorCode::DERIVED_ADDRESS_MISMATCH;
    }

    keyOut = stealthKey;
    return StealthErrorCode::OK;
}

}
