// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stealth/secretpoint.h"

#include "crypto/keccak.h"
#include "support/cleanse.h"

namespace stealth {

CSharedSecret::CSharedSecret()
{
    memset(data, 0, sizeof(data));
}

CSharedSecret::~CSharedSecret()
{
    memory_cleanse(data, sizeof(data));
}

CSharedSecret::CSharedSecret(CSharedSecret const & other)
{
    memcpy(data, other.data, sizeof(data));
}

CSharedSecret& CSharedSecret::operator=(CSharedSecret const & other)
{
    memcpy(data, other.data, sizeof(data));
    return *this;
}

bool CSharedSecret::operator==(CSharedSecret const & other) const
{
    return memcmp(data, other.data, sizeof(data)) == 0;
}

CSecretPoint::CSecretPoint(CKey const & privkey, CPubKey const & pubkey)
:privkey(privkey), pubkey(pubkey)
{}

bool CSecretPoint::getEcdhSecret(CSharedSecret & secretOut) const
{
    if (!privkey.IsValid())
        return false;
    CPubKey shared;
    if (!pubkey.Multiply(privkey.begin(), shared))
        return false;
    Keccak256(secretOut.begin(), shared.begin(), shared.size());
    return true;
}

bool CSecretPoint::isShared(CSecretPoint const & other) const
{
    CSharedSecret mine, theirs;
    return getEcdhSecret(mine) && other.getEcdhSecret(theirs) && mine == theirs;
}

StealthErrorCode ComputeSharedSecret(Bytes const & scalar, Bytes const & point, CSharedSecret & secretOut)
{
    if (scalar.size() != PrivateKeySize)
        return StealthErrorCode::INVALID_KEY_LENGTH;
    if (point.size() != CompressedPubKeySize && point.size() != UncompressedPubKeySize)
        return StealthErrorCode::INVALID_KEY_LENGTH;

    CKey key;
    key.Set(scalar.begin(), scalar.end(), true);
    if (!key.IsValid())
        return StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED;

    CPubKey pubkey(point);
    if (!pubkey.IsValid())
        return StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED;

    if (!CSecretPoint(key, pubkey).getEcdhSecret(secretOut))
        return StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED;
    return StealthErrorCode::OK;
}

}
