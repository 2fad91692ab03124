// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stealth/derivation.h"

#include "crypto/keccak.h"
#include "random.h"
#include "support/cleanse.h"
#include "utilstrencodings.h"

namespace stealth {

CStealthAddress::CStealthAddress()
: viewTag(0)
{}

CStealthAddress::CStealthAddress(CAccountID const & address, CPubKey const & ephemeralPubKey, unsigned char viewTag)
: address(address), ephemeralPubKey(ephemeralPubKey), viewTag(viewTag)
{}

CAccountID const & CStealthAddress::getAddress() const
{
    return address;
}

CPubKey const & CStealthAddress::getEphemeralPubKey() const
{
    return ephemeralPubKey;
}

unsigned char CStealthAddress::getViewTag() const
{
    return viewTag;
}

std::string CStealthAddress::getViewTagHex() const
{
    return HexStr(&viewTag, &viewTag + 1);
}

bool CStealthAddress::operator==(CStealthAddress const & other) const
{
    return address == other.address
        && ephemeralPubKey == other.ephemeralPubKey
        && viewTag == other.viewTag;
}

bool ParsePublicKey(Bytes const & data, CPubKey & pubkeyOut)
{
    if (data.size() != CompressedPubKeySize && data.size() != UncompressedPubKeySize)
        return false;
    pubkeyOut.Set(data.begin(), data.end());
    return pubkeyOut.IsFullyValid();
}

StealthErrorCode DeriveStealthScalar(CSharedSecret const & secret, CPubKey const & viewingPubKey, CKey & scalarOut)
{
    if (!viewingPubKey.IsValid())
        return StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT;

    // The viewing key is hashed in the encoding it was published in.
    unsigned char hash[CKeccak256::OUTPUT_SIZE];
    CKeccak256()
        .Write(secret.begin(), secret.size())
        .Write(viewingPubKey.begin(), viewingPubKey.size())
        .Finalize(hash);
    scalarOut.Set(hash, hash + sizeof(hash), true);
    memory_cleanse(hash, sizeof(hash));

    if (!scalarOut.IsValid())
        return StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED;
    return StealthErrorCode::OK;
}

StealthErrorCode DeriveOneTimeAddress(CSharedSecret const & secret, CPubKey const & viewingPubKey, CAccountID & addressOut)
{
    CKey stealthKey;
    StealthErrorCode code = DeriveStealthScalar(secret, viewingPubKey, stealthKey);
    if (code != StealthErrorCode::OK)
        return code;
    if (!GetAccountID(stealthKey.GetPubKey(), addressOut))
        return StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED;
    return StealthErrorCode::OK;
}

StealthErrorCode DeriveStealthAddress(
        Bytes const & viewingPublicKey,
        boost::optional<Bytes> const & spendingPublicKey,
        boost::optional<Bytes> const & ephemeralPrivateKey,
        CRandomSource & rng,
        CStealthAddress & addressOut)
{
    CPubKey viewingPubKey;
    if (!ParsePublicKey(viewingPublicKey, viewingPubKey)) {
        LogStealth("Rejecting viewing public key of %d bytes\n", viewingPublicKey.size());
        return StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT;
    }

    if (spendingPublicKey) {
        CPubKey spendingPubKey;
        if (!ParsePublicKey(*spendingPublicKey, spendingPubKey)) {
            LogStealth("Rejecting spending public key of %d bytes\n", spendingPublicKey->size());
            return StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT;
        }
    }

    CKey ephemeralKey;
    if (ephemeralPrivateKey) {
        if (ephemeralPrivateKey->size() != PrivateKeySize)
            return StealthErrorCode::INVALID_KEY_LENGTH;
        ephemeralKey.Set(ephemeralPrivateKey->begin(), ephemeralPrivateKey->end(), true);
        if (!ephemeralKey.IsValid())
            return StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED;
    } else {
        ephemeralKey.MakeNewKey(rng, true);
    }

    CSharedSecret secret;
    if (!CSecretPoint(ephemeralKey, viewingPubKey).getEcdhSecret(secret))
        return StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED;

    CAccountID address;
    StealthErrorCode code = DeriveOneTimeAddress(secret, viewingPubKey, address);
    if (code != StealthErrorCode::OK)
        return code;

    addressOut = CStealthAddress(address, ephemeralKey.GetPubKey(), secret.GetViewTag());
    LogStealth("Derived stealth address %s with view tag %s\n", address.ToString(), addressOut.getViewTagHex());
    return StealthErrorCode::OK;
}

}
