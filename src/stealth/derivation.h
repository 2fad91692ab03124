// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_DERIVATION_H
#define STEALTH_STEALTH_DERIVATION_H

#include "address.h"
#include "key.h"
#include "pubkey.h"
#include "defs.h"
#include "errors.h"
#include "secretpoint.h"

#include <boost/optional.hpp>

class CRandomSource;

namespace stealth {

/** A one-time address as published by a sender. */
class CStealthAddress {
public:
    CStealthAddress();
    CStealthAddress(CAccountID const & address, CPubKey const & ephemeralPubKey, unsigned char viewTag);

    CAccountID const & getAddress() const;
    CPubKey const & getEphemeralPubKey() const;
    unsigned char getViewTag() const;

    /** Two lowercase hex digits, no prefix. */
    std::string getViewTagHex() const;

    bool operator==(CStealthAddress const & other) const;
    bool operator!=(CStealthAddress const & other) const { return !(*this == other); }
private:
    CAccountID address;
    CPubKey ephemeralPubKey;
    unsigned char viewTag;
};

/** Parse a 33 or 65 byte encoding of a point on the curve. */
bool ParsePublicKey(Bytes const & data, CPubKey & pubkeyOut);

/**
 * stealthScalar = keccak256(secret || viewingPubKey).
 * The viewing key is hashed in the 33 or 65 byte encoding it was given in, so
 * sender and receiver must agree on the published form.
 */
StealthErrorCode DeriveStealthScalar(CSharedSecret const & secret, CPubKey const & viewingPubKey, CKey & scalarOut);

/** Account of stealthScalar * G. */
StealthErrorCode DeriveOneTimeAddress(CSharedSecret const & secret, CPubKey const & viewingPubKey, CAccountID & addressOut);

/**
 * Sender side: derive a fresh stealth address for the receiver owning
 * viewingPublicKey.
 *
 * A new ephemeral key is drawn from rng on every call unless one is supplied.
 * spendingPublicKey is validated when given but does not enter the derivation.
 */
StealthErrorCode DeriveStealthAddress(
        Bytes const & viewingPublicKey,
        boost::optional<Bytes> const & spendingPublicKey,
        boost::optional<Bytes> const & ephemeralPrivateKey,
        CRandomSource & rng,
        CStealthAddress & addressOut);

}

#endif // STEALTH_STEALTH_DERIVATION_H
