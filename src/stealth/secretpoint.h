// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_SECRETPOINT_H
#define STEALTH_STEALTH_SECRETPOINT_H

#include "key.h"
#include "pubkey.h"
#include "defs.h"
#include "errors.h"

namespace stealth {

/** keccak256 of a compressed ECDH point. Wiped on destruction. */
class CSharedSecret {
public:
    CSharedSecret();
    ~CSharedSecret();

    CSharedSecret(CSharedSecret const & other);
    CSharedSecret& operator=(CSharedSecret const & other);

    unsigned char* begin() { return data; }
    unsigned char* end() { return data + SharedSecretSize; }
    const unsigned char* begin() const { return data; }
    const unsigned char* end() const { return data + SharedSecretSize; }
    size_t size() const { return SharedSecretSize; }

    /** The one-byte view tag is the first byte of the secret. */
    unsigned char GetViewTag() const { return data[0]; }

    bool operator==(CSharedSecret const & other) const;
    bool operator!=(CSharedSecret const & other) const { return !(*this == other); }
private:
    unsigned char data[SharedSecretSize];
};

/**
 * ECDH between one party's private scalar and the other party's public point.
 * Either side of an exchange computes the same secret.
 */
class CSecretPoint {
public:
    CSecretPoint() = delete;
    CSecretPoint(CKey const & privkey, CPubKey const & pubkey);

    /** Fails when the point is not on the curve. */
    bool getEcdhSecret(CSharedSecret & secretOut) const;

    bool isShared(CSecretPoint const & other) const;
private:
    CKey privkey;
    CPubKey pubkey;
};

/**
 * Compute the shared secret of a 32-byte scalar and a 33 or 65 byte point.
 * Both point encodings yield the same secret.
 *
 * @return INVALID_KEY_LENGTH on a wrong length, SHARED_SECRET_COMPUTATION_FAILED
 *         on a zero or out-of-range scalar or a point that is not on the curve.
 */
StealthErrorCode ComputeSharedSecret(Bytes const & scalar, Bytes const & point, CSharedSecret & secretOut);

}

#endif // STEALTH_STEALTH_SECRETPOINT_H
