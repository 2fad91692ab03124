// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_SPENDKEY_H
#define STEALTH_STEALTH_SPENDKEY_H

#include "address.h"
#include "key.h"
#include "defs.h"
#include "errors.h"

#include <boost/optional.hpp>

namespace stealth {

/**
 * Recover the private key controlling a discovered stealth address.
 *
 * The key is re-derived from the viewing key and the ephemeral public key and
 * is only returned when its account equals stealthAddress; any other outcome
 * is DERIVED_ADDRESS_MISMATCH. When viewingPublicKey is not given it is
 * computed from viewingPrivateKey.
 *
 * spendingPrivateKey must be 32 bytes but the recovered key does not depend
 * on it.
 */
StealthErrorCode DeriveSpendingKey(
        Bytes const & spendingPrivateKey,
        Bytes const & viewingPrivateKey,
        CAccountID const & stealthAddress,
        Bytes const & ephemeralPublicKey,
        boost::optional<Bytes> const & viewingPublicKey,
        CKey & keyOut);

}

#endif // STEALTH_STEALTH_SPENDKEY_H
