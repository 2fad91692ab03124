// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_KEYS_H
#define STEALTH_STEALTH_KEYS_H

#include "key.h"
#include "pubkey.h"

class CRandomSource;

namespace stealth {

/** A private scalar with its compressed public point. */
class CStealthKeyPair {
public:
    CStealthKeyPair() = default;
    explicit CStealthKeyPair(CKey const & privkey);

    CKey const & getPrivKey() const;
    CPubKey const & getPubKey() const;

    bool IsValid() const;
private:
    CKey privkey;
    CPubKey pubkey;
};

/** The receiver's long-lived spending and viewing key pairs. */
class CStealthKeys {
public:
    CStealthKeys() = default;
    CStealthKeys(CStealthKeyPair const & spending, CStealthKeyPair const & viewing);

    CStealthKeyPair const & getSpending() const;
    CStealthKeyPair const & getViewing() const;
private:
    CStealthKeyPair spending;
    CStealthKeyPair viewing;
};

/** Two independent key pairs drawn from rng. */
CStealthKeys GenerateStealthKeys(CRandomSource & rng);

}

#endif // STEALTH_STEALTH_KEYS_H
