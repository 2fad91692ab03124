// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_RANDOM_H
#define STEALTH_RANDOM_H

#include <stdint.h>
#include <stdlib.h>

/**
 * Functions to gather random data via the OpenSSL PRNG
 */
void GetRandBytes(unsigned char* buf, int num);

/**
 * Function to gather random data from multiple sources, failing whenever any
 * of those source fail to provide a result.
 */
void GetStrongRandBytes(unsigned char* buf, int num);

/**
 * Source of secret randomness for key generation. Key material is always
 * drawn through this interface so callers can substitute a scripted source
 * in tests.
 */
class CRandomSource
{
public:
    virtual ~CRandomSource() = default;
    virtual void GetBytes(unsigned char* buf, size_t num) = 0;
};

/** Default source backed by GetStrongRandBytes(). Stateless and thread safe. */
class CStrongRandomSource : public CRandomSource
{
public:
    void GetBytes(unsigned char* buf, size_t num) override;
};

/** Process-wide CStrongRandomSource instance. */
CRandomSource& GetStrongRandomSource();

#endif // STEALTH_RANDOM_H
