// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.h"

#include "support/cleanse.h"
#include "util.h"

#include <algorithm>
#include <errno.h>
#include <limits>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#ifdef __linux__
#include <sys/random.h>
#endif

#include <openssl/err.h>
#include <openssl/rand.h>

static void RandFailure()
{
    LogPrintf("Failed to read randomness, aborting\n");
    abort();
}

void GetRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        RandFailure();
    }
}

/** Fallback: get 32 bytes of system entropy. Do not use this in normal code. */
static void GetOSRand(unsigned char *ent32)
{
#ifdef __linux__
    size_t filled = 0;
    while (filled < 32) {
        ssize_t n = getrandom(ent32 + filled, 32 - filled, 0);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            RandFailure();
        }
        filled += n;
    }
#else
    FILE* f = fopen("/dev/urandom", "rb");
    if (f == NULL || fread(ent32, 1, 32, f) != 32) {
        if (f) fclose(f);
        RandFailure();
    }
    fclose(f);
#endif
}

void GetStrongRandBytes(unsigned char* buf, int num)
{
    // First source: OpenSSL's RNG
    GetRandBytes(buf, num);

    // Second source: OS RNG, XOR-ed in block by block
    unsigned char buf2[32];
    for (int pos = 0; pos < num; pos += 32) {
        GetOSRand(buf2);
        int len = std::min(32, num - pos);
        for (int i = 0; i < len; ++i)
            buf[pos + i] ^= buf2[i];
    }
    memory_cleanse(buf2, sizeof(buf2));
}

void CStrongRandomSource::GetBytes(unsigned char* buf, size_t num)
{
    if (num > (size_t)std::numeric_limits<int>::max())
        RandFailure();
    GetStrongRandBytes(buf, (int)num);
}

CRandomSource& GetStrongRandomSource()
{
    static CStrongRandomSource source;
    return source;
}
