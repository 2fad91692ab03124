// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_SUPPORT_CLEANSE_H
#define STEALTH_SUPPORT_CLEANSE_H

#include <stdlib.h>

/** Overwrite len bytes at ptr with zeroes in a way the compiler cannot elide. */
void memory_cleanse(void *ptr, size_t len);

#endif // STEALTH_SUPPORT_CLEANSE_H
