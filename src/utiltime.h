// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_UTILTIME_H
#define STEALTH_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds and GetMillisSinceEpoch() in
 * milliseconds. Both honour mocktime, where the time can be fixed by the
 * caller, eg for testing.
 */
int64_t GetTime();
int64_t GetMillisSinceEpoch();
void SetMockTime(int64_t nMockTimeIn);

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

#endif // STEALTH_UTILTIME_H
