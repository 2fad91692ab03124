// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_DEFS_H
#define STEALTH_STEALTH_DEFS_H

#include <vector>

#include "../util.h"

#define LogStealth(...) do { \
    LogPrint("stealth", "stealth: %s", tfm::format(__VA_ARGS__)); \
} while(0)

namespace stealth
{
    static constexpr size_t PrivateKeySize = 32;
    static constexpr size_t CompressedPubKeySize = 33;
    static constexpr size_t UncompressedPubKeySize = 65;
    static constexpr size_t SharedSecretSize = 32;

    static constexpr char const * DefaultNetwork = "eth";
    static constexpr unsigned int DefaultScanThreads = 1;

    typedef std::vector<unsigned char> Bytes;
}

#endif /* STEALTH_STEALTH_DEFS_H */
