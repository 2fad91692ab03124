// Copyright (c) 2020 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_CRYPTO_KECCAK_H
#define STEALTH_CRYPTO_KECCAK_H

#include <stdint.h>
#include <stdlib.h>

/**
 * A hasher class for Keccak-256 as used by Ethereum, i.e. the original
 * Keccak submission padding (0x01) rather than the FIPS-202 SHA3 padding (0x06).
 */
class CKeccak256
{
private:
    uint64_t m_state[25] = {0};
    unsigned char m_buffer[136]; // rate bytes (1600 - 256*2) / 8 = 136
    size_t m_pos = 0;
    bool m_finalized = false;

public:
    static constexpr size_t OUTPUT_SIZE = 32;

    CKeccak256() = default;
    CKeccak256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CKeccak256& Reset();
};

/** Compute Keccak-256 of input. */
void Keccak256(unsigned char hash[CKeccak256::OUTPUT_SIZE], const unsigned char* data, size_t len);

#endif // STEALTH_CRYPTO_KECCAK_H
