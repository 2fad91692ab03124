// Copyright (c) 2020 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"
#include <string.h>

// Keccak-f[1600] round constants
static const uint64_t keccak_round_constants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

// Rotation offsets, indexed by lane x + 5*y
static const int keccak_rotation_offsets[25] = {
    0, 1, 62, 28, 27, 36, 44, 6, 55, 20, 3, 10, 43,
    25, 39, 41, 45, 15, 21, 8, 18, 2, 61, 56, 14
};

// Pi step destination of lane (x, y): (y, 2x + 3y)
static const int keccak_pi_lanes[25] = {
    0, 10, 20, 5, 15, 16, 1, 11, 21, 6, 7, 17, 2,
    12, 22, 23, 8, 18, 3, 13, 14, 24, 9, 19, 4
};

static const size_t KECCAK256_RATE = 136;

static inline uint64_t rotl64(uint64_t x, int n) {
    return n == 0 ? x : (x << n) | (x >> (64 - n));
}

// Keccak-f[1600] permutation
static void keccakf1600(uint64_t state[25]) {
    for (int round = 0; round < 24; ++round) {
        // Theta step
        uint64_t C[5], D[5];
        for (int i = 0; i < 5; ++i)
            C[i] = state[i] ^ state[i + 5] ^ state[i + 10] ^ state[i + 15] ^ state[i + 20];
        for (int i = 0; i < 5; ++i)
            D[i] = C[(i + 4) % 5] ^ rotl64(C[(i + 1) % 5], 1);
        for (int i = 0; i < 25; ++i)
            state[i] ^= D[i % 5];

        // Rho and Pi steps
        uint64_t temp[25];
        for (int i = 0; i < 25; ++i)
            temp[i] = state[i];
        for (int i = 0; i < 25; ++i)
            state[keccak_pi_lanes[i]] = rotl64(temp[i], keccak_rotation_offsets[i]);

        // Chi step
        for (int i = 0; i < 25; i += 5) {
            uint64_t t[5];
            for (int j = 0; j < 5; ++j)
                t[j] = state[i + j];
            for (int j = 0; j < 5; ++j)
                state[i + j] = t[j] ^ ((~t[(j + 1) % 5]) & t[(j + 2) % 5]);
        }

        // Iota step
        state[0] ^= keccak_round_constants[round];
    }
}

static void absorb_block(uint64_t state[25], const unsigned char* block) {
    for (size_t i = 0; i < KECCAK256_RATE / 8; ++i) {
        uint64_t v = 0;
        for (int j = 0; j < 8; ++j)
            v |= ((uint64_t)block[i * 8 + j]) << (8 * j);
        state[i] ^= v;
    }
    keccakf1600(state);
}

CKeccak256& CKeccak256::Write(const unsigned char* data, size_t len) {
    if (m_finalized) return *this;

    while (len > 0) {
        size_t to_copy = KECCAK256_RATE - m_pos;
        if (to_copy > len) to_copy = len;

        memcpy(m_buffer + m_pos, data, to_copy);
        m_pos += to_copy;
        data += to_copy;
        len -= to_copy;

        if (m_pos == KECCAK256_RATE) {
            absorb_block(m_state, m_buffer);
            m_pos = 0;
        }
    }

    return *this;
}

void CKeccak256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
    if (m_finalized) return;

    // Keccak padding: append 0x01, then zeros, then 0x80
    m_buffer[m_pos] = 0x01;
    memset(m_buffer + m_pos + 1, 0, KECCAK256_RATE - m_pos - 1);
    m_buffer[KECCAK256_RATE - 1] |= 0x80;
    absorb_block(m_state, m_buffer);

    // Squeeze the first 256 bits
    for (size_t i = 0; i < OUTPUT_SIZE / 8; ++i) {
        for (int j = 0; j < 8; ++j)
            hash[i * 8 + j] = (m_state[i] >> (8 * j)) & 0xFF;
    }

    m_finalized = true;
}

CKeccak256& CKeccak256::Reset() {
    memset(m_state, 0, sizeof(m_state));
    memset(m_buffer, 0, sizeof(m_buffer));
    m_pos = 0;
    m_finalized = false;
    return *this;
}

void Keccak256(unsigned char hash[CKeccak256::OUTPUT_SIZE], const unsigned char* data, size_t len) {
    CKeccak256 ctx;
    ctx.Write(data, len);
    ctx.Finalize(hash);
}
