// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "key.h"

#include "random.h"
#include "support/cleanse.h"

#include <assert.h>

#include <secp256k1.h>

static secp256k1_context* secp256k1_context_sign = NULL;

bool CKey::Check(const unsigned char *vch) {
    return secp256k1_ec_seckey_verify(secp256k1_context_sign, vch);
}

void CKey::MakeNewKey(CRandomSource& rng, bool fCompressedIn) {
    do {
        rng.GetBytes(keydata.data(), keydata.size());
    } while (!Check(keydata.data()));
    fValid = true;
    fCompressed = fCompressedIn;
}

void CKey::MakeNewKey(bool fCompressedIn) {
    MakeNewKey(GetStrongRandomSource(), fCompressedIn);
}

CPubKey CKey::GetPubKey() const {
    assert(fValid);
    secp256k1_pubkey pubkey;
    size_t clen = CPubKey::PUBLIC_KEY_SIZE;
    CPubKey result;
    int ret = secp256k1_ec_pubkey_create(secp256k1_context_sign, &pubkey, begin());
    assert(ret);
    unsigned char pub[CPubKey::PUBLIC_KEY_SIZE];
    secp256k1_ec_pubkey_serialize(secp256k1_context_sign, pub, &clen, &pubkey, fCompressed ? SECP256K1_EC_COMPRESSED : SECP256K1_EC_UNCOMPRESSED);
    result.Set(pub, pub + clen);
    assert(result.size() == clen);
    assert(result.IsValid());
    return result;
}

bool CKey::VerifyPubKey(const CPubKey& pubkey) const {
    if (!fValid || !pubkey.IsValid())
        return false;
    if (pubkey.IsCompressed() != fCompressed) {
        return false;
    }
    return GetPubKey() == pubkey;
}

bool ECC_InitSanityCheck() {
    CKey key;
    key.MakeNewKey(true);
    CPubKey pubkey = key.GetPubKey();
    if (!key.VerifyPubKey(pubkey))
        return false;
    // The scalar multiplication path must agree with key generation.
    static const unsigned char one[32] = {
        0,0,0,0,0,0,0,0, 0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0, 0,0,0,0,0,0,0,1
    };
    CPubKey product;
    return pubkey.Multiply(one, product) && product == pubkey;
}

void ECC_Start() {
    assert(secp256k1_context_sign == NULL);

    secp256k1_context *ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN);
    assert(ctx != NULL);

    {
        // Pass in a random blinding seed to the secp256k1 context.
        unsigned char seed[32];
        GetRandBytes(seed, 32);
        bool ret = secp256k1_context_randomize(ctx, seed);
        assert(ret);
        memory_cleanse(seed, sizeof(seed));
    }

    secp256k1_context_sign = ctx;
}

void ECC_Stop() {
    secp256k1_context *ctx = secp256k1_context_sign;
    secp256k1_context_sign = NULL;

    if (ctx) {
        secp256k1_context_destroy(ctx);
    }
}
