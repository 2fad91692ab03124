// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <boost/test/unit_test.hpp>

#include "test/test_stealth.h"

#include "key.h"
#include "utilstrencodings.h"
#include "stealth/secretpoint.h"

using namespace stealth;

namespace {
Bytes FromHex(std::string const & hex)
{
    return ParseHex(StripHexPrefix(hex));
}
}

BOOST_FIXTURE_TEST_SUITE(stealth_secretpoint_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(known_answer)
{
    CSharedSecret secret;
    BOOST_CHECK(ComputeSharedSecret(FromHex(vectors::ephemeralPrivateKey), FromHex(vectors::viewingPublicKey), secret) == StealthErrorCode::OK);
    BOOST_CHECK_EQUAL(HexStr(secret), vectors::sharedSecret);
    BOOST_CHECK_EQUAL(HexStr(&secret.begin()[0], &secret.begin()[1]), vectors::viewTag);
    BOOST_CHECK_EQUAL(secret.GetViewTag(), 0x59);
}

BOOST_AUTO_TEST_CASE(ecdh_symmetry)
{
    CSharedSecret senderSide, receiverSide;
    BOOST_CHECK(ComputeSharedSecret(FromHex(vectors::ephemeralPrivateKey), FromHex(vectors::viewingPublicKey), senderSide) == StealthErrorCode::OK);
    BOOST_CHECK(ComputeSharedSecret(FromHex(vectors::viewingPrivateKey), FromHex(vectors::ephemeralPublicKey), receiverSide) == StealthErrorCode::OK);
    BOOST_CHECK(senderSide == receiverSide);

    for (int i = 0; i < 16; ++i) {
        CKey a, b;
        a.MakeNewKey(true);
        b.MakeNewKey(true);
        CSecretPoint ab(a, b.GetPubKey());
        CSecretPoint ba(b, a.GetPubKey());
        BOOST_CHECK(ab.isShared(ba));

        CSharedSecret s1, s2;
        BOOST_CHECK(ab.getEcdhSecret(s1));
        BOOST_CHECK(ba.getEcdhSecret(s2));
        BOOST_CHECK_EQUAL(HexStr(s1), HexStr(s2));
    }
}

BOOST_AUTO_TEST_CASE(point_encodings_agree)
{
    CSharedSecret fromCompressed, fromUncompressed;
    BOOST_CHECK(ComputeSharedSecret(FromHex(vectors::ephemeralPrivateKey), FromHex(vectors::viewingPublicKey), fromCompressed) == StealthErrorCode::OK);
    BOOST_CHECK(ComputeSharedSecret(FromHex(vectors::ephemeralPrivateKey), FromHex(vectors::viewingPublicKeyUncompressed), fromUncompressed) == StealthErrorCode::OK);
    BOOST_CHECK(fromCompressed == fromUncompressed);
}

BOOST_AUTO_TEST_CASE(length_checks)
{
    CSharedSecret secret;
    Bytes const priv = FromHex(vectors::viewingPrivateKey);
    Bytes const pub = FromHex(vectors::ephemeralPublicKey);

    BOOST_CHECK(ComputeSharedSecret(Bytes(), pub, secret) == StealthErrorCode::INVALID_KEY_LENGTH);
    BOOST_CHECK(ComputeSharedSecret(Bytes(priv.begin(), priv.end() - 1), pub, secret) == StealthErrorCode::INVALID_KEY_LENGTH);
    Bytes longPriv(priv);
    longPriv.push_back(0);
    BOOST_CHECK(ComputeSharedSecret(longPriv, pub, secret) == StealthErrorCode::INVALID_KEY_LENGTH);

    BOOST_CHECK(ComputeSharedSecret(priv, Bytes(), secret) == StealthErrorCode::INVALID_KEY_LENGTH);
    BOOST_CHECK(ComputeSharedSecret(priv, Bytes(pub.begin(), pub.end() - 1), secret) == StealthErrorCode::INVALID_KEY_LENGTH);
    BOOST_CHECK(ComputeSharedSecret(priv, Bytes(64, 0x04), secret) == StealthErrorCode::INVALID_KEY_LENGTH);
}

BOOST_AUTO_TEST_CASE(curve_failures)
{
    CSharedSecret secret;
    Bytes const priv = FromHex(vectors::viewingPrivateKey);
    Bytes const pub = FromHex(vectors::ephemeralPublicKey);

    BOOST_CHECK(ComputeSharedSecret(Bytes(32, 0), pub, secret) == StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED);
    BOOST_CHECK(ComputeSharedSecret(Bytes(32, 0xff), pub, secret) == StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED);

    // x = 5 is not on the curve
    Bytes offCurve(33, 0);
    offCurve[0] = 0x02;
    offCurve[32] = 0x05;
    BOOST_CHECK(ComputeSharedSecret(priv, offCurve, secret) == StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED);

    Bytes badPrefix(pub);
    badPrefix[0] = 0x09;
    BOOST_CHECK(ComputeSharedSecret(priv, badPrefix, secret) == StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED);

    // A 33 byte string with an uncompressed prefix is not a valid encoding either.
    Bytes mixed(pub);
    mixed[0] = 0x04;
    BOOST_CHECK(ComputeSharedSecret(priv, mixed, secret) == StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED);
}

BOOST_AUTO_TEST_SUITE_END()
