// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <boost/test/unit_test.hpp>

#include "test/test_stealth.h"

#include "utilstrencodings.h"
#include "stealth/api.h"

using namespace stealth;

namespace {

bool HasCode(StealthError const & e, StealthErrorCode code)
{
    return e.GetCode() == code;
}

#define CHECK_STEALTH_ERROR(statement, errcode) \
    BOOST_CHECK_EXCEPTION(statement, StealthError, [](StealthError const & e) { return HasCode(e, errcode); })

}

BOOST_FIXTURE_TEST_SUITE(stealth_api_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(end_to_end)
{
    CStealthKeys keys = GenerateStealthKeys();
    BOOST_CHECK(keys.getSpending().IsValid());
    BOOST_CHECK(keys.getViewing().IsValid());
    BOOST_CHECK(!(keys.getSpending().getPrivKey() == keys.getViewing().getPrivKey()));

    std::string const viewingPub = HexStrPrefixed(keys.getViewing().getPubKey());
    std::string const viewingPriv = HexStrPrefixed(keys.getViewing().getPrivKey());
    std::string const spendingPub = HexStrPrefixed(keys.getSpending().getPubKey());
    std::string const spendingPriv = HexStrPrefixed(keys.getSpending().getPrivKey());
    BOOST_CHECK(IsValidPublicKey(viewingPub));
    BOOST_CHECK(IsValidPublicKey(spendingPub));

    CStealthAddress address = GenerateStealthAddress(viewingPub, spendingPub);
    BOOST_CHECK(IsValidStealthAddress(address.getAddress().ToString()));

    std::vector<CStealthMetadata> published(1, CreateStealthMetadata(address, "eth"));
    std::vector<CStealthAddress> found = ScanStealthAddresses(viewingPriv, viewingPub, published);
    BOOST_REQUIRE_EQUAL(found.size(), 1U);
    BOOST_CHECK(found[0] == address);

    CKey key = DeriveStealthSpendingKey(spendingPriv, viewingPriv,
            found[0].getAddress().ToChecksumString(), HexStrPrefixed(found[0].getEphemeralPubKey()), viewingPub);
    CAccountID controlled;
    BOOST_CHECK(GetAccountID(key.GetPubKey(), controlled));
    BOOST_CHECK(controlled == address.getAddress());
}

BOOST_AUTO_TEST_CASE(known_answer)
{
    CStealthAddress address = GenerateStealthAddress(
            StripHexPrefix(vectors::viewingPublicKey), std::string(""), ToLower(vectors::ephemeralPrivateKey));
    BOOST_CHECK_EQUAL(address.getAddress().ToString(), vectors::stealthAddress);
    BOOST_CHECK_EQUAL(address.getViewTagHex(), vectors::viewTag);

    CScriptedRandomSource rng;
    rng.Push(ParseHex(StripHexPrefix(vectors::ephemeralPrivateKey)));
    BOOST_CHECK(GenerateStealthAddress(rng, vectors::viewingPublicKey) == address);

    CKey key = DeriveStealthSpendingKey(vectors::spendingPrivateKey, vectors::viewingPrivateKey,
            vectors::stealthAddress, vectors::ephemeralPublicKey);
    BOOST_CHECK_EQUAL(HexStrPrefixed(key), vectors::stealthPrivateKey);

    BOOST_CHECK_EQUAL(HexStrPrefixed(DerivePublicKey(vectors::viewingPrivateKey)), vectors::viewingPublicKey);
    BOOST_CHECK_EQUAL(HexStrPrefixed(DerivePublicKey(StripHexPrefix(vectors::spendingPrivateKey))), vectors::spendingPublicKey);
}

BOOST_AUTO_TEST_CASE(generation_errors)
{
    CHECK_STEALTH_ERROR(GenerateStealthAddress(""), StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT);
    CHECK_STEALTH_ERROR(GenerateStealthAddress("0xnothex"), StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT);
    CHECK_STEALTH_ERROR(GenerateStealthAddress("0x1234"), StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT);
    CHECK_STEALTH_ERROR(GenerateStealthAddress(vectors::viewingPublicKey, std::string("0x02")), StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT);
    CHECK_STEALTH_ERROR(GenerateStealthAddress(vectors::viewingPublicKey, boost::none, std::string("0x1234")), StealthErrorCode::INVALID_KEY_LENGTH);
    CHECK_STEALTH_ERROR(GenerateStealthAddress(vectors::viewingPublicKey, boost::none, std::string("xyz")), StealthErrorCode::INVALID_HEX);
    CHECK_STEALTH_ERROR(GenerateStealthAddress(vectors::viewingPublicKey, boost::none, std::string(64, '0')), StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED);
}

BOOST_AUTO_TEST_CASE(scan_errors)
{
    std::vector<CStealthMetadata> records(1, CStealthMetadata(vectors::stealthAddress, vectors::ephemeralPublicKey, vectors::viewTag));
    CHECK_STEALTH_ERROR(ScanStealthAddresses("", vectors::viewingPublicKey, records), StealthErrorCode::MISSING_VIEWING_KEYS);
    CHECK_STEALTH_ERROR(ScanStealthAddresses(vectors::viewingPrivateKey, "", records), StealthErrorCode::MISSING_VIEWING_KEYS);

    BOOST_CHECK(ScanStealthAddresses("0xnothex", vectors::viewingPublicKey, records).empty());
    BOOST_CHECK(ScanStealthAddresses(vectors::viewingPrivateKey, vectors::viewingPublicKey, std::vector<CStealthMetadata>()).empty());
    BOOST_CHECK_EQUAL(ScanStealthAddresses(vectors::viewingPrivateKey, vectors::viewingPublicKey, records, 4).size(), 1U);
}

BOOST_AUTO_TEST_CASE(scan_document)
{
    std::string const known =
        "{\"stealthAddress\":\"" + vectors::stealthAddressChecksum + "\","
        "\"ephemeralPublicKey\":\"" + vectors::ephemeralPublicKey + "\","
        "\"viewTag\":\"0x59\",\"network\":\"eth\",\"createdAt\":1700000000000}";
    // Parses, but the point is not on the curve and the tag is not hex.
    std::string const bogus =
        "{\"stealthAddress\":\"0x1234\",\"ephemeralPublicKey\":\"0x0200\",\"viewTag\":\"zz\"}";

    std::vector<CStealthAddress> found;
    BOOST_CHECK(ScanMetadataDocument(vectors::viewingPrivateKey, vectors::viewingPublicKey,
            "[" + bogus + "," + known + ",{}]", found, 2));
    BOOST_REQUIRE_EQUAL(found.size(), 1U);

    UniValue obj = StealthAddressToJSON(found[0]);
    BOOST_CHECK_EQUAL(obj["address"].get_str(), vectors::stealthAddress);
    BOOST_CHECK_EQUAL(obj["ephemeralPublicKey"].get_str(), vectors::ephemeralPublicKey);
    BOOST_CHECK_EQUAL(obj["viewTag"].get_str(), vectors::viewTag);

    // An element of the wrong shape rejects the document.
    BOOST_CHECK(!ScanMetadataDocument(vectors::viewingPrivateKey, vectors::viewingPublicKey,
            "[" + known + ",\"" + vectors::stealthAddress + "\"]", found));
    BOOST_CHECK(found.empty());
    BOOST_CHECK(!ScanMetadataDocument(vectors::viewingPrivateKey, vectors::viewingPublicKey, known, found));
    BOOST_CHECK(!ScanMetadataDocument(vectors::viewingPrivateKey, vectors::viewingPublicKey, "[", found));

    CHECK_STEALTH_ERROR(ScanMetadataDocument("", vectors::viewingPublicKey, "[" + known + "]", found),
            StealthErrorCode::MISSING_VIEWING_KEYS);
}

BOOST_AUTO_TEST_CASE(address_from_parts)
{
    CStealthAddress address = StealthAddressFromParts(vectors::stealthAddressChecksum,
            StripHexPrefix(vectors::ephemeralPublicKey), "0x59");
    BOOST_CHECK_EQUAL(address.getAddress().ToString(), vectors::stealthAddress);
    BOOST_CHECK_EQUAL(HexStrPrefixed(address.getEphemeralPubKey()), vectors::ephemeralPublicKey);
    BOOST_CHECK_EQUAL((int)address.getViewTag(), 0x59);

    CStealthMetadata metadata = CreateStealthMetadata(address, "base");
    BOOST_CHECK_EQUAL(metadata.stealthAddress, vectors::stealthAddress);
    BOOST_CHECK_EQUAL(metadata.viewTag, vectors::viewTag);

    CHECK_STEALTH_ERROR(StealthAddressFromParts(StripHexPrefix(vectors::stealthAddress), vectors::ephemeralPublicKey, "59"),
            StealthErrorCode::INVALID_HEX);
    CHECK_STEALTH_ERROR(StealthAddressFromParts(vectors::stealthAddress, "0x0200", "59"),
            StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT);
    CHECK_STEALTH_ERROR(StealthAddressFromParts(vectors::stealthAddress, "nothex", "59"),
            StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT);
    CHECK_STEALTH_ERROR(StealthAddressFromParts(vectors::stealthAddress, vectors::ephemeralPublicKey, "5"),
            StealthErrorCode::INVALID_HEX);
    CHECK_STEALTH_ERROR(StealthAddressFromParts(vectors::stealthAddress, vectors::ephemeralPublicKey, "0x5959"),
            StealthErrorCode::INVALID_HEX);
}

BOOST_AUTO_TEST_CASE(spendkey_errors)
{
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, vectors::viewingPrivateKey,
            "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf", vectors::ephemeralPublicKey), StealthErrorCode::DERIVED_ADDRESS_MISMATCH);
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, vectors::viewingPrivateKey,
            "0x1234", vectors::ephemeralPublicKey), StealthErrorCode::DERIVED_ADDRESS_MISMATCH);
    // Key errors are reported ahead of a malformed address.
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, "0x" + std::string(62, '1'),
            "0x1234", vectors::ephemeralPublicKey), StealthErrorCode::INVALID_KEY_LENGTH);
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, vectors::viewingPrivateKey,
            "not an address", "0x02"), StealthErrorCode::INVALID_KEY_LENGTH);
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, "xyz",
            "0x1234", vectors::ephemeralPublicKey), StealthErrorCode::INVALID_HEX);
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey("0x1234", vectors::viewingPrivateKey,
            vectors::stealthAddress, vectors::ephemeralPublicKey), StealthErrorCode::INVALID_KEY_LENGTH);
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, "nothex",
            vectors::stealthAddress, vectors::ephemeralPublicKey), StealthErrorCode::INVALID_HEX);
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, vectors::viewingPrivateKey,
            vectors::stealthAddress, "0x02"), StealthErrorCode::INVALID_KEY_LENGTH);
    CHECK_STEALTH_ERROR(DeriveStealthSpendingKey(vectors::spendingPrivateKey, vectors::viewingPrivateKey,
            vectors::stealthAddress, vectors::ephemeralPublicKey, std::string("0x0202")), StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT);

    try {
        DeriveStealthSpendingKey(vectors::spendingPrivateKey, vectors::viewingPrivateKey,
                "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf", vectors::ephemeralPublicKey);
        BOOST_ERROR("mismatch not reported");
    } catch (StealthError const & e) {
        BOOST_CHECK_EQUAL(StealthErrorName(e.GetCode()), "DerivedAddressMismatch");
        BOOST_CHECK_EQUAL(std::string(e.what()), "Derived address mismatch");
    }
}

BOOST_AUTO_TEST_CASE(validation_helpers)
{
    BOOST_CHECK(IsValidStealthAddress(vectors::stealthAddress));
    BOOST_CHECK(IsValidStealthAddress(vectors::stealthAddressChecksum));
    BOOST_CHECK(!IsValidStealthAddress(StripHexPrefix(vectors::stealthAddress)));
    BOOST_CHECK(!IsValidStealthAddress("0X" + StripHexPrefix(vectors::stealthAddress)));
    BOOST_CHECK(!IsValidStealthAddress(vectors::stealthAddress + "00"));

    BOOST_CHECK(IsValidPublicKey(vectors::viewingPublicKey));
    BOOST_CHECK(IsValidPublicKey(StripHexPrefix(vectors::viewingPublicKey)));
    BOOST_CHECK(!IsValidPublicKey(vectors::viewingPublicKeyUncompressed));
    BOOST_CHECK(!IsValidPublicKey("0x1234"));

    CHECK_STEALTH_ERROR(DerivePublicKey("0x1234"), StealthErrorCode::INVALID_KEY_LENGTH);
    CHECK_STEALTH_ERROR(DerivePublicKey("zz"), StealthErrorCode::INVALID_HEX);
    CHECK_STEALTH_ERROR(DerivePublicKey(std::string(64, '0')), StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED);
}

BOOST_AUTO_TEST_SUITE_END()
