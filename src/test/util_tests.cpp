// Copyright (c) 2011-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.h"
#include "utilstrencodings.h"
#include "utiltime.h"
#include "test/test_stealth.h"

#include <stdint.h>
#include <vector>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

static const unsigned char ParseHex_expected[65] = {
    0x04, 0x67, 0x8a, 0xfd, 0xb0, 0xfe, 0x55, 0x48, 0x27, 0x19, 0x67, 0xf1, 0xa6, 0x71, 0x30, 0xb7,
    0x10, 0x5c, 0xd6, 0xa8, 0x28, 0xe0, 0x39, 0x09, 0xa6, 0x79, 0x62, 0xe0, 0xea, 0x1f, 0x61, 0xde,
    0xb6, 0x49, 0xf6, 0xbc, 0x3f, 0x4c, 0xef, 0x38, 0xc4, 0xf3, 0x55, 0x04, 0xe5, 0x1e, 0xc1, 0x12,
    0xde, 0x5c, 0x38, 0x4d, 0xf7, 0xba, 0x0b, 0x8d, 0x57, 0x8a, 0x4c, 0x70, 0x2b, 0x6b, 0xf1, 0x1d,
    0x5f
};

BOOST_AUTO_TEST_CASE(util_ParseHex)
{
    std::vector<unsigned char> result;
    std::vector<unsigned char> expected(ParseHex_expected, ParseHex_expected + sizeof(ParseHex_expected));
    // Basic test vector
    result = ParseHex("04678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5f");
    BOOST_CHECK_EQUAL_COLLECTIONS(result.begin(), result.end(), expected.begin(), expected.end());

    // Spaces between bytes must be supported
    result = ParseHex("12 34 56 78");
    BOOST_CHECK(result.size() == 4 && result[0] == 0x12 && result[1] == 0x34 && result[2] == 0x56 && result[3] == 0x78);

    // Stop parsing at invalid value
    result = ParseHex("1234 invalid 1234");
    BOOST_CHECK(result.size() == 2 && result[0] == 0x12 && result[1] == 0x34);
}

BOOST_AUTO_TEST_CASE(util_TryParseHex)
{
    std::vector<unsigned char> result;
    BOOST_CHECK(TryParseHex("0xAbCd", result));
    BOOST_CHECK(result.size() == 2 && result[0] == 0xab && result[1] == 0xcd);
    BOOST_CHECK(TryParseHex("0Xabcd", result));
    BOOST_CHECK(TryParseHex("abcd", result));
    BOOST_CHECK_EQUAL(HexStr(result), "abcd");

    BOOST_CHECK(!TryParseHex("", result));
    BOOST_CHECK(result.empty());
    BOOST_CHECK(!TryParseHex("0x", result));
    BOOST_CHECK(!TryParseHex("0xabc", result));
    BOOST_CHECK(!TryParseHex("0xab cd", result));
    BOOST_CHECK(!TryParseHex("0xzz", result));
}

BOOST_AUTO_TEST_CASE(util_HexStr)
{
    BOOST_CHECK_EQUAL(
        HexStr(ParseHex_expected, ParseHex_expected + 5, true),
        "04 67 8a fd b0");

    std::vector<unsigned char> vch = ParseHex("00ff10");
    BOOST_CHECK_EQUAL(HexStr(vch), "00ff10");
    BOOST_CHECK_EQUAL(HexStrPrefixed(vch), "0x00ff10");
    BOOST_CHECK_EQUAL(HexStrPrefixed(std::vector<unsigned char>()), "0x");

    BOOST_CHECK_EQUAL(StripHexPrefix("0xab"), "ab");
    BOOST_CHECK_EQUAL(StripHexPrefix("ab"), "ab");
    BOOST_CHECK_EQUAL(ToLower("0xAbC"), "0xabc");
}

BOOST_AUTO_TEST_CASE(util_IsHex)
{
    BOOST_CHECK(IsHex("00"));
    BOOST_CHECK(IsHex("00112233445566778899aabbccddeeffAABBCCDDEEFF"));
    BOOST_CHECK(IsHex("ff"));
    BOOST_CHECK(IsHex("FF"));

    BOOST_CHECK(!IsHex(""));
    BOOST_CHECK(!IsHex("0"));
    BOOST_CHECK(!IsHex("a"));
    BOOST_CHECK(!IsHex("eleven"));
    BOOST_CHECK(!IsHex("00xx00"));
    BOOST_CHECK(!IsHex("0x0000"));
}

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    const char *argv_test[] = {"-ignored", "-a", "-b", "-ccc=argument", "-ccc=multiple", "f", "-d=e", "-", "--network=test", "-nologtimestamps"};

    ParseParameters(0, (char**)argv_test);
    BOOST_CHECK(!IsArgSet("-a"));
    BOOST_CHECK(GetPositionalArgs().empty());

    ParseParameters(1, (char**)argv_test);
    BOOST_CHECK(!IsArgSet("-ignored"));

    ParseParameters(10, (char**)argv_test);
    BOOST_CHECK(IsArgSet("-a") && IsArgSet("-b") && IsArgSet("-ccc") && IsArgSet("-d"));
    BOOST_CHECK(!IsArgSet("f"));
    BOOST_CHECK_EQUAL(GetArg("-a", "x"), "");
    BOOST_CHECK_EQUAL(GetArg("-ccc", "x"), "multiple");
    BOOST_CHECK_EQUAL(GetArg("-d", "x"), "e");
    BOOST_CHECK_EQUAL(GetArg("-network", "eth"), "test");
    BOOST_CHECK(!GetBoolArg("-logtimestamps", true));

    std::vector<std::string> const & positional = GetPositionalArgs();
    BOOST_REQUIRE_EQUAL(positional.size(), 2U);
    BOOST_CHECK_EQUAL(positional[0], "f");
    BOOST_CHECK_EQUAL(positional[1], "-");
}

BOOST_AUTO_TEST_CASE(util_GetArg)
{
    ClearArgs();
    BOOST_CHECK_EQUAL(GetArg("-scanthreads", (int64_t)1), 1);
    BOOST_CHECK(SoftSetArg("-scanthreads", "4"));
    BOOST_CHECK(!SoftSetArg("-scanthreads", "8"));
    BOOST_CHECK_EQUAL(GetArg("-scanthreads", (int64_t)1), 4);

    BOOST_CHECK(SoftSetBoolArg("-checksum", true));
    BOOST_CHECK(GetBoolArg("-checksum", false));
    BOOST_CHECK(!SoftSetBoolArg("-checksum", false));
    BOOST_CHECK(GetBoolArg("-checksum", false));
    BOOST_CHECK(GetBoolArg("-unset", true));

    // An explicit -noprinttoconsole survives a soft default.
    const char *argv_quiet[] = {"prog", "-noprinttoconsole", "demo"};
    ParseParameters(3, (char**)argv_quiet);
    BOOST_CHECK(!SoftSetBoolArg("-printtoconsole", true));
    BOOST_CHECK(!GetBoolArg("-printtoconsole", true));
}

BOOST_AUTO_TEST_CASE(util_LogAcceptCategory)
{
    const char *argv_none[] = {"prog"};
    ParseParameters(1, (char**)argv_none);
    InitLogging();
    BOOST_CHECK(LogAcceptCategory(NULL));
    BOOST_CHECK(!LogAcceptCategory("stealth"));

    const char *argv_one[] = {"prog", "-debug=stealth"};
    ParseParameters(2, (char**)argv_one);
    InitLogging();
    BOOST_CHECK(LogAcceptCategory("stealth"));
    BOOST_CHECK(!LogAcceptCategory("net"));

    const char *argv_all[] = {"prog", "-debug"};
    ParseParameters(2, (char**)argv_all);
    InitLogging();
    BOOST_CHECK(LogAcceptCategory("stealth"));
    BOOST_CHECK(LogAcceptCategory("net"));
}

BOOST_AUTO_TEST_CASE(util_FormatParagraph)
{
    BOOST_CHECK_EQUAL(FormatParagraph("", 79, 0), "");
    BOOST_CHECK_EQUAL(FormatParagraph("test", 79, 0), "test");
    BOOST_CHECK_EQUAL(FormatParagraph(" test", 79, 0), " test");
    BOOST_CHECK_EQUAL(FormatParagraph("test test", 79, 0), "test test");
    BOOST_CHECK_EQUAL(FormatParagraph("test test", 4, 0), "test\ntest");
    BOOST_CHECK_EQUAL(FormatParagraph("testerde test", 4, 0), "testerde\ntest");
    BOOST_CHECK_EQUAL(FormatParagraph("test test", 4, 4), "test\n    test");
}

BOOST_AUTO_TEST_CASE(util_mocktime)
{
    SetMockTime(1700000000);
    BOOST_CHECK_EQUAL(GetTime(), 1700000000);
    BOOST_CHECK_EQUAL(GetMillisSinceEpoch(), 1700000000000LL);
    BOOST_CHECK_EQUAL(DateTimeStrFormat("%Y-%m-%d %H:%M:%S", 1700000000), "2023-11-14 22:13:20");
    SetMockTime(0);
    BOOST_CHECK(GetMillisSinceEpoch() > 1700000000000LL);
}

BOOST_AUTO_TEST_SUITE_END()
