// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stealth/api.h"

#include "random.h"
#include "stealth/scanner.h"
#include "stealth/spendkey.h"
#include "support/cleanse.h"
#include "utilstrencodings.h"

#include <boost/scope_exit.hpp>

namespace stealth {

namespace {

void Check(StealthErrorCode code)
{
    if (code != StealthErrorCode::OK)
        throw StealthError(code);
}

Bytes ParsePrivateKeyHex(std::string const & str, char const * name)
{
    Bytes result;
    if (!TryParseHex(str, result))
        throw StealthError(StealthErrorCode::INVALID_HEX, name);
    return result;
}

Bytes ParsePublicKeyHex(std::string const & str, char const * name)
{
    Bytes result;
    if (!TryParseHex(str, result))
        throw StealthError(StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT, name);
    return result;
}

boost::optional<Bytes> ParseOptional(boost::optional<std::string> const & str, char const * name,
        Bytes (*parse)(std::string const &, char const *))
{
    if (!str || str->empty())
        return boost::none;
    return parse(*str, name);
}

void Cleanse(Bytes & bytes)
{
    if (!bytes.empty())
        memory_cleanse(bytes.data(), bytes.size());
}

}

CStealthKeys GenerateStealthKeys()
{
    return GenerateStealthKeys(GetStrongRandomSource());
}

CStealthAddress GenerateStealthAddress(
        std::string const & viewingPublicKey,
        boost::optional<std::string> const & spendingPublicKey,
        boost::optional<std::string> const & ephemeralPrivateKey)
{
    return GenerateStealthAddress(GetStrongRandomSource(), viewingPublicKey, spendingPublicKey, ephemeralPrivateKey);
}

CStealthAddress GenerateStealthAddress(
        CRandomSource & rng,
        std::string const & viewingPublicKey,
        boost::optional<std::string> const & spendingPublicKey,
        boost::optional<std::string> const & ephemeralPrivateKey)
{
    Bytes const viewingPub = ParsePublicKeyHex(viewingPublicKey, "viewingPublicKey");
    boost::optional<Bytes> const spendingPub = ParseOptional(spendingPublicKey, "spendingPublicKey", &ParsePublicKeyHex);
    boost::optional<Bytes> ephemeralPriv = ParseOptional(ephemeralPrivateKey, "ephemeralPrivateKey", &ParsePrivateKeyHex);
    BOOST_SCOPE_EXIT(&ephemeralPriv) {
        if (ephemeralPriv)
            Cleanse(*ephemeralPriv);
    } BOOST_SCOPE_EXIT_END

    CStealthAddress result;
    Check(DeriveStealthAddress(viewingPub, spendingPub, ephemeralPriv, rng, result));
    return result;
}

std::vector<CStealthAddress> ScanStealthAddresses(
        std::string const & viewingPrivateKey,
        std::string const & viewingPublicKey,
        std::vector<CStealthMetadata> const & metadata,
        unsigned int nThreads)
{
    if (viewingPrivateKey.empty() || viewingPublicKey.empty())
        throw StealthError(StealthErrorCode::MISSING_VIEWING_KEYS);

    std::vector<CStealthAddress> found;
    Bytes viewingPriv, viewingPub;
    BOOST_SCOPE_EXIT(&viewingPriv) {
        Cleanse(viewingPriv);
    } BOOST_SCOPE_EXIT_END

    if (!TryParseHex(viewingPrivateKey, viewingPriv) || !TryParseHex(viewingPublicKey, viewingPub)) {
        LogStealth("Viewing keys are not hex, no record can match\n");
        return found;
    }

    Check(ScanMetadata(viewingPriv, viewingPub, metadata, found, nThreads));
    return found;
}

bool ScanMetadataDocument(
        std::string const & viewingPrivateKey,
        std::string const & viewingPublicKey,
        std::string const & metadataJson,
        std::vector<CStealthAddress> & foundOut,
        unsigned int nThreads)
{
    foundOut.clear();
    std::vector<CStealthMetadata> records;
    if (!MetadataListFromJSON(metadataJson, records))
        return false;
    foundOut = ScanStealthAddresses(viewingPrivateKey, viewingPublicKey, records, nThreads);
    return true;
}

CStealthAddress StealthAddressFromParts(
        std::string const & stealthAddress,
        std::string const & ephemeralPublicKey,
        std::string const & viewTag)
{
    CAccountID account;
    if (!account.SetString(stealthAddress))
        throw StealthError(StealthErrorCode::INVALID_HEX, "stealthAddress");

    CPubKey ephemeralPubKey;
    if (!ParsePublicKey(ParsePublicKeyHex(ephemeralPublicKey, "ephemeralPublicKey"), ephemeralPubKey))
        throw StealthError(StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT, "ephemeralPublicKey");

    Bytes tag;
    if (!TryParseHex(viewTag, tag) || tag.size() != 1)
        throw StealthError(StealthErrorCode::INVALID_HEX, "viewTag");

    return CStealthAddress(account, ephemeralPubKey, tag[0]);
}

CKey DeriveStealthSpendingKey(
        std::string const & spendingPrivateKey,
        std::string const & viewingPrivateKey,
        std::string const & stealthAddress,
        std::string const & ephemeralPublicKey,
        boost::optional<std::string> const & viewingPublicKey)
{
    Bytes spendingPriv, viewingPriv;
    BOOST_SCOPE_EXIT(&spendingPriv, &viewingPriv) {
        Cleanse(spendingPriv);
        Cleanse(viewingPriv);
    } BOOST_SCOPE_EXIT_END

    spendingPriv = ParsePrivateKeyHex(spendingPrivateKey, "spendingPrivateKey");
    viewingPriv = ParsePrivateKeyHex(viewingPrivateKey, "viewingPrivateKey");
    Bytes const ephemeralPub = ParsePublicKeyHex(ephemeralPublicKey, "ephemeralPublicKey");
    boost::optional<Bytes> const viewingPub = ParseOptional(viewingPublicKey, "viewingPublicKey", &ParsePublicKeyHex);

    // Key errors take precedence, so an unparsable address is checked against
    // the null account and only rejected once the keys have been used.
    CAccountID address;
    bool const fAddressValid = address.SetString("0x" + StripHexPrefix(stealthAddress));
    if (!fAddressValid)
        address.SetNull();

    CKey result;
    StealthErrorCode code = DeriveSpendingKey(spendingPriv, viewingPriv, address, ephemeralPub, viewingPub, result);
    if (!fAddressValid && (code == StealthErrorCode::OK || code == StealthErrorCode::DERIVED_ADDRESS_MISMATCH))
        throw StealthError(StealthErrorCode::DERIVED_ADDRESS_MISMATCH, "not an address: " + stealthAddress);
    Check(code);
    return result;
}

bool IsValidStealthAddress(std::string const & address)
{
    return IsValidAccountString(address) && address[1] == 'x';
}

bool IsValidPublicKey(std::string const & publicKey)
{
    std::string const digits = StripHexPrefix(publicKey);
    if (digits.size() != 2 * CompressedPubKeySize)
        return false;
    for (char c : digits)
        if (HexDigit(c) < 0)
            return false;
    return true;
}

CPubKey DerivePublicKey(std::string const & privateKey)
{
    Bytes priv = ParsePrivateKeyHex(privateKey, "privateKey");
    BOOST_SCOPE_EXIT(&priv) {
        Cleanse(priv);
    } BOOST_SCOPE_EXIT_END

    if (priv.size() != PrivateKeySize)
        throw StealthError(StealthErrorCode::INVALID_KEY_LENGTH);
    CKey key;
    key.Set(priv.begin(), priv.end(), true);
    if (!key.IsValid())
        throw StealthError(StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED, "private key out of range");
    return key.GetPubKey();
}

}
