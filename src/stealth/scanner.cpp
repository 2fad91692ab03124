// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stealth/scanner.h"

#include "utilstrencodings.h"

#include <algorithm>

#include <boost/bind/bind.hpp>
#include <boost/optional.hpp>

namespace stealth {

namespace {

typedef std::vector<boost::optional<CStealthAddress>> SlotsT;

bool ParseViewTag(std::string const & str, unsigned char & tagOut)
{
    std::string const digits = StripHexPrefix(str);
    if (digits.size() != 2 || HexDigit(digits[0]) < 0 || HexDigit(digits[1]) < 0)
        return false;
    tagOut = (unsigned char)((HexDigit(digits[0]) << 4) | HexDigit(digits[1]));
    return true;
}

bool ParseRecordAddress(std::string const & str, CAccountID & addressOut)
{
    return addressOut.SetString("0x" + StripHexPrefix(str));
}

void ScanRange(CKey const & viewingKey, CPubKey const & viewingPubKey,
        std::vector<CStealthMetadata> const & records, size_t begin, size_t end, SlotsT & slots)
{
    for (size_t i = begin; i < end; ++i) {
        CStealthAddress found;
        if (TryScanRecord(viewingKey, viewingPubKey, records[i], found))
            slots[i] = found;
    }
}

}

bool TryScanRecord(CKey const & viewingKey, CPubKey const & viewingPubKey,
        CStealthMetadata const & record, CStealthAddress & found)
{
    if (record.stealthAddress.empty() || record.ephemeralPublicKey.empty() || record.viewTag.empty())
        return false;

    unsigned char storedTag;
    Bytes ephemeralBytes;
    CPubKey ephemeralPubKey;
    if (!ParseViewTag(record.viewTag, storedTag)
            || !TryParseHex(record.ephemeralPublicKey, ephemeralBytes)
            || !ParsePublicKey(ephemeralBytes, ephemeralPubKey))
        return false;

    CSharedSecret secret;
    if (!CSecretPoint(viewingKey, ephemeralPubKey).getEcdhSecret(secret))
        return false;

    if (secret.GetViewTag() != storedTag)
        return false;

    CAccountID claimed, derived;
    if (!ParseRecordAddress(record.stealthAddress, claimed))
        return false;
    if (DeriveOneTimeAddress(secret, viewingPubKey, derived) != StealthErrorCode::OK)
        return false;
    if (derived != claimed)
        return false;

    found = CStealthAddress(claimed, ephemeralPubKey, storedTag);
    return true;
}

void CreateScanThread(boost::thread_group & group, boost::function<void ()> const & worker)
{
    group.create_thread(worker);
}

StealthErrorCode ScanMetadata(Bytes const & viewingPrivateKey, Bytes const & viewingPublicKey,
        std::vector<CStealthMetadata> const & records, std::vector<CStealthAddress> & foundOut,
        unsigned int nThreads)
{
    return ScanMetadata(viewingPrivateKey, viewingPublicKey, records, foundOut, nThreads, &CreateScanThread);
}

StealthErrorCode ScanMetadata(Bytes const & viewingPrivateKey, Bytes const & viewingPublicKey,
        std::vector<CStealthMetadata> const & records, std::vector<CStealthAddress> & foundOut,
        unsigned int nThreads, ScanThreadSpawner const & spawn)
{
    if (viewingPrivateKey.empty() || viewingPublicKey.empty())
        return StealthErrorCode::MISSING_VIEWING_KEYS;

    foundOut.clear();

    // Malformed viewing keys make every record fail, which is an empty result.
    CKey viewingKey;
    CPubKey viewingPubKey;
    if (viewingPrivateKey.size() == PrivateKeySize)
        viewingKey.Set(viewingPrivateKey.begin(), viewingPrivateKey.end(), true);
    if (!viewingKey.IsValid() || !ParsePublicKey(viewingPublicKey, viewingPubKey)) {
        LogStealth("Unusable viewing keys, no record can match\n");
        return StealthErrorCode::OK;
    }

    if (nThreads == 0)
        nThreads = std::max(1u, boost::thread::hardware_concurrency());
    if (nThreads > records.size())
        nThreads = std::max<size_t>(1, records.size());

    SlotsT slots(records.size());
    if (nThreads == 1) {
        ScanRange(viewingKey, viewingPubKey, records, 0, records.size(), slots);
    } else {
        size_t const chunk = (records.size() + nThreads - 1) / nThreads;
        boost::thread_group scanThreads;
        // Workers reference this frame, so they are joined on every path out.
        try {
            for (size_t begin = 0; begin < records.size(); begin += chunk) {
                size_t const end = std::min(records.size(), begin + chunk);
                try {
                    spawn(scanThreads, boost::bind(&ScanRange, boost::cref(viewingKey), boost::cref(viewingPubKey),
                            boost::cref(records), begin, end, boost::ref(slots)));
                } catch (boost::thread_resource_error const & e) {
                    LogStealth("Could not start scan worker (%s), scanning records %d..%d inline\n",
                            e.what(), begin, records.size());
                    ScanRange(viewingKey, viewingPubKey, records, begin, records.size(), slots);
                    break;
                }
            }
        } catch (...) {
            scanThreads.join_all();
            throw;
        }
        scanThreads.join_all();
    }

    for (boost::optional<CStealthAddress> const & slot : slots)
        if (slot)
            foundOut.push_back(*slot);

    LogStealth("Scanned %d records on %d thread(s), %d matched\n", records.size(), nThreads, foundOut.size());
    return StealthErrorCode::OK;
}

}
