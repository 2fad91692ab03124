// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stealth/metadata.h"

#include "stealth/defs.h"
#include "stealth/derivation.h"
#include "utilstrencodings.h"
#include "utiltime.h"

namespace stealth {

namespace {

bool ReadString(UniValue const & obj, std::string const & key, std::string & out)
{
    UniValue const & value = obj[key];
    if (value.isNull()) {
        out.clear();
        return true;
    }
    if (!value.isStr())
        return false;
    out = value.get_str();
    return true;
}

}

bool CStealthMetadata::operator==(CStealthMetadata const & other) const
{
    return stealthAddress == other.stealthAddress
        && ephemeralPublicKey == other.ephemeralPublicKey
        && viewTag == other.viewTag
        && network == other.network
        && createdAt == other.createdAt;
}

CStealthMetadata CreateStealthMetadata(CStealthAddress const & address, std::string const & network)
{
    return CStealthMetadata(
            address.getAddress().ToString(),
            HexStrPrefixed(address.getEphemeralPubKey()),
            address.getViewTagHex(),
            network,
            GetMillisSinceEpoch());
}

UniValue MetadataToJSON(CStealthMetadata const & metadata)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("stealthAddress", metadata.stealthAddress);
    obj.pushKV("ephemeralPublicKey", metadata.ephemeralPublicKey);
    obj.pushKV("viewTag", metadata.viewTag);
    obj.pushKV("network", metadata.network);
    obj.pushKV("createdAt", metadata.createdAt);
    return obj;
}

bool MetadataFromJSON(UniValue const & obj, CStealthMetadata & metadataOut)
{
    if (!obj.isObject())
        return false;

    CStealthMetadata result;
    if (!ReadString(obj, "stealthAddress", result.stealthAddress)
            || !ReadString(obj, "ephemeralPublicKey", result.ephemeralPublicKey)
            || !ReadString(obj, "viewTag", result.viewTag)
            || !ReadString(obj, "network", result.network))
        return false;

    UniValue const & createdAt = obj["createdAt"];
    if (createdAt.isNum())
        result.createdAt = createdAt.get_int64();
    else if (!createdAt.isNull())
        return false;

    metadataOut = result;
    return true;
}

UniValue MetadataListToJSON(std::vector<CStealthMetadata> const & list)
{
    UniValue arr(UniValue::VARR);
    for (CStealthMetadata const & metadata : list)
        arr.push_back(MetadataToJSON(metadata));
    return arr;
}

bool MetadataListFromJSON(std::string const & json, std::vector<CStealthMetadata> & listOut)
{
    UniValue doc;
    if (!doc.read(json) || !doc.isArray()) {
        LogStealth("Metadata document is not a JSON array\n");
        return false;
    }

    std::vector<CStealthMetadata> result;
    result.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        CStealthMetadata metadata;
        if (!MetadataFromJSON(doc[i], metadata)) {
            LogStealth("Malformed metadata record at index %d\n", i);
            return false;
        }
        result.push_back(metadata);
    }
    listOut.swap(result);
    return true;
}

UniValue StealthAddressToJSON(CStealthAddress const & address)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", address.getAddress().ToString());
    obj.pushKV("ephemeralPublicKey", HexStrPrefixed(address.getEphemeralPubKey()));
    obj.pushKV("viewTag", address.getViewTagHex());
    return obj;
}

}
