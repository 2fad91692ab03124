// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_METADATA_H
#define STEALTH_STEALTH_METADATA_H

#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

namespace stealth {

class CStealthAddress;

/**
 * Publication record for a stealth payment. Fields are kept in wire form and
 * are only interpreted by the scanner.
 */
struct CStealthMetadata
{
    std::string stealthAddress;
    std::string ephemeralPublicKey;
    std::string viewTag;
    std::string network;
    int64_t createdAt;

    CStealthMetadata() : createdAt(0) {}
    CStealthMetadata(std::string const & stealthAddress, std::string const & ephemeralPublicKey,
            std::string const & viewTag, std::string const & network = "", int64_t createdAt = 0)
    : stealthAddress(stealthAddress), ephemeralPublicKey(ephemeralPublicKey), viewTag(viewTag),
      network(network), createdAt(createdAt)
    {}

    bool operator==(CStealthMetadata const & other) const;
};

/** Wire form of an address plus the network name, stamped with the current time in milliseconds. */
CStealthMetadata CreateStealthMetadata(CStealthAddress const & address, std::string const & network);

UniValue MetadataToJSON(CStealthMetadata const & metadata);

/**
 * Read one record. Missing string fields read as empty and a missing
 * createdAt as 0; a field of the wrong JSON type fails the whole record.
 */
bool MetadataFromJSON(UniValue const & obj, CStealthMetadata & metadataOut);

UniValue MetadataListToJSON(std::vector<CStealthMetadata> const & list);

/** Parse a JSON array of records. Any malformed element fails the document. */
bool MetadataListFromJSON(std::string const & json, std::vector<CStealthMetadata> & listOut);

/** address / ephemeralPublicKey / viewTag object as returned by generation and scanning. */
UniValue StealthAddressToJSON(CStealthAddress const & address);

}

#endif // STEALTH_STEALTH_METADATA_H
