// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_API_H
#define STEALTH_STEALTH_API_H

/**
 * String level entry points. Keys, points and addresses are hex with an
 * optional 0x prefix in any case; they are decoded once here and the typed
 * core below never sees a string. Every operation except the scan throws
 * StealthError on failure.
 */

#include "key.h"
#include "pubkey.h"
#include "defs.h"
#include "derivation.h"
#include "errors.h"
#include "keys.h"
#include "metadata.h"

#include <string>
#include <vector>

#include <boost/optional.hpp>

class CRandomSource;

namespace stealth {

CStealthKeys GenerateStealthKeys();

CStealthAddress GenerateStealthAddress(
        std::string const & viewingPublicKey,
        boost::optional<std::string> const & spendingPublicKey = boost::none,
        boost::optional<std::string> const & ephemeralPrivateKey = boost::none);

CStealthAddress GenerateStealthAddress(
        CRandomSource & rng,
        std::string const & viewingPublicKey,
        boost::optional<std::string> const & spendingPublicKey = boost::none,
        boost::optional<std::string> const & ephemeralPrivateKey = boost::none);

/**
 * Throws only for MISSING_VIEWING_KEYS. Records that fail for any reason are
 * skipped, and viewing keys that are present but unusable match nothing.
 */
std::vector<CStealthAddress> ScanStealthAddresses(
        std::string const & viewingPrivateKey,
        std::string const & viewingPublicKey,
        std::vector<CStealthMetadata> const & metadata,
        unsigned int nThreads = DefaultScanThreads);

/**
 * Scan a JSON array of metadata records. Returns false, leaving foundOut
 * empty, when the document is not an array of record objects; records that
 * parse but are malformed are skipped as in ScanStealthAddresses.
 */
bool ScanMetadataDocument(
        std::string const & viewingPrivateKey,
        std::string const & viewingPublicKey,
        std::string const & metadataJson,
        std::vector<CStealthAddress> & foundOut,
        unsigned int nThreads = DefaultScanThreads);

/**
 * Rebuild a stealth address from its published parts. The address needs a
 * 0x prefix, the view tag is one byte of hex.
 */
CStealthAddress StealthAddressFromParts(
        std::string const & stealthAddress,
        std::string const & ephemeralPublicKey,
        std::string const & viewTag);

/** The returned key wipes itself; render it with HexStrPrefixed() only where it must leave the process. */
CKey DeriveStealthSpendingKey(
        std::string const & spendingPrivateKey,
        std::string const & viewingPrivateKey,
        std::string const & stealthAddress,
        std::string const & ephemeralPublicKey,
        boost::optional<std::string> const & viewingPublicKey = boost::none);

/** "0x" followed by exactly 40 hex digits. */
bool IsValidStealthAddress(std::string const & address);

/** Compressed point: optional 0x then exactly 66 hex digits. No curve check. */
bool IsValidPublicKey(std::string const & publicKey);

/** Compressed public key of a private key. */
CPubKey DerivePublicKey(std::string const & privateKey);

}

#endif // STEALTH_STEALTH_API_H
