// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_SCANNER_H
#define STEALTH_STEALTH_SCANNER_H

#include "key.h"
#include "pubkey.h"
#include "defs.h"
#include "derivation.h"
#include "errors.h"
#include "metadata.h"

#include <vector>

#include <boost/function.hpp>
#include <boost/thread.hpp>

namespace stealth {

/** Starts one scan worker in the group. May throw boost::thread_resource_error. */
typedef boost::function<void (boost::thread_group &, boost::function<void ()> const &)> ScanThreadSpawner;

/** Default spawner, boost::thread_group::create_thread. */
void CreateScanThread(boost::thread_group & group, boost::function<void ()> const & worker);

/**
 * Check a single record against the receiver's viewing key.
 *
 * Never fails: a record that is incomplete, malformed, or carries a point the
 * curve rejects is simply not a match. The address is only re-derived when the
 * view tag matches.
 *
 * @param[in] viewingKey      receiver's viewing private key
 * @param[in] viewingPubKey   receiver's viewing public key, either encoding
 * @param[in] record          candidate in wire form
 * @param[out] found          set on a match
 * @return true on a match
 */
bool TryScanRecord(CKey const & viewingKey, CPubKey const & viewingPubKey,
        CStealthMetadata const & record, CStealthAddress & found);

/**
 * Return every record addressed to the owner of the viewing keys, in input
 * order. Individual records never fail the scan; the only error is
 * MISSING_VIEWING_KEYS when either key is empty.
 *
 * nThreads > 1 splits the records over a thread group, 0 uses one thread per
 * hardware core. The result is the same for any thread count. If a worker
 * cannot be started, the chunks it would have taken are scanned on the
 * calling thread; every started worker is joined before returning.
 */
StealthErrorCode ScanMetadata(Bytes const & viewingPrivateKey, Bytes const & viewingPublicKey,
        std::vector<CStealthMetadata> const & records, std::vector<CStealthAddress> & foundOut,
        unsigned int nThreads = DefaultScanThreads);

StealthErrorCode ScanMetadata(Bytes const & viewingPrivateKey, Bytes const & viewingPublicKey,
        std::vector<CStealthMetadata> const & records, std::vector<CStealthAddress> & foundOut,
        unsigned int nThreads, ScanThreadSpawner const & spawn);

}

#endif // STEALTH_STEALTH_SCANNER_H
