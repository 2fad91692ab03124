// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_STEALTH_ERRORS_H
#define STEALTH_STEALTH_ERRORS_H

#include <stdexcept>
#include <string>

namespace stealth {

enum class StealthErrorCode {
    OK = 0,
    INVALID_KEY_LENGTH,
    INVALID_PUBLIC_KEY_FORMAT,
    MISSING_VIEWING_KEYS,
    SHARED_SECRET_COMPUTATION_FAILED,
    DERIVED_ADDRESS_MISMATCH,
    //! A string handed to the hex API was not hex at all
    INVALID_HEX,
};

/** Short symbolic name, e.g. "InvalidKeyLength". */
std::string StealthErrorName(StealthErrorCode code);

/** Human readable description. */
std::string StealthErrorString(StealthErrorCode code);

class StealthError : public std::runtime_error
{
public:
    explicit StealthError(StealthErrorCode code);
    StealthError(StealthErrorCode code, const std::string& detail);

    StealthErrorCode GetCode() const { return code; }

private:
    StealthErrorCode code;
};

}

#endif // STEALTH_STEALTH_ERRORS_H
