// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "errors.h"

namespace stealth {

std::string StealthErrorName(StealthErrorCode code)
{
    switch (code) {
    case StealthErrorCode::OK: return "OK";
    case StealthErrorCode::INVALID_KEY_LENGTH: return "InvalidKeyLength";
    case StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT: return "InvalidPublicKeyFormat";
    case StealthErrorCode::MISSING_VIEWING_KEYS: return "MissingViewingKeys";
    case StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED: return "SharedSecretComputationFailed";
    case StealthErrorCode::DERIVED_ADDRESS_MISMATCH: return "DerivedAddressMismatch";
    case StealthErrorCode::INVALID_HEX: return "InvalidHex";
    }
    return "Unknown";
}

std::string StealthErrorString(StealthErrorCode code)
{
    switch (code) {
    case StealthErrorCode::OK: return "No error";
    case StealthErrorCode::INVALID_KEY_LENGTH: return "Invalid key length: private keys must be 32 bytes, public keys 33 or 65 bytes";
    case StealthErrorCode::INVALID_PUBLIC_KEY_FORMAT: return "Invalid public key format";
    case StealthErrorCode::MISSING_VIEWING_KEYS: return "Missing viewing keys";
    case StealthErrorCode::SHARED_SECRET_COMPUTATION_FAILED: return "Shared secret computation failed";
    case StealthErrorCode::DERIVED_ADDRESS_MISMATCH: return "Derived address mismatch";
    case StealthErrorCode::INVALID_HEX: return "Invalid hex string";
    }
    return "Unknown error";
}

StealthError::StealthError(StealthErrorCode code)
: std::runtime_error(StealthErrorString(code)), code(code)
{
}

StealthError::StealthError(StealthErrorCode code, const std::string& detail)
: std::runtime_error(StealthErrorString(code) + ": " + detail), code(code)
{
}

}
