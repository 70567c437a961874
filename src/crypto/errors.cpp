// SECPCORE - Field and Curve Error Reporting
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/crypto/errors.h"

namespace secpcore {

const char* EcErrorString(EcError err) {
    switch (err) {
        case EcError::OK: return "No error";
        case EcError::OUT_OF_RANGE: return "Value not in the field range";
        case EcError::NOT_ON_CURVE: return "Point is not on the secp256k1 curve";
        case EcError::MISMATCHED_COORDINATES: return "Both coordinates must be present or both absent";
        case EcError::DIVISION_BY_ZERO: return "Division by zero";
        default: return "Unknown error";
    }
}

} // namespace secpcore
