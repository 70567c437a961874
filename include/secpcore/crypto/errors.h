// SECPCORE - Field and Curve Error Reporting
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#ifndef SECPCORE_CRYPTO_ERRORS_H
#define SECPCORE_CRYPTO_ERRORS_H

#include <stdexcept>
#include <string>

namespace secpcore {

// ============================================================================
// Error Codes
// ============================================================================

/// Error codes raised by field element and curve point operations
enum class EcError {
    OK = 0,
    
    /// Field element value is negative or >= p
    OUT_OF_RANGE,
    
    /// Both coordinates present but y^2 != x^3 + 7
    NOT_ON_CURVE,
    
    /// Exactly one coordinate present
    MISMATCHED_COORDINATES,
    
    /// Inverse or division of the zero element
    DIVISION_BY_ZERO,
};

/// Convert error to string
const char* EcErrorString(EcError err);

// ============================================================================
// Exception
// ============================================================================

/// Recoverable failure of a field or curve operation
class EcException : public std::runtime_error {
public:
    EcException(EcError code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}
    
    EcError Code() const { return code_; }

private:
    EcError code_;
};

} // namespace secpcore

#endif // SECPCORE_CRYPTO_ERRORS_H
