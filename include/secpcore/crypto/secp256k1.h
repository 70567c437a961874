// SECPCORE - secp256k1 Curve Parameters
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// Process-wide constants of the curve y^2 = x^3 + 7 over F_p.
// Each accessor materializes its value once, on first use.

#ifndef SECPCORE_CRYPTO_SECP256K1_H
#define SECPCORE_CRYPTO_SECP256K1_H

#include <cstdint>

#include "secpcore/crypto/bignum.h"
#include "secpcore/crypto/field.h"
#include "secpcore/crypto/point.h"

namespace secpcore {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Field size p = 2^256 - 2^32 - 977
constexpr const char* FIELD_PRIME_HEX =
    "fffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f";

/// Group order n
constexpr const char* CURVE_ORDER_HEX =
    "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";

/// Generator point G
constexpr const char* GENERATOR_X_HEX =
    "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
constexpr const char* GENERATOR_Y_HEX =
    "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";

/// Curve parameter a (= 0 for secp256k1)
constexpr uint32_t CURVE_A = 0;

/// Curve parameter b (= 7 for secp256k1)
constexpr uint32_t CURVE_B = 7;

// ============================================================================
// Accessors
// ============================================================================

/// The field prime p
const BigInt& FieldPrime();

/// The group order N
const BigInt& CurveOrder();

/// b as a field element
const FieldElement& CurveB();

/// The generator G
const Point& Generator();

} // namespace secp256k1
} // namespace secpcore

#endif // SECPCORE_CRYPTO_SECP256K1_H
