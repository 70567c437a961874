// SECPCORE - Finite Field Arithmetic
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// Arithmetic over the secp256k1 base field F_p, p = 2^256 - 2^32 - 977.

#ifndef SECPCORE_CRYPTO_FIELD_H
#define SECPCORE_CRYPTO_FIELD_H

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

#include "secpcore/crypto/bignum.h"

namespace secpcore {

// ============================================================================
// Field Element over the secp256k1 prime
// ============================================================================

/**
 * Element of F_p. The value is always reduced: 0 <= num < p.
 *
 * Instances are immutable. Operations that cannot succeed (inverting or
 * dividing by zero, constructing from an out-of-range value) throw
 * EcException.
 */
class FieldElement {
public:
    /// Number of hex digits in the textual form of a reduced value
    static constexpr size_t HEX_DIGITS = 64;

    /// The field modulus p
    static const BigInt& Prime();

    /**
     * Validating factory.
     *
     * @param num Value in [0, p)
     * @throws EcException with EcError::OUT_OF_RANGE otherwise
     */
    static FieldElement Create(const BigInt& num);

    /// Parse hex text (optional 0x prefix) and validate
    static FieldElement FromHex(const std::string& hex);

    /// Construct from a small unsigned value
    static FieldElement FromUInt(uint64_t value);

    static FieldElement Zero();
    static FieldElement One();

    /// Underlying integer
    const BigInt& Num() const { return num_; }

    bool IsZero() const { return num_.IsZero(); }
    bool IsOdd() const { return num_.IsOdd(); }

    bool operator==(const FieldElement& other) const { return num_ == other.num_; }
    bool operator!=(const FieldElement& other) const { return !(*this == other); }

    /// Field arithmetic
    FieldElement operator+(const FieldElement& other) const;
    FieldElement operator-(const FieldElement& other) const;
    FieldElement operator*(const FieldElement& other) const;
    FieldElement operator-() const;

    /// Division; throws EcError::DIVISION_BY_ZERO when other is zero
    FieldElement operator/(const FieldElement& other) const;

    /// k * a for an arbitrary (possibly negative) integer k, reduced mod p
    static FieldElement ScalarMul(const BigInt& k, const FieldElement& a);

    FieldElement Square() const;

    /**
     * Exponentiation.
     *
     * Non-negative exponents are reduced mod (p - 1) first, so a^0 and
     * a^(p-1) both evaluate as a^0 = 1. Negative exponents invert first
     * and therefore throw EcError::DIVISION_BY_ZERO for a zero base.
     */
    FieldElement Pow(const BigInt& exponent) const;
    FieldElement Pow(int64_t exponent) const;

    /// Multiplicative inverse a^(p-2); throws EcError::DIVISION_BY_ZERO for zero
    FieldElement Inverse() const;

    /// Square root a^((p+1)/4), or nullopt if a is not a quadratic residue
    std::optional<FieldElement> Sqrt() const;

    /// 64 lower-case hex digits, zero padded
    std::string ToHex() const;

    /// "FieldElement_0x<num>_(mod 0x<p>)"
    std::string ToString() const;

private:
    explicit FieldElement(BigInt num) : num_(std::move(num)) {}

    BigInt num_;
};

std::ostream& operator<<(std::ostream& os, const FieldElement& fe);

} // namespace secpcore

#endif // SECPCORE_CRYPTO_FIELD_H
