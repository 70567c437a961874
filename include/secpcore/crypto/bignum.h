// SECPCORE - Arbitrary-Precision Integers
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// Signed, unbounded integer backed by an OpenSSL BIGNUM.
// Field elements and scalars are built on top of this type.

#ifndef SECPCORE_CRYPTO_BIGNUM_H
#define SECPCORE_CRYPTO_BIGNUM_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

struct bignum_st;

namespace secpcore {

// ============================================================================
// BigInt
// ============================================================================

/**
 * Arbitrary-precision signed integer.
 *
 * Owns exactly one OpenSSL BIGNUM. Copies are deep; a moved-from BigInt may
 * only be destroyed or assigned to.
 */
class BigInt {
public:
    /// Default constructor - zero
    BigInt();

    /// Construct from a machine integer
    explicit BigInt(int64_t value);

    BigInt(const BigInt& other);
    BigInt& operator=(const BigInt& other);
    BigInt(BigInt&& other) noexcept;
    BigInt& operator=(BigInt&& other) noexcept;
    ~BigInt();

    /// Parse hex text: optional leading '-', optional "0x" prefix
    static BigInt FromHex(const std::string& hex);

    /// Parse decimal text with an optional leading '-'
    static BigInt FromDecimal(const std::string& dec);

    /// Parse either form: "0x..." (or "-0x...") is hex, anything else decimal
    static BigInt FromString(const std::string& str);

    /// Construct from big-endian unsigned bytes
    static BigInt FromBytes(const uint8_t* data, size_t len);

    /// Queries
    bool IsZero() const;
    bool IsNegative() const;
    bool IsOdd() const;

    /// Number of significant bits of the magnitude (0 for zero)
    int NumBits() const;

    /// Test bit n of the magnitude
    bool IsBitSet(int n) const;

    /// Arithmetic
    BigInt operator+(const BigInt& other) const;
    BigInt operator-(const BigInt& other) const;
    BigInt operator*(const BigInt& other) const;
    BigInt operator-() const;
    BigInt operator>>(int shift) const;

    BigInt& operator+=(const BigInt& other);
    BigInt& operator-=(const BigInt& other);

    /// Signed comparison
    bool operator==(const BigInt& other) const;
    bool operator!=(const BigInt& other) const { return !(*this == other); }
    bool operator<(const BigInt& other) const;
    bool operator<=(const BigInt& other) const;
    bool operator>(const BigInt& other) const;
    bool operator>=(const BigInt& other) const;

    /// Absolute value
    BigInt Abs() const;

    /// Non-negative residue of a modulo m, in [0, m). m must be positive.
    static BigInt Mod(const BigInt& a, const BigInt& m);

    /// base^exp mod m for exp >= 0 and m positive
    static BigInt ModExp(const BigInt& base, const BigInt& exp, const BigInt& m);

    /// Lower-case minimal hex, '-' prefixed when negative, "0" for zero
    std::string ToHex() const;

    /// Lower-case hex zero-padded to at least `digits` characters.
    /// Only defined for non-negative values (throws std::domain_error).
    std::string ToHexPadded(size_t digits) const;

    /// Decimal representation
    std::string ToDecimal() const;

    /// 32-byte big-endian encoding (throws std::out_of_range if negative or >= 2^256)
    std::array<uint8_t, 32> ToBytes32() const;

    /// Underlying OpenSSL handle
    const bignum_st* get() const { return bn_; }

private:
    bignum_st* bn_;
};

std::ostream& operator<<(std::ostream& os, const BigInt& value);

} // namespace secpcore

#endif // SECPCORE_CRYPTO_BIGNUM_H
