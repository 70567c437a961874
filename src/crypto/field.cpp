// SECPCORE - Finite Field Arithmetic Implementation
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/crypto/field.h"
#include "secpcore/crypto/errors.h"
#include "secpcore/crypto/secp256k1.h"
#include "secpcore/util/logging.h"

#include <ostream>

namespace secpcore {

namespace {

const BigInt& PrimeMinusOne() {
    static const BigInt value = FieldElement::Prime() - BigInt(1);
    return value;
}

const BigInt& PrimeMinusTwo() {
    static const BigInt value = FieldElement::Prime() - BigInt(2);
    return value;
}

// (p + 1) / 4, the square-root exponent for p = 3 mod 4
const BigInt& SqrtExponent() {
    static const BigInt value = (FieldElement::Prime() + BigInt(1)) >> 2;
    return value;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

const BigInt& FieldElement::Prime() {
    return secp256k1::FieldPrime();
}

FieldElement FieldElement::Create(const BigInt& num) {
    if (num.IsNegative() || num >= Prime()) {
        throw EcException(EcError::OUT_OF_RANGE,
            "Number " + num.ToDecimal() + " not in the field range 0 to " +
            PrimeMinusOne().ToDecimal());
    }
    return FieldElement(num);
}

FieldElement FieldElement::FromHex(const std::string& hex) {
    return Create(BigInt::FromHex(hex));
}

FieldElement FieldElement::FromUInt(uint64_t value) {
    // Every uint64_t is below p, but values above INT64_MAX need the byte path
    uint8_t bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[7 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xff);
    }
    return FieldElement(BigInt::FromBytes(bytes, sizeof(bytes)));
}

FieldElement FieldElement::Zero() {
    return FieldElement(BigInt());
}

FieldElement FieldElement::One() {
    return FieldElement(BigInt(1));
}

// ============================================================================
// Arithmetic
// ============================================================================

FieldElement FieldElement::operator+(const FieldElement& other) const {
    BigInt sum = num_ + other.num_;
    if (sum >= Prime()) {
        sum -= Prime();
    }
    return FieldElement(std::move(sum));
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
    BigInt diff = num_ - other.num_;
    if (diff.IsNegative()) {
        diff += Prime();
    }
    return FieldElement(std::move(diff));
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
    return FieldElement(BigInt::Mod(num_ * other.num_, Prime()));
}

FieldElement FieldElement::operator-() const {
    if (IsZero()) return *this;
    return FieldElement(Prime() - num_);
}

FieldElement FieldElement::operator/(const FieldElement& other) const {
    return *this * other.Inverse();
}

FieldElement FieldElement::ScalarMul(const BigInt& k, const FieldElement& a) {
    return FieldElement(BigInt::Mod(k * a.num_, Prime()));
}

FieldElement FieldElement::Square() const {
    return *this * *this;
}

FieldElement FieldElement::Pow(const BigInt& exponent) const {
    if (exponent.IsNegative()) {
        return Inverse().Pow(BigInt::Mod(exponent.Abs(), PrimeMinusOne()));
    }
    BigInt reduced = BigInt::Mod(exponent, PrimeMinusOne());
    return FieldElement(BigInt::ModExp(num_, reduced, Prime()));
}

FieldElement FieldElement::Pow(int64_t exponent) const {
    return Pow(BigInt(exponent));
}

FieldElement FieldElement::Inverse() const {
    if (IsZero()) {
        LOG_DEBUG(util::LogCategory::FIELD) << "Inverse of zero requested";
        throw EcException(EcError::DIVISION_BY_ZERO,
                          "Division by zero: the zero element has no inverse");
    }
    // Fermat: a^(p-2) = a^-1 for prime p
    return FieldElement(BigInt::ModExp(num_, PrimeMinusTwo(), Prime()));
}

std::optional<FieldElement> FieldElement::Sqrt() const {
    FieldElement root(BigInt::ModExp(num_, SqrtExponent(), Prime()));
    if (root.Square() != *this) {
        return std::nullopt;
    }
    return root;
}

// ============================================================================
// Text
// ============================================================================

std::string FieldElement::ToHex() const {
    return num_.ToHexPadded(HEX_DIGITS);
}

std::string FieldElement::ToString() const {
    return "FieldElement_0x" + ToHex() + "_(mod 0x" +
           Prime().ToHexPadded(HEX_DIGITS) + ")";
}

std::ostream& operator<<(std::ostream& os, const FieldElement& fe) {
    return os << fe.ToString();
}

} // namespace secpcore
