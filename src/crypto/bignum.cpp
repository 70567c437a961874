// SECPCORE - Arbitrary-Precision Integers
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/crypto/bignum.h"
#include "secpcore/core/hex.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <cctype>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace secpcore {

namespace {

struct CtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using CtxPtr = std::unique_ptr<BN_CTX, CtxDeleter>;

CtxPtr NewCtx() {
    CtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        throw std::runtime_error("BN_CTX_new failed");
    }
    return ctx;
}

BIGNUM* NewBN() {
    BIGNUM* bn = BN_new();
    if (!bn) {
        throw std::runtime_error("BN_new failed");
    }
    return bn;
}

void Check(int ok, const char* what) {
    if (ok != 1) {
        throw std::runtime_error(std::string(what) + " failed");
    }
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

BigInt::BigInt() : bn_(NewBN()) {}

BigInt::BigInt(int64_t value) : bn_(NewBN()) {
    // Magnitude computed in unsigned space so INT64_MIN does not overflow
    uint64_t magnitude = value < 0
        ? static_cast<uint64_t>(-(value + 1)) + 1
        : static_cast<uint64_t>(value);

    uint8_t bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[7 - i] = static_cast<uint8_t>((magnitude >> (i * 8)) & 0xff);
    }
    if (!BN_bin2bn(bytes, sizeof(bytes), bn_)) {
        BN_free(bn_);
        throw std::runtime_error("BN_bin2bn failed");
    }
    BN_set_negative(bn_, value < 0 ? 1 : 0);
}

BigInt::BigInt(const BigInt& other) : bn_(BN_dup(other.bn_)) {
    if (!bn_) {
        throw std::runtime_error("BN_dup failed");
    }
}

BigInt& BigInt::operator=(const BigInt& other) {
    if (this != &other) {
        BigInt copy(other);
        std::swap(bn_, copy.bn_);
    }
    return *this;
}

BigInt::BigInt(BigInt&& other) noexcept : bn_(other.bn_) {
    other.bn_ = nullptr;
}

BigInt& BigInt::operator=(BigInt&& other) noexcept {
    std::swap(bn_, other.bn_);
    return *this;
}

BigInt::~BigInt() {
    BN_free(bn_);
}

BigInt BigInt::FromBytes(const uint8_t* data, size_t len) {
    BigInt result;
    if (len > 0 && !BN_bin2bn(data, static_cast<int>(len), result.bn_)) {
        throw std::runtime_error("BN_bin2bn failed");
    }
    return result;
}

BigInt BigInt::FromHex(const std::string& hex) {
    std::string digits = hex;
    bool negative = false;
    if (!digits.empty() && digits[0] == '-') {
        negative = true;
        digits = digits.substr(1);
    }
    digits = StripHexPrefix(digits);

    if (!IsHexDigits(digits)) {
        throw std::invalid_argument("Invalid hex integer: '" + hex + "'");
    }

    std::vector<HexByte> bytes = HexToBytes(digits);
    BigInt result = FromBytes(bytes.data(), bytes.size());
    if (negative && !result.IsZero()) {
        BN_set_negative(result.bn_, 1);
    }
    return result;
}

BigInt BigInt::FromDecimal(const std::string& dec) {
    size_t start = (!dec.empty() && dec[0] == '-') ? 1 : 0;
    if (start == dec.length()) {
        throw std::invalid_argument("Invalid decimal integer: '" + dec + "'");
    }
    for (size_t i = start; i < dec.length(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(dec[i]))) {
            throw std::invalid_argument("Invalid decimal integer: '" + dec + "'");
        }
    }

    BIGNUM* parsed = nullptr;
    int consumed = BN_dec2bn(&parsed, dec.c_str());
    if (consumed != static_cast<int>(dec.length()) || !parsed) {
        BN_free(parsed);
        throw std::invalid_argument("Invalid decimal integer: '" + dec + "'");
    }

    BigInt result;
    BN_free(result.bn_);
    result.bn_ = parsed;
    return result;
}

BigInt BigInt::FromString(const std::string& str) {
    std::string body = (!str.empty() && str[0] == '-') ? str.substr(1) : str;
    if (HasHexPrefix(body)) {
        return FromHex(str);
    }
    return FromDecimal(str);
}

// ============================================================================
// Queries
// ============================================================================

bool BigInt::IsZero() const {
    return BN_is_zero(bn_);
}

bool BigInt::IsNegative() const {
    return BN_is_negative(bn_);
}

bool BigInt::IsOdd() const {
    return BN_is_odd(bn_);
}

int BigInt::NumBits() const {
    return BN_num_bits(bn_);
}

bool BigInt::IsBitSet(int n) const {
    return BN_is_bit_set(bn_, n);
}

// ============================================================================
// Arithmetic
// ============================================================================

BigInt BigInt::operator+(const BigInt& other) const {
    BigInt result;
    Check(BN_add(result.bn_, bn_, other.bn_), "BN_add");
    return result;
}

BigInt BigInt::operator-(const BigInt& other) const {
    BigInt result;
    Check(BN_sub(result.bn_, bn_, other.bn_), "BN_sub");
    return result;
}

BigInt BigInt::operator*(const BigInt& other) const {
    BigInt result;
    CtxPtr ctx = NewCtx();
    Check(BN_mul(result.bn_, bn_, other.bn_, ctx.get()), "BN_mul");
    return result;
}

BigInt BigInt::operator-() const {
    BigInt result(*this);
    if (!result.IsZero()) {
        BN_set_negative(result.bn_, IsNegative() ? 0 : 1);
    }
    return result;
}

BigInt BigInt::operator>>(int shift) const {
    BigInt result;
    Check(BN_rshift(result.bn_, bn_, shift), "BN_rshift");
    return result;
}

BigInt& BigInt::operator+=(const BigInt& other) {
    Check(BN_add(bn_, bn_, other.bn_), "BN_add");
    return *this;
}

BigInt& BigInt::operator-=(const BigInt& other) {
    Check(BN_sub(bn_, bn_, other.bn_), "BN_sub");
    return *this;
}

BigInt BigInt::Abs() const {
    BigInt result(*this);
    BN_set_negative(result.bn_, 0);
    return result;
}

BigInt BigInt::Mod(const BigInt& a, const BigInt& m) {
    if (m.IsZero() || m.IsNegative()) {
        throw std::domain_error("Modulus must be positive");
    }
    BigInt result;
    CtxPtr ctx = NewCtx();
    Check(BN_nnmod(result.bn_, a.bn_, m.bn_, ctx.get()), "BN_nnmod");
    return result;
}

BigInt BigInt::ModExp(const BigInt& base, const BigInt& exp, const BigInt& m) {
    if (exp.IsNegative()) {
        throw std::domain_error("Exponent must be non-negative");
    }
    BigInt reduced = Mod(base, m);
    BigInt result;
    CtxPtr ctx = NewCtx();
    Check(BN_mod_exp(result.bn_, reduced.bn_, exp.bn_, m.bn_, ctx.get()), "BN_mod_exp");
    return result;
}

// ============================================================================
// Comparison
// ============================================================================

bool BigInt::operator==(const BigInt& other) const {
    return BN_cmp(bn_, other.bn_) == 0;
}

bool BigInt::operator<(const BigInt& other) const {
    return BN_cmp(bn_, other.bn_) < 0;
}

bool BigInt::operator<=(const BigInt& other) const {
    return BN_cmp(bn_, other.bn_) <= 0;
}

bool BigInt::operator>(const BigInt& other) const {
    return BN_cmp(bn_, other.bn_) > 0;
}

bool BigInt::operator>=(const BigInt& other) const {
    return BN_cmp(bn_, other.bn_) >= 0;
}

// ============================================================================
// Conversion
// ============================================================================

std::string BigInt::ToHex() const {
    if (IsZero()) {
        return "0";
    }

    std::vector<HexByte> bytes(static_cast<size_t>(BN_num_bytes(bn_)));
    BN_bn2bin(bn_, bytes.data());

    std::string hex = BytesToHex(bytes);
    size_t first = hex.find_first_not_of('0');
    hex = hex.substr(first);

    return IsNegative() ? "-" + hex : hex;
}

std::string BigInt::ToHexPadded(size_t digits) const {
    if (IsNegative()) {
        throw std::domain_error("Cannot zero-pad a negative value");
    }
    std::string hex = ToHex();
    if (hex.length() < digits) {
        hex.insert(0, digits - hex.length(), '0');
    }
    return hex;
}

std::string BigInt::ToDecimal() const {
    char* dec = BN_bn2dec(bn_);
    if (!dec) {
        throw std::runtime_error("BN_bn2dec failed");
    }
    std::string result(dec);
    OPENSSL_free(dec);
    return result;
}

std::array<uint8_t, 32> BigInt::ToBytes32() const {
    std::array<uint8_t, 32> result{};
    if (IsNegative() || NumBits() > 256) {
        throw std::out_of_range("Value does not fit in 32 unsigned bytes");
    }
    if (BN_bn2binpad(bn_, result.data(), static_cast<int>(result.size())) < 0) {
        throw std::runtime_error("BN_bn2binpad failed");
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const BigInt& value) {
    return os << value.ToDecimal();
}

} // namespace secpcore
