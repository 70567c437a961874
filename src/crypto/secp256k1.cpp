// SECPCORE - secp256k1 Curve Parameters
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/crypto/secp256k1.h"
#include "secpcore/util/logging.h"

namespace secpcore {
namespace secp256k1 {

const BigInt& FieldPrime() {
    static const BigInt prime = BigInt::FromHex(FIELD_PRIME_HEX);
    return prime;
}

const BigInt& CurveOrder() {
    static const BigInt order = BigInt::FromHex(CURVE_ORDER_HEX);
    return order;
}

const FieldElement& CurveB() {
    static const FieldElement b = FieldElement::FromUInt(CURVE_B);
    return b;
}

const Point& Generator() {
    static const Point g = [] {
        LOG_TRACE(util::LogCategory::CURVE) << "Materializing generator point";
        return Point::FromHex(GENERATOR_X_HEX, GENERATOR_Y_HEX);
    }();
    return g;
}

} // namespace secp256k1
} // namespace secpcore
