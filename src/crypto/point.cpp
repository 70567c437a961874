// SECPCORE - secp256k1 Curve Points Implementation
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/crypto/point.h"
#include "secpcore/crypto/errors.h"
#include "secpcore/crypto/secp256k1.h"
#include "secpcore/util/logging.h"

#include <ostream>
#include <stdexcept>

namespace secpcore {

namespace {

const FieldElement& Two() {
    static const FieldElement two = FieldElement::FromUInt(2);
    return two;
}

const FieldElement& Three() {
    static const FieldElement three = FieldElement::FromUInt(3);
    return three;
}

/// x^3 + b
FieldElement CurveRhs(const FieldElement& x) {
    return x.Pow(3) + secp256k1::CurveB();
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Point Point::Create(const std::optional<FieldElement>& x,
                    const std::optional<FieldElement>& y) {
    if (!x && !y) {
        return Point();
    }
    if (!x || !y) {
        throw EcException(EcError::MISMATCHED_COORDINATES,
            "Invalid point: both coordinates must be present or both absent");
    }
    return Create(*x, *y);
}

Point Point::Create(const FieldElement& x, const FieldElement& y) {
    FieldElement left = y.Pow(2);
    FieldElement right = CurveRhs(x);

    if (left != right) {
        LOG_DEBUG(util::LogCategory::CURVE) << "Rejected point x=0x" << x.ToHex();
        throw EcException(EcError::NOT_ON_CURVE,
            "Point (0x" + x.ToHex() + ", 0x" + y.ToHex() +
            ") is not on the secp256k1 curve: 0x" + left.ToHex() +
            " != 0x" + right.ToHex());
    }
    return Point(x, y);
}

Point Point::FromHex(const std::string& xHex, const std::string& yHex) {
    return Create(FieldElement::FromHex(xHex), FieldElement::FromHex(yHex));
}

Point Point::LiftX(const FieldElement& x, bool odd) {
    auto y = CurveRhs(x).Sqrt();
    if (!y) {
        throw EcException(EcError::NOT_ON_CURVE,
            "No curve point has x = 0x" + x.ToHex());
    }
    if (y->IsOdd() != odd) {
        y = -*y;
    }
    return Point(x, *y);
}

bool Point::IsOnCurve(const FieldElement& x, const FieldElement& y) {
    return y.Square() == CurveRhs(x);
}

const FieldElement& Point::X() const {
    if (!coords_) {
        throw std::logic_error("Point at infinity has no x coordinate");
    }
    return coords_->x;
}

const FieldElement& Point::Y() const {
    if (!coords_) {
        throw std::logic_error("Point at infinity has no y coordinate");
    }
    return coords_->y;
}

// ============================================================================
// Group Law
// ============================================================================

Point Point::operator+(const Point& other) const {
    if (IsInfinity()) return other;
    if (other.IsInfinity()) return *this;

    const FieldElement& x1 = coords_->x;
    const FieldElement& y1 = coords_->y;
    const FieldElement& x2 = other.coords_->x;
    const FieldElement& y2 = other.coords_->y;

    if (x1 == x2) {
        // P + (-P) = O. A vertical tangent (y = 0) would also double to O,
        // but no secp256k1 point has y = 0.
        if (y1 != y2 || y1.IsZero()) {
            return Point();
        }

        // s = 3x^2 / 2y
        FieldElement s = (Three() * x1.Square()) / (Two() * y1);
        FieldElement x3 = s.Square() - (x1 + x1);
        FieldElement y3 = s * (x1 - x3) - y1;
        return Point(std::move(x3), std::move(y3));
    }

    // s = (y2 - y1) / (x2 - x1)
    FieldElement s = (y2 - y1) / (x2 - x1);
    FieldElement x3 = s.Square() - x1 - x2;
    FieldElement y3 = s * (x1 - x3) - y1;
    return Point(std::move(x3), std::move(y3));
}

Point Point::operator-(const Point& other) const {
    return *this + (-other);
}

Point Point::operator-() const {
    if (IsInfinity()) return *this;
    return Point(coords_->x, -coords_->y);
}

Point Point::Double() const {
    return *this + *this;
}

Point Point::Multiply(const BigInt& scalar) const {
    // Non-negative residue in [0, N); negative scalars wrap around
    BigInt k = BigInt::Mod(scalar, secp256k1::CurveOrder());

    Point result;
    Point addend = *this;

    // Least significant bit first
    while (!k.IsZero()) {
        if (k.IsOdd()) {
            result = result + addend;
        }
        addend = addend.Double();
        k = k >> 1;
    }

    return result;
}

bool Point::operator==(const Point& other) const {
    if (IsInfinity() || other.IsInfinity()) {
        return IsInfinity() && other.IsInfinity();
    }
    return coords_->x == other.coords_->x && coords_->y == other.coords_->y;
}

Point operator*(const Point& point, const BigInt& scalar) {
    return point.Multiply(scalar);
}

Point operator*(const BigInt& scalar, const Point& point) {
    return point.Multiply(scalar);
}

// ============================================================================
// Text
// ============================================================================

std::string Point::ToString() const {
    if (IsInfinity()) {
        return "(Infinity)";
    }
    return "(x=0x" + coords_->x.ToHex() + ", y=0x" + coords_->y.ToHex() + ")";
}

std::ostream& operator<<(std::ostream& os, const Point& point) {
    return os << point.ToString();
}

} // namespace secpcore
