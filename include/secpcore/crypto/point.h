// SECPCORE - secp256k1 Curve Points
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// Affine points on y^2 = x^3 + 7 over F_p, plus the point at infinity.
// The group law assumes a field characteristic other than 2 or 3, which
// holds for secp256k1 and is not checked.
//
// Doubling a point with y = 0 yields infinity. That case cannot arise on
// secp256k1: y = 0 requires x^3 = -7, and -7 is not a cube mod p.

#ifndef SECPCORE_CRYPTO_POINT_H
#define SECPCORE_CRYPTO_POINT_H

#include <iosfwd>
#include <optional>
#include <string>

#include "secpcore/crypto/bignum.h"
#include "secpcore/crypto/field.h"

namespace secpcore {

// ============================================================================
// Point
// ============================================================================

/**
 * An element of the secp256k1 group.
 *
 * Either the point at infinity (the identity) or an affine pair (x, y)
 * satisfying the curve equation. Both states are held in one optional, so a
 * half-specified point cannot exist once construction succeeds.
 */
class Point {
public:
    struct Coordinates {
        FieldElement x;
        FieldElement y;
    };

    /// Default constructor - point at infinity
    Point() = default;

    /// The identity element
    static Point Infinity() { return Point(); }

    /**
     * Validating factory from optional coordinates.
     *
     * Both absent yields infinity; both present must satisfy y^2 = x^3 + 7.
     *
     * @throws EcException NOT_ON_CURVE or MISMATCHED_COORDINATES
     */
    static Point Create(const std::optional<FieldElement>& x,
                        const std::optional<FieldElement>& y);

    /// Validating factory for an affine pair
    static Point Create(const FieldElement& x, const FieldElement& y);

    /// Parse both coordinates from hex and validate
    static Point FromHex(const std::string& xHex, const std::string& yHex);

    /**
     * Find the curve point with the given x coordinate and y parity.
     *
     * @throws EcException NOT_ON_CURVE if x^3 + 7 has no square root
     */
    static Point LiftX(const FieldElement& x, bool odd);

    /// Check y^2 == x^3 + 7
    static bool IsOnCurve(const FieldElement& x, const FieldElement& y);

    bool IsInfinity() const { return !coords_.has_value(); }

    /// Affine coordinates, or nullopt for infinity
    const std::optional<Coordinates>& Coords() const { return coords_; }

    /// Coordinate accessors; throw std::logic_error on infinity
    const FieldElement& X() const;
    const FieldElement& Y() const;

    /// Group law
    Point operator+(const Point& other) const;
    Point operator-(const Point& other) const;
    Point operator-() const;

    /// this + this
    Point Double() const;

    /**
     * Scalar multiplication by double-and-add.
     *
     * The scalar is reduced modulo the group order N into [0, N) first, so
     * negative and oversized scalars are accepted.
     */
    Point Multiply(const BigInt& scalar) const;

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }

    /// "(Infinity)" or "(x=0x<64 hex>, y=0x<64 hex>)"
    std::string ToString() const;

private:
    Point(FieldElement x, FieldElement y)
        : coords_(Coordinates{std::move(x), std::move(y)}) {}

    std::optional<Coordinates> coords_;
};

Point operator*(const Point& point, const BigInt& scalar);
Point operator*(const BigInt& scalar, const Point& point);

std::ostream& operator<<(std::ostream& os, const Point& point);

} // namespace secpcore

#endif // SECPCORE_CRYPTO_POINT_H
