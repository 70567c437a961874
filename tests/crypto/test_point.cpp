// SECPCORE - secp256k1 Point Tests
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// Tests for point validation, the group law and scalar multiplication

#include <gtest/gtest.h>
#include "secpcore/crypto/point.h"
#include "secpcore/crypto/errors.h"
#include "secpcore/crypto/secp256k1.h"

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace secpcore {
namespace test {

namespace {

const char* G2_X = "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
const char* G2_Y = "1ae168fea63dc339a3c58419466ceaeef7f632653266d0e1236431a950cfe52a";
const char* G3_X = "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9";
const char* G3_Y = "388f7b0f632de8140fe337e62a37f3566500a99934c2231b6cb9fd7584b8e672";

const Point& G() {
    return secp256k1::Generator();
}

const BigInt& N() {
    return secp256k1::CurveOrder();
}

} // anonymous namespace

// ============================================================================
// Error Codes
// ============================================================================

TEST(EcErrorTest, ErrorStrings) {
    EXPECT_STREQ(EcErrorString(EcError::OK), "No error");
    EXPECT_STREQ(EcErrorString(EcError::DIVISION_BY_ZERO), "Division by zero");
    EXPECT_STRNE(EcErrorString(EcError::NOT_ON_CURVE),
                 EcErrorString(EcError::MISMATCHED_COORDINATES));
}

TEST(EcErrorTest, ExceptionCarriesCode) {
    EcException e(EcError::OUT_OF_RANGE, "message");
    EXPECT_EQ(e.Code(), EcError::OUT_OF_RANGE);
    EXPECT_STREQ(e.what(), "message");
}

// ============================================================================
// Construction and Validation
// ============================================================================

TEST(PointTest, GeneratorIsOnCurve) {
    EXPECT_FALSE(G().IsInfinity());
    EXPECT_EQ(G().X().ToHex(), secp256k1::GENERATOR_X_HEX);
    EXPECT_EQ(G().Y().ToHex(), secp256k1::GENERATOR_Y_HEX);
    EXPECT_TRUE(Point::IsOnCurve(G().X(), G().Y()));
}

TEST(PointTest, CreateRejectsPointOffCurve) {
    try {
        Point::Create(FieldElement::FromUInt(1), FieldElement::FromUInt(2));
        FAIL() << "Expected EcException";
    } catch (const EcException& e) {
        EXPECT_EQ(e.Code(), EcError::NOT_ON_CURVE);
        // y^2 = 4 and x^3 + 7 = 8 are both reported
        std::string msg = e.what();
        EXPECT_NE(msg.find("not on the secp256k1 curve"), std::string::npos);
        EXPECT_NE(msg.find("0x" + std::string(63, '0') + "4"), std::string::npos);
        EXPECT_NE(msg.find("0x" + std::string(63, '0') + "8"), std::string::npos);
    }
    EXPECT_FALSE(Point::IsOnCurve(FieldElement::FromUInt(1), FieldElement::FromUInt(2)));
}

TEST(PointTest, CreateFromOptionals) {
    Point inf = Point::Create(std::nullopt, std::nullopt);
    EXPECT_TRUE(inf.IsInfinity());
    EXPECT_FALSE(inf.Coords().has_value());

    Point g = Point::Create(std::optional<FieldElement>(G().X()),
                            std::optional<FieldElement>(G().Y()));
    EXPECT_EQ(g, G());
    ASSERT_TRUE(g.Coords().has_value());
    EXPECT_EQ(g.Coords()->x, G().X());
}

TEST(PointTest, MismatchedCoordinates) {
    try {
        Point::Create(std::optional<FieldElement>(G().X()), std::nullopt);
        FAIL() << "Expected EcException";
    } catch (const EcException& e) {
        EXPECT_EQ(e.Code(), EcError::MISMATCHED_COORDINATES);
    }

    try {
        Point::Create(std::nullopt, std::optional<FieldElement>(G().Y()));
        FAIL() << "Expected EcException";
    } catch (const EcException& e) {
        EXPECT_EQ(e.Code(), EcError::MISMATCHED_COORDINATES);
    }
}

TEST(PointTest, FromHex) {
    EXPECT_EQ(Point::FromHex(G2_X, G2_Y), G() + G());
    EXPECT_THROW(Point::FromHex("0x1", "0x2"), EcException);
    EXPECT_THROW(Point::FromHex("zz", "0x2"), std::invalid_argument);
}

TEST(PointTest, InfinityHasNoCoordinates) {
    Point inf = Point::Infinity();
    EXPECT_TRUE(inf.IsInfinity());
    EXPECT_THROW(inf.X(), std::logic_error);
    EXPECT_THROW(inf.Y(), std::logic_error);
}

TEST(PointTest, LiftX) {
    Point g = Point::LiftX(G().X(), G().Y().IsOdd());
    EXPECT_EQ(g, G());

    Point neg = Point::LiftX(G().X(), !G().Y().IsOdd());
    EXPECT_EQ(neg, -G());
}

TEST(PointTest, LiftXParity) {
    FieldElement one = FieldElement::FromUInt(1);

    Point even = Point::LiftX(one, false);
    EXPECT_EQ(even.Y().ToHex(), "4218f20ae6c646b363db68605822fb14264ca8d2587fdd6fbc750d587e76a7ee");
    EXPECT_FALSE(even.Y().IsOdd());

    Point odd = Point::LiftX(one, true);
    EXPECT_EQ(odd.Y().ToHex(), "bde70df51939b94c9c24979fa7dd04ebd9b3572da7802290438af2a681895441");
    EXPECT_TRUE(odd.Y().IsOdd());

    EXPECT_EQ(even, -odd);
}

TEST(PointTest, LiftXWithoutSolution) {
    // 5^3 + 7 = 132 is not a square mod p
    try {
        Point::LiftX(FieldElement::FromUInt(5), false);
        FAIL() << "Expected EcException";
    } catch (const EcException& e) {
        EXPECT_EQ(e.Code(), EcError::NOT_ON_CURVE);
    }
}

// ============================================================================
// Group Law
// ============================================================================

TEST(PointTest, InfinityIsIdentity) {
    Point inf = Point::Infinity();
    EXPECT_EQ(G() + inf, G());
    EXPECT_EQ(inf + G(), G());
    EXPECT_TRUE((inf + inf).IsInfinity());
}

TEST(PointTest, PointPlusNegationIsInfinity) {
    EXPECT_TRUE((G() + (-G())).IsInfinity());
    EXPECT_TRUE((G() - G()).IsInfinity());
    EXPECT_TRUE((-Point::Infinity()).IsInfinity());
}

TEST(PointTest, NoPointHasZeroY) {
    // y = 0 needs x^3 = -7; -7 is a cube mod p only if (-7)^((p-1)/3) == 1
    BigInt third = BigInt::FromHex(
        "55555555555555555555555555555555555555555555555555555554fffffeba");
    EXPECT_EQ(third * BigInt(3) + BigInt(1), secp256k1::FieldPrime());

    FieldElement minusSeven = -FieldElement::FromUInt(7);
    EXPECT_NE(minusSeven.Pow(third), FieldElement::One());
}

TEST(PointTest, NegationFlipsY) {
    Point neg = -G();
    EXPECT_EQ(neg.X(), G().X());
    EXPECT_EQ(neg.Y(), -G().Y());
    EXPECT_EQ(-neg, G());
}

TEST(PointTest, DoublingTestVector) {
    Point g2 = G() + G();
    EXPECT_EQ(g2.X().ToHex(), G2_X);
    EXPECT_EQ(g2.Y().ToHex(), G2_Y);
    EXPECT_EQ(G().Double(), g2);
}

TEST(PointTest, AdditionTestVector) {
    Point g3 = G() + (G() + G());
    EXPECT_EQ(g3.X().ToHex(), G3_X);
    EXPECT_EQ(g3.Y().ToHex(), G3_Y);
    EXPECT_EQ(G() * BigInt(3), g3);
}

TEST(PointTest, AdditionIsCommutative) {
    Point g2 = G().Double();
    Point g3 = G() + g2;
    EXPECT_EQ(G() + g2, g2 + G());
    EXPECT_EQ(g2 + g3, g3 + g2);
}

TEST(PointTest, AdditionIsAssociative) {
    Point g2 = G().Double();
    Point g5 = G() * BigInt(5);
    EXPECT_EQ((G() + g2) + g5, G() + (g2 + g5));
}

TEST(PointTest, Subtraction) {
    Point g3 = G() * BigInt(3);
    EXPECT_EQ(g3 - G(), G().Double());
    EXPECT_EQ(G() - g3, -G().Double());
}

TEST(PointTest, ResultsStayOnCurve) {
    Point p = G();
    for (int i = 0; i < 8; ++i) {
        p = p + G().Double();
        ASSERT_FALSE(p.IsInfinity());
        EXPECT_TRUE(Point::IsOnCurve(p.X(), p.Y()));
    }
}

// ============================================================================
// Scalar Multiplication
// ============================================================================

TEST(PointTest, MultiplyByZero) {
    EXPECT_TRUE((G() * BigInt(0)).IsInfinity());
}

TEST(PointTest, MultiplyByOneAndTwo) {
    EXPECT_EQ(G() * BigInt(1), G());
    EXPECT_EQ(G() * BigInt(2), G() + G());
}

TEST(PointTest, MultiplyByGroupOrder) {
    EXPECT_TRUE((G() * N()).IsInfinity());
    EXPECT_EQ(G() * (N() + BigInt(1)), G());
    EXPECT_EQ(G() * (N() * BigInt(2) + BigInt(3)), G() * BigInt(3));
}

TEST(PointTest, MultiplyByNegativeScalar) {
    EXPECT_EQ(G() * BigInt(-1), G() * (N() - BigInt(1)));
    EXPECT_EQ(G() * BigInt(-1), -G());
    EXPECT_EQ(G() * BigInt(-2), -(G().Double()));
    EXPECT_TRUE((G() * (-N())).IsInfinity());
}

TEST(PointTest, MultiplyInfinity) {
    Point inf = Point::Infinity();
    EXPECT_TRUE((inf * BigInt(0)).IsInfinity());
    EXPECT_TRUE((inf * BigInt(7)).IsInfinity());
    EXPECT_TRUE((inf * BigInt(-7)).IsInfinity());
    EXPECT_TRUE((inf * N()).IsInfinity());
}

TEST(PointTest, ScalarOnEitherSide) {
    BigInt k = BigInt::FromHex("deadbeef");
    EXPECT_EQ(k * G(), G() * k);
    EXPECT_EQ(G().Multiply(k), G() * k);
}

TEST(PointTest, MultiplicationDistributes) {
    BigInt a(12345);
    BigInt b(67890);
    EXPECT_EQ(G() * a + G() * b, G() * (a + b));
    EXPECT_EQ((G() * a) * b, G() * (a * b));
}

// ============================================================================
// Text
// ============================================================================

TEST(PointTest, ToStringInfinity) {
    EXPECT_EQ(Point::Infinity().ToString(), "(Infinity)");
}

TEST(PointTest, ToStringCoordinates) {
    std::string expected = std::string("(x=0x") + secp256k1::GENERATOR_X_HEX +
                           ", y=0x" + secp256k1::GENERATOR_Y_HEX + ")";
    EXPECT_EQ(G().ToString(), expected);

    std::ostringstream oss;
    oss << G();
    EXPECT_EQ(oss.str(), expected);
}

TEST(PointTest, HexRoundTrip) {
    Point g3 = G() * BigInt(3);
    EXPECT_EQ(Point::FromHex(g3.X().ToHex(), g3.Y().ToHex()), g3);
}

} // namespace test
} // namespace secpcore
