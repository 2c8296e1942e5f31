// VERISCORE - Curve Encoding Tests
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include <gtest/gtest.h>
#include "veriscore/core/error.h"
#include "veriscore/crypto/curve.h"

namespace veriscore {
namespace test {

using util::JSONValue;

class CurveTest : public ::testing::Test {
protected:
    void SetUp() override {
        InitCurveParams();
    }

    static G1Point G1Mul(uint64_t k) { return FieldFromUint64(k) * G1Point::one(); }
    static G2Point G2Mul(uint64_t k) { return FieldFromUint64(k) * G2Point::one(); }
};

// ============================================================================
// Coordinates and JSON
// ============================================================================

TEST_F(CurveTest, G1GeneratorCoordinates) {
    G1Coords coords = G1ToCoords(G1Point::one());
    EXPECT_EQ(coords.x, "1");
    EXPECT_EQ(coords.y, "2");
}

TEST_F(CurveTest, G2GeneratorCoordinates) {
    G2Coords coords = G2ToCoords(G2Point::one());
    EXPECT_EQ(coords.x[0],
              "10857046999023057135944570762232829481370756359578518086990519993285655852781");
    EXPECT_EQ(coords.x[1],
              "11559732032986387107991004021392285783925812861821192530917403151452391805634");
    EXPECT_EQ(coords.y[0],
              "8495653923123431417604973247489272438418190587263600148770280649306958101930");
    EXPECT_EQ(coords.y[1],
              "4082367875863433681332203403145435568316851327593401208105741076214120093531");
}

TEST_F(CurveTest, G1JSONRoundTrip) {
    G1Point p = G1Mul(12345);
    const JSONValue json = G1ToJSON(p);
    ASSERT_EQ(json.Size(), 3u);
    EXPECT_EQ(json[2].GetString(), "1");

    auto back = G1FromJSON(json);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, p);
}

TEST_F(CurveTest, G2JSONRoundTrip) {
    G2Point p = G2Mul(777);
    const JSONValue json = G2ToJSON(p);
    ASSERT_EQ(json.Size(), 3u);
    EXPECT_EQ(json[2][0].GetString(), "1");
    EXPECT_EQ(json[2][1].GetString(), "0");

    auto back = G2FromJSON(json);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, p);
}

TEST_F(CurveTest, JSONInfinity) {
    const JSONValue g1 = G1ToJSON(G1Point::zero());
    EXPECT_EQ(g1.ToJSON(), R"(["0","1","0"])");
    auto p1 = G1FromJSON(g1);
    ASSERT_TRUE(p1.has_value());
    EXPECT_TRUE(p1->is_zero());

    auto p2 = G2FromJSON(G2ToJSON(G2Point::zero()));
    ASSERT_TRUE(p2.has_value());
    EXPECT_TRUE(p2->is_zero());
}

TEST_F(CurveTest, G1JSONOffCurve) {
    EXPECT_FALSE(G1FromJSON(JSONValue::Parse(R"(["1","3","1"])")).has_value());
}

TEST_F(CurveTest, G1JSONNonCanonicalCoordinate) {
    // x = q + 1 is congruent to the generator's x but not canonical
    JSONValue json = JSONValue::FromStrings(
        {"21888242871839275222246405745257275088696311157297823662689037894645226208584", "2", "1"});
    EXPECT_FALSE(G1FromJSON(json).has_value());
}

TEST_F(CurveTest, G1JSONProjectiveZRejected) {
    EXPECT_FALSE(G1FromJSON(JSONValue::Parse(R"(["1","2","2"])")).has_value());
}

TEST_F(CurveTest, JSONShapeErrorsThrow) {
    EXPECT_THROW(G1FromJSON(JSONValue::Parse(R"(["1","2"])")), ProofError);
    EXPECT_THROW(G1FromJSON(JSONValue::Parse(R"(["1","x","1"])")), ProofError);
    EXPECT_THROW(G1FromJSON(JSONValue::Parse(R"([1,2,1])")), ProofError);
    EXPECT_THROW(G2FromJSON(JSONValue::Parse(R"([["1","2"],["3","4"]])")), ProofError);
    EXPECT_THROW(G2FromJSON(JSONValue::Parse(R"([["1"],["3","4"],["1","0"]])")), ProofError);
}

TEST_F(CurveTest, GTShape) {
    GTElement gt = CurvePP::reduced_pairing(G1Point::one(), G2Point::one());
    const JSONValue json = GTToJSON(gt);
    EXPECT_TRUE(IsGTShape(json));
    ASSERT_EQ(json.Size(), 2u);
    EXPECT_EQ(json[0].Size(), 3u);

    EXPECT_FALSE(IsGTShape(JSONValue::Parse(R"([["1","2"]])")));
    EXPECT_FALSE(IsGTShape(JSONValue("x")));
}

// ============================================================================
// Compressed Bytes
// ============================================================================

TEST_F(CurveTest, G1CompressRoundTrip) {
    for (uint64_t k : {1u, 2u, 3u, 1000u, 987654321u}) {
        G1Point p = G1Mul(k);
        auto bytes = CompressG1(p);
        auto back = DecompressG1(bytes.data());
        ASSERT_TRUE(back.has_value()) << "k=" << k;
        EXPECT_EQ(*back, p) << "k=" << k;
    }
}

TEST_F(CurveTest, G1CompressSignFlag) {
    G1Point p = G1Point::one();
    auto pos = CompressG1(p);
    auto neg = CompressG1(-p);
    // Same x, opposite sign flag
    EXPECT_EQ(pos[0], 1);
    EXPECT_EQ(neg[0], 1);
    EXPECT_NE(pos[31] & 0x80, neg[31] & 0x80);
    EXPECT_EQ(*DecompressG1(neg.data()), -p);
}

TEST_F(CurveTest, G2CompressRoundTrip) {
    for (uint64_t k : {1u, 5u, 424242u}) {
        G2Point p = G2Mul(k);
        auto bytes = CompressG2(p);
        auto back = DecompressG2(bytes.data());
        ASSERT_TRUE(back.has_value()) << "k=" << k;
        EXPECT_EQ(*back, p) << "k=" << k;

        auto negBack = DecompressG2(CompressG2(-p).data());
        ASSERT_TRUE(negBack.has_value());
        EXPECT_EQ(*negBack, -p);
    }
}

TEST_F(CurveTest, CompressInfinity) {
    auto g1 = CompressG1(G1Point::zero());
    EXPECT_EQ(g1[31], 0x40);
    auto back1 = DecompressG1(g1.data());
    ASSERT_TRUE(back1.has_value());
    EXPECT_TRUE(back1->is_zero());

    auto g2 = CompressG2(G2Point::zero());
    EXPECT_EQ(g2[63], 0x40);
    auto back2 = DecompressG2(g2.data());
    ASSERT_TRUE(back2.has_value());
    EXPECT_TRUE(back2->is_zero());
}

TEST_F(CurveTest, DecompressRejectsBothFlags) {
    auto bytes = CompressG1(G1Point::one());
    bytes[31] |= 0xC0;
    EXPECT_FALSE(DecompressG1(bytes.data()).has_value());
}

TEST_F(CurveTest, DecompressRejectsInfinityWithPayload) {
    std::array<Byte, G1_COMPRESSED_SIZE> bytes{};
    bytes[0] = 1;
    bytes[31] = 0x40;
    EXPECT_FALSE(DecompressG1(bytes.data()).has_value());
}

TEST_F(CurveTest, DecompressRejectsXAboveModulus) {
    std::array<Byte, G1_COMPRESSED_SIZE> bytes;
    bytes.fill(0xff);
    bytes[31] = 0x3f;  // 2^254 - 1, flags clear
    EXPECT_FALSE(DecompressG1(bytes.data()).has_value());

    std::array<Byte, G2_COMPRESSED_SIZE> bytes2;
    bytes2.fill(0xff);
    bytes2[63] = 0x3f;
    EXPECT_FALSE(DecompressG2(bytes2.data()).has_value());
}

TEST_F(CurveTest, DecompressRejectsNonResidue) {
    // 4^3 + 3 is not a square mod q
    std::array<Byte, G1_COMPRESSED_SIZE> bytes{};
    bytes[0] = 4;
    EXPECT_FALSE(DecompressG1(bytes.data()).has_value());
    bytes[31] = 0x80;
    EXPECT_FALSE(DecompressG1(bytes.data()).has_value());

    bytes[0] = 5;
    bytes[31] = 0;
    EXPECT_TRUE(DecompressG1(bytes.data()).has_value());
}

} // namespace test
} // namespace veriscore
