// VERISCORE - Hex Encoding Tests
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include <gtest/gtest.h>
#include "veriscore/core/hex.h"

namespace veriscore {
namespace test {

TEST(HexTest, EncodesLowercase) {
    EXPECT_EQ(BytesToHex(Bytes{0x00, 0x0f, 0xab, 0xff}), "000fabff");
    EXPECT_EQ(BytesToHex(Bytes{}), "");
}

TEST(HexTest, DecodesEitherCaseWithOptionalPrefix) {
    const Bytes expected = {0xc0, 0xff, 0xee};
    EXPECT_EQ(HexToBytes("c0ffee"), expected);
    EXPECT_EQ(HexToBytes("C0FFEE"), expected);
    EXPECT_EQ(HexToBytes("0Xc0ffee"), expected);
    ASSERT_TRUE(HexToBytes("0x").has_value());
    EXPECT_TRUE(HexToBytes("0x")->empty());
}

TEST(HexTest, RejectsMalformedInput) {
    EXPECT_FALSE(HexToBytes("abc").has_value());
    EXPECT_FALSE(HexToBytes("0xa").has_value());
    EXPECT_FALSE(HexToBytes("0g").has_value());
    EXPECT_FALSE(HexToBytes("a b ").has_value());
}

TEST(HexTest, StripHexPrefix) {
    EXPECT_EQ(StripHexPrefix("0xab"), "ab");
    EXPECT_EQ(StripHexPrefix("ab"), "ab");
    EXPECT_EQ(StripHexPrefix("0"), "0");
}

TEST(HexTest, ProofSizedBuffer) {
    Bytes proof(128);
    for (size_t i = 0; i < proof.size(); ++i) {
        proof[i] = static_cast<Byte>(i * 7);
    }
    const std::string hex = BytesToHex(proof);
    EXPECT_EQ(hex.size(), 256u);
    EXPECT_EQ(HexToBytes(hex), proof);
}

} // namespace test
} // namespace veriscore
