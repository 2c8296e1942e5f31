// VERISCORE - Poseidon Hash Tests
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Reference values match the circomlib Poseidon over BN254.

#include <gtest/gtest.h>
#include "veriscore/core/error.h"
#include "veriscore/crypto/poseidon.h"
#include "veriscore/proof/statement.h"

#include <string>
#include <vector>

namespace veriscore {
namespace test {

class PoseidonTest : public ::testing::Test {
protected:
    void SetUp() override {
        InitCurveParams();
    }

    static FieldElement F(uint64_t v) { return FieldFromUint64(v); }
};

// ============================================================================
// Parameters
// ============================================================================

TEST_F(PoseidonTest, RoundCounts) {
    const auto& p3 = PoseidonParams::ForWidth(3);
    EXPECT_EQ(p3.fullRounds, 8u);
    EXPECT_EQ(p3.partialRounds, 57u);
    EXPECT_EQ(p3.roundConstants.size(), 65u * 3u);
    ASSERT_EQ(p3.mds.size(), 3u);
    EXPECT_EQ(p3.mds[0].size(), 3u);

    EXPECT_EQ(PoseidonParams::ForWidth(2).partialRounds, 56u);
    EXPECT_EQ(PoseidonParams::ForWidth(4).partialRounds, 56u);
}

TEST_F(PoseidonTest, FirstConstants) {
    const auto& p3 = PoseidonParams::ForWidth(3);
    EXPECT_EQ(FieldToMpz(p3.roundConstants[0]),
              mpz_class("0ee9a592ba9a9518d05986d656f40c2114c4993c11bb29938d21d47304cd8e6e", 16));
    EXPECT_EQ(FieldToMpz(p3.mds[0][0]),
              mpz_class("109b7f411ba0e4c9b2b70caf5c36a7b194be7c11ad24378bfedb68592ba8118b", 16));
}

TEST_F(PoseidonTest, FullRoundSchedule) {
    const auto& p = PoseidonParams::ForWidth(3);
    EXPECT_TRUE(p.IsFullRound(0));
    EXPECT_TRUE(p.IsFullRound(3));
    EXPECT_FALSE(p.IsFullRound(4));
    EXPECT_FALSE(p.IsFullRound(4 + p.partialRounds - 1));
    EXPECT_TRUE(p.IsFullRound(4 + p.partialRounds));
    EXPECT_EQ(p.TotalRounds(), 65u);
}

TEST_F(PoseidonTest, ParamsAreCached) {
    EXPECT_EQ(&PoseidonParams::ForWidth(3), &PoseidonParams::ForWidth(3));
}

TEST_F(PoseidonTest, UnsupportedWidthThrows) {
    EXPECT_THROW(PoseidonParams::Generate(1), ProofError);
    EXPECT_THROW(PoseidonParams::Generate(POSEIDON_MAX_INPUTS + 2), ProofError);
}

// ============================================================================
// Hash
// ============================================================================

TEST_F(PoseidonTest, Sbox) {
    EXPECT_EQ(PoseidonSbox(F(2)), F(32));
    EXPECT_EQ(PoseidonSbox(F(0)), F(0));
}

TEST_F(PoseidonTest, SingleInputVector) {
    EXPECT_EQ(FieldToDecimal(PoseidonHash({F(1)})),
              "18586133768512220936620570745912940619677854269274689475585506675881198879027");
}

TEST_F(PoseidonTest, TwoInputVectors) {
    EXPECT_EQ(FieldToDecimal(PoseidonHash({F(1), F(2)})),
              "7853200120776062878684798364095072458815029376092732009249414926327459813530");
    EXPECT_EQ(FieldToDecimal(PoseidonHash({F(3), F(4)})),
              "14763215145315200506921711489642608356394854266165572616578112107564877678998");
}

TEST_F(PoseidonTest, ThreeInputVectors) {
    EXPECT_EQ(FieldToDecimal(PoseidonHash({F(0), F(0), F(0)})),
              "5317387130258456662214331362918410991734007599705406860481038345552731150762");
    EXPECT_EQ(FieldToDecimal(PoseidonHash({F(8500), F(12345), F(67890)})),
              "12935698533679254003152744995778560494104759410854810410670645331557744004209");
}

TEST_F(PoseidonTest, OrderMatters) {
    EXPECT_NE(PoseidonHash({F(1), F(2)}), PoseidonHash({F(2), F(1)}));
}

TEST_F(PoseidonTest, InputCountLimits) {
    EXPECT_THROW(PoseidonHash({}), ProofError);
    std::vector<FieldElement> tooMany(POSEIDON_MAX_INPUTS + 1, F(1));
    EXPECT_THROW(PoseidonHash(tooMany), ProofError);
}

// ============================================================================
// Commitment
// ============================================================================

TEST_F(PoseidonTest, CommitmentIsHashOfScoreSaltEntity) {
    EXPECT_EQ(ComputeCommitment(8500, F(12345), F(67890)),
              PoseidonHash({F(8500), F(12345), F(67890)}));
    EXPECT_EQ(ComputeCommitment(F(8500), F(12345), F(67890)),
              ComputeCommitment(8500, F(12345), F(67890)));
}

TEST_F(PoseidonTest, CommitmentBindsEachInput) {
    const FieldElement base = ComputeCommitment(8500, F(12345), F(67890));
    EXPECT_NE(base, ComputeCommitment(8501, F(12345), F(67890)));
    EXPECT_NE(base, ComputeCommitment(8500, F(12346), F(67890)));
    EXPECT_NE(base, ComputeCommitment(8500, F(12345), F(67891)));
}

TEST_F(PoseidonTest, CommitmentBindsRandomSaltsAndEntities) {
    std::vector<FieldElement> seen;
    for (int i = 0; i < 8; ++i) {
        const FieldElement salt = FieldFromDecimal(GenerateSalt());
        const FieldElement entity = FieldFromDecimal(HashEntityId("entity-" + std::to_string(i)));
        const FieldElement otherSalt = FieldFromDecimal(GenerateSalt());
        const FieldElement otherEntity =
            FieldFromDecimal(HashEntityId("entity-" + std::to_string(i) + "-other"));
        const Score score = 1250 * static_cast<Score>(i);

        const FieldElement base = ComputeCommitment(score, salt, entity);
        EXPECT_EQ(base, ComputeCommitment(score, salt, entity));
        EXPECT_NE(base, ComputeCommitment(score + 1, salt, entity)) << i;
        EXPECT_NE(base, ComputeCommitment(score, otherSalt, entity)) << i;
        EXPECT_NE(base, ComputeCommitment(score, salt, otherEntity)) << i;
        // Salt and entity hash are not interchangeable
        EXPECT_NE(base, ComputeCommitment(score, entity, salt)) << i;

        for (const auto& prev : seen) {
            EXPECT_NE(base, prev) << i;
        }
        seen.push_back(base);
    }
}

} // namespace test
} // namespace veriscore
