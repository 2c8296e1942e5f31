// VERISCORE - Poseidon Hash Function
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field, with the
// parameters of circomlib's Poseidon so that commitments computed here match
// the ones computed inside circuits and by the external toolchain.
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458

#ifndef VERISCORE_CRYPTO_POSEIDON_H
#define VERISCORE_CRYPTO_POSEIDON_H

#include "veriscore/crypto/field.h"

#include <cstdint>
#include <vector>

namespace veriscore {

// ============================================================================
// Poseidon Parameters
// ============================================================================

/// Largest number of inputs a single hash call accepts
constexpr size_t POSEIDON_MAX_INPUTS = 16;

/**
 * Round constants and MDS matrix for one state width.
 *
 * Derived with the Grain LFSR of the Poseidon reference scripts (x^5 S-box,
 * 254-bit prime field, 8 full rounds). Instances are computed once per width
 * and never modified afterwards.
 */
struct PoseidonParams {
    /// State width (t = inputs + 1)
    size_t width;

    /// Number of full rounds (R_F)
    size_t fullRounds;

    /// Number of partial rounds (R_P)
    size_t partialRounds;

    /// (R_F + R_P) * t constants, indexed [round * t + i]
    std::vector<FieldElement> roundConstants;

    /// MDS matrix (width x width)
    std::vector<std::vector<FieldElement>> mds;

    /// Total rounds
    size_t TotalRounds() const { return fullRounds + partialRounds; }

    /// True if round r applies the S-box to every state element
    bool IsFullRound(size_t r) const {
        return r < fullRounds / 2 || r >= fullRounds / 2 + partialRounds;
    }

    /// Const reference to the cached parameters for a state width (2..17).
    /// @throws ProofError(CryptographicError) for unsupported widths
    static const PoseidonParams& ForWidth(size_t width);

    /// Run the Grain LFSR generator (uncached)
    static PoseidonParams Generate(size_t width);
};

// ============================================================================
// Hashing
// ============================================================================

/// S-box x^5
FieldElement PoseidonSbox(const FieldElement& x);

/// Hash 1..16 field elements to one field element.
/// @throws ProofError(CryptographicError) for 0 or more than 16 inputs
FieldElement PoseidonHash(const std::vector<FieldElement>& inputs);

/// Commitment binding a score to its salt and entity: Hash(score, salt, entity_hash)
FieldElement ComputeCommitment(const FieldElement& score, const FieldElement& salt,
                               const FieldElement& entityHash);

/// Same, for boundary callers holding an integer score
FieldElement ComputeCommitment(uint64_t score, const FieldElement& salt,
                               const FieldElement& entityHash);

} // namespace veriscore

#endif // VERISCORE_CRYPTO_POSEIDON_H
