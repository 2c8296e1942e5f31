// VERISCORE - Statement Inputs
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Typed inputs for the three provable statements about a private compliance
// score. Each input validates itself and renders the signal map the circuit
// builder (and the external witness toolchain) consume.
//
// entity_hash and salt travel as decimal strings, the boundary type of the
// toolchain. Validate() rejects strings that do not parse; ToSignalMap() on
// unvalidated input maps them to zero, as the toolchain does.

#ifndef VERISCORE_PROOF_STATEMENT_H
#define VERISCORE_PROOF_STATEMENT_H

#include "veriscore/core/types.h"
#include "veriscore/util/json.h"

#include <gmpxx.h>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace veriscore {

/// Ordered signal name -> one or more big integer values
using SignalMap = std::vector<std::pair<std::string, std::vector<mpz_class>>>;

/// Signal names shared with the external toolchain
namespace Signals {
    constexpr const char* THRESHOLD = "threshold";
    constexpr const char* MIN_SCORE = "minScore";
    constexpr const char* MAX_SCORE = "maxScore";
    constexpr const char* TARGET_TIER = "targetTier";
    constexpr const char* ENTITY_HASH = "entityHash";
    constexpr const char* SCORE = "score";
    constexpr const char* SALT = "salt";
}

// ============================================================================
// Statement Inputs
// ============================================================================

/// score >= threshold
struct ThresholdInput {
    Score threshold = 0;        ///< public
    std::string entityHash;     ///< public
    Score score = 0;            ///< private
    std::string salt;           ///< private

    /**
     * Check the statement holds.
     * @throws ProofError ScoreOutOfRange, InvalidInput(threshold),
     *         ThresholdNotMet, InvalidInput(entity_hash|salt), in that order
     */
    void Validate() const;

    SignalMap ToSignalMap() const;
};

/// min_score <= score <= max_score
struct RangeInput {
    Score minScore = 0;
    Score maxScore = 0;
    std::string entityHash;
    Score score = 0;
    std::string salt;

    /// @throws ProofError ScoreOutOfRange, InvalidInput(min_score),
    ///         InvalidInput(score), InvalidInput(entity_hash|salt)
    void Validate() const;

    SignalMap ToSignalMap() const;
};

/// score lies in the fixed interval of target_tier
struct TierInput {
    uint64_t targetTier = 0;
    std::string entityHash;
    Score score = 0;
    std::string salt;

    /// @throws ProofError InvalidTier, ScoreOutOfRange, InvalidInput(score),
    ///         InvalidInput(entity_hash|salt)
    void Validate() const;

    SignalMap ToSignalMap() const;

    /// Closed score interval of a tier; (0, 0) outside 1..NUM_TIERS
    static std::pair<Score, Score> TierBounds(uint64_t tier);
};

using StatementInput = std::variant<ThresholdInput, RangeInput, TierInput>;

CircuitKind KindOf(const StatementInput& input);
void ValidateStatement(const StatementInput& input);
SignalMap StatementSignals(const StatementInput& input);

// ============================================================================
// Signal Maps
// ============================================================================

/// Look up a signal; nullptr if absent
const std::vector<mpz_class>* FindSignal(const SignalMap& signals, const std::string& name);

/**
 * Toolchain input.json: decimal strings, scalar when a signal has one value.
 * Keys are written in sorted order, not SignalMap order; the toolchain looks
 * signals up by name.
 */
util::JSONValue SignalMapToJSON(const SignalMap& signals);

// ============================================================================
// Entity and Salt Helpers
// ============================================================================

/// Fresh uniformly random 248-bit salt (31 bytes of OS entropy, below the
/// field modulus) as a decimal string
std::string GenerateSalt();

/// SHA-256 of an entity identifier reduced into the scalar field, as decimal
std::string HashEntityId(const std::string& entityId);

} // namespace veriscore

#endif // VERISCORE_PROOF_STATEMENT_H
