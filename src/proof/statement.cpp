// VERISCORE - Statement Inputs Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/statement.h"
#include "veriscore/core/error.h"
#include "veriscore/core/random.h"
#include "veriscore/crypto/field.h"

#include <openssl/evp.h>

#include <array>

namespace veriscore {

namespace {

/// Fixed tier table: tier 1 is the best
constexpr std::array<std::pair<Score, Score>, NUM_TIERS> TIER_TABLE = {{
    {9500, 10000},
    {8500, 9499},
    {7000, 8499},
    {5000, 6999},
    {0, 4999},
}};

std::string Interval(Score lo, Score hi) {
    return "[" + std::to_string(lo) + ", " + std::to_string(hi) + "]";
}

/// Decimal string to integer; unparsable input becomes zero
mpz_class DecimalOrZero(const std::string& decimal) {
    if (!IsDecimalString(decimal)) {
        return 0;
    }
    return mpz_class(decimal, 10);
}

mpz_class FromScore(Score value) {
    return mpz_class(std::to_string(value), 10);
}

void ValidateFieldStrings(const std::string& entityHash, const std::string& salt) {
    if (!IsDecimalString(entityHash)) {
        throw ProofError::InvalidInput("entity_hash", entityHash, "decimal field element");
    }
    if (!IsDecimalString(salt)) {
        throw ProofError::InvalidInput("salt", salt, "decimal field element");
    }
}

} // anonymous namespace

// ============================================================================
// ThresholdInput
// ============================================================================

void ThresholdInput::Validate() const {
    if (score > MAX_SCORE) {
        throw ProofError::ScoreOutOfRange(score);
    }
    if (threshold > MAX_SCORE) {
        throw ProofError::InvalidInput("threshold", std::to_string(threshold),
                                       Interval(0, MAX_SCORE));
    }
    if (score < threshold) {
        throw ProofError::ThresholdNotMet(score, threshold);
    }
    ValidateFieldStrings(entityHash, salt);
}

SignalMap ThresholdInput::ToSignalMap() const {
    return {
        {Signals::THRESHOLD, {FromScore(threshold)}},
        {Signals::ENTITY_HASH, {DecimalOrZero(entityHash)}},
        {Signals::SCORE, {FromScore(score)}},
        {Signals::SALT, {DecimalOrZero(salt)}},
    };
}

// ============================================================================
// RangeInput
// ============================================================================

void RangeInput::Validate() const {
    if (score > MAX_SCORE) {
        throw ProofError::ScoreOutOfRange(score);
    }
    // Bounds past MAX_SCORE would overflow the 14-bit range gadgets
    if (maxScore > MAX_SCORE) {
        throw ProofError::InvalidInput("max_score", std::to_string(maxScore),
                                       Interval(0, MAX_SCORE));
    }
    if (minScore > maxScore) {
        throw ProofError::InvalidInput("min_score", std::to_string(minScore),
                                       "<= max_score (" + std::to_string(maxScore) + ")");
    }
    if (score < minScore || score > maxScore) {
        throw ProofError::InvalidInput("score", std::to_string(score),
                                       Interval(minScore, maxScore));
    }
    ValidateFieldStrings(entityHash, salt);
}

SignalMap RangeInput::ToSignalMap() const {
    return {
        {Signals::MIN_SCORE, {FromScore(minScore)}},
        {Signals::MAX_SCORE, {FromScore(maxScore)}},
        {Signals::ENTITY_HASH, {DecimalOrZero(entityHash)}},
        {Signals::SCORE, {FromScore(score)}},
        {Signals::SALT, {DecimalOrZero(salt)}},
    };
}

// ============================================================================
// TierInput
// ============================================================================

std::pair<Score, Score> TierInput::TierBounds(uint64_t tier) {
    if (tier < 1 || tier > NUM_TIERS) {
        return {0, 0};
    }
    return TIER_TABLE[tier - 1];
}

void TierInput::Validate() const {
    if (targetTier < 1 || targetTier > NUM_TIERS) {
        throw ProofError::InvalidTier(targetTier);
    }
    if (score > MAX_SCORE) {
        throw ProofError::ScoreOutOfRange(score);
    }
    auto [lo, hi] = TierBounds(targetTier);
    if (score < lo || score > hi) {
        throw ProofError::InvalidInput("score", std::to_string(score),
                                       "tier " + std::to_string(targetTier) + " range " +
                                       Interval(lo, hi));
    }
    ValidateFieldStrings(entityHash, salt);
}

SignalMap TierInput::ToSignalMap() const {
    return {
        {Signals::TARGET_TIER, {FromScore(targetTier)}},
        {Signals::ENTITY_HASH, {DecimalOrZero(entityHash)}},
        {Signals::SCORE, {FromScore(score)}},
        {Signals::SALT, {DecimalOrZero(salt)}},
    };
}

// ============================================================================
// Variant Helpers
// ============================================================================

CircuitKind KindOf(const StatementInput& input) {
    switch (input.index()) {
        case 0: return CircuitKind::Threshold;
        case 1: return CircuitKind::Range;
        default: return CircuitKind::Tier;
    }
}

void ValidateStatement(const StatementInput& input) {
    std::visit([](const auto& in) { in.Validate(); }, input);
}

SignalMap StatementSignals(const StatementInput& input) {
    return std::visit([](const auto& in) { return in.ToSignalMap(); }, input);
}

// ============================================================================
// Signal Maps
// ============================================================================

const std::vector<mpz_class>* FindSignal(const SignalMap& signals, const std::string& name) {
    for (const auto& entry : signals) {
        if (entry.first == name) {
            return &entry.second;
        }
    }
    return nullptr;
}

util::JSONValue SignalMapToJSON(const SignalMap& signals) {
    util::JSONValue::Object obj;
    for (const auto& [name, values] : signals) {
        if (values.size() == 1) {
            obj[name] = util::JSONValue(values.front().get_str(10));
        } else {
            util::JSONValue::Array arr;
            for (const auto& v : values) {
                arr.emplace_back(v.get_str(10));
            }
            obj[name] = util::JSONValue(std::move(arr));
        }
    }
    return util::JSONValue(std::move(obj));
}

// ============================================================================
// Entity and Salt Helpers
// ============================================================================

std::string GenerateSalt() {
    // 31 bytes stay below the field modulus
    const Bytes bytes = RandomBytes(31);
    mpz_class value;
    mpz_import(value.get_mpz_t(), bytes.size(), 1, 1, 0, 0, bytes.data());
    return value.get_str(10);
}

std::string HashEntityId(const std::string& entityId) {
    std::array<unsigned char, 32> digest;
    unsigned int digestLen = 0;
    if (EVP_Digest(entityId.data(), entityId.size(), digest.data(), &digestLen,
                   EVP_sha256(), nullptr) != 1 || digestLen != digest.size()) {
        throw ProofError::CryptographicError("SHA-256 digest failed");
    }
    mpz_class value;
    mpz_import(value.get_mpz_t(), digest.size(), 1, 1, 0, 0, digest.data());
    return FieldToDecimal(FieldFromMpz<FieldElement>(value));
}

} // namespace veriscore
