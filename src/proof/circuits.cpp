// VERISCORE - Statement Circuits Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/circuits.h"
#include "veriscore/core/error.h"
#include "veriscore/util/logging.h"

namespace veriscore {

// ============================================================================
// StatementCircuit
// ============================================================================

StatementCircuit::StatementCircuit(CircuitKind kind, const FieldElement& entityHash,
                                   const FieldElement& score, const FieldElement& salt)
    : entityHashValue_(entityHash)
    , scoreValue_(score)
    , saltValue_(salt)
    , kind_(kind)
{
}

void StatementCircuit::AllocateShared() {
    entityHash_.allocate(pb_, "entity_hash");
    commitment_.allocate(pb_, "commitment");
    pb_.set_input_sizes(pb_.num_variables());

    score_.allocate(pb_, "score");
    salt_.allocate(pb_, "salt");

    commitmentHash_ = std::make_unique<PoseidonGadget>(
        pb_,
        std::vector<LinearCombination>{LinearCombination(score_), LinearCombination(salt_),
                                       LinearCombination(entityHash_)},
        commitment_, "commitment_hash");
}

void StatementCircuit::GenerateSharedConstraints() {
    commitmentHash_->generate_r1cs_constraints();
}

void StatementCircuit::GenerateSharedWitness() {
    pb_.val(entityHash_) = entityHashValue_;
    pb_.val(score_) = scoreValue_;
    pb_.val(salt_) = saltValue_;
    commitmentHash_->generate_r1cs_witness();
}

void StatementCircuit::Synthesize() {
    if (state_ != State::Unsynthesized) {
        throw ProofError::SynthesisError(std::string(CircuitName(kind_)) +
                                         " circuit already synthesized");
    }
    GenerateConstraints();
    state_ = State::Synthesized;
    GenerateWitness();

    LOG_DEBUG(util::LogCategory::CIRCUIT) << CircuitName(kind_) << " synthesized: "
                                          << pb_.num_constraints() << " constraints, "
                                          << pb_.num_variables() << " variables";
}

void StatementCircuit::MarkConsumed() {
    if (state_ != State::Synthesized) {
        throw ProofError::SynthesisError(std::string(CircuitName(kind_)) +
                                         " circuit must be synthesized before proving");
    }
    state_ = State::Consumed;
}

bool StatementCircuit::IsSatisfied() const {
    return state_ != State::Unsynthesized && pb_.is_satisfied();
}

FieldElement StatementCircuit::Commitment() const {
    return pb_.val(commitment_);
}

Variable StatementCircuit::PublicVariable(size_t index) const {
    if (index >= pb_.num_inputs()) {
        throw ProofError::SynthesisError(std::string(CircuitName(kind_)) + ": public input " +
                                         std::to_string(index) + " out of range");
    }
    // Index 0 is the constant one; primary inputs follow it
    return Variable(static_cast<libsnark::var_index_t>(index + 1));
}

// ============================================================================
// ThresholdCircuit
// ============================================================================

ThresholdCircuit::ThresholdCircuit(const FieldElement& threshold,
                                   const FieldElement& entityHash,
                                   const FieldElement& score, const FieldElement& salt)
    : StatementCircuit(CircuitKind::Threshold, entityHash, score, salt)
    , thresholdValue_(threshold)
{
    threshold_.allocate(pb_, "threshold");
    AllocateShared();

    aboveThreshold_ = std::make_unique<NonNegativeGadget>(
        pb_, LinearCombination(score_) - LinearCombination(threshold_), SCORE_BITS,
        "score_minus_threshold");
    belowMax_ = std::make_unique<NonNegativeGadget>(
        pb_, LinearCombination(FieldFromUint64(MAX_SCORE)) - LinearCombination(score_),
        SCORE_BITS, "max_minus_score");
}

void ThresholdCircuit::GenerateConstraints() {
    aboveThreshold_->generate_r1cs_constraints();
    belowMax_->generate_r1cs_constraints();
    GenerateSharedConstraints();
}

void ThresholdCircuit::GenerateWitness() {
    pb_.val(threshold_) = thresholdValue_;
    GenerateSharedWitness();
    aboveThreshold_->generate_r1cs_witness();
    belowMax_->generate_r1cs_witness();
}

// ============================================================================
// RangeCircuit
// ============================================================================

RangeCircuit::RangeCircuit(const FieldElement& minScore, const FieldElement& maxScore,
                           const FieldElement& entityHash, const FieldElement& score,
                           const FieldElement& salt)
    : StatementCircuit(CircuitKind::Range, entityHash, score, salt)
    , minValue_(minScore)
    , maxValue_(maxScore)
{
    minScore_.allocate(pb_, "min_score");
    maxScore_.allocate(pb_, "max_score");
    AllocateShared();

    validRange_ = std::make_unique<NonNegativeGadget>(
        pb_, LinearCombination(maxScore_) - LinearCombination(minScore_), SCORE_BITS,
        "max_minus_min");
    aboveMin_ = std::make_unique<NonNegativeGadget>(
        pb_, LinearCombination(score_) - LinearCombination(minScore_), SCORE_BITS,
        "score_minus_min");
    belowMax_ = std::make_unique<NonNegativeGadget>(
        pb_, LinearCombination(maxScore_) - LinearCombination(score_), SCORE_BITS,
        "max_minus_score");
}

void RangeCircuit::GenerateConstraints() {
    validRange_->generate_r1cs_constraints();
    aboveMin_->generate_r1cs_constraints();
    belowMax_->generate_r1cs_constraints();
    GenerateSharedConstraints();
}

void RangeCircuit::GenerateWitness() {
    pb_.val(minScore_) = minValue_;
    pb_.val(maxScore_) = maxValue_;
    GenerateSharedWitness();
    validRange_->generate_r1cs_witness();
    aboveMin_->generate_r1cs_witness();
    belowMax_->generate_r1cs_witness();
}

// ============================================================================
// TierCircuit
// ============================================================================

TierCircuit::TierCircuit(const FieldElement& targetTier, const FieldElement& entityHash,
                         const FieldElement& score, const FieldElement& salt)
    : StatementCircuit(CircuitKind::Tier, entityHash, score, salt)
    , tierValue_(targetTier)
{
    targetTier_.allocate(pb_, "target_tier");
    AllocateShared();

    selector_ = std::make_unique<TierSelectorGadget>(pb_, targetTier_, "tier_selector");
    aboveMin_ = std::make_unique<NonNegativeGadget>(
        pb_, LinearCombination(score_) - selector_->SelectedMin(), SCORE_BITS,
        "score_minus_tier_min");
    belowMax_ = std::make_unique<NonNegativeGadget>(
        pb_, selector_->SelectedMax() - LinearCombination(score_), SCORE_BITS,
        "tier_max_minus_score");
}

void TierCircuit::GenerateConstraints() {
    selector_->generate_r1cs_constraints();
    aboveMin_->generate_r1cs_constraints();
    belowMax_->generate_r1cs_constraints();
    GenerateSharedConstraints();
}

void TierCircuit::GenerateWitness() {
    pb_.val(targetTier_) = tierValue_;
    GenerateSharedWitness();
    selector_->generate_r1cs_witness();
    aboveMin_->generate_r1cs_witness();
    belowMax_->generate_r1cs_witness();
}

// ============================================================================
// Factory
// ============================================================================

namespace {

FieldElement RequireSignal(const SignalMap& signals, const char* name) {
    const std::vector<mpz_class>* values = FindSignal(signals, name);
    if (values == nullptr) {
        throw ProofError::WitnessError(std::string("missing signal '") + name + "'");
    }
    if (values->size() != 1) {
        throw ProofError::WitnessError(std::string("signal '") + name + "' expects 1 value, got " +
                                       std::to_string(values->size()));
    }
    if (values->front() < 0) {
        throw ProofError::WitnessError(std::string("signal '") + name + "' is negative");
    }
    return FieldFromMpz<FieldElement>(values->front());
}

} // anonymous namespace

std::unique_ptr<StatementCircuit> BuildCircuit(CircuitKind kind, const SignalMap& signals) {
    InitCurveParams();

    switch (kind) {
        case CircuitKind::Threshold:
            return std::make_unique<ThresholdCircuit>(
                RequireSignal(signals, Signals::THRESHOLD),
                RequireSignal(signals, Signals::ENTITY_HASH),
                RequireSignal(signals, Signals::SCORE),
                RequireSignal(signals, Signals::SALT));
        case CircuitKind::Range:
            return std::make_unique<RangeCircuit>(
                RequireSignal(signals, Signals::MIN_SCORE),
                RequireSignal(signals, Signals::MAX_SCORE),
                RequireSignal(signals, Signals::ENTITY_HASH),
                RequireSignal(signals, Signals::SCORE),
                RequireSignal(signals, Signals::SALT));
        case CircuitKind::Tier:
            return std::make_unique<TierCircuit>(
                RequireSignal(signals, Signals::TARGET_TIER),
                RequireSignal(signals, Signals::ENTITY_HASH),
                RequireSignal(signals, Signals::SCORE),
                RequireSignal(signals, Signals::SALT));
    }
    throw ProofError::WitnessError("unknown circuit kind");
}

ConstraintSystem ConstraintSystemFor(CircuitKind kind) {
    InitCurveParams();
    const FieldElement zero = FieldElement::zero();

    std::unique_ptr<StatementCircuit> circuit;
    switch (kind) {
        case CircuitKind::Threshold:
            circuit = std::make_unique<ThresholdCircuit>(zero, zero, zero, zero);
            break;
        case CircuitKind::Range:
            circuit = std::make_unique<RangeCircuit>(zero, zero, zero, zero, zero);
            break;
        case CircuitKind::Tier:
            circuit = std::make_unique<TierCircuit>(zero, zero, zero, zero);
            break;
    }
    if (!circuit) {
        throw ProofError::SetupError("unknown circuit kind");
    }
    circuit->GenerateConstraints();
    return circuit->GetConstraintSystem();
}

} // namespace veriscore
