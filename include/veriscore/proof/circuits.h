// VERISCORE - Statement Circuits
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// One arithmetic circuit per statement kind. Public inputs are allocated
// first, in the order the verifier expects them, with the commitment last:
//
//   threshold: [threshold, entity_hash, commitment]
//   range:     [min_score, max_score, entity_hash, commitment]
//   tier:      [target_tier, entity_hash, commitment]
//
// Private inputs are score and salt. A circuit owns its witness and is built
// fresh for every proof request; synthesis runs exactly once.

#ifndef VERISCORE_PROOF_CIRCUITS_H
#define VERISCORE_PROOF_CIRCUITS_H

#include "veriscore/core/types.h"
#include "veriscore/proof/gadgets.h"
#include "veriscore/proof/statement.h"

#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

#include <memory>

namespace veriscore {

using ConstraintSystem = libsnark::r1cs_constraint_system<FieldElement>;
using PrimaryInput = libsnark::r1cs_primary_input<FieldElement>;
using AuxiliaryInput = libsnark::r1cs_auxiliary_input<FieldElement>;

// ============================================================================
// StatementCircuit
// ============================================================================

/**
 * Base class for the three statement circuits.
 *
 * Lifecycle: Unsynthesized -> Synthesized (constraints emitted and witness
 * assigned) -> Consumed (handed to the prover).
 */
class StatementCircuit {
public:
    enum class State {
        Unsynthesized,
        Synthesized,
        Consumed
    };

    virtual ~StatementCircuit() = default;

    StatementCircuit(const StatementCircuit&) = delete;
    StatementCircuit& operator=(const StatementCircuit&) = delete;

    CircuitKind Kind() const { return kind_; }
    State GetState() const { return state_; }

    /**
     * Emit constraints and assign the witness.
     * @throws ProofError(SynthesisError) when called twice or when a gadget
     *         value does not fit its constraint shape
     */
    void Synthesize();

    /// Transition Synthesized -> Consumed
    void MarkConsumed();

    /// True if the assignment satisfies every constraint
    bool IsSatisfied() const;

    /// Commitment output (valid after synthesis)
    FieldElement Commitment() const;

    size_t NumPublicInputs() const { return pb_.num_inputs(); }
    size_t NumConstraints() const { return pb_.num_constraints(); }

    ConstraintSystem GetConstraintSystem() const { return pb_.get_constraint_system(); }
    PrimaryInput GetPrimaryInput() const { return pb_.primary_input(); }
    AuxiliaryInput GetAuxiliaryInput() const { return pb_.auxiliary_input(); }

    /// Protoboard access for inspection
    Protoboard& Board() { return pb_; }
    const Variable& ScoreVariable() const { return score_; }

    /**
     * Variable holding public input `index`, in GetPrimaryInput() order.
     * @throws ProofError(SynthesisError) if index >= NumPublicInputs()
     */
    Variable PublicVariable(size_t index) const;

protected:
    StatementCircuit(CircuitKind kind, const FieldElement& entityHash,
                     const FieldElement& score, const FieldElement& salt);

    /// Allocate entity hash and commitment, close the public section, then
    /// allocate the private inputs and the commitment hash. Subclasses call
    /// this after allocating their leading public inputs.
    void AllocateShared();

    virtual void GenerateConstraints() = 0;
    virtual void GenerateWitness() = 0;

    /// Constraints and witness of the shared part (commitment hash)
    void GenerateSharedConstraints();
    void GenerateSharedWitness();

    Protoboard pb_;
    Variable entityHash_;
    Variable commitment_;
    Variable score_;
    Variable salt_;

    FieldElement entityHashValue_;
    FieldElement scoreValue_;
    FieldElement saltValue_;

private:
    friend ConstraintSystem ConstraintSystemFor(CircuitKind kind);

    CircuitKind kind_;
    State state_ = State::Unsynthesized;
    std::unique_ptr<PoseidonGadget> commitmentHash_;
};

// ============================================================================
// Concrete Circuits
// ============================================================================

/// score - threshold >= 0, MAX_SCORE - score >= 0
class ThresholdCircuit : public StatementCircuit {
public:
    ThresholdCircuit(const FieldElement& threshold, const FieldElement& entityHash,
                     const FieldElement& score, const FieldElement& salt);

protected:
    void GenerateConstraints() override;
    void GenerateWitness() override;

private:
    Variable threshold_;
    FieldElement thresholdValue_;
    std::unique_ptr<NonNegativeGadget> aboveThreshold_;
    std::unique_ptr<NonNegativeGadget> belowMax_;
};

/// max - min >= 0, score - min >= 0, max - score >= 0
class RangeCircuit : public StatementCircuit {
public:
    RangeCircuit(const FieldElement& minScore, const FieldElement& maxScore,
                 const FieldElement& entityHash, const FieldElement& score,
                 const FieldElement& salt);

protected:
    void GenerateConstraints() override;
    void GenerateWitness() override;

private:
    Variable minScore_;
    Variable maxScore_;
    FieldElement minValue_;
    FieldElement maxValue_;
    std::unique_ptr<NonNegativeGadget> validRange_;
    std::unique_ptr<NonNegativeGadget> aboveMin_;
    std::unique_ptr<NonNegativeGadget> belowMax_;
};

/// Tier bounds selected by one-hot indicators, then the two range checks
class TierCircuit : public StatementCircuit {
public:
    TierCircuit(const FieldElement& targetTier, const FieldElement& entityHash,
                const FieldElement& score, const FieldElement& salt);

protected:
    void GenerateConstraints() override;
    void GenerateWitness() override;

private:
    Variable targetTier_;
    FieldElement tierValue_;
    std::unique_ptr<TierSelectorGadget> selector_;
    std::unique_ptr<NonNegativeGadget> aboveMin_;
    std::unique_ptr<NonNegativeGadget> belowMax_;
};

// ============================================================================
// Factory
// ============================================================================

/**
 * Build an unsynthesized circuit from a signal map.
 * @throws ProofError(WitnessError) if a signal is missing or does not hold
 *         exactly one value
 */
std::unique_ptr<StatementCircuit> BuildCircuit(CircuitKind kind, const SignalMap& signals);

/// Witness-independent constraint system of a circuit kind (used by setup)
ConstraintSystem ConstraintSystemFor(CircuitKind kind);

} // namespace veriscore

#endif // VERISCORE_PROOF_CIRCUITS_H
