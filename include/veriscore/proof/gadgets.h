// VERISCORE - Circuit Gadgets
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Reusable sub-circuits shared by the statement circuits:
//
//  - NonNegativeGadget: proves a linear combination lies in [0, 2^bits)
//  - TierSelectorGadget: one-hot selection of a tier's score bounds
//  - PoseidonGadget: in-circuit Poseidon hash bound to an output variable
//
// Gadgets follow the libsnark convention: the constructor allocates
// variables, generate_r1cs_constraints() emits constraints and
// generate_r1cs_witness() assigns values on the protoboard.

#ifndef VERISCORE_PROOF_GADGETS_H
#define VERISCORE_PROOF_GADGETS_H

#include "veriscore/crypto/field.h"

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

#include <string>
#include <vector>

namespace veriscore {

using Protoboard = libsnark::protoboard<FieldElement>;
using Variable = libsnark::pb_variable<FieldElement>;
using VariableArray = libsnark::pb_variable_array<FieldElement>;
using LinearCombination = libsnark::linear_combination<FieldElement>;

/// Current value of a linear combination on the protoboard
FieldElement EvaluateOnBoard(const Protoboard& pb, const LinearCombination& lc);

// ============================================================================
// NonNegativeGadget
// ============================================================================

/**
 * Decomposes `value` into `bits` boolean variables b_i with b_i * (b_i - 1) = 0
 * and value = sum(b_i * 2^i). A negative difference wraps to a field element
 * far above 2^bits, so the decomposition only exists for 0 <= value < 2^bits.
 */
class NonNegativeGadget : public libsnark::gadget<FieldElement> {
public:
    NonNegativeGadget(Protoboard& pb, const LinearCombination& value, size_t bits,
                      const std::string& annotation);

    void generate_r1cs_constraints();

    /// @throws ProofError(SynthesisError) if the value does not fit in `bits`
    void generate_r1cs_witness();

    size_t BitWidth() const { return bitWidth_; }
    const VariableArray& Bits() const { return bits_; }

private:
    LinearCombination value_;
    size_t bitWidth_;
    VariableArray bits_;
};

// ============================================================================
// TierSelectorGadget
// ============================================================================

/**
 * Five boolean indicators is_1..is_5 with sum(is_i) = 1 and
 * sum(i * is_i) = target_tier. The selected bounds are linear combinations
 * of the indicators with the tier table as constant coefficients, so they
 * cost no extra constraints.
 */
class TierSelectorGadget : public libsnark::gadget<FieldElement> {
public:
    TierSelectorGadget(Protoboard& pb, const Variable& targetTier,
                       const std::string& annotation);

    void generate_r1cs_constraints();

    /// @throws ProofError(SynthesisError) if target_tier is outside 1..5
    void generate_r1cs_witness();

    /// sum(is_i * TIER_MIN_i)
    LinearCombination SelectedMin() const;
    /// sum(is_i * TIER_MAX_i)
    LinearCombination SelectedMax() const;

    const VariableArray& Indicators() const { return indicators_; }

private:
    Variable targetTier_;
    VariableArray indicators_;
};

// ============================================================================
// PoseidonGadget
// ============================================================================

/**
 * Poseidon permutation over linear-combination state. Each S-box x^5 costs
 * three multiplication constraints (x2 = x*x, x4 = x2*x2, x5 = x4*x); round
 * constants and MDS mixing stay linear. The first state element after the
 * last round is constrained equal to `output`.
 */
class PoseidonGadget : public libsnark::gadget<FieldElement> {
public:
    PoseidonGadget(Protoboard& pb, const std::vector<LinearCombination>& inputs,
                   const Variable& output, const std::string& annotation);

    void generate_r1cs_constraints();

    /// Assigns S-box intermediates and the output variable
    void generate_r1cs_witness();

private:
    struct Sbox {
        LinearCombination in;
        Variable x2;
        Variable x4;
        Variable x5;
    };

    std::vector<LinearCombination> inputs_;
    Variable output_;
    std::vector<Sbox> sboxes_;
    LinearCombination result_;
};

} // namespace veriscore

#endif // VERISCORE_PROOF_GADGETS_H
