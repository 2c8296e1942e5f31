// VERISCORE - Circuit Gadgets Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/gadgets.h"
#include "veriscore/core/error.h"
#include "veriscore/crypto/poseidon.h"
#include "veriscore/proof/statement.h"

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

namespace veriscore {

using libsnark::r1cs_constraint;

FieldElement EvaluateOnBoard(const Protoboard& pb, const LinearCombination& lc) {
    return lc.evaluate(pb.full_variable_assignment());
}

// ============================================================================
// NonNegativeGadget
// ============================================================================

NonNegativeGadget::NonNegativeGadget(Protoboard& pb, const LinearCombination& value,
                                     size_t bits, const std::string& annotation)
    : libsnark::gadget<FieldElement>(pb, annotation)
    , value_(value)
    , bitWidth_(bits)
{
    bits_.allocate(pb, bits, annotation + ".bits");
}

void NonNegativeGadget::generate_r1cs_constraints() {
    LinearCombination packed;
    FieldElement weight = FieldElement::one();
    for (size_t i = 0; i < bitWidth_; ++i) {
        libsnark::generate_boolean_r1cs_constraint<FieldElement>(
            this->pb, bits_[i], this->annotation_prefix + ".boolean_" + std::to_string(i));
        packed = packed + LinearCombination(bits_[i]) * weight;
        weight += weight;
    }
    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldElement>(LinearCombination(FieldElement::one()), packed, value_),
        this->annotation_prefix + ".packing");
}

void NonNegativeGadget::generate_r1cs_witness() {
    const mpz_class value = FieldToMpz(EvaluateOnBoard(this->pb, value_));
    mpz_class limit = 1;
    limit <<= bitWidth_;
    if (value >= limit) {
        throw ProofError::SynthesisError(this->annotation_prefix + ": value " +
                                         value.get_str(10) + " does not fit in " +
                                         std::to_string(bitWidth_) + " bits");
    }
    for (size_t i = 0; i < bitWidth_; ++i) {
        this->pb.val(bits_[i]) = mpz_tstbit(value.get_mpz_t(), i) ? FieldElement::one()
                                                                  : FieldElement::zero();
    }
}

// ============================================================================
// TierSelectorGadget
// ============================================================================

TierSelectorGadget::TierSelectorGadget(Protoboard& pb, const Variable& targetTier,
                                       const std::string& annotation)
    : libsnark::gadget<FieldElement>(pb, annotation)
    , targetTier_(targetTier)
{
    indicators_.allocate(pb, NUM_TIERS, annotation + ".is_tier");
}

void TierSelectorGadget::generate_r1cs_constraints() {
    LinearCombination count;
    LinearCombination weighted;
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        libsnark::generate_boolean_r1cs_constraint<FieldElement>(
            this->pb, indicators_[i],
            this->annotation_prefix + ".boolean_" + std::to_string(i + 1));
        count = count + LinearCombination(indicators_[i]);
        weighted = weighted + LinearCombination(indicators_[i]) * FieldFromUint64(i + 1);
    }

    const LinearCombination one(FieldElement::one());
    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldElement>(one, count, one),
        this->annotation_prefix + ".one_hot");
    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldElement>(one, weighted, LinearCombination(targetTier_)),
        this->annotation_prefix + ".selects_target");
}

void TierSelectorGadget::generate_r1cs_witness() {
    const mpz_class tier = FieldToMpz(this->pb.val(targetTier_));
    if (tier < 1 || tier > NUM_TIERS) {
        throw ProofError::SynthesisError(this->annotation_prefix + ": target tier " +
                                         tier.get_str(10) + " outside 1.." +
                                         std::to_string(NUM_TIERS));
    }
    const size_t selected = tier.get_ui();
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        this->pb.val(indicators_[i]) = (i + 1 == selected) ? FieldElement::one()
                                                           : FieldElement::zero();
    }
}

LinearCombination TierSelectorGadget::SelectedMin() const {
    LinearCombination out;
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        out = out + LinearCombination(indicators_[i]) *
                    FieldFromUint64(TierInput::TierBounds(i + 1).first);
    }
    return out;
}

LinearCombination TierSelectorGadget::SelectedMax() const {
    LinearCombination out;
    for (size_t i = 0; i < NUM_TIERS; ++i) {
        out = out + LinearCombination(indicators_[i]) *
                    FieldFromUint64(TierInput::TierBounds(i + 1).second);
    }
    return out;
}

// ============================================================================
// PoseidonGadget
// ============================================================================

PoseidonGadget::PoseidonGadget(Protoboard& pb, const std::vector<LinearCombination>& inputs,
                               const Variable& output, const std::string& annotation)
    : libsnark::gadget<FieldElement>(pb, annotation)
    , inputs_(inputs)
    , output_(output)
{
    const PoseidonParams& params = PoseidonParams::ForWidth(inputs.size() + 1);
    const size_t t = params.width;

    std::vector<LinearCombination> state;
    state.emplace_back(FieldElement::zero());
    state.insert(state.end(), inputs.begin(), inputs.end());

    auto applySbox = [&](LinearCombination& x) {
        const std::string prefix = annotation + ".sbox_" + std::to_string(sboxes_.size());
        Sbox sbox;
        sbox.in = x;
        sbox.x2.allocate(pb, prefix + ".x2");
        sbox.x4.allocate(pb, prefix + ".x4");
        sbox.x5.allocate(pb, prefix + ".x5");
        x = LinearCombination(sbox.x5);
        sboxes_.push_back(std::move(sbox));
    };

    for (size_t r = 0; r < params.TotalRounds(); ++r) {
        for (size_t i = 0; i < t; ++i) {
            state[i] = state[i] + LinearCombination(params.roundConstants[r * t + i]);
        }

        if (params.IsFullRound(r)) {
            for (auto& element : state) {
                applySbox(element);
            }
        } else {
            applySbox(state[0]);
        }

        std::vector<LinearCombination> mixed(t);
        for (size_t i = 0; i < t; ++i) {
            for (size_t j = 0; j < t; ++j) {
                mixed[i] = mixed[i] + state[j] * params.mds[i][j];
            }
        }
        state.swap(mixed);
    }

    result_ = state[0];
}

void PoseidonGadget::generate_r1cs_constraints() {
    for (size_t k = 0; k < sboxes_.size(); ++k) {
        const Sbox& sbox = sboxes_[k];
        const std::string prefix = this->annotation_prefix + ".sbox_" + std::to_string(k);
        this->pb.add_r1cs_constraint(
            r1cs_constraint<FieldElement>(sbox.in, sbox.in, sbox.x2), prefix + ".square");
        this->pb.add_r1cs_constraint(
            r1cs_constraint<FieldElement>(sbox.x2, sbox.x2, sbox.x4), prefix + ".fourth");
        this->pb.add_r1cs_constraint(
            r1cs_constraint<FieldElement>(sbox.x4, sbox.in, sbox.x5), prefix + ".fifth");
    }
    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldElement>(LinearCombination(FieldElement::one()), result_, output_),
        this->annotation_prefix + ".output");
}

void PoseidonGadget::generate_r1cs_witness() {
    const PoseidonParams& params = PoseidonParams::ForWidth(inputs_.size() + 1);
    const size_t t = params.width;

    std::vector<FieldElement> state(t, FieldElement::zero());
    for (size_t i = 0; i < inputs_.size(); ++i) {
        state[i + 1] = EvaluateOnBoard(this->pb, inputs_[i]);
    }

    // Same S-box order as the constructor
    size_t next = 0;
    auto applySbox = [&](FieldElement& x) {
        const Sbox& sbox = sboxes_[next++];
        FieldElement x2 = x * x;
        FieldElement x4 = x2 * x2;
        FieldElement x5 = x4 * x;
        this->pb.val(sbox.x2) = x2;
        this->pb.val(sbox.x4) = x4;
        this->pb.val(sbox.x5) = x5;
        x = x5;
    };

    std::vector<FieldElement> mixed(t);
    for (size_t r = 0; r < params.TotalRounds(); ++r) {
        for (size_t i = 0; i < t; ++i) {
            state[i] += params.roundConstants[r * t + i];
        }

        if (params.IsFullRound(r)) {
            for (auto& element : state) {
                applySbox(element);
            }
        } else {
            applySbox(state[0]);
        }

        for (size_t i = 0; i < t; ++i) {
            FieldElement acc = FieldElement::zero();
            for (size_t j = 0; j < t; ++j) {
                acc += params.mds[i][j] * state[j];
            }
            mixed[i] = acc;
        }
        state.swap(mixed);
    }

    this->pb.val(output_) = state[0];
}

} // namespace veriscore
