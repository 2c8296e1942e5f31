// VERISCORE - Poseidon Hash Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// ZK-friendly algebraic hash function over the BN254 scalar field

#include "veriscore/crypto/poseidon.h"
#include "veriscore/core/error.h"

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace veriscore {

namespace {

// ============================================================================
// Parameter Generation
// ============================================================================

/// Partial rounds for t = 2..17 (circomlib table)
constexpr std::array<size_t, 16> PARTIAL_ROUNDS = {
    56, 57, 56, 60, 60, 63, 64, 63, 60, 66, 60, 65, 70, 60, 64, 68
};

constexpr size_t FULL_ROUNDS = 8;
constexpr size_t FIELD_BITS = 254;

/// Grain LFSR in self-shrinking mode, as in the Poseidon reference scripts
class GrainLfsr {
public:
    GrainLfsr(size_t width, size_t fullRounds, size_t partialRounds) {
        size_t pos = 0;
        auto push = [&](uint64_t value, size_t bits) {
            for (size_t i = bits; i-- > 0;) {
                state_[pos++] = static_cast<uint8_t>((value >> i) & 1);
            }
        };
        push(1, 2);                 // prime field
        push(0, 4);                 // x^alpha S-box
        push(FIELD_BITS, 12);
        push(width, 12);
        push(fullRounds, 10);
        push(partialRounds, 10);
        push((uint64_t(1) << 30) - 1, 30);

        for (int i = 0; i < 160; ++i) {
            Clock();
        }
    }

    /// Next output bit: pairs (b1, b2) yield b2 when b1 is set
    uint8_t NextBit() {
        for (;;) {
            uint8_t first = Clock();
            uint8_t second = Clock();
            if (first == 1) {
                return second;
            }
        }
    }

    /// MSB-first integer of `bits` output bits
    mpz_class NextInteger(size_t bits) {
        mpz_class out = 0;
        for (size_t i = 0; i < bits; ++i) {
            out <<= 1;
            out += static_cast<unsigned long>(NextBit());
        }
        return out;
    }

private:
    uint8_t Clock() {
        uint8_t bit = state_[(head_ + 62) % 80] ^ state_[(head_ + 51) % 80] ^
                      state_[(head_ + 38) % 80] ^ state_[(head_ + 23) % 80] ^
                      state_[(head_ + 13) % 80] ^ state_[head_];
        state_[head_] = bit;
        head_ = (head_ + 1) % 80;
        return bit;
    }

    std::array<uint8_t, 80> state_{};
    size_t head_ = 0;
};

} // anonymous namespace

PoseidonParams PoseidonParams::Generate(size_t width) {
    if (width < 2 || width > POSEIDON_MAX_INPUTS + 1) {
        throw ProofError::CryptographicError(
            "unsupported Poseidon width " + std::to_string(width));
    }
    InitCurveParams();

    PoseidonParams params;
    params.width = width;
    params.fullRounds = FULL_ROUNDS;
    params.partialRounds = PARTIAL_ROUNDS[width - 2];

    GrainLfsr lfsr(width, params.fullRounds, params.partialRounds);
    const mpz_class modulus = FieldModulus<FieldElement>();

    // Round constants by rejection sampling
    const size_t count = params.TotalRounds() * width;
    params.roundConstants.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        mpz_class value = lfsr.NextInteger(FIELD_BITS);
        while (value >= modulus) {
            value = lfsr.NextInteger(FIELD_BITS);
        }
        params.roundConstants.push_back(FieldFromMpz<FieldElement>(value));
    }

    // Cauchy matrix M[i][j] = 1 / (x_i + y_j) over distinct samples
    for (;;) {
        std::vector<mpz_class> samples;
        std::set<mpz_class> seen;
        do {
            samples.clear();
            seen.clear();
            for (size_t i = 0; i < 2 * width; ++i) {
                mpz_class value = lfsr.NextInteger(FIELD_BITS) % modulus;
                samples.push_back(value);
                seen.insert(value);
            }
        } while (seen.size() != samples.size());

        bool usable = true;
        std::vector<std::vector<FieldElement>> mds(width, std::vector<FieldElement>(width));
        for (size_t i = 0; i < width && usable; ++i) {
            for (size_t j = 0; j < width; ++j) {
                FieldElement sum = FieldFromMpz<FieldElement>(samples[i]) +
                                   FieldFromMpz<FieldElement>(samples[width + j]);
                if (sum.is_zero()) {
                    usable = false;
                    break;
                }
                mds[i][j] = sum.inverse();
            }
        }
        if (usable) {
            params.mds = std::move(mds);
            break;
        }
    }

    return params;
}

const PoseidonParams& PoseidonParams::ForWidth(size_t width) {
    static std::mutex cacheMutex;
    static std::map<size_t, std::unique_ptr<PoseidonParams>> cache;

    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = cache.find(width);
    if (it == cache.end()) {
        auto params = std::make_unique<PoseidonParams>(Generate(width));
        it = cache.emplace(width, std::move(params)).first;
    }
    return *it->second;
}

// ============================================================================
// Permutation
// ============================================================================

FieldElement PoseidonSbox(const FieldElement& x) {
    FieldElement x2 = x * x;
    FieldElement x4 = x2 * x2;
    return x4 * x;
}

FieldElement PoseidonHash(const std::vector<FieldElement>& inputs) {
    if (inputs.empty() || inputs.size() > POSEIDON_MAX_INPUTS) {
        throw ProofError::CryptographicError(
            "Poseidon accepts 1 to 16 inputs, got " + std::to_string(inputs.size()));
    }

    const PoseidonParams& params = PoseidonParams::ForWidth(inputs.size() + 1);
    const size_t t = params.width;

    std::vector<FieldElement> state(t, FieldElement::zero());
    for (size_t i = 0; i < inputs.size(); ++i) {
        state[i + 1] = inputs[i];
    }

    std::vector<FieldElement> mixed(t);
    for (size_t r = 0; r < params.TotalRounds(); ++r) {
        for (size_t i = 0; i < t; ++i) {
            state[i] += params.roundConstants[r * t + i];
        }

        if (params.IsFullRound(r)) {
            for (auto& element : state) {
                element = PoseidonSbox(element);
            }
        } else {
            state[0] = PoseidonSbox(state[0]);
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

    return state[0];
}

FieldElement ComputeCommitment(const FieldElement& score, const FieldElement& salt,
                               const FieldElement& entityHash) {
    return PoseidonHash({score, salt, entityHash});
}

FieldElement ComputeCommitment(uint64_t score, const FieldElement& salt,
                               const FieldElement& entityHash) {
    return ComputeCommitment(FieldFromUint64(score), salt, entityHash);
}

} // namespace veriscore
