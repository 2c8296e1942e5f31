// VERISCORE - Proof Artifact and Codec
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// A Groth16 proof (A in G1, B in G2, C in G1) and the artifact that carries
// it together with its public inputs and statement kind. Encodings:
//
//  - binary: A || B || C compressed, 128 bytes
//  - hex: lowercase hex of the binary form
//  - JSON: snarkjs proof schema (pi_a, pi_b, pi_c, protocol, curve)
//  - call data: arguments of a Solidity verifyProof(a, b, c, inputs). The
//    coordinates of B are (c1, c0) here, the reverse of the JSON form; the
//    on-chain precompile expects that order.

#ifndef VERISCORE_PROOF_ARTIFACT_H
#define VERISCORE_PROOF_ARTIFACT_H

#include "veriscore/core/types.h"
#include "veriscore/crypto/field.h"
#include "veriscore/util/json.h"

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace veriscore {

using BackendProof = libsnark::r1cs_gg_ppzksnark_proof<CurvePP>;

// ============================================================================
// CallData
// ============================================================================

/// Arguments of a Solidity Groth16 verifier call, as decimal strings
struct CallData {
    std::array<std::string, 2> a;
    /// [[x.c1, x.c0], [y.c1, y.c0]]
    std::array<std::array<std::string, 2>, 2> b;
    std::array<std::string, 2> c;
    std::vector<std::string> inputs;

    /// verifyProof(...) call text, one argument per line
    std::string ToSolidityCall() const;

    /// {a, b, c, inputs}
    util::JSONValue ToJSON() const;
};

// ============================================================================
// Proof
// ============================================================================

class Proof {
public:
    /// Size of the binary encoding
    static constexpr size_t SERIALIZED_SIZE = 128;

    Proof();
    Proof(const G1Point& a, const G2Point& b, const G1Point& c);

    static Proof FromBackend(const BackendProof& proof);
    BackendProof ToBackend() const;

    const G1Point& A() const { return a_; }
    const G2Point& B() const { return b_; }
    const G1Point& C() const { return c_; }

    Bytes ToBytes() const;

    /// @throws ProofError(InvalidProofFormat) for truncated or malformed input
    static Proof FromBytes(const Bytes& data);
    static Proof FromBytes(const Byte* data, size_t len);

    std::string ToHex() const;

    /// @throws ProofError(InvalidProofFormat) for invalid hex or bytes
    static Proof FromHex(const std::string& hex);

    util::JSONValue ToJSON() const;

    /**
     * Parse the snarkjs proof schema.
     * @throws ProofError(SerializationError) if fields are missing or not
     *         decimal strings, ProofError(InvalidProofFormat) for a foreign
     *         protocol or curve or for points off the curve
     */
    static Proof FromJSON(const util::JSONValue& json);

    CallData ToCallData(const std::vector<FieldElement>& publicInputs) const;

    bool operator==(const Proof& other) const;
    bool operator!=(const Proof& other) const { return !(*this == other); }

private:
    G1Point a_;
    G2Point b_;
    G1Point c_;
};

// ============================================================================
// ProofArtifact
// ============================================================================

/// Proof + ordered public inputs + statement kind
struct ProofArtifact {
    Proof proof;
    std::vector<FieldElement> publicInputs;
    CircuitKind kind = CircuitKind::Threshold;

    /// Last public input (the commitment), if any
    std::optional<FieldElement> ScoreCommitment() const;

    /// Public inputs as decimal strings
    std::vector<std::string> PublicInputStrings() const;

    /// snarkjs public.json: array of decimal strings
    util::JSONValue PublicInputsToJSON() const;

    /// {proof, public_inputs, circuit}
    util::JSONValue ToJSON() const;

    /// @throws ProofError(SerializationError) for missing fields,
    ///         ProofError(InvalidProofFormat) for an unknown circuit name,
    ///         non-canonical inputs or a malformed proof
    static ProofArtifact FromJSON(const util::JSONValue& json);

    /// kind (1 byte) || input count (u32 LE) || inputs (32 bytes LE each) || proof
    Bytes ToBytes() const;

    /// @throws ProofError(InvalidProofFormat) for truncated or malformed input
    static ProofArtifact FromBytes(const Bytes& data);

    CallData ToCallData() const;

    bool operator==(const ProofArtifact& other) const;
    bool operator!=(const ProofArtifact& other) const { return !(*this == other); }
};

} // namespace veriscore

#endif // VERISCORE_PROOF_ARTIFACT_H
