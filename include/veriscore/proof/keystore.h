// VERISCORE - Key Store
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// On-disk layout of the per-circuit keys under a build directory:
//
//   {build_dir}/{circuit_name}/proving_key.bin        backend binary stream
//   {build_dir}/{circuit_name}/verification_key.json  snarkjs schema
//
// Setup runs the Groth16 generator on the witness-independent constraint
// system of a circuit kind and persists both keys.

#ifndef VERISCORE_PROOF_KEYSTORE_H
#define VERISCORE_PROOF_KEYSTORE_H

#include "veriscore/core/types.h"
#include "veriscore/crypto/field.h"
#include "veriscore/util/json.h"

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <string>

namespace veriscore {

using ProvingKey = libsnark::r1cs_gg_ppzksnark_proving_key<CurvePP>;
using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<CurvePP>;
using ProcessedVerificationKey = libsnark::r1cs_gg_ppzksnark_processed_verification_key<CurvePP>;

constexpr const char* PROVING_KEY_FILE = "proving_key.bin";
constexpr const char* VERIFICATION_KEY_FILE = "verification_key.json";

// ============================================================================
// Verification Key JSON
// ============================================================================

/// snarkjs verification_key.json; alpha and beta come from the proving key
/// since the backend verification key only keeps their pairing
util::JSONValue VerificationKeyToJSON(const ProvingKey& pk, const VerificationKey& vk);

/**
 * Parse a snarkjs verification key.
 *
 * @param expectedPublic Public input count of the circuit the key belongs to
 * @throws ProofError(SerializationError) for missing fields or malformed
 *         coordinates, ProofError(VerificationFailed) for a foreign protocol
 *         or curve, an IC length that does not match, or points off the curve
 */
VerificationKey VerificationKeyFromJSON(const util::JSONValue& json, size_t expectedPublic);

// ============================================================================
// KeyStore
// ============================================================================

class KeyStore {
public:
    explicit KeyStore(std::string buildDir);

    const std::string& BuildDir() const { return buildDir_; }

    std::string CircuitDir(CircuitKind kind) const;
    std::string ProvingKeyPath(CircuitKind kind) const;
    std::string VerificationKeyPath(CircuitKind kind) const;

    bool HasProvingKey(CircuitKind kind) const;
    bool HasVerificationKey(CircuitKind kind) const;

    /// @throws ProofError CircuitNotFound (missing), IoError (unreadable),
    ///         SetupError (corrupt)
    ProvingKey LoadProvingKey(CircuitKind kind) const;

    /// @throws ProofError CircuitNotFound, IoError, SerializationError,
    ///         VerificationFailed
    VerificationKey LoadVerificationKey(CircuitKind kind) const;

    /**
     * Generate and persist both keys for a circuit kind, replacing any
     * existing files.
     * @return the new proving key
     * @throws ProofError SetupError or IoError
     */
    ProvingKey Setup(CircuitKind kind) const;

    /// Setup for every circuit kind
    void SetupAll() const;

private:
    std::string buildDir_;
};

} // namespace veriscore

#endif // VERISCORE_PROOF_KEYSTORE_H
