// VERISCORE - Verifier
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Checks proof artifacts against the verification keys in a build
// directory. A well-formed proof of a false statement yields false; errors
// are reserved for mismatched artifacts and backend or key faults.

#ifndef VERISCORE_PROOF_VERIFIER_H
#define VERISCORE_PROOF_VERIFIER_H

#include "veriscore/proof/artifact.h"
#include "veriscore/proof/keystore.h"

#include <array>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace veriscore {

class Verifier {
public:
    /// @throws ProofError(CircuitNotFound) if buildDir is not a directory
    explicit Verifier(const std::string& buildDir);

    Verifier(const Verifier&) = delete;
    Verifier& operator=(const Verifier&) = delete;

    /**
     * Verify an artifact claimed to prove a statement of `expected` kind.
     *
     * @throws ProofError(InvalidProofFormat) if the artifact kind differs from
     *         `expected` or the public input count does not match the kind;
     *         CircuitNotFound / SerializationError / VerificationFailed for
     *         key problems
     */
    bool Verify(const ProofArtifact& artifact, CircuitKind expected);

    bool VerifyThreshold(const ProofArtifact& artifact) {
        return Verify(artifact, CircuitKind::Threshold);
    }
    bool VerifyRange(const ProofArtifact& artifact) {
        return Verify(artifact, CircuitKind::Range);
    }
    bool VerifyTier(const ProofArtifact& artifact) {
        return Verify(artifact, CircuitKind::Tier);
    }

    /// Verify wire bytes (Proof::ToBytes) against explicit public inputs
    bool VerifyRaw(CircuitKind kind, const Bytes& proofBytes,
                   const std::vector<FieldElement>& publicInputs);

    bool HasCachedKey(CircuitKind kind) const;
    void ResetKeys();
    size_t KeyLoadCount() const { return keyLoads_.load(); }

    const KeyStore& Keys() const { return keyStore_; }

private:
    struct KeySlot {
        mutable std::shared_mutex mutex;
        std::shared_ptr<const ProcessedVerificationKey> key;
    };

    std::shared_ptr<const ProcessedVerificationKey> GetKey(CircuitKind kind);
    bool VerifyProof(CircuitKind kind, const Proof& proof,
                     const std::vector<FieldElement>& publicInputs);

    KeyStore keyStore_;
    std::array<KeySlot, 3> slots_;
    std::atomic<size_t> keyLoads_{0};
};

/// One-shot threshold verification against the keys in buildDir
bool VerifyComplianceThreshold(const std::string& buildDir, const ProofArtifact& artifact);

} // namespace veriscore

#endif // VERISCORE_PROOF_VERIFIER_H
