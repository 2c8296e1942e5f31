// VERISCORE - Verifier Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/verifier.h"
#include "veriscore/core/error.h"
#include "veriscore/util/fs.h"
#include "veriscore/util/logging.h"

#include <mutex>

namespace veriscore {

Verifier::Verifier(const std::string& buildDir)
    : keyStore_(buildDir)
{
    if (!util::fs::IsDirectory(buildDir)) {
        throw ProofError::CircuitNotFound(buildDir);
    }
    InitCurveParams();
}

std::shared_ptr<const ProcessedVerificationKey> Verifier::GetKey(CircuitKind kind) {
    KeySlot& slot = slots_[static_cast<size_t>(kind) - 1];
    {
        std::shared_lock<std::shared_mutex> lock(slot.mutex);
        if (slot.key) {
            return slot.key;
        }
    }

    std::unique_lock<std::shared_mutex> lock(slot.mutex);
    if (!slot.key) {
        VerificationKey vk = keyStore_.LoadVerificationKey(kind);
        slot.key = std::make_shared<const ProcessedVerificationKey>(
            libsnark::r1cs_gg_ppzksnark_verifier_process_vk<CurvePP>(vk));
        ++keyLoads_;
    }
    return slot.key;
}

bool Verifier::HasCachedKey(CircuitKind kind) const {
    const KeySlot& slot = slots_[static_cast<size_t>(kind) - 1];
    std::shared_lock<std::shared_mutex> lock(slot.mutex);
    return slot.key != nullptr;
}

void Verifier::ResetKeys() {
    for (auto& slot : slots_) {
        std::unique_lock<std::shared_mutex> lock(slot.mutex);
        slot.key.reset();
    }
}

bool Verifier::VerifyProof(CircuitKind kind, const Proof& proof,
                           const std::vector<FieldElement>& publicInputs) {
    if (publicInputs.size() != PublicInputCount(kind)) {
        throw ProofError::InvalidProofFormat(
            std::string(CircuitName(kind)) + " expects " +
            std::to_string(PublicInputCount(kind)) + " public inputs, got " +
            std::to_string(publicInputs.size()));
    }

    std::shared_ptr<const ProcessedVerificationKey> pvk = GetKey(kind);

    VERISCORE_LOG_TIMER(timer, util::LogCategory::VERIFIER,
                        std::string("verify ") + CircuitName(kind));
    bool valid = false;
    try {
        valid = libsnark::r1cs_gg_ppzksnark_online_verifier_strong_IC<CurvePP>(
            *pvk, publicInputs, proof.ToBackend());
    } catch (const std::exception& e) {
        throw ProofError::VerificationFailed(e.what());
    }

    LOG_INFO(util::LogCategory::VERIFIER) << CircuitName(kind) << " proof "
                                          << (valid ? "verified" : "rejected");
    return valid;
}

bool Verifier::Verify(const ProofArtifact& artifact, CircuitKind expected) {
    if (artifact.kind != expected) {
        throw ProofError::InvalidProofFormat(std::string("Expected ") + CircuitName(expected) +
                                             " proof, got " + CircuitName(artifact.kind));
    }
    return VerifyProof(expected, artifact.proof, artifact.publicInputs);
}

bool Verifier::VerifyRaw(CircuitKind kind, const Bytes& proofBytes,
                         const std::vector<FieldElement>& publicInputs) {
    return VerifyProof(kind, Proof::FromBytes(proofBytes), publicInputs);
}

bool VerifyComplianceThreshold(const std::string& buildDir, const ProofArtifact& artifact) {
    Verifier verifier(buildDir);
    return verifier.VerifyThreshold(artifact);
}

} // namespace veriscore
