// VERISCORE - Prover Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/prover.h"
#include "veriscore/core/error.h"
#include "veriscore/proof/circuits.h"
#include "veriscore/util/config.h"
#include "veriscore/util/fs.h"
#include "veriscore/util/logging.h"

#include <mutex>

namespace veriscore {

namespace {

std::string EntityPrefix(const StatementInput& input) {
    const std::string& entity =
        std::visit([](const auto& in) -> const std::string& { return in.entityHash; }, input);
    return entity.size() > 8 ? entity.substr(0, 8) + "..." : entity;
}

} // anonymous namespace

ProverOptions ProverOptions::FromConfig(const util::ConfigManager& config) {
    ProverOptions options;
    options.autoSetup = config.GetBool(util::ConfigKeys::AUTOSETUP, false);
    return options;
}

// ============================================================================
// Prover
// ============================================================================

Prover::Prover(const std::string& buildDir, ProverOptions options)
    : keyStore_(buildDir)
    , options_(options)
{
    if (!util::fs::IsDirectory(buildDir)) {
        throw ProofError::CircuitNotFound(buildDir);
    }
    InitCurveParams();
}

Prover::KeySlot& Prover::SlotFor(CircuitKind kind) {
    return slots_[static_cast<size_t>(kind) - 1];
}

const Prover::KeySlot& Prover::SlotFor(CircuitKind kind) const {
    return slots_[static_cast<size_t>(kind) - 1];
}

std::shared_ptr<const ProvingKey> Prover::GetProvingKey(CircuitKind kind) {
    KeySlot& slot = SlotFor(kind);
    {
        std::shared_lock<std::shared_mutex> lock(slot.mutex);
        if (slot.key) {
            return slot.key;
        }
    }

    std::unique_lock<std::shared_mutex> lock(slot.mutex);
    if (slot.key) {
        return slot.key;
    }

    if (!keyStore_.HasProvingKey(kind)) {
        if (!options_.autoSetup) {
            throw ProofError::CircuitNotFound(keyStore_.ProvingKeyPath(kind));
        }
        LOG_INFO(util::LogCategory::PROVER) << "No proving key for " << CircuitName(kind)
                                            << ", running setup";
        slot.key = std::make_shared<const ProvingKey>(keyStore_.Setup(kind));
    } else {
        slot.key = std::make_shared<const ProvingKey>(keyStore_.LoadProvingKey(kind));
    }
    ++keyLoads_;
    return slot.key;
}

bool Prover::HasCachedKey(CircuitKind kind) const {
    const KeySlot& slot = SlotFor(kind);
    std::shared_lock<std::shared_mutex> lock(slot.mutex);
    return slot.key != nullptr;
}

void Prover::ResetKeys() {
    for (auto& slot : slots_) {
        std::unique_lock<std::shared_mutex> lock(slot.mutex);
        slot.key.reset();
    }
}

ProofArtifact Prover::Prove(const StatementInput& input) {
    const CircuitKind kind = KindOf(input);
    ValidateStatement(input);

    VERISCORE_LOG_TIMER(timer, util::LogCategory::PROVER,
                        std::string("prove ") + CircuitName(kind));
    LOG_INFO(util::LogCategory::PROVER) << "Proving " << CircuitName(kind)
                                        << " statement for entity " << EntityPrefix(input);

    // Witness
    std::unique_ptr<StatementCircuit> circuit;
    try {
        circuit = BuildCircuit(kind, StatementSignals(input));
        circuit->Synthesize();
    } catch (const ProofError& e) {
        if (e.Code() == ErrorCode::SynthesisError) {
            throw ProofError::WitnessError(e.what());
        }
        throw;
    }
    if (!circuit->IsSatisfied()) {
        throw ProofError::WitnessError(std::string(CircuitName(kind)) +
                                       " witness does not satisfy the constraints");
    }
    timer.Phase("witness");

    // Key
    std::shared_ptr<const ProvingKey> pk = GetProvingKey(kind);
    if (pk->constraint_system.num_inputs() != circuit->NumPublicInputs() ||
        pk->constraint_system.num_constraints() != circuit->NumConstraints()) {
        throw ProofError::ProofGenerationFailed(std::string("proving key does not match the ") +
                                                CircuitName(kind) + " circuit; rerun setup");
    }
    timer.Phase("key");

    // Proof
    PrimaryInput primary = circuit->GetPrimaryInput();
    AuxiliaryInput auxiliary = circuit->GetAuxiliaryInput();
    circuit->MarkConsumed();

    Proof proof = [&]() {
        try {
            return Proof::FromBackend(
                libsnark::r1cs_gg_ppzksnark_prover<CurvePP>(*pk, primary, auxiliary));
        } catch (const std::exception& e) {
            throw ProofError::ProofGenerationFailed(e.what());
        }
    }();
    timer.Phase("groth16");

    ProofArtifact artifact;
    artifact.proof = proof;
    artifact.publicInputs = std::move(primary);
    artifact.kind = kind;

    LOG_INFO(util::LogCategory::PROVER) << "Generated " << CircuitName(kind) << " proof ("
                                        << timer.Summary() << ")";
    return artifact;
}

// ============================================================================
// Convenience
// ============================================================================

ProofArtifact ProveComplianceThreshold(const std::string& buildDir, Score score,
                                       Score threshold, const std::string& entityHash,
                                       const std::string& salt) {
    ThresholdInput input;
    input.threshold = threshold;
    input.entityHash = entityHash;
    input.score = score;
    input.salt = salt;

    Prover prover(buildDir);
    return prover.ProveThreshold(input);
}

} // namespace veriscore
