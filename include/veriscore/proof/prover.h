// VERISCORE - Prover
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Turns a validated statement into a Groth16 proof artifact:
//
//   validate -> signal map -> circuit synthesis (witness) -> proving key
//   -> proof generation -> artifact (public inputs, commitment last)
//
// Proving keys are loaded from the key store on first use per circuit kind
// and kept for the prover's lifetime. Concurrent first calls for the same
// kind load the key once; calls for different kinds do not contend.

#ifndef VERISCORE_PROOF_PROVER_H
#define VERISCORE_PROOF_PROVER_H

#include "veriscore/proof/artifact.h"
#include "veriscore/proof/keystore.h"
#include "veriscore/proof/statement.h"

#include <array>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>

namespace veriscore {

namespace util {
class ConfigManager;
}

struct ProverOptions {
    /// Run setup for a circuit kind whose proving key is missing
    bool autoSetup{false};

    static ProverOptions FromConfig(const util::ConfigManager& config);
};

class Prover {
public:
    /// @throws ProofError(CircuitNotFound) if buildDir is not a directory
    explicit Prover(const std::string& buildDir, ProverOptions options = {});

    Prover(const Prover&) = delete;
    Prover& operator=(const Prover&) = delete;

    /**
     * Prove a statement.
     *
     * Validation errors are rethrown unchanged before any circuit work.
     * @throws ProofError WitnessError, CircuitNotFound, SetupError,
     *         ProofGenerationFailed
     */
    ProofArtifact Prove(const StatementInput& input);

    ProofArtifact ProveThreshold(const ThresholdInput& input) { return Prove(input); }
    ProofArtifact ProveRange(const RangeInput& input) { return Prove(input); }
    ProofArtifact ProveTier(const TierInput& input) { return Prove(input); }

    bool HasCachedKey(CircuitKind kind) const;

    /// Drop cached proving keys; the next call reloads from disk
    void ResetKeys();

    /// Number of proving keys loaded or generated so far
    size_t KeyLoadCount() const { return keyLoads_.load(); }

    const KeyStore& Keys() const { return keyStore_; }
    const ProverOptions& Options() const { return options_; }

private:
    struct KeySlot {
        mutable std::shared_mutex mutex;
        std::shared_ptr<const ProvingKey> key;
    };

    std::shared_ptr<const ProvingKey> GetProvingKey(CircuitKind kind);
    KeySlot& SlotFor(CircuitKind kind);
    const KeySlot& SlotFor(CircuitKind kind) const;

    KeyStore keyStore_;
    ProverOptions options_;
    std::array<KeySlot, 3> slots_;
    std::atomic<size_t> keyLoads_{0};
};

/// One-shot threshold proof against the keys in buildDir
ProofArtifact ProveComplianceThreshold(const std::string& buildDir, Score score,
                                       Score threshold, const std::string& entityHash,
                                       const std::string& salt);

} // namespace veriscore

#endif // VERISCORE_PROOF_PROVER_H
