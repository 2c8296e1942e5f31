// VERISCORE - Proof Service
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Runs prove and verify calls on a worker pool. Proving cannot be
// interrupted; ProveWithin gives up waiting after a deadline and leaves the
// call to finish in its worker.

#ifndef VERISCORE_PROOF_SERVICE_H
#define VERISCORE_PROOF_SERVICE_H

#include "veriscore/proof/prover.h"
#include "veriscore/proof/verifier.h"
#include "veriscore/util/threadpool.h"

#include <chrono>
#include <future>
#include <optional>
#include <string>

namespace veriscore {

class ProofService {
public:
    struct Options {
        std::string buildDir;
        size_t numThreads{0};       // 0 = hardware concurrency
        size_t maxQueueSize{1024};
        ProverOptions prover;

        static Options FromConfig(const util::ConfigManager& config);
    };

    /// @throws ProofError(CircuitNotFound) if the build directory is missing
    explicit ProofService(const Options& options);
    ~ProofService();

    ProofService(const ProofService&) = delete;
    ProofService& operator=(const ProofService&) = delete;

    /// @throws std::runtime_error if the queue is full or the service stopped
    std::future<ProofArtifact> SubmitProve(const StatementInput& input);
    std::future<bool> SubmitVerify(const ProofArtifact& artifact, CircuitKind expected);

    /// Result if the proof completes within `timeout`, otherwise nullopt
    std::optional<ProofArtifact> ProveWithin(const StatementInput& input,
                                             std::chrono::milliseconds timeout);

    /// Block until all submitted calls have finished
    void Wait() { pool_.Wait(); }

    Prover& GetProver() { return prover_; }
    Verifier& GetVerifier() { return verifier_; }
    size_t ThreadCount() const { return pool_.ThreadCount(); }

private:
    Prover prover_;
    Verifier verifier_;
    // Declared last: workers are joined before the prover and verifier go away
    util::ThreadPool pool_;
};

} // namespace veriscore

#endif // VERISCORE_PROOF_SERVICE_H
