// VERISCORE - Proof Service Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/service.h"
#include "veriscore/util/config.h"
#include "veriscore/util/logging.h"

namespace veriscore {

namespace {

util::ThreadPool::Config PoolConfig(const ProofService::Options& options) {
    util::ThreadPool::Config config;
    config.numThreads = options.numThreads;
    config.maxQueueSize = options.maxQueueSize;
    config.name = "proof";
    return config;
}

} // anonymous namespace

ProofService::Options ProofService::Options::FromConfig(const util::ConfigManager& config) {
    Options options;
    options.buildDir = config.GetPath(util::ConfigKeys::BUILDDIR, "build/circuits");
    options.numThreads = static_cast<size_t>(config.GetUInt(util::ConfigKeys::THREADS, 0));
    options.prover = ProverOptions::FromConfig(config);
    return options;
}

ProofService::ProofService(const Options& options)
    : prover_(options.buildDir, options.prover)
    , verifier_(options.buildDir)
    , pool_(PoolConfig(options))
{
    LOG_INFO(util::LogCategory::SERVICE) << "Proof service started with "
                                         << pool_.ThreadCount() << " workers on "
                                         << options.buildDir;
}

ProofService::~ProofService() {
    pool_.Shutdown();
    const util::ThreadPool::Stats stats = pool_.GetStats();
    LOG_INFO(util::LogCategory::SERVICE) << "Proof service stopped: " << stats.completed
                                         << " calls completed, " << stats.rejected
                                         << " rejected, " << stats.dropped << " dropped";
}

std::future<ProofArtifact> ProofService::SubmitProve(const StatementInput& input) {
    return pool_.Submit([this, input]() { return prover_.Prove(input); });
}

std::future<bool> ProofService::SubmitVerify(const ProofArtifact& artifact,
                                             CircuitKind expected) {
    return pool_.Submit([this, artifact, expected]() {
        return verifier_.Verify(artifact, expected);
    });
}

std::optional<ProofArtifact> ProofService::ProveWithin(const StatementInput& input,
                                                       std::chrono::milliseconds timeout) {
    std::future<ProofArtifact> result = SubmitProve(input);
    if (result.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN(util::LogCategory::SERVICE) << "Proof of " << CircuitName(KindOf(input))
                                             << " not ready after " << timeout.count()
                                             << " ms, abandoning wait";
        return std::nullopt;
    }
    return result.get();
}

} // namespace veriscore
