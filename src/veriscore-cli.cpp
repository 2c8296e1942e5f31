// VERISCORE CLI - Command Line Interface
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// veriscore-cli runs key setup, proves compliance-score statements and
// verifies proof artifacts against a build directory of circuit keys.

#include "veriscore/core/error.h"
#include "veriscore/proof/keystore.h"
#include "veriscore/proof/prover.h"
#include "veriscore/proof/verifier.h"
#include "veriscore/util/config.h"
#include "veriscore/util/fs.h"
#include "veriscore/util/logging.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace veriscore {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "VERISCORE CLI";

namespace defaults {
    constexpr const char* BUILDDIR = "build/circuits";
    constexpr const char* OUTDIR = ".";
}

/// Options only the CLI understands
namespace keys {
    constexpr const char* ENTITY = "entity";
    constexpr const char* ENTITYHASH = "entityhash";
    constexpr const char* SALT = "salt";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
}

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: veriscore-cli [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  setup [circuit]                     Generate keys (all circuits by default)\n";
    std::cout << "  prove threshold <score> <threshold> Prove score >= threshold\n";
    std::cout << "  prove range <score> <min> <max>     Prove min <= score <= max\n";
    std::cout << "  prove tier <score> <tier>           Prove score lies in tier 1..5\n";
    std::cout << "  verify <circuit> <proof.json>       Verify a proof artifact\n";
    std::cout << "  hashentity <id>                     Print the entity hash of an identifier\n";
    std::cout << "\nCircuits: compliance_threshold, range_proof, tier_membership\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -conf=<file>          Config file (default: " << util::DEFAULT_CONFIG_FILENAME
              << ")\n";
    std::cout << "  -builddir=<dir>       Circuit key directory (default: " << defaults::BUILDDIR
              << ")\n";
    std::cout << "  -outdir=<dir>         Output directory for prove (default: .)\n";
    std::cout << "  -autosetup            Run setup when a proving key is missing\n";
    std::cout << "  -entity=<id>          Entity identifier, hashed with SHA-256\n";
    std::cout << "  -entityhash=<dec>     Entity hash as a decimal field element\n";
    std::cout << "  -salt=<dec>           Commitment salt (random if omitted)\n";
    std::cout << "  -loglevel=<level>     trace, debug, info, warn, error\n";
    std::cout << "  -debug=<category>     Debug logging for a category (or 1 for all)\n";
    std::cout << "  -help, -version\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 VERISCORE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Helpers
// ============================================================================

Score ParseScoreArg(const std::string& name, const std::string& value) {
    if (!IsDecimalString(value) || value.size() > 18) {
        throw ProofError::InvalidInput(name, value, "unsigned integer");
    }
    return std::stoull(value);
}

CircuitKind ParseCircuitArg(const std::string& value) {
    auto kind = CircuitKindFromName(value);
    if (!kind) {
        throw ProofError::InvalidInput("circuit", value,
                                       "compliance_threshold, range_proof or tier_membership");
    }
    return *kind;
}

void WriteOutput(const std::string& path, const std::string& content) {
    if (!util::fs::WriteFileAtomic(path, content)) {
        throw ProofError::IoError("cannot write output", path);
    }
}

// ============================================================================
// Commands
// ============================================================================

int CommandSetup(const util::ConfigManager& config, const std::vector<std::string>& args) {
    const std::string buildDir = config.GetPath(util::ConfigKeys::BUILDDIR, defaults::BUILDDIR);
    if (!util::fs::CreateDirectories(buildDir)) {
        throw ProofError::IoError("cannot create build directory", buildDir);
    }

    KeyStore store(buildDir);
    if (args.empty()) {
        store.SetupAll();
    } else {
        for (const auto& arg : args) {
            store.Setup(ParseCircuitArg(arg));
        }
    }
    std::cout << "Keys written to " << buildDir << "\n";
    return 0;
}

int CommandProve(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: prove needs a statement type. Use -help for usage.\n";
        return 1;
    }

    std::string entityHash;
    if (auto hash = config.TryGetString(keys::ENTITYHASH)) {
        entityHash = *hash;
    } else if (auto entity = config.TryGetString(keys::ENTITY)) {
        entityHash = HashEntityId(*entity);
    } else {
        std::cerr << "Error: -entity or -entityhash is required\n";
        return 1;
    }
    const std::string salt = config.GetString(keys::SALT, GenerateSalt());

    const std::string& type = args[0];
    StatementInput input;
    if (type == "threshold" && args.size() == 3) {
        ThresholdInput in;
        in.score = ParseScoreArg("score", args[1]);
        in.threshold = ParseScoreArg("threshold", args[2]);
        in.entityHash = entityHash;
        in.salt = salt;
        input = in;
    } else if (type == "range" && args.size() == 4) {
        RangeInput in;
        in.score = ParseScoreArg("score", args[1]);
        in.minScore = ParseScoreArg("min_score", args[2]);
        in.maxScore = ParseScoreArg("max_score", args[3]);
        in.entityHash = entityHash;
        in.salt = salt;
        input = in;
    } else if (type == "tier" && args.size() == 3) {
        TierInput in;
        in.score = ParseScoreArg("score", args[1]);
        in.targetTier = ParseScoreArg("target_tier", args[2]);
        in.entityHash = entityHash;
        in.salt = salt;
        input = in;
    } else {
        std::cerr << "Error: invalid arguments for 'prove " << type << "'. Use -help for usage.\n";
        return 1;
    }

    Prover prover(config.GetPath(util::ConfigKeys::BUILDDIR, defaults::BUILDDIR),
                  ProverOptions::FromConfig(config));
    ProofArtifact artifact = prover.Prove(input);

    const std::string outDir = config.GetPath(util::ConfigKeys::OUTDIR, defaults::OUTDIR);
    if (!util::fs::CreateDirectories(outDir)) {
        throw ProofError::IoError("cannot create output directory", outDir);
    }
    WriteOutput(util::fs::JoinPath(outDir, "proof.json"), artifact.ToJSON().ToJSON(true) + "\n");
    WriteOutput(util::fs::JoinPath(outDir, "public.json"),
                artifact.PublicInputsToJSON().ToJSON(true) + "\n");
    WriteOutput(util::fs::JoinPath(outDir, "calldata.txt"),
                artifact.ToCallData().ToSolidityCall() + "\n");

    std::cout << "circuit:    " << CircuitName(artifact.kind) << "\n";
    std::cout << "commitment: " << FieldToDecimal(*artifact.ScoreCommitment()) << "\n";
    std::cout << "salt:       " << salt << "\n";
    std::cout << "proof:      " << artifact.proof.ToHex() << "\n";
    std::cout << "Wrote proof.json, public.json and calldata.txt to " << outDir << "\n";
    return 0;
}

int CommandVerify(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Error: verify needs <circuit> <proof.json>\n";
        return 1;
    }
    const CircuitKind kind = ParseCircuitArg(args[0]);

    std::string content;
    if (!util::fs::ReadFile(args[1], content)) {
        throw ProofError::IoError("cannot read proof artifact", args[1]);
    }
    auto json = util::JSONValue::TryParse(content);
    if (!json) {
        throw ProofError::SerializationError("proof artifact is not valid JSON: " + args[1]);
    }

    Verifier verifier(config.GetPath(util::ConfigKeys::BUILDDIR, defaults::BUILDDIR));
    const bool valid = verifier.Verify(ProofArtifact::FromJSON(*json), kind);
    std::cout << (valid ? "valid" : "invalid") << "\n";
    return valid ? 0 : 2;
}

int CommandHashEntity(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: hashentity needs exactly one identifier\n";
        return 1;
    }
    std::cout << HashEntityId(args[0]) << "\n";
    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    util::AllowStandardKeys(config);
    for (const char* key : {keys::ENTITY, keys::ENTITYHASH, keys::SALT, keys::HELP, keys::VERSION}) {
        config.AllowKey(key);
    }

    if (auto error = config.ParseCommandLine(argc, argv)) {
        std::cerr << "Error: " << error->message << ". Use -help for usage.\n";
        return 1;
    }

    if (config.GetBool(keys::HELP, false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool(keys::VERSION, false)) {
        PrintVersion();
        return 0;
    }

    // Config file; a missing default file is fine
    const std::string confPath = config.GetPath(util::ConfigKeys::CONF,
                                                util::DEFAULT_CONFIG_FILENAME);
    if (config.HasKey(util::ConfigKeys::CONF) || util::fs::IsFile(confPath)) {
        if (auto error = config.ParseFile(confPath)) {
            std::cerr << "Error reading config: " << error->ToString() << "\n";
            return 1;
        }
    }

    // Only warnings reach the terminal unless asked for
    config.SetDefault(util::ConfigKeys::LOGLEVEL, "warn");
    const util::LogOptions logOptions = util::GetLogOptions(config);
    if (!util::ConfigureLogging(logOptions)) {
        std::cerr << "Warning: cannot open log file " << logOptions.file << "\n";
    }
    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    const auto& positional = config.Positional();
    if (positional.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'veriscore-cli -help' for usage information.\n";
        return 1;
    }

    const std::string& command = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "setup") {
        return CommandSetup(config, args);
    }
    if (command == "prove") {
        return CommandProve(config, args);
    }
    if (command == "verify") {
        return CommandVerify(config, args);
    }
    if (command == "hashentity") {
        return CommandHashEntity(args);
    }

    std::cerr << "Error: unknown command '" << command << "'\n";
    return 1;
}

} // namespace cli
} // namespace veriscore

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    int rc = 1;
    try {
        rc = veriscore::cli::AppMain(argc, argv);
    } catch (const veriscore::ProofError& e) {
        std::cerr << "Error [" << veriscore::ErrorCodeToString(e.Code()) << "]: " << e.what()
                  << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    veriscore::util::Logger::Instance().Flush();
    return rc;
}
