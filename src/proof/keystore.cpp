// VERISCORE - Key Store Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/keystore.h"
#include "veriscore/core/error.h"
#include "veriscore/crypto/curve.h"
#include "veriscore/proof/circuits.h"
#include "veriscore/util/fs.h"
#include "veriscore/util/logging.h"

#include <memory>
#include <sstream>

namespace veriscore {

using util::JSONValue;
namespace fs = util::fs;

namespace {

const JSONValue& RequireKey(const JSONValue& json, const char* key) {
    if (!json.IsObject() || !json.HasKey(key)) {
        throw ProofError::SerializationError(std::string("verification key: missing field '") +
                                             key + "'");
    }
    return json[key];
}

G1Point RequireG1(const JSONValue& json, const char* key) {
    auto point = G1FromJSON(json);
    if (!point) {
        throw ProofError::VerificationFailed(std::string("verification key: ") + key +
                                             " is not a valid G1 point");
    }
    return *point;
}

G2Point RequireG2(const JSONValue& json, const char* key) {
    auto point = G2FromJSON(json);
    if (!point) {
        throw ProofError::VerificationFailed(std::string("verification key: ") + key +
                                             " is not a valid G2 point");
    }
    return *point;
}

} // anonymous namespace

// ============================================================================
// Verification Key JSON
// ============================================================================

JSONValue VerificationKeyToJSON(const ProvingKey& pk, const VerificationKey& vk) {
    JSONValue::Object obj;
    obj["protocol"] = JSONValue("groth16");
    obj["curve"] = JSONValue("bn128");
    obj["nPublic"] = JSONValue(static_cast<uint64_t>(vk.gamma_ABC_g1.rest.domain_size()));
    obj["vk_alpha_1"] = G1ToJSON(pk.alpha_g1);
    obj["vk_beta_2"] = G2ToJSON(pk.beta_g2);
    obj["vk_gamma_2"] = G2ToJSON(vk.gamma_g2);
    obj["vk_delta_2"] = G2ToJSON(vk.delta_g2);
    obj["vk_alphabeta_12"] = GTToJSON(vk.alpha_g1_beta_g2);

    JSONValue::Array ic;
    ic.push_back(G1ToJSON(vk.gamma_ABC_g1.first));
    for (size_t i = 0; i < vk.gamma_ABC_g1.rest.domain_size(); ++i) {
        ic.push_back(G1ToJSON(vk.gamma_ABC_g1.rest[i]));
    }
    obj["IC"] = JSONValue(std::move(ic));
    return JSONValue(std::move(obj));
}

VerificationKey VerificationKeyFromJSON(const JSONValue& json, size_t expectedPublic) {
    InitCurveParams();

    const JSONValue& protocol = RequireKey(json, "protocol");
    if (!protocol.IsString() || protocol.GetString() != "groth16") {
        throw ProofError::VerificationFailed("verification key: protocol is not groth16");
    }
    const JSONValue& curve = RequireKey(json, "curve");
    if (!curve.IsString() || curve.GetString() != "bn128") {
        throw ProofError::VerificationFailed("verification key: curve is not bn128");
    }

    const JSONValue& nPublic = RequireKey(json, "nPublic");
    if (!nPublic.IsInt() || nPublic.GetInt() < 0 ||
        static_cast<size_t>(nPublic.GetInt()) != expectedPublic) {
        throw ProofError::VerificationFailed("verification key: nPublic does not match circuit (" +
                                             std::to_string(expectedPublic) + ")");
    }

    const JSONValue& ic = RequireKey(json, "IC");
    if (!ic.IsArray() || ic.Size() != expectedPublic + 1) {
        throw ProofError::VerificationFailed("verification key: IC must hold " +
                                             std::to_string(expectedPublic + 1) + " points");
    }

    if (!IsGTShape(RequireKey(json, "vk_alphabeta_12"))) {
        throw ProofError::VerificationFailed("verification key: malformed vk_alphabeta_12");
    }

    const G1Point alpha = RequireG1(RequireKey(json, "vk_alpha_1"), "vk_alpha_1");
    const G2Point beta = RequireG2(RequireKey(json, "vk_beta_2"), "vk_beta_2");
    const G2Point gamma = RequireG2(RequireKey(json, "vk_gamma_2"), "vk_gamma_2");
    const G2Point delta = RequireG2(RequireKey(json, "vk_delta_2"), "vk_delta_2");

    G1Point first = RequireG1(ic[0], "IC[0]");
    std::vector<G1Point> rest;
    rest.reserve(expectedPublic);
    for (size_t i = 1; i < ic.Size(); ++i) {
        rest.push_back(RequireG1(ic[i], "IC"));
    }

    // The stored pairing is informational; recompute it from alpha and beta
    const GTElement alphaBeta = CurvePP::reduced_pairing(alpha, beta);

    return VerificationKey(alphaBeta, gamma, delta,
                           libsnark::accumulation_vector<G1Point>(std::move(first),
                                                                  std::move(rest)));
}

// ============================================================================
// KeyStore
// ============================================================================

KeyStore::KeyStore(std::string buildDir) : buildDir_(std::move(buildDir)) {}

std::string KeyStore::CircuitDir(CircuitKind kind) const {
    return fs::JoinPath(buildDir_, CircuitName(kind));
}

std::string KeyStore::ProvingKeyPath(CircuitKind kind) const {
    return fs::JoinPath(CircuitDir(kind), PROVING_KEY_FILE);
}

std::string KeyStore::VerificationKeyPath(CircuitKind kind) const {
    return fs::JoinPath(CircuitDir(kind), VERIFICATION_KEY_FILE);
}

bool KeyStore::HasProvingKey(CircuitKind kind) const {
    return fs::IsFile(ProvingKeyPath(kind));
}

bool KeyStore::HasVerificationKey(CircuitKind kind) const {
    return fs::IsFile(VerificationKeyPath(kind));
}

ProvingKey KeyStore::LoadProvingKey(CircuitKind kind) const {
    InitCurveParams();
    const std::string path = ProvingKeyPath(kind);
    if (!fs::IsFile(path)) {
        throw ProofError::CircuitNotFound(path);
    }

    std::string content;
    if (!fs::ReadFile(path, content)) {
        throw ProofError::IoError("cannot read proving key", path);
    }

    VERISCORE_LOG_TIMER(timer, util::LogCategory::KEYS,
                        std::string("load proving key ") + CircuitName(kind));
    std::istringstream in(content);
    ProvingKey pk;
    in >> pk;
    if (in.fail()) {
        throw ProofError::SetupError("corrupt proving key", path);
    }

    LOG_INFO(util::LogCategory::KEYS) << "Loaded proving key for " << CircuitName(kind)
                                      << " (" << content.size() << " bytes)";
    return pk;
}

VerificationKey KeyStore::LoadVerificationKey(CircuitKind kind) const {
    const std::string path = VerificationKeyPath(kind);
    if (!fs::IsFile(path)) {
        throw ProofError::CircuitNotFound(path);
    }

    std::string content;
    if (!fs::ReadFile(path, content)) {
        throw ProofError::IoError("cannot read verification key", path);
    }

    auto json = JSONValue::TryParse(content);
    if (!json) {
        throw ProofError::SerializationError("verification key is not valid JSON: " + path);
    }

    VerificationKey vk = VerificationKeyFromJSON(*json, PublicInputCount(kind));
    LOG_DEBUG(util::LogCategory::KEYS) << "Loaded verification key for " << CircuitName(kind);
    return vk;
}

ProvingKey KeyStore::Setup(CircuitKind kind) const {
    InitCurveParams();
    VERISCORE_LOG_TIMER(timer, util::LogCategory::KEYS,
                        std::string("setup ") + CircuitName(kind));

    ConstraintSystem cs = ConstraintSystemFor(kind);
    timer.Phase("constraints");

    std::unique_ptr<libsnark::r1cs_gg_ppzksnark_keypair<CurvePP>> keypair;
    try {
        keypair = std::make_unique<libsnark::r1cs_gg_ppzksnark_keypair<CurvePP>>(
            libsnark::r1cs_gg_ppzksnark_generator<CurvePP>(cs));
    } catch (const std::exception& e) {
        throw ProofError::SetupError(std::string("key generation failed: ") + e.what());
    }
    timer.Phase("generator");

    const std::string dir = CircuitDir(kind);
    if (!fs::CreateDirectories(dir)) {
        throw ProofError::IoError("cannot create circuit directory", dir);
    }

    std::ostringstream pkStream;
    pkStream << keypair->pk;
    if (!fs::WriteFileAtomic(ProvingKeyPath(kind), pkStream.str())) {
        throw ProofError::IoError("cannot write proving key", ProvingKeyPath(kind));
    }

    const std::string vkJson = VerificationKeyToJSON(keypair->pk, keypair->vk).ToJSON(true);
    if (!fs::WriteFileAtomic(VerificationKeyPath(kind), vkJson)) {
        throw ProofError::IoError("cannot write verification key", VerificationKeyPath(kind));
    }

    LOG_INFO(util::LogCategory::KEYS) << "Setup complete for " << CircuitName(kind) << ": "
                                      << cs.num_constraints() << " constraints, "
                                      << cs.num_inputs() << " public inputs";
    return std::move(keypair->pk);
}

void KeyStore::SetupAll() const {
    for (CircuitKind kind : ALL_CIRCUIT_KINDS) {
        Setup(kind);
    }
}

} // namespace veriscore
