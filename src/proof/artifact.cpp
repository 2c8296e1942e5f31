// VERISCORE - Proof Artifact and Codec Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/proof/artifact.h"
#include "veriscore/core/error.h"
#include "veriscore/core/hex.h"
#include "veriscore/crypto/curve.h"
#include "veriscore/util/logging.h"

#include <sstream>

namespace veriscore {

using util::JSONValue;

namespace {

constexpr const char* PROTOCOL = "groth16";
constexpr const char* CURVE = "bn128";

[[noreturn]] void Reject(const ProofError& error) {
    LOG_DEBUG(util::LogCategory::CODEC) << "Rejected encoding: " << error.what();
    throw error;
}

const JSONValue& RequireKey(const JSONValue& json, const char* key) {
    if (!json.IsObject() || !json.HasKey(key)) {
        Reject(ProofError::SerializationError(std::string("missing field '") + key + "'"));
    }
    return json[key];
}

const std::string& RequireString(const JSONValue& json, const char* key) {
    const JSONValue& value = RequireKey(json, key);
    if (!value.IsString()) {
        Reject(ProofError::SerializationError(std::string("field '") + key +
                                              "' is not a string"));
    }
    return value.GetString();
}

/// Canonical scalar from a decimal string
FieldElement ParsePublicInput(const JSONValue& value) {
    if (!value.IsString() || !IsDecimalString(value.GetString())) {
        Reject(ProofError::SerializationError("public input is not a decimal string"));
    }
    const mpz_class integer(value.GetString(), 10);
    if (integer >= FieldModulus<FieldElement>()) {
        Reject(ProofError::InvalidProofFormat("public input " + value.GetString() +
                                              " exceeds the field modulus"));
    }
    return FieldFromMpz<FieldElement>(integer);
}

} // anonymous namespace

// ============================================================================
// CallData
// ============================================================================

std::string CallData::ToSolidityCall() const {
    std::ostringstream ss;
    ss << "verifyProof(\n"
       << "  [" << a[0] << ", " << a[1] << "],\n"
       << "  [[" << b[0][0] << ", " << b[0][1] << "], [" << b[1][0] << ", " << b[1][1] << "]],\n"
       << "  [" << c[0] << ", " << c[1] << "],\n"
       << "  [";
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << inputs[i];
    }
    ss << "]\n)";
    return ss.str();
}

JSONValue CallData::ToJSON() const {
    JSONValue::Object obj;
    obj["a"] = JSONValue::FromStrings({a[0], a[1]});
    JSONValue::Array bArr;
    bArr.push_back(JSONValue::FromStrings({b[0][0], b[0][1]}));
    bArr.push_back(JSONValue::FromStrings({b[1][0], b[1][1]}));
    obj["b"] = JSONValue(std::move(bArr));
    obj["c"] = JSONValue::FromStrings({c[0], c[1]});
    obj["inputs"] = JSONValue::FromStrings(inputs);
    return JSONValue(std::move(obj));
}

// ============================================================================
// Proof
// ============================================================================

Proof::Proof() {
    InitCurveParams();
    a_ = G1Point::zero();
    b_ = G2Point::zero();
    c_ = G1Point::zero();
}

Proof::Proof(const G1Point& a, const G2Point& b, const G1Point& c)
    : a_(a), b_(b), c_(c)
{
}

Proof Proof::FromBackend(const BackendProof& proof) {
    return Proof(proof.g_A, proof.g_B, proof.g_C);
}

BackendProof Proof::ToBackend() const {
    G1Point a(a_);
    G2Point b(b_);
    G1Point c(c_);
    return BackendProof(std::move(a), std::move(b), std::move(c));
}

Bytes Proof::ToBytes() const {
    Bytes out;
    out.reserve(SERIALIZED_SIZE);
    auto a = CompressG1(a_);
    auto b = CompressG2(b_);
    auto c = CompressG1(c_);
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    out.insert(out.end(), c.begin(), c.end());
    return out;
}

Proof Proof::FromBytes(const Bytes& data) {
    return FromBytes(data.data(), data.size());
}

Proof Proof::FromBytes(const Byte* data, size_t len) {
    if (len != SERIALIZED_SIZE) {
        Reject(ProofError::InvalidProofFormat("expected " + std::to_string(SERIALIZED_SIZE) +
                                              " proof bytes, got " + std::to_string(len)));
    }
    auto a = DecompressG1(data);
    if (!a) {
        Reject(ProofError::InvalidProofFormat("invalid G1 point A"));
    }
    auto b = DecompressG2(data + G1_COMPRESSED_SIZE);
    if (!b) {
        Reject(ProofError::InvalidProofFormat("invalid G2 point B"));
    }
    auto c = DecompressG1(data + G1_COMPRESSED_SIZE + G2_COMPRESSED_SIZE);
    if (!c) {
        Reject(ProofError::InvalidProofFormat("invalid G1 point C"));
    }
    return Proof(*a, *b, *c);
}

std::string Proof::ToHex() const {
    return BytesToHex(ToBytes());
}

Proof Proof::FromHex(const std::string& hex) {
    auto data = HexToBytes(hex);
    if (!data) {
        Reject(ProofError::InvalidProofFormat("proof hex is not an even-length hex string"));
    }
    return FromBytes(*data);
}

JSONValue Proof::ToJSON() const {
    JSONValue::Object obj;
    obj["pi_a"] = G1ToJSON(a_);
    obj["pi_b"] = G2ToJSON(b_);
    obj["pi_c"] = G1ToJSON(c_);
    obj["protocol"] = JSONValue(PROTOCOL);
    obj["curve"] = JSONValue(CURVE);
    return JSONValue(std::move(obj));
}

Proof Proof::FromJSON(const JSONValue& json) {
    const std::string& protocol = RequireString(json, "protocol");
    if (protocol != PROTOCOL) {
        Reject(ProofError::InvalidProofFormat("unsupported protocol '" + protocol + "'"));
    }
    const std::string& curve = RequireString(json, "curve");
    if (curve != CURVE) {
        Reject(ProofError::InvalidProofFormat("unsupported curve '" + curve + "'"));
    }

    auto a = G1FromJSON(RequireKey(json, "pi_a"));
    if (!a) {
        Reject(ProofError::InvalidProofFormat("pi_a is not a valid G1 point"));
    }
    auto b = G2FromJSON(RequireKey(json, "pi_b"));
    if (!b) {
        Reject(ProofError::InvalidProofFormat("pi_b is not a valid G2 point"));
    }
    auto c = G1FromJSON(RequireKey(json, "pi_c"));
    if (!c) {
        Reject(ProofError::InvalidProofFormat("pi_c is not a valid G1 point"));
    }
    return Proof(*a, *b, *c);
}

CallData Proof::ToCallData(const std::vector<FieldElement>& publicInputs) const {
    G1Coords a = G1ToCoords(a_);
    G2Coords b = G2ToCoords(b_);
    G1Coords c = G1ToCoords(c_);

    CallData out;
    out.a = {a.x, a.y};
    out.b = {{{b.x[1], b.x[0]}, {b.y[1], b.y[0]}}};
    out.c = {c.x, c.y};
    for (const auto& input : publicInputs) {
        out.inputs.push_back(FieldToDecimal(input));
    }
    return out;
}

bool Proof::operator==(const Proof& other) const {
    return a_ == other.a_ && b_ == other.b_ && c_ == other.c_;
}

// ============================================================================
// ProofArtifact
// ============================================================================

std::optional<FieldElement> ProofArtifact::ScoreCommitment() const {
    if (publicInputs.empty()) {
        return std::nullopt;
    }
    return publicInputs.back();
}

std::vector<std::string> ProofArtifact::PublicInputStrings() const {
    std::vector<std::string> out;
    out.reserve(publicInputs.size());
    for (const auto& input : publicInputs) {
        out.push_back(FieldToDecimal(input));
    }
    return out;
}

JSONValue ProofArtifact::PublicInputsToJSON() const {
    return JSONValue::FromStrings(PublicInputStrings());
}

JSONValue ProofArtifact::ToJSON() const {
    JSONValue::Object obj;
    obj["proof"] = proof.ToJSON();
    obj["public_inputs"] = PublicInputsToJSON();
    obj["circuit"] = JSONValue(CircuitName(kind));
    return JSONValue(std::move(obj));
}

ProofArtifact ProofArtifact::FromJSON(const JSONValue& json) {
    const std::string& circuit = RequireString(json, "circuit");
    auto kind = CircuitKindFromName(circuit);
    if (!kind) {
        Reject(ProofError::InvalidProofFormat("unknown circuit '" + circuit + "'"));
    }

    const JSONValue& inputs = RequireKey(json, "public_inputs");
    if (!inputs.IsArray()) {
        Reject(ProofError::SerializationError("field 'public_inputs' is not an array"));
    }

    ProofArtifact artifact;
    artifact.kind = *kind;
    artifact.proof = Proof::FromJSON(RequireKey(json, "proof"));
    for (const auto& input : inputs.GetArray()) {
        artifact.publicInputs.push_back(ParsePublicInput(input));
    }
    return artifact;
}

Bytes ProofArtifact::ToBytes() const {
    Bytes out;
    out.reserve(1 + 4 + publicInputs.size() * FIELD_BYTES + Proof::SERIALIZED_SIZE);
    out.push_back(static_cast<Byte>(kind));

    const uint32_t count = static_cast<uint32_t>(publicInputs.size());
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<Byte>((count >> (8 * i)) & 0xff));
    }
    for (const auto& input : publicInputs) {
        auto bytes = FieldToBytesLE(input);
        out.insert(out.end(), bytes.begin(), bytes.end());
    }

    Bytes proofBytes = proof.ToBytes();
    out.insert(out.end(), proofBytes.begin(), proofBytes.end());
    return out;
}

ProofArtifact ProofArtifact::FromBytes(const Bytes& data) {
    constexpr size_t HEADER_SIZE = 5;
    if (data.size() < HEADER_SIZE) {
        Reject(ProofError::InvalidProofFormat("artifact truncated"));
    }

    auto kind = CircuitKindFromByte(data[0]);
    if (!kind) {
        Reject(ProofError::InvalidProofFormat("unknown circuit tag " + std::to_string(data[0])));
    }

    uint32_t count = 0;
    for (int i = 0; i < 4; ++i) {
        count |= static_cast<uint32_t>(data[1 + i]) << (8 * i);
    }

    const size_t expected = HEADER_SIZE + static_cast<size_t>(count) * FIELD_BYTES +
                            Proof::SERIALIZED_SIZE;
    if (data.size() != expected) {
        Reject(ProofError::InvalidProofFormat("artifact of " + std::to_string(count) +
                                              " inputs expects " + std::to_string(expected) +
                                              " bytes, got " + std::to_string(data.size())));
    }

    ProofArtifact artifact;
    artifact.kind = *kind;
    size_t offset = HEADER_SIZE;
    for (uint32_t i = 0; i < count; ++i) {
        auto input = FieldFromBytesLE(data.data() + offset);
        if (!input) {
            Reject(ProofError::InvalidProofFormat("public input " + std::to_string(i) +
                                                  " exceeds the field modulus"));
        }
        artifact.publicInputs.push_back(*input);
        offset += FIELD_BYTES;
    }
    artifact.proof = Proof::FromBytes(data.data() + offset, Proof::SERIALIZED_SIZE);
    return artifact;
}

CallData ProofArtifact::ToCallData() const {
    return proof.ToCallData(publicInputs);
}

bool ProofArtifact::operator==(const ProofArtifact& other) const {
    return kind == other.kind && publicInputs == other.publicInputs && proof == other.proof;
}

} // namespace veriscore
