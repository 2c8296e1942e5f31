// VERISCORE - Error Types Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/core/error.h"

namespace veriscore {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::CircuitNotFound:       return "CircuitNotFound";
        case ErrorCode::InvalidInput:          return "InvalidInput";
        case ErrorCode::ScoreOutOfRange:       return "ScoreOutOfRange";
        case ErrorCode::ThresholdNotMet:       return "ThresholdNotMet";
        case ErrorCode::InvalidTier:           return "InvalidTier";
        case ErrorCode::WitnessError:          return "WitnessError";
        case ErrorCode::SynthesisError:        return "SynthesisError";
        case ErrorCode::SetupError:            return "SetupError";
        case ErrorCode::ProofGenerationFailed: return "ProofGenerationFailed";
        case ErrorCode::VerificationFailed:    return "VerificationFailed";
        case ErrorCode::InvalidProofFormat:    return "InvalidProofFormat";
        case ErrorCode::SerializationError:    return "SerializationError";
        case ErrorCode::IoError:               return "IoError";
        case ErrorCode::CryptographicError:    return "CryptographicError";
    }
    return "Unknown";
}

ProofError::ProofError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

ProofError ProofError::CircuitNotFound(const std::string& path) {
    ProofError err(ErrorCode::CircuitNotFound, "Circuit file not found: " + path);
    err.path_ = path;
    return err;
}

ProofError ProofError::InvalidInput(const std::string& field, const std::string& value,
                                    const std::string& expected) {
    ProofError err(ErrorCode::InvalidInput,
                   "Invalid input: " + field + " = " + value + " (expected " + expected + ")");
    err.field_ = field;
    err.value_ = value;
    err.expected_ = expected;
    return err;
}

ProofError ProofError::ScoreOutOfRange(Score score) {
    ProofError err(ErrorCode::ScoreOutOfRange,
                   "Score " + std::to_string(score) + " out of valid range [0, " +
                   std::to_string(MAX_SCORE) + "]");
    err.field_ = "score";
    err.value_ = std::to_string(score);
    err.expected_ = "0-" + std::to_string(MAX_SCORE);
    return err;
}

ProofError ProofError::ThresholdNotMet(Score score, Score threshold) {
    ProofError err(ErrorCode::ThresholdNotMet,
                   "Score " + std::to_string(score) + " does not meet threshold " +
                   std::to_string(threshold));
    err.field_ = "score";
    err.value_ = std::to_string(score);
    err.expected_ = ">= " + std::to_string(threshold);
    return err;
}

ProofError ProofError::InvalidTier(uint64_t tier) {
    ProofError err(ErrorCode::InvalidTier,
                   "Invalid tier: " + std::to_string(tier) + " (expected 1-" +
                   std::to_string(NUM_TIERS) + ")");
    err.field_ = "target_tier";
    err.value_ = std::to_string(tier);
    err.expected_ = "1-" + std::to_string(NUM_TIERS);
    return err;
}

ProofError ProofError::WitnessError(const std::string& reason) {
    ProofError err(ErrorCode::WitnessError, "Witness generation failed: " + reason);
    err.reason_ = reason;
    return err;
}

ProofError ProofError::SynthesisError(const std::string& reason) {
    ProofError err(ErrorCode::SynthesisError, "Circuit synthesis failed: " + reason);
    err.reason_ = reason;
    return err;
}

ProofError ProofError::SetupError(const std::string& reason, const std::string& path) {
    std::string message = "Setup failed: " + reason;
    if (!path.empty()) {
        message += " (" + path + ")";
    }
    ProofError err(ErrorCode::SetupError, message);
    err.reason_ = reason;
    err.path_ = path;
    return err;
}

ProofError ProofError::ProofGenerationFailed(const std::string& reason) {
    ProofError err(ErrorCode::ProofGenerationFailed, "Proof generation failed: " + reason);
    err.reason_ = reason;
    return err;
}

ProofError ProofError::VerificationFailed(const std::string& reason) {
    ProofError err(ErrorCode::VerificationFailed, "Verification failed: " + reason);
    err.reason_ = reason;
    return err;
}

ProofError ProofError::InvalidProofFormat(const std::string& reason) {
    ProofError err(ErrorCode::InvalidProofFormat, "Invalid proof format: " + reason);
    err.reason_ = reason;
    return err;
}

ProofError ProofError::SerializationError(const std::string& reason) {
    ProofError err(ErrorCode::SerializationError, "Serialization error: " + reason);
    err.reason_ = reason;
    return err;
}

ProofError ProofError::IoError(const std::string& reason, const std::string& path) {
    ProofError err(ErrorCode::IoError, "IO error: " + reason + " (" + path + ")");
    err.reason_ = reason;
    err.path_ = path;
    return err;
}

ProofError ProofError::CryptographicError(const std::string& reason) {
    ProofError err(ErrorCode::CryptographicError, "Cryptographic error: " + reason);
    err.reason_ = reason;
    return err;
}

} // namespace veriscore
