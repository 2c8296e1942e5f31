// VERISCORE - Error Types
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Every failure raised by the library is a ProofError carrying an ErrorCode
// plus the structured context needed to act on it: the offending field and
// value, the expected bound, or the missing file path.
//
// A proof that is well formed but does not satisfy its statement is not an
// error; verification returns false for it.

#ifndef VERISCORE_CORE_ERROR_H
#define VERISCORE_CORE_ERROR_H

#include "veriscore/core/types.h"

#include <stdexcept>
#include <string>

namespace veriscore {

enum class ErrorCode {
    /// Missing build directory, key or circuit file
    CircuitNotFound,
    /// Input field outside its domain
    InvalidInput,
    /// Score above MAX_SCORE
    ScoreOutOfRange,
    /// Score below the claimed threshold
    ThresholdNotMet,
    /// Target tier outside 1..NUM_TIERS
    InvalidTier,
    /// Witness could not be computed from the signal map
    WitnessError,
    /// A gadget value does not fit its constraint shape
    SynthesisError,
    /// Key generation or key loading failed
    SetupError,
    /// Backend failure while proving
    ProofGenerationFailed,
    /// Backend failure while verifying (malformed key, library fault)
    VerificationFailed,
    /// Proof bytes, hex or artifact shape are malformed
    InvalidProofFormat,
    /// JSON or binary document could not be encoded or decoded
    SerializationError,
    /// Filesystem failure
    IoError,
    /// Field or curve library failure
    CryptographicError
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

/**
 * Exception type for all library failures.
 */
class ProofError : public std::runtime_error {
public:
    ProofError(ErrorCode code, const std::string& message);

    ErrorCode Code() const { return code_; }

    /// Offending input field (InvalidInput)
    const std::string& Field() const { return field_; }
    /// Offending value, rendered as text
    const std::string& Value() const { return value_; }
    /// Human-readable description of the accepted domain
    const std::string& Expected() const { return expected_; }
    /// File or directory involved (CircuitNotFound, IoError, SetupError)
    const std::string& Path() const { return path_; }
    /// Underlying cause reported by a library or subsystem
    const std::string& Reason() const { return reason_; }

    // Named constructors, one per kind
    static ProofError CircuitNotFound(const std::string& path);
    static ProofError InvalidInput(const std::string& field, const std::string& value,
                                   const std::string& expected);
    static ProofError ScoreOutOfRange(Score score);
    static ProofError ThresholdNotMet(Score score, Score threshold);
    static ProofError InvalidTier(uint64_t tier);
    static ProofError WitnessError(const std::string& reason);
    static ProofError SynthesisError(const std::string& reason);
    static ProofError SetupError(const std::string& reason, const std::string& path = "");
    static ProofError ProofGenerationFailed(const std::string& reason);
    static ProofError VerificationFailed(const std::string& reason);
    static ProofError InvalidProofFormat(const std::string& reason);
    static ProofError SerializationError(const std::string& reason);
    static ProofError IoError(const std::string& reason, const std::string& path);
    static ProofError CryptographicError(const std::string& reason);

private:
    ErrorCode code_;
    std::string field_;
    std::string value_;
    std::string expected_;
    std::string path_;
    std::string reason_;
};

} // namespace veriscore

#endif // VERISCORE_CORE_ERROR_H
