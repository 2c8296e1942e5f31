// VERISCORE - Core Types Header
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Fundamental types shared by every module: bytes, scores and the three
// statement kinds with their fixed circuit names.

#ifndef VERISCORE_CORE_TYPES_H
#define VERISCORE_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veriscore {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Compliance score in basis points
using Score = uint64_t;

/// Highest valid score
constexpr Score MAX_SCORE = 10000;

/// Bit width that covers any difference in [0, MAX_SCORE] (2^14 = 16384)
constexpr size_t SCORE_BITS = 14;

/// Number of compliance tiers
constexpr unsigned NUM_TIERS = 5;

// ============================================================================
// Circuit Kinds
// ============================================================================

/// The three statement kinds, one circuit each
enum class CircuitKind : uint8_t {
    Threshold = 1,
    Range = 2,
    Tier = 3
};

constexpr std::array<CircuitKind, 3> ALL_CIRCUIT_KINDS = {
    CircuitKind::Threshold, CircuitKind::Range, CircuitKind::Tier
};

/// Fixed toolchain name ("compliance_threshold", "range_proof", "tier_membership")
const char* CircuitName(CircuitKind kind);

/// Inverse of CircuitName
std::optional<CircuitKind> CircuitKindFromName(const std::string& name);

/// Inverse of the numeric enum value
std::optional<CircuitKind> CircuitKindFromByte(uint8_t value);

/// Number of public inputs the circuit exposes (commitment included)
size_t PublicInputCount(CircuitKind kind);

} // namespace veriscore

#endif // VERISCORE_CORE_TYPES_H
