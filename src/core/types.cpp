// VERISCORE - Core Types Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/core/types.h"

namespace veriscore {

const char* CircuitName(CircuitKind kind) {
    switch (kind) {
        case CircuitKind::Threshold: return "compliance_threshold";
        case CircuitKind::Range:     return "range_proof";
        case CircuitKind::Tier:      return "tier_membership";
    }
    return "unknown";
}

std::optional<CircuitKind> CircuitKindFromName(const std::string& name) {
    for (CircuitKind kind : ALL_CIRCUIT_KINDS) {
        if (name == CircuitName(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<CircuitKind> CircuitKindFromByte(uint8_t value) {
    for (CircuitKind kind : ALL_CIRCUIT_KINDS) {
        if (static_cast<uint8_t>(kind) == value) {
            return kind;
        }
    }
    return std::nullopt;
}

size_t PublicInputCount(CircuitKind kind) {
    switch (kind) {
        case CircuitKind::Threshold: return 3;  // threshold, entity_hash, commitment
        case CircuitKind::Range:     return 4;  // min, max, entity_hash, commitment
        case CircuitKind::Tier:      return 3;  // target_tier, entity_hash, commitment
    }
    return 0;
}

} // namespace veriscore
