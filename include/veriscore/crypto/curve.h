// VERISCORE - Curve Point Encodings
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Encodings of BN254 group elements shared by the proof codec and the
// verification key store:
//
//  - decimal coordinate arrays as written by snarkjs ("projective" form with
//    z = 1, point at infinity as ["0", "1", "0"])
//  - canonical compressed bytes: little-endian x, flags in the top two bits
//    of the last byte (bit 7: y is the larger of the two roots, bit 6: point
//    at infinity). G1 takes 32 bytes, G2 64 bytes (x.c0 then x.c1).

#ifndef VERISCORE_CRYPTO_CURVE_H
#define VERISCORE_CRYPTO_CURVE_H

#include "veriscore/crypto/field.h"
#include "veriscore/util/json.h"

#include <array>
#include <optional>

namespace veriscore {

constexpr size_t G1_COMPRESSED_SIZE = 32;
constexpr size_t G2_COMPRESSED_SIZE = 64;

// ============================================================================
// Affine Coordinates
// ============================================================================

/// Affine coordinates as decimal strings ("0","0" for infinity)
struct G1Coords {
    std::string x;
    std::string y;
};

/// Affine coordinates of a G2 point, each coordinate as (c0, c1)
struct G2Coords {
    std::array<std::string, 2> x;
    std::array<std::string, 2> y;
};

G1Coords G1ToCoords(const G1Point& point);
G2Coords G2ToCoords(const G2Point& point);

// ============================================================================
// snarkjs JSON Form
// ============================================================================

util::JSONValue G1ToJSON(const G1Point& point);
util::JSONValue G2ToJSON(const G2Point& point);

/// vk_alphabeta_12 layout: 2 x 3 x 2 decimal strings
util::JSONValue GTToJSON(const GTElement& element);

/**
 * Parse a G1 point from its snarkjs array.
 *
 * @throws ProofError(SerializationError) if the value does not have the
 *         expected shape or holds non-decimal strings
 * @return nullopt if the coordinates are non-canonical or off the curve
 */
std::optional<G1Point> G1FromJSON(const util::JSONValue& value);

/// G2 counterpart of G1FromJSON; also rejects points outside the subgroup
std::optional<G2Point> G2FromJSON(const util::JSONValue& value);

/// True if value is a 2 x 3 x 2 array of decimal strings
bool IsGTShape(const util::JSONValue& value);

// ============================================================================
// Compressed Bytes
// ============================================================================

std::array<Byte, G1_COMPRESSED_SIZE> CompressG1(const G1Point& point);
std::array<Byte, G2_COMPRESSED_SIZE> CompressG2(const G2Point& point);

/// Decode G1_COMPRESSED_SIZE bytes; nullopt if malformed or not on the curve
std::optional<G1Point> DecompressG1(const Byte* data);

/// Decode G2_COMPRESSED_SIZE bytes; nullopt if malformed, not on the curve
/// or not in the prime-order subgroup
std::optional<G2Point> DecompressG2(const Byte* data);

} // namespace veriscore

#endif // VERISCORE_CRYPTO_CURVE_H
