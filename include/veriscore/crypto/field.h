// VERISCORE - Finite Field Helpers
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// BN254 (alt_bn128) types from libff and the conversions the rest of the
// code needs: decimal strings, 32-byte little-endian encodings and GMP
// integers. Arithmetic itself is libff's.
//
// libff keeps Montgomery constants in globals that must be initialized
// before any field element is created; every entry point of this library
// calls InitCurveParams() for that reason.

#ifndef VERISCORE_CRYPTO_FIELD_H
#define VERISCORE_CRYPTO_FIELD_H

#include "veriscore/core/types.h"

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <gmpxx.h>

#include <array>
#include <optional>
#include <string>

namespace veriscore {

// ============================================================================
// Curve Types
// ============================================================================

using CurvePP = libff::alt_bn128_pp;

/// Scalar field of BN254; circuit variables and public inputs live here
using FieldElement = libff::Fr<CurvePP>;

/// Base field and its quadratic extension (group coordinates)
using BaseField = libff::alt_bn128_Fq;
using BaseField2 = libff::alt_bn128_Fq2;

using G1Point = libff::G1<CurvePP>;
using G2Point = libff::G2<CurvePP>;
using GTElement = libff::GT<CurvePP>;

/// Encoded size of a field element
constexpr size_t FIELD_BYTES = 32;

/// Initialize libff curve parameters (idempotent, thread-safe).
/// Also silences libff's profiling output.
void InitCurveParams();

// ============================================================================
// GMP Conversions
// ============================================================================

/// Field modulus as a GMP integer
template<typename FieldT>
mpz_class FieldModulus() {
    mpz_class out;
    FieldT::field_char().to_mpz(out.get_mpz_t());
    return out;
}

/// Canonical integer value of a field element
template<typename FieldT>
mpz_class FieldToMpz(const FieldT& value) {
    mpz_class out;
    value.as_bigint().to_mpz(out.get_mpz_t());
    return out;
}

/// Field element from an integer, reduced modulo the field order
template<typename FieldT>
FieldT FieldFromMpz(const mpz_class& value) {
    InitCurveParams();
    mpz_class reduced = value % FieldModulus<FieldT>();
    if (reduced < 0) {
        reduced += FieldModulus<FieldT>();
    }
    return FieldT(libff::bigint<FieldT::num_limbs>(reduced.get_mpz_t()));
}

// ============================================================================
// Scalar Field Conversions
// ============================================================================

FieldElement FieldFromUint64(uint64_t value);

/// Parse an unsigned decimal string; the value is reduced modulo the order.
/// @throws ProofError(CryptographicError) if the string is not decimal
FieldElement FieldFromDecimal(const std::string& decimal);

/// Non-throwing variant of FieldFromDecimal
std::optional<FieldElement> TryFieldFromDecimal(const std::string& decimal);

/// True if every character is a decimal digit and the string is non-empty
bool IsDecimalString(const std::string& str);

/// Canonical decimal representation
std::string FieldToDecimal(const FieldElement& value);

/// Decimal representation of any libff prime field element
template<typename FieldT>
std::string ToDecimal(const FieldT& value) {
    return FieldToMpz(value).get_str(10);
}

/// 32-byte little-endian canonical encoding
std::array<Byte, FIELD_BYTES> FieldToBytesLE(const FieldElement& value);

/// Inverse of FieldToBytesLE; nullopt for values >= modulus
std::optional<FieldElement> FieldFromBytesLE(const Byte* data);

/// Little-endian encoding of an integer into exactly FIELD_BYTES bytes
void MpzToBytesLE(const mpz_class& value, Byte* out);

/// Integer from FIELD_BYTES little-endian bytes
mpz_class MpzFromBytesLE(const Byte* data);

} // namespace veriscore

#endif // VERISCORE_CRYPTO_FIELD_H
