// VERISCORE - Curve Point Encodings Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/crypto/curve.h"
#include "veriscore/core/error.h"

#include <libff/algebra/curves/alt_bn128/alt_bn128_init.hpp>

#include <cstring>

namespace veriscore {

using util::JSONValue;

namespace {

constexpr Byte FLAG_LARGER_Y = 0x80;
constexpr Byte FLAG_INFINITY = 0x40;
constexpr Byte FLAG_MASK = FLAG_LARGER_Y | FLAG_INFINITY;

// ============================================================================
// Helpers
// ============================================================================

/// y > -y comparing canonical integers
bool IsLargerRoot(const BaseField& y) {
    return FieldToMpz(y) > FieldToMpz(-y);
}

/// Lexicographic order on (c1, c0)
bool IsLargerRoot(const BaseField2& y) {
    const BaseField2 neg = -y;
    const mpz_class c1 = FieldToMpz(y.c1);
    const mpz_class negC1 = FieldToMpz(neg.c1);
    if (c1 != negC1) {
        return c1 > negC1;
    }
    return FieldToMpz(y.c0) > FieldToMpz(neg.c0);
}

std::optional<BaseField> CanonicalBase(const mpz_class& value) {
    if (value >= FieldModulus<BaseField>()) {
        return std::nullopt;
    }
    return FieldFromMpz<BaseField>(value);
}

/// Decimal string at a JSON position
mpz_class ParseCoordinate(const JSONValue& value) {
    if (!value.IsString() || !IsDecimalString(value.GetString())) {
        throw ProofError::SerializationError("curve coordinate is not a decimal string");
    }
    return mpz_class(value.GetString(), 10);
}

void RequireArray(const JSONValue& value, size_t size, const char* what) {
    if (!value.IsArray() || value.Size() != size) {
        throw ProofError::SerializationError(std::string(what) + ": expected array of " +
                                             std::to_string(size) + " elements");
    }
}

std::optional<BaseField2> ParseBase2(const JSONValue& value) {
    RequireArray(value, 2, "Fq2 element");
    auto c0 = CanonicalBase(ParseCoordinate(value[0]));
    auto c1 = CanonicalBase(ParseCoordinate(value[1]));
    if (!c0 || !c1) {
        return std::nullopt;
    }
    return BaseField2(*c0, *c1);
}

JSONValue Base2ToJSON(const BaseField2& value) {
    return JSONValue::FromStrings({ToDecimal(value.c0), ToDecimal(value.c1)});
}

G1Point ToAffine(const G1Point& point) {
    G1Point copy(point);
    copy.to_affine_coordinates();
    return copy;
}

G2Point ToAffine(const G2Point& point) {
    G2Point copy(point);
    copy.to_affine_coordinates();
    return copy;
}

bool InPrimeSubgroup(const G2Point& point) {
    return (FieldElement::field_char() * point).is_zero();
}

/// Square root with the sign selected by the flag; nullopt for non-squares
template<typename FieldT>
std::optional<FieldT> RootWithSign(const FieldT& square, bool larger) {
    if (square.is_zero()) {
        if (larger) {
            return std::nullopt;
        }
        return square;
    }
    // sqrt() loops forever on non-residues
    if ((square ^ FieldT::euler) != FieldT::one()) {
        return std::nullopt;
    }
    FieldT root = square.sqrt();
    if (IsLargerRoot(root) != larger) {
        root = -root;
    }
    return root;
}

bool AllZero(const Byte* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (data[i] != 0) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Affine Coordinates
// ============================================================================

G1Coords G1ToCoords(const G1Point& point) {
    if (point.is_zero()) {
        return {"0", "0"};
    }
    G1Point affine = ToAffine(point);
    return {ToDecimal(affine.X), ToDecimal(affine.Y)};
}

G2Coords G2ToCoords(const G2Point& point) {
    if (point.is_zero()) {
        return {{"0", "0"}, {"0", "0"}};
    }
    G2Point affine = ToAffine(point);
    return {{ToDecimal(affine.X.c0), ToDecimal(affine.X.c1)},
            {ToDecimal(affine.Y.c0), ToDecimal(affine.Y.c1)}};
}

// ============================================================================
// snarkjs JSON Form
// ============================================================================

JSONValue G1ToJSON(const G1Point& point) {
    if (point.is_zero()) {
        return JSONValue::FromStrings({"0", "1", "0"});
    }
    G1Coords coords = G1ToCoords(point);
    return JSONValue::FromStrings({coords.x, coords.y, "1"});
}

JSONValue G2ToJSON(const G2Point& point) {
    JSONValue::Array out;
    if (point.is_zero()) {
        out.push_back(JSONValue::FromStrings({"0", "0"}));
        out.push_back(JSONValue::FromStrings({"1", "0"}));
        out.push_back(JSONValue::FromStrings({"0", "0"}));
        return JSONValue(std::move(out));
    }
    G2Point affine = ToAffine(point);
    out.push_back(Base2ToJSON(affine.X));
    out.push_back(Base2ToJSON(affine.Y));
    out.push_back(JSONValue::FromStrings({"1", "0"}));
    return JSONValue(std::move(out));
}

JSONValue GTToJSON(const GTElement& element) {
    JSONValue::Array out;
    for (const auto* half : {&element.c0, &element.c1}) {
        JSONValue::Array coeffs;
        coeffs.push_back(Base2ToJSON(half->c0));
        coeffs.push_back(Base2ToJSON(half->c1));
        coeffs.push_back(Base2ToJSON(half->c2));
        out.push_back(JSONValue(std::move(coeffs)));
    }
    return JSONValue(std::move(out));
}

std::optional<G1Point> G1FromJSON(const JSONValue& value) {
    InitCurveParams();
    RequireArray(value, 3, "G1 point");
    const mpz_class x = ParseCoordinate(value[0]);
    const mpz_class y = ParseCoordinate(value[1]);
    const mpz_class z = ParseCoordinate(value[2]);

    if (z == 0) {
        return G1Point::zero();
    }
    if (z != 1) {
        return std::nullopt;
    }
    auto fx = CanonicalBase(x);
    auto fy = CanonicalBase(y);
    if (!fx || !fy) {
        return std::nullopt;
    }
    G1Point point(*fx, *fy, BaseField::one());
    if (!point.is_well_formed()) {
        return std::nullopt;
    }
    return point;
}

std::optional<G2Point> G2FromJSON(const JSONValue& value) {
    InitCurveParams();
    RequireArray(value, 3, "G2 point");
    auto x = ParseBase2(value[0]);
    auto y = ParseBase2(value[1]);
    auto z = ParseBase2(value[2]);
    if (!x || !y || !z) {
        return std::nullopt;
    }

    if (z->is_zero()) {
        return G2Point::zero();
    }
    if (*z != BaseField2::one()) {
        return std::nullopt;
    }
    G2Point point(*x, *y, BaseField2::one());
    if (!point.is_well_formed() || !InPrimeSubgroup(point)) {
        return std::nullopt;
    }
    return point;
}

bool IsGTShape(const JSONValue& value) {
    if (!value.IsArray() || value.Size() != 2) {
        return false;
    }
    for (const auto& half : value.GetArray()) {
        if (!half.IsArray() || half.Size() != 3) {
            return false;
        }
        for (const auto& coeff : half.GetArray()) {
            if (!coeff.IsArray() || coeff.Size() != 2) {
                return false;
            }
            for (const auto& c : coeff.GetArray()) {
                if (!c.IsString() || !IsDecimalString(c.GetString())) {
                    return false;
                }
            }
        }
    }
    return true;
}

// ============================================================================
// Compressed Bytes
// ============================================================================

std::array<Byte, G1_COMPRESSED_SIZE> CompressG1(const G1Point& point) {
    std::array<Byte, G1_COMPRESSED_SIZE> out{};
    if (point.is_zero()) {
        out[G1_COMPRESSED_SIZE - 1] |= FLAG_INFINITY;
        return out;
    }
    G1Point affine = ToAffine(point);
    MpzToBytesLE(FieldToMpz(affine.X), out.data());
    if (IsLargerRoot(affine.Y)) {
        out[G1_COMPRESSED_SIZE - 1] |= FLAG_LARGER_Y;
    }
    return out;
}

std::array<Byte, G2_COMPRESSED_SIZE> CompressG2(const G2Point& point) {
    std::array<Byte, G2_COMPRESSED_SIZE> out{};
    if (point.is_zero()) {
        out[G2_COMPRESSED_SIZE - 1] |= FLAG_INFINITY;
        return out;
    }
    G2Point affine = ToAffine(point);
    MpzToBytesLE(FieldToMpz(affine.X.c0), out.data());
    MpzToBytesLE(FieldToMpz(affine.X.c1), out.data() + FIELD_BYTES);
    if (IsLargerRoot(affine.Y)) {
        out[G2_COMPRESSED_SIZE - 1] |= FLAG_LARGER_Y;
    }
    return out;
}

std::optional<G1Point> DecompressG1(const Byte* data) {
    InitCurveParams();
    std::array<Byte, G1_COMPRESSED_SIZE> buf;
    std::memcpy(buf.data(), data, buf.size());
    const Byte flags = buf.back() & FLAG_MASK;
    buf.back() &= static_cast<Byte>(~FLAG_MASK);

    if (flags == FLAG_MASK) {
        return std::nullopt;
    }
    if (flags == FLAG_INFINITY) {
        if (!AllZero(buf.data(), buf.size())) {
            return std::nullopt;
        }
        return G1Point::zero();
    }

    auto x = CanonicalBase(MpzFromBytesLE(buf.data()));
    if (!x) {
        return std::nullopt;
    }
    const BaseField rhs = (*x) * (*x) * (*x) + libff::alt_bn128_coeff_b;
    auto y = RootWithSign(rhs, flags == FLAG_LARGER_Y);
    if (!y) {
        return std::nullopt;
    }
    G1Point point(*x, *y, BaseField::one());
    if (!point.is_well_formed()) {
        return std::nullopt;
    }
    return point;
}

std::optional<G2Point> DecompressG2(const Byte* data) {
    InitCurveParams();
    std::array<Byte, G2_COMPRESSED_SIZE> buf;
    std::memcpy(buf.data(), data, buf.size());
    const Byte flags = buf.back() & FLAG_MASK;
    buf.back() &= static_cast<Byte>(~FLAG_MASK);

    if (flags == FLAG_MASK) {
        return std::nullopt;
    }
    if (flags == FLAG_INFINITY) {
        if (!AllZero(buf.data(), buf.size())) {
            return std::nullopt;
        }
        return G2Point::zero();
    }

    auto c0 = CanonicalBase(MpzFromBytesLE(buf.data()));
    auto c1 = CanonicalBase(MpzFromBytesLE(buf.data() + FIELD_BYTES));
    if (!c0 || !c1) {
        return std::nullopt;
    }
    const BaseField2 x(*c0, *c1);
    const BaseField2 rhs = x * x * x + libff::alt_bn128_twist_coeff_b;
    auto y = RootWithSign(rhs, flags == FLAG_LARGER_Y);
    if (!y) {
        return std::nullopt;
    }
    G2Point point(x, *y, BaseField2::one());
    if (!point.is_well_formed() || !InPrimeSubgroup(point)) {
        return std::nullopt;
    }
    return point;
}

} // namespace veriscore
