// VERISCORE - Finite Field Helpers Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/crypto/field.h"
#include "veriscore/core/error.h"

#include <libff/common/profiling.hpp>

#include <cstring>
#include <mutex>

namespace veriscore {

void InitCurveParams() {
    static std::once_flag initFlag;
    std::call_once(initFlag, []() {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        CurvePP::init_public_params();
    });
}

FieldElement FieldFromUint64(uint64_t value) {
    InitCurveParams();
    mpz_class v;
    mpz_import(v.get_mpz_t(), 1, -1, sizeof(value), 0, 0, &value);
    return FieldFromMpz<FieldElement>(v);
}

bool IsDecimalString(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

std::optional<FieldElement> TryFieldFromDecimal(const std::string& decimal) {
    if (!IsDecimalString(decimal)) {
        return std::nullopt;
    }
    return FieldFromMpz<FieldElement>(mpz_class(decimal, 10));
}

FieldElement FieldFromDecimal(const std::string& decimal) {
    auto value = TryFieldFromDecimal(decimal);
    if (!value) {
        throw ProofError::CryptographicError("not a decimal field element: '" + decimal + "'");
    }
    return *value;
}

std::string FieldToDecimal(const FieldElement& value) {
    return ToDecimal(value);
}

void MpzToBytesLE(const mpz_class& value, Byte* out) {
    std::memset(out, 0, FIELD_BYTES);
    if (mpz_sizeinbase(value.get_mpz_t(), 256) > FIELD_BYTES) {
        throw ProofError::CryptographicError("integer does not fit in 32 bytes");
    }
    size_t count = 0;
    mpz_export(out, &count, -1, 1, 0, 0, value.get_mpz_t());
}

mpz_class MpzFromBytesLE(const Byte* data) {
    mpz_class out;
    mpz_import(out.get_mpz_t(), FIELD_BYTES, -1, 1, 0, 0, data);
    return out;
}

std::array<Byte, FIELD_BYTES> FieldToBytesLE(const FieldElement& value) {
    std::array<Byte, FIELD_BYTES> out{};
    MpzToBytesLE(FieldToMpz(value), out.data());
    return out;
}

std::optional<FieldElement> FieldFromBytesLE(const Byte* data) {
    mpz_class v = MpzFromBytesLE(data);
    if (v >= FieldModulus<FieldElement>()) {
        return std::nullopt;
    }
    return FieldFromMpz<FieldElement>(v);
}

} // namespace veriscore
