// VERISCORE - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/core/hex.h"

namespace veriscore {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

/// 0..15, or 16 for anything that is not a hex digit
Byte Nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<Byte>(c - '0');
    const char lower = static_cast<char>(c | 0x20);
    if (lower >= 'a' && lower <= 'f') return static_cast<Byte>(lower - 'a' + 10);
    return 16;
}

} // namespace

std::string StripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] | 0x20) == 'x') {
        return hex.substr(2);
    }
    return hex;
}

std::string BytesToHex(const Byte* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0x0f];
    }
    return out;
}

std::string BytesToHex(const Bytes& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<Bytes> HexToBytes(const std::string& hex) {
    const std::string digits = StripHexPrefix(hex);
    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }

    Bytes out(digits.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const Byte hi = Nibble(digits[2 * i]);
        const Byte lo = Nibble(digits[2 * i + 1]);
        if (hi > 15 || lo > 15) {
            return std::nullopt;
        }
        out[i] = static_cast<Byte>((hi << 4) | lo);
    }
    return out;
}

} // namespace veriscore
