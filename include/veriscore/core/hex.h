// VERISCORE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Hex text for proof bytes and byte-oriented test vectors. Encoding is
// lowercase without a prefix; decoding accepts either case and an optional
// "0x".

#ifndef VERISCORE_CORE_HEX_H
#define VERISCORE_CORE_HEX_H

#include "veriscore/core/types.h"

#include <optional>
#include <string>

namespace veriscore {

std::string BytesToHex(const Byte* data, size_t len);
std::string BytesToHex(const Bytes& data);

/// nullopt on odd digit count or a non-hex character
std::optional<Bytes> HexToBytes(const std::string& hex);

/// Strip a leading "0x"/"0X"
std::string StripHexPrefix(const std::string& hex);

} // namespace veriscore

#endif // VERISCORE_CORE_HEX_H
