// VERISCORE - Secure Random Number Generation Header
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Kernel entropy for commitment salts and temporary file names.

#ifndef VERISCORE_CORE_RANDOM_H
#define VERISCORE_CORE_RANDOM_H

#include "veriscore/core/types.h"

#include <cstdint>

namespace veriscore {

/// Fill len bytes from getrandom(2), retrying short reads and EINTR
/// @throws std::system_error if the kernel refuses
void GetRandBytes(Byte* buf, size_t len);

/// len fresh random bytes
Bytes RandomBytes(size_t len);

uint64_t GetRandUint64();

} // namespace veriscore

#endif // VERISCORE_CORE_RANDOM_H
