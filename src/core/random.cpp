// VERISCORE - Secure Random Number Generation Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/core/random.h"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <sys/random.h>

namespace veriscore {

void GetRandBytes(Byte* buf, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        const ssize_t got = getrandom(buf + filled, len - filled, 0);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "getrandom");
        }
        filled += static_cast<size_t>(got);
    }
}

Bytes RandomBytes(size_t len) {
    Bytes out(len);
    GetRandBytes(out.data(), out.size());
    return out;
}

uint64_t GetRandUint64() {
    Byte raw[sizeof(uint64_t)];
    GetRandBytes(raw, sizeof(raw));
    uint64_t value = 0;
    std::memcpy(&value, raw, sizeof(value));
    return value;
}

} // namespace veriscore
