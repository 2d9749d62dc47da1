// Two's-complement 16-bit arithmetic helpers.
#pragma once

#include <cstdint>

namespace tinybasic {

// Reduce any integer modulo 2^16 into [-32768, 32767].
inline int16_t wrapInt16(int64_t value) {
    int64_t low = value & 0xFFFF;
    return static_cast<int16_t>(low >= 0x8000 ? low - 0x10000 : low);
}

inline int16_t addInt16(int16_t a, int16_t b) { return wrapInt16(int64_t{a} + b); }
inline int16_t subInt16(int16_t a, int16_t b) { return wrapInt16(int64_t{a} - b); }
inline int16_t mulInt16(int16_t a, int16_t b) { return wrapInt16(int64_t{a} * b); }
inline int16_t negInt16(int16_t a) { return wrapInt16(-int64_t{a}); }

// Truncates toward zero; -32768 / -1 wraps to -32768. Divisor must be non-zero.
inline int16_t divInt16(int16_t a, int16_t b) { return wrapInt16(int64_t{a} / b); }

} // namespace tinybasic
