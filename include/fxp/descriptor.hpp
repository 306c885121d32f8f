/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>

namespace fxp {

__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;

/**
 * Compile-time description of a fixed-point type.
 *
 * - shift:     real value = stored integer * 2^shift
 * - bits:      upper bound on the magnitude of the stored integer,
 *              |stored| <= 2^bits - 1 (bits == 0 means the value is exactly 0)
 * - is_signed: whether the stored integer may be negative
 *
 * A descriptor has no runtime footprint inside fixed<>; it only exists to
 * derive result types and storage.
 */
struct descriptor {
    int shift;
    unsigned bits;
    bool is_signed;
};

constexpr bool operator==(const descriptor& a, const descriptor& b) {
    return a.shift == b.shift && a.bits == b.bits && a.is_signed == b.is_signed;
}

constexpr bool operator!=(const descriptor& a, const descriptor& b) {
    return !(a == b);
}

namespace detail {

constexpr unsigned umax(unsigned a, unsigned b) { return a > b ? a : b; }
constexpr int imin(int a, int b) { return a < b ? a : b; }

// Number of significant bits in v (0 for v == 0).
constexpr unsigned bit_length(uint128_t v) {
    unsigned n = 0;
    while (v != 0) {
        v >>= 1;
        ++n;
    }
    return n;
}

// Smallest k with 2^k >= v (v >= 1).
constexpr unsigned ceil_log2(uint128_t v) {
    return v <= 1 ? 0 : bit_length(v - 1);
}

constexpr uint128_t gcd(uint128_t a, uint128_t b) {
    while (b != 0) {
        const uint128_t t = a % b;
        a = b;
        b = t;
    }
    return a;
}

constexpr bool is_pow2(uint128_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

// |v| without overflowing on the most negative value.
constexpr uint128_t magnitude(int128_t v) {
    return v < 0 ? uint128_t(0) - static_cast<uint128_t>(v) : static_cast<uint128_t>(v);
}

} // namespace detail

} // namespace fxp
