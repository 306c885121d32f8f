/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <limits>

#include <fxp/descriptor.hpp>
#include <fxp/storage.hpp>

/**
 * Operation algebra.
 *
 * Every rule maps operand descriptors to a result descriptor. Rules are
 * sound: the result bits are never below the worst-case magnitude the
 * operation can produce. The template operators and the runtime plan auditor
 * both call these functions, so there is only one definition of each rule.
 */
namespace fxp::rules {

using fxp::fits;

// Shifts are int template arguments. A derived shift outside int is not a
// constant expression, so callers working at runtime widen first and check.
constexpr bool shift_fits(long long s) {
    return s >= std::numeric_limits<int>::min() && s <= std::numeric_limits<int>::max();
}

// Realignment moves a value to a finer (smaller) shift by multiplying its
// stored integer by 2^(d.shift - to_shift). Coarser targets would divide.
constexpr bool can_rescale(const descriptor& d, int to_shift) {
    return to_shift <= d.shift;
}

constexpr descriptor rescale(const descriptor& d, int to_shift) {
    return {to_shift,
            d.bits == 0 ? 0u : d.bits + static_cast<unsigned>(d.shift - to_shift),
            d.is_signed};
}

// Common type two operands are realigned to before they are combined. An
// exact zero carries no scale, so it adopts the other operand's shift.
constexpr descriptor common(const descriptor& a, const descriptor& b) {
    const bool is_signed = a.is_signed || b.is_signed;
    if (a.bits == 0 && b.bits != 0) return {b.shift, b.bits, is_signed};
    if (b.bits == 0) return {a.bits == 0 ? detail::imin(a.shift, b.shift) : a.shift, a.bits, is_signed};
    const int s = detail::imin(a.shift, b.shift);
    return {s, detail::umax(rescale(a, s).bits, rescale(b, s).bits), is_signed};
}

// One carry bit over the wider realigned operand; an exact zero operand
// contributes nothing.
constexpr descriptor add(const descriptor& a, const descriptor& b) {
    const descriptor c = common(a, b);
    if (a.bits == 0 || b.bits == 0) return c;
    return {c.shift, c.bits + 1, c.is_signed};
}

// Differences are always signed, even for unsigned operands.
constexpr descriptor sub(const descriptor& a, const descriptor& b) {
    const descriptor c = common(a, b);
    if (a.bits == 0 || b.bits == 0) return {c.shift, c.bits, true};
    return {c.shift, c.bits + 1, true};
}

constexpr descriptor mul(const descriptor& a, const descriptor& b) {
    const bool is_signed = a.is_signed || b.is_signed;
    if (a.bits == 0 || b.bits == 0) return {a.shift + b.shift, 0, is_signed};
    return {a.shift + b.shift, a.bits + b.bits, is_signed};
}

// Magnitudes are symmetric, so negation keeps the bit count.
constexpr descriptor neg(const descriptor& a) {
    return {a.shift, a.bits, true};
}

constexpr descriptor abs(const descriptor& a) {
    return {a.shift, a.bits, false};
}

// Logical shifts change the scale only; the stored integer is untouched.
constexpr descriptor shl(const descriptor& a, unsigned k) {
    return {a.shift + static_cast<int>(k), a.bits, a.is_signed};
}

constexpr descriptor shr(const descriptor& a, unsigned k) {
    return {a.shift - static_cast<int>(k), a.bits, a.is_signed};
}

// Stored-integer shifts keep the value; raw_shr drops the k low bits.
constexpr descriptor raw_shl(const descriptor& a, unsigned k) {
    return rescale(a, a.shift - static_cast<int>(k));
}

constexpr descriptor raw_shr(const descriptor& a, unsigned k) {
    return {a.shift + static_cast<int>(k), a.bits > k ? a.bits - k : 0u, a.is_signed};
}

constexpr descriptor mul_const(const descriptor& a, int128_t v) {
    const bool is_signed = a.is_signed || v < 0;
    if (v == 0 || a.bits == 0) return {a.shift, 0, is_signed};
    return {a.shift, a.bits + detail::ceil_log2(detail::magnitude(v)), is_signed};
}

// Exact division needs a power-of-two divisor: it becomes a scale change.
constexpr bool can_div_exact(int128_t v) {
    return detail::is_pow2(detail::magnitude(v));
}

constexpr descriptor div_exact(const descriptor& a, int128_t v) {
    const int k = static_cast<int>(detail::bit_length(detail::magnitude(v))) - 1;
    return {a.shift - k, a.bits, a.is_signed || v < 0};
}

constexpr bool can_div_const_trunc(int128_t v) {
    return v != 0;
}

// |a| <= 2^bits - 1 and |v| >= 2^(L-1) give |a / v| < 2^(bits - L + 1).
constexpr descriptor div_const_trunc(const descriptor& a, int128_t v) {
    const unsigned len = detail::bit_length(detail::magnitude(v));
    const unsigned bound = a.bits + 1;
    return {a.shift, bound > len ? bound - len : 0u, a.is_signed || v < 0};
}

// Exponent e such that target_raw = trunc(a_raw * 2^e / b_raw).
constexpr int div_trunc_exponent(const descriptor& a, const descriptor& b, int target_shift) {
    return a.shift - b.shift - target_shift;
}

// Worst-case quotient bits for a truncating division into target_shift
// (the smallest nonzero divisor is one stored unit).
constexpr unsigned div_trunc_bound(const descriptor& a, const descriptor& b, int target_shift) {
    const int e = div_trunc_exponent(a, b, target_shift);
    if (a.bits == 0) return 0;
    if (e >= 0) return a.bits + static_cast<unsigned>(e);
    const unsigned drop = static_cast<unsigned>(-e);
    return a.bits > drop ? a.bits - drop : 0u;
}

// Working type for the truncating division: holds the scaled dividend and
// the scaled divisor at once.
constexpr descriptor div_trunc_work(const descriptor& a, const descriptor& b, int target_shift) {
    const int e = div_trunc_exponent(a, b, target_shift);
    const unsigned num = a.bits == 0 ? 0u : a.bits + (e > 0 ? static_cast<unsigned>(e) : 0u);
    const unsigned den = b.bits + (e < 0 ? static_cast<unsigned>(-e) : 0u);
    return {0, detail::umax(num, den), a.is_signed || b.is_signed};
}

constexpr bool can_div_trunc(const descriptor& a, const descriptor& b, const descriptor& target) {
    return target.bits >= div_trunc_bound(a, b, target.shift) &&
           (target.is_signed || !(a.is_signed || b.is_signed));
}

// Balanced accumulation of n realigned values: ceil(log2 n) carry bits.
constexpr descriptor sum(const descriptor* ds, std::size_t n) {
    descriptor acc{0, 0, false};
    bool any_nonzero = false;
    std::size_t nonzero = 0;
    for (std::size_t i = 0; i < n; ++i) {
        acc.is_signed = acc.is_signed || ds[i].is_signed;
        if (ds[i].bits == 0) continue;
        acc.shift = any_nonzero ? detail::imin(acc.shift, ds[i].shift) : ds[i].shift;
        any_nonzero = true;
        ++nonzero;
    }
    if (!any_nonzero) return acc;
    for (std::size_t i = 0; i < n; ++i) {
        if (ds[i].bits == 0) continue;
        acc.bits = detail::umax(acc.bits, rescale(ds[i], acc.shift).bits);
    }
    acc.bits += detail::ceil_log2(nonzero);
    return acc;
}

constexpr descriptor sum(std::initializer_list<descriptor> ds) {
    return sum(ds.begin(), ds.size());
}

// Same descriptor repeated n times.
constexpr descriptor sum_n(const descriptor& d, std::size_t n) {
    if (n == 0) return {0, 0, false};
    if (d.bits == 0) return d;
    return {d.shift, d.bits + detail::ceil_log2(n), d.is_signed};
}

// A conversion is lossless when the target is at least as fine, has room
// for the realigned bits, and does not drop a sign.
constexpr bool converts_losslessly(const descriptor& from, const descriptor& to) {
    if (from.bits == 0) return true;
    return can_rescale(from, to.shift) && rescale(from, to.shift).bits <= to.bits &&
           (to.is_signed || !from.is_signed);
}

} // namespace fxp::rules
