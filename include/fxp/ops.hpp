/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <type_traits>

#include <fxp/fixed.hpp>
#include <fxp/rules.hpp>
#include <fxp/storage.hpp>

namespace fxp {

namespace detail {

// x's stored integer in storage T, realigned to `to_shift`.
template <class T, int S, unsigned B, bool G>
constexpr T aligned(const fixed<S, B, G>& x, int to_shift) {
    if constexpr (B == 0) {
        (void)x;
        (void)to_shift;
        return T(0);
    } else {
        return scale_up(static_cast<T>(x.raw()), static_cast<unsigned>(S - to_shift));
    }
}

template <class T>
constexpr uint128_t raw_magnitude(T raw) {
    if constexpr (integer_traits<T>::is_signed) {
        return magnitude(static_cast<int128_t>(raw));
    } else {
        return static_cast<uint128_t>(raw);
    }
}

// Orders m1 * 2^s1 against m2 * 2^s2. Only the coarser magnitude is
// shifted, and only while it stays below 2^128.
constexpr int compare_magnitudes(uint128_t m1, int s1, uint128_t m2, int s2) {
    if (m1 == 0 || m2 == 0) return m1 == m2 ? 0 : (m1 == 0 ? -1 : 1);
    if (s1 < s2) return -compare_magnitudes(m2, s2, m1, s1);
    const long long d = static_cast<long long>(s1) - s2;
    if (static_cast<long long>(bit_length(m1)) + d > 128) return 1;
    const uint128_t x = m1 << d;
    return x < m2 ? -1 : (m2 < x ? 1 : 0);
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr int compare(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    constexpr descriptor c = rules::common(fixed<S1, B1, G1>::desc, fixed<S2, B2, G2>::desc);
    if constexpr (fits(c)) {
        using T = storage_t<c.bits, c.is_signed>;
        const T x = aligned<T>(a, c.shift);
        const T y = aligned<T>(b, c.shift);
        return x < y ? -1 : (y < x ? 1 : 0);
    } else {
        // No storage holds both realigned; order by sign, then magnitude.
        bool neg_a = false;
        bool neg_b = false;
        if constexpr (G1) neg_a = a.raw() < 0;
        if constexpr (G2) neg_b = b.raw() < 0;
        if (neg_a != neg_b) return neg_a ? -1 : 1;
        const int m = compare_magnitudes(raw_magnitude(a.raw()), S1, raw_magnitude(b.raw()), S2);
        return neg_a ? -m : m;
    }
}

} // namespace detail

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr auto operator+(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    constexpr descriptor d = rules::add(fixed<S1, B1, G1>::desc, fixed<S2, B2, G2>::desc);
    static_assert(fits(d), "fxp capacity error: sum needs more bits than the widest storage");
    using R = fixed<d.shift, d.bits, d.is_signed>;
    using T = typename R::storage_type;
    return R::from_raw_unchecked(
        static_cast<T>(detail::aligned<T>(a, d.shift) + detail::aligned<T>(b, d.shift)));
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr auto operator-(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    constexpr descriptor d = rules::sub(fixed<S1, B1, G1>::desc, fixed<S2, B2, G2>::desc);
    static_assert(fits(d), "fxp capacity error: difference needs more bits than the widest storage");
    using R = fixed<d.shift, d.bits, d.is_signed>;
    using T = typename R::storage_type;
    return R::from_raw_unchecked(
        static_cast<T>(detail::aligned<T>(a, d.shift) - detail::aligned<T>(b, d.shift)));
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr auto operator*(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    constexpr descriptor d = rules::mul(fixed<S1, B1, G1>::desc, fixed<S2, B2, G2>::desc);
    static_assert(fits(d), "fxp capacity error: product needs more bits than the widest storage");
    using R = fixed<d.shift, d.bits, d.is_signed>;
    using T = typename R::storage_type;
    if constexpr (d.bits == 0) {
        (void)a;
        (void)b;
        return R();
    } else {
        return R::from_raw_unchecked(static_cast<T>(static_cast<T>(a.raw()) * static_cast<T>(b.raw())));
    }
}

template <int S, unsigned B, bool G>
constexpr auto operator-(const fixed<S, B, G>& a) {
    constexpr descriptor d = rules::neg(fixed<S, B, G>::desc);
    static_assert(fits(d), "fxp capacity error: negation needs a signed storage wider than the table allows");
    using R = fixed<d.shift, d.bits, d.is_signed>;
    using T = typename R::storage_type;
    return R::from_raw_unchecked(static_cast<T>(-static_cast<T>(a.raw())));
}

template <int S, unsigned B, bool G>
constexpr fixed<S, B, G> operator+(const fixed<S, B, G>& a) {
    return a;
}

// Comparisons realign both operands to the finer shift; raw integers at
// different shifts are never compared directly. When no storage holds the
// realigned pair, operands are ordered by sign and magnitude instead, so
// any two fixed types compare.
template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr bool operator==(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    return detail::compare(a, b) == 0;
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr bool operator!=(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    return detail::compare(a, b) != 0;
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr bool operator<(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    return detail::compare(a, b) < 0;
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr bool operator<=(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    return detail::compare(a, b) <= 0;
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr bool operator>(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    return detail::compare(a, b) > 0;
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr bool operator>=(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    return detail::compare(a, b) >= 0;
}

// Compile-time shift amount for operator<< / operator>>: x << fxp::by<3>.
template <unsigned K>
using shift_amount = std::integral_constant<unsigned, K>;

template <unsigned K>
inline constexpr shift_amount<K> by{};

template <int S, unsigned B, bool G, unsigned K>
constexpr auto operator<<(const fixed<S, B, G>& a, shift_amount<K>) {
    return a.template shl<K>();
}

template <int S, unsigned B, bool G, unsigned K>
constexpr auto operator>>(const fixed<S, B, G>& a, shift_amount<K>) {
    return a.template shr<K>();
}

// min and max return the common realigned type, which must itself fit the
// widest storage; compare with < when it does not.
template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr auto min(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    constexpr descriptor c = rules::common(fixed<S1, B1, G1>::desc, fixed<S2, B2, G2>::desc);
    static_assert(fits(c), "fxp capacity error: min() result type exceeds the widest storage");
    using R = fixed<c.shift, c.bits, c.is_signed>;
    return b < a ? R(b) : R(a);
}

template <int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr auto max(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    constexpr descriptor c = rules::common(fixed<S1, B1, G1>::desc, fixed<S2, B2, G2>::desc);
    static_assert(fits(c), "fxp capacity error: max() result type exceeds the widest storage");
    using R = fixed<c.shift, c.bits, c.is_signed>;
    return a < b ? R(b) : R(a);
}

/**
 * Balanced sum of any number of fixed values. The result carries
 * ceil(log2 N) extra bits over the widest realigned operand, where repeated
 * binary + would add one bit per operand.
 */
template <class... Ts>
constexpr auto sum(const Ts&... xs) {
    static_assert(sizeof...(Ts) > 0, "sum() needs at least one operand");
    static_assert((is_fixed_v<Ts> && ...), "sum() operands must be fxp::fixed values");
    constexpr descriptor d = rules::sum({Ts::desc...});
    static_assert(fits(d), "fxp capacity error: sum() needs more bits than the widest storage");
    using R = fixed<d.shift, d.bits, d.is_signed>;
    using T = typename R::storage_type;
    return R::from_raw_unchecked(static_cast<T>((T(0) + ... + detail::aligned<T>(xs, d.shift))));
}

template <int S, unsigned B, bool G, std::size_t N>
constexpr auto sum(const std::array<fixed<S, B, G>, N>& xs) {
    constexpr descriptor d = rules::sum_n(fixed<S, B, G>::desc, N);
    static_assert(fits(d), "fxp capacity error: sum() needs more bits than the widest storage");
    using R = fixed<d.shift, d.bits, d.is_signed>;
    using T = typename R::storage_type;
    T acc = 0;
    for (const auto& x : xs) {
        acc = static_cast<T>(acc + static_cast<T>(x.raw()));
    }
    return R::from_raw_unchecked(acc);
}

/**
 * Runtime division into a caller-named Target type.
 *
 * LOSSY: the quotient is truncated toward zero at Target's shift. Target's
 * bits must cover the worst-case quotient (divisor of one stored unit), so
 * the high bits are never lost. Returns nullopt when b is zero.
 */
template <class Target, int S1, unsigned B1, bool G1, int S2, unsigned B2, bool G2>
constexpr std::optional<Target> div_trunc(const fixed<S1, B1, G1>& a, const fixed<S2, B2, G2>& b) {
    static_assert(is_fixed_v<Target>, "div_trunc<Target>: Target must be an fxp::fixed type");
    constexpr descriptor da = fixed<S1, B1, G1>::desc;
    constexpr descriptor db = fixed<S2, B2, G2>::desc;
    static_assert(rules::can_div_trunc(da, db, Target::desc),
                  "fxp capacity error: div_trunc<Target> cannot hold the worst-case quotient "
                  "(or drops the sign of a signed operand)");
    constexpr descriptor w = rules::div_trunc_work(da, db, Target::shift);
    static_assert(fits(w), "fxp capacity error: div_trunc intermediate exceeds the widest storage");
    using W = storage_t<w.bits, w.is_signed>;
    constexpr int e = rules::div_trunc_exponent(da, db, Target::shift);

    if (b.raw() == 0) return std::nullopt;
    W num = static_cast<W>(a.raw());
    W den = static_cast<W>(b.raw());
    if constexpr (e > 0) {
        num = detail::scale_up(num, static_cast<unsigned>(e));
    } else if constexpr (e < 0) {
        den = detail::scale_up(den, static_cast<unsigned>(-e));
    }
    return Target::from_raw_unchecked(static_cast<typename Target::storage_type>(num / den));
}

} // namespace fxp
