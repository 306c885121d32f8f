/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <numeric>

#include <fxp/descriptor.hpp>

namespace fxp {

// Result of parsing a decimal string such as "2.375" into num/den.
struct parsed_decimal {
    bool ok;
    std::intmax_t num;
    std::intmax_t den;
    const char* error;
};

/**
 * Parse an optionally signed decimal ("-12.5", "0.125", "1'000") into an
 * exact fraction reduced to lowest terms. At most 18 significant digits,
 * so that num and den both fit std::intmax_t.
 */
constexpr parsed_decimal parse_decimal(const char* s, std::size_t n) {
    constexpr std::intmax_t limit = 100000000000000000;  // 1e17
    std::size_t i = 0;
    bool negative = false;
    if (i < n && (s[i] == '-' || s[i] == '+')) {
        negative = s[i] == '-';
        ++i;
    }
    std::intmax_t num = 0;
    std::intmax_t den = 1;
    bool seen_digit = false;
    bool seen_point = false;
    for (; i < n; ++i) {
        const char c = s[i];
        if (c == '\'') continue;
        if (c == '.') {
            if (seen_point) return {false, 0, 1, "more than one decimal point"};
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') return {false, 0, 1, "unexpected character in decimal literal"};
        if (num >= limit || den >= limit) return {false, 0, 1, "too many digits in decimal literal"};
        num = num * 10 + (c - '0');
        if (seen_point) den *= 10;
        seen_digit = true;
    }
    if (!seen_digit) return {false, 0, 1, "decimal literal has no digits"};
    const std::intmax_t g = std::gcd(num, den);
    if (g > 1) {
        num /= g;
        den /= g;
    }
    return {true, negative ? -num : num, den, nullptr};
}

// How a rational num/den is stored at a given shift, if it can be at all.
struct representation {
    bool exact;
    unsigned bits;        // bit length of the stored magnitude
    uint128_t magnitude;  // |stored|; meaningful when bits <= 128
    bool negative;
};

/**
 * Stored integer for num/den at `shift` (value = stored * 2^shift).
 * Exact only when den is a power of two no finer than the shift allows
 * and, for positive shifts, the value is a multiple of 2^shift.
 */
constexpr representation represent(std::intmax_t num, std::intmax_t den, int shift) {
    if (den < 0) {
        num = -num;
        den = -den;
    }
    if (den == 0) return {false, 0, 0, false};
    const bool negative = num < 0;
    uint128_t mag = detail::magnitude(num);
    if (mag == 0) return {true, 0, 0, false};
    uint128_t d = static_cast<uint128_t>(den);
    const uint128_t g = detail::gcd(mag, d);
    mag /= g;
    d /= g;
    if (!detail::is_pow2(d)) return {false, 0, 0, negative};

    // value = mag / 2^k, stored = mag * 2^(-shift - k)
    const int k = static_cast<int>(detail::bit_length(d)) - 1;
    const long long e = -static_cast<long long>(shift) - k;
    const unsigned len = detail::bit_length(mag);
    if (e >= 0) {
        const long long bits = len + e;
        if (bits > 128) return {true, static_cast<unsigned>(bits > 4096 ? 4096 : bits), 0, negative};
        return {true, static_cast<unsigned>(bits), mag << e, negative};
    }
    const long long drop = -e;
    if (drop >= static_cast<long long>(len)) return {false, 0, 0, negative};
    if ((mag & ((uint128_t(1) << drop) - 1)) != 0) return {false, 0, 0, negative};
    return {true, static_cast<unsigned>(len - drop), mag >> drop, negative};
}

/**
 * An exact rational literal carried in the type, so that construction can be
 * checked at compile time. Produced by operator""_fx; std::ratio works the
 * same way wherever a literal type is accepted.
 */
template <std::intmax_t Num, std::intmax_t Den = 1>
struct lit {
    static_assert(Den > 0, "fxp representation error: literal denominator must be positive");
    static constexpr std::intmax_t num = Num / std::gcd(Num, Den);
    static constexpr std::intmax_t den = Den / std::gcd(Num, Den);

    constexpr lit<-Num, Den> operator-() const { return {}; }
    constexpr lit operator+() const { return *this; }
};

namespace detail {

template <char... Cs>
struct literal_text {
    static constexpr char text[] = {Cs...};
    static constexpr parsed_decimal parsed = parse_decimal(text, sizeof...(Cs));
    static_assert(parsed.ok,
                  "fxp representation error: _fx accepts plain decimal literals of at most 18 digits");
};

} // namespace detail

namespace literals {

// 2.375_fx is lit<19, 8>; the value is exact, nothing goes through a double.
template <char... Cs>
constexpr auto operator""_fx() {
    using text = detail::literal_text<Cs...>;
    return lit<text::parsed.num, text::parsed.den>{};
}

} // namespace literals

} // namespace fxp
