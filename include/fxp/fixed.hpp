/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <type_traits>

#include <fxp/descriptor.hpp>
#include <fxp/rules.hpp>
#include <fxp/storage.hpp>

namespace fxp {

enum class range_check { ok, too_small, too_large };

namespace detail {

// raw * 2^k where the caller has proven the product fits T. A zero raw value
// may come with any k, so it short-circuits before the shift is formed.
template <class T>
constexpr T scale_up(T raw, unsigned k) {
    using U = unsigned_twin_t<T>;
    if (raw == 0 || k == 0) return raw;
    return static_cast<T>(raw * static_cast<T>(static_cast<U>(1) << k));
}

// Classify any integer against the symmetric magnitude bound 2^bits - 1.
template <class I>
constexpr range_check classify(I raw, unsigned bits, bool is_signed) {
    const uint128_t limit = bits == 0 ? 0 : (~uint128_t(0) >> (128 - bits));
    bool negative = false;
    uint128_t mag = 0;
    if constexpr (integer_traits<I>::is_signed) {
        negative = raw < 0;
        mag = magnitude(static_cast<int128_t>(raw));
    } else {
        mag = static_cast<uint128_t>(raw);
    }
    if (negative) {
        if (!is_signed || mag > limit) return range_check::too_small;
        return range_check::ok;
    }
    return mag > limit ? range_check::too_large : range_check::ok;
}

} // namespace detail

/**
 * Fixed-point value with a compile-time type descriptor.
 * Template parameters:
 * - Shift:  real value = raw() * 2^Shift
 * - Bits:   |raw()| <= 2^Bits - 1
 * - Signed: whether raw() may be negative
 *
 * Storage is derived from (Bits, Signed) by the storage resolver, so equal
 * descriptors always share a layout. Every arithmetic operator derives its
 * result type from fxp::rules and cannot overflow; the only lossy operations
 * are the ones named so (raw_shr, div_const_trunc, div_trunc, narrow,
 * from_double, to_double).
 */
template <int Shift, unsigned Bits, bool Signed = false>
class fixed {
    static_assert(fits(Bits, Signed),
                  "fxp capacity error: fixed<> bits exceed the widest storage in the table");

public:
    using storage_type = storage_t<Bits, Signed>;

    static constexpr int shift = Shift;
    static constexpr unsigned bits = Bits;
    static constexpr bool is_signed = Signed;
    static constexpr descriptor desc{Shift, Bits, Signed};
    static constexpr storage_info storage = resolve<Bits, Signed>::info;

    constexpr fixed() : value_(0) {}

    // Lossless conversion from another fixed type (finer or equal shift,
    // enough bits, no sign dropped).
    template <int S2, unsigned B2, bool G2,
              typename = std::enable_if_t<rules::converts_losslessly(descriptor{S2, B2, G2}, desc)>>
    constexpr fixed(const fixed<S2, B2, G2>& other) : value_(0) {
        if constexpr (B2 != 0) {
            value_ = detail::scale_up(static_cast<storage_type>(other.raw()),
                                      static_cast<unsigned>(S2 - Shift));
        }
    }

    static constexpr fixed from_raw_unchecked(storage_type raw) {
        fixed f;
        f.value_ = raw;
        return f;
    }

    template <class I>
    static constexpr range_check check_raw(I raw) {
        static_assert(integer_traits<I>::is_integer, "check_raw expects an integer");
        return detail::classify(raw, Bits, Signed);
    }

    template <class I>
    static constexpr std::optional<fixed> from_raw(I raw) {
        if (check_raw(raw) != range_check::ok) return std::nullopt;
        return from_raw_unchecked(static_cast<storage_type>(raw));
    }

    static constexpr fixed min() {
        if constexpr (Signed) {
            return from_raw_unchecked(static_cast<storage_type>(-magnitude_limit<storage_type>(Bits)));
        } else {
            return fixed();
        }
    }

    static constexpr fixed max() {
        return from_raw_unchecked(magnitude_limit<storage_type>(Bits));
    }

    constexpr storage_type raw() const { return value_; }

    // Nearest double; loses precision once Bits exceeds the mantissa.
    double to_double() const {
        return std::ldexp(static_cast<double>(value_), Shift);
    }

    float to_float() const {
        return std::ldexp(static_cast<float>(value_), Shift);
    }

    // Truncates toward zero; nullopt for NaN, infinities and out-of-range input.
    static std::optional<fixed> from_double(double v) {
        if (!std::isfinite(v)) return std::nullopt;
        const double scaled = std::trunc(std::ldexp(v, -Shift));
        if (std::fabs(scaled) >= std::ldexp(1.0, static_cast<int>(Bits))) return std::nullopt;
        if (!Signed && scaled < 0) return std::nullopt;
        return from_raw_unchecked(static_cast<storage_type>(scaled));
    }

    // Integer value of a value whose scale is a whole power of two.
    constexpr auto to_integer() const {
        static_assert(Shift >= 0,
                      "fxp representation error: to_integer() would drop fractional bits");
        return rescale<0>().raw();
    }

    template <int NewShift>
    constexpr auto rescale() const {
        static_assert(rules::can_rescale(desc, NewShift),
                      "fxp representation error: rescale<> may only move to a finer shift");
        constexpr descriptor d = rules::rescale(desc, NewShift);
        static_assert(fits(d), "fxp capacity error: rescale<> exceeds the widest storage");
        return fixed<d.shift, d.bits, d.is_signed>(*this);
    }

    template <unsigned NewBits>
    constexpr fixed<Shift, NewBits, Signed> widen() const {
        static_assert(NewBits >= Bits, "fxp capacity error: widen<> cannot remove bits, use narrow<>");
        return fixed<Shift, NewBits, Signed>(*this);
    }

    template <unsigned NewBits>
    constexpr std::optional<fixed<Shift, NewBits, Signed>> narrow() const {
        return fixed<Shift, NewBits, Signed>::from_raw(value_);
    }

    constexpr fixed<Shift, Bits, true> to_signed() const {
        return fixed<Shift, Bits, true>(*this);
    }

    constexpr std::optional<fixed<Shift, Bits, false>> to_unsigned() const {
        using R = fixed<Shift, Bits, false>;
        if constexpr (Signed) {
            if (value_ < 0) return std::nullopt;
        }
        return R::from_raw_unchecked(static_cast<typename R::storage_type>(value_));
    }

    constexpr fixed<Shift, Bits, false> abs() const {
        using R = fixed<Shift, Bits, false>;
        using T = typename R::storage_type;
        if constexpr (Signed) {
            if (value_ < 0) return R::from_raw_unchecked(static_cast<T>(-value_));
        }
        return R::from_raw_unchecked(static_cast<T>(value_));
    }

    // Logical shifts: value * 2^K or value / 2^K, exact, type change only.
    template <unsigned K>
    constexpr auto shl() const {
        constexpr descriptor d = rules::shl(desc, K);
        return fixed<d.shift, d.bits, d.is_signed>::from_raw_unchecked(value_);
    }

    template <unsigned K>
    constexpr auto shr() const {
        constexpr descriptor d = rules::shr(desc, K);
        return fixed<d.shift, d.bits, d.is_signed>::from_raw_unchecked(value_);
    }

    // Moves the stored integer left by K; the value is unchanged.
    template <unsigned K>
    constexpr auto raw_shl() const {
        return rescale<Shift - static_cast<int>(K)>();
    }

    /**
     * Moves the stored integer right by K, keeping the value's scale.
     * LOSSY: the K low bits are discarded, truncating toward zero.
     */
    template <unsigned K>
    constexpr auto raw_shr() const {
        constexpr descriptor d = rules::raw_shr(desc, K);
        using R = fixed<d.shift, d.bits, d.is_signed>;
        if constexpr (K >= Bits) {
            return R();
        } else {
            constexpr storage_type unit = detail::scale_up(storage_type(1), K);
            return R::from_raw_unchecked(static_cast<typename R::storage_type>(value_ / unit));
        }
    }

    template <std::intmax_t V>
    constexpr auto mul_const() const {
        constexpr descriptor d = rules::mul_const(desc, V);
        static_assert(fits(d), "fxp capacity error: mul_const<> exceeds the widest storage");
        using R = fixed<d.shift, d.bits, d.is_signed>;
        using T = typename R::storage_type;
        if constexpr (d.bits == 0) {
            return R();
        } else {
            return R::from_raw_unchecked(static_cast<T>(static_cast<T>(value_) * static_cast<T>(V)));
        }
    }

    // Division by a power-of-two constant: a scale change, exact and free.
    template <std::intmax_t V>
    constexpr auto div_exact() const {
        static_assert(rules::can_div_exact(V),
                      "fxp representation error: div_exact<> needs a power-of-two divisor, "
                      "use div_const_trunc<> or div_trunc<> for truncating division");
        constexpr descriptor d = rules::div_exact(desc, V);
        using R = fixed<d.shift, d.bits, d.is_signed>;
        using T = typename R::storage_type;
        if constexpr (V < 0) {
            return R::from_raw_unchecked(static_cast<T>(-static_cast<T>(value_)));
        } else {
            return R::from_raw_unchecked(static_cast<T>(value_));
        }
    }

    // LOSSY: raw() / V truncated toward zero, scale unchanged.
    template <std::intmax_t V>
    constexpr auto div_const_trunc() const {
        static_assert(rules::can_div_const_trunc(V), "fxp representation error: division by zero");
        constexpr descriptor d = rules::div_const_trunc(desc, V);
        using R = fixed<d.shift, d.bits, d.is_signed>;
        constexpr unsigned work_bits = detail::umax(Bits, detail::bit_length(detail::magnitude(V)));
        static_assert(fits(work_bits, d.is_signed),
                      "fxp capacity error: div_const_trunc<> intermediate exceeds the widest storage");
        using W = storage_t<work_bits, d.is_signed>;
        return R::from_raw_unchecked(
            static_cast<typename R::storage_type>(static_cast<W>(value_) / static_cast<W>(V)));
    }

private:
    storage_type value_;
};

template <int Shift, unsigned Bits>
using ufixed = fixed<Shift, Bits, false>;

template <int Shift, unsigned Bits>
using sfixed = fixed<Shift, Bits, true>;

template <class T>
struct is_fixed : std::false_type {};

template <int S, unsigned B, bool G>
struct is_fixed<fixed<S, B, G>> : std::true_type {};

template <class T>
inline constexpr bool is_fixed_v = is_fixed<T>::value;

} // namespace fxp
