/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <type_traits>

#include <fxp/fixed.hpp>
#include <fxp/literal.hpp>
#include <fxp/storage.hpp>

namespace fxp {

namespace detail {

template <class T>
constexpr T signed_magnitude(const representation& r) {
    const T m = static_cast<T>(r.magnitude);
    if (r.negative) return static_cast<T>(-m);
    return m;
}

} // namespace detail

/**
 * Build a value from an exact literal (lit<>, _fx, std::ratio) at Shift,
 * with the fewest bits that hold it. Negative literals give signed types.
 *
 *   from_literal<-3>(2.375_fx)   -> ufixed<-3, 5>, raw() == 19
 *   from_literal<-1>(0.1_fx)     -> build error (representation)
 */
template <int Shift, class L>
constexpr auto from_literal(L) {
    constexpr representation r = represent(L::num, L::den, Shift);
    static_assert(r.exact,
                  "fxp representation error: literal is not a whole multiple of 2^Shift");
    static_assert(fits(r.bits, r.negative),
                  "fxp capacity error: literal needs more bits than the widest storage");
    using R = fixed<Shift, r.bits, r.negative>;
    return R::from_raw_unchecked(detail::signed_magnitude<typename R::storage_type>(r));
}

// Same, into caller-chosen bits; signed when the literal is negative.
template <int Shift, unsigned Bits, class L>
constexpr auto from_literal(L) {
    constexpr representation r = represent(L::num, L::den, Shift);
    static_assert(r.exact,
                  "fxp representation error: literal is not a whole multiple of 2^Shift");
    static_assert(r.bits <= Bits,
                  "fxp representation error: literal does not fit the requested bits");
    using R = fixed<Shift, Bits, r.negative>;
    return R::from_raw_unchecked(detail::signed_magnitude<typename R::storage_type>(r));
}

template <int Shift, unsigned Bits, bool Signed, class L>
constexpr fixed<Shift, Bits, Signed> from_literal(L) {
    constexpr representation r = represent(L::num, L::den, Shift);
    static_assert(r.exact,
                  "fxp representation error: literal is not a whole multiple of 2^Shift");
    static_assert(r.bits <= Bits,
                  "fxp representation error: literal does not fit the requested bits");
    static_assert(Signed || !r.negative,
                  "fxp representation error: negative literal needs a signed type");
    using T = typename fixed<Shift, Bits, Signed>::storage_type;
    return fixed<Shift, Bits, Signed>::from_raw_unchecked(detail::signed_magnitude<T>(r));
}

// Exact fixed<0, W, signed> view of a builtin integer of width W. Signed
// inputs move to the next storage width so that the type minimum still fits
// the symmetric magnitude bound.
template <class I>
constexpr auto from_int(I v) {
    static_assert(integer_traits<I>::is_integer, "from_int expects a builtin integer");
    using R = fixed<0, integer_traits<I>::width, integer_traits<I>::is_signed>;
    return R::from_raw_unchecked(static_cast<typename R::storage_type>(v));
}

} // namespace fxp
