/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <type_traits>

#include <fxp/descriptor.hpp>
#include <fxp/fixed.hpp>
#include <fxp/storage.hpp>

namespace fxp {

/**
 * Numeric capability set: the descriptor of anything that takes part in the
 * algebra. fixed<> reports its own; builtin integers behave as
 * fixed<0, width, signed> (see from_int).
 */
template <class T, class Enable = void>
struct numeric_traits {
    static constexpr bool is_numeric = false;
};

template <int S, unsigned B, bool G>
struct numeric_traits<fixed<S, B, G>> {
    static constexpr bool is_numeric = true;
    static constexpr descriptor desc = fixed<S, B, G>::desc;
    using storage_type = typename fixed<S, B, G>::storage_type;
};

template <class I>
struct numeric_traits<I, std::enable_if_t<integer_traits<I>::is_integer>> {
    static constexpr bool is_numeric = true;
    static constexpr descriptor desc{0, integer_traits<I>::width, integer_traits<I>::is_signed};
    using storage_type = I;
};

// Family of fixed types whose bits are bounded by the storage width Storage.
template <class Storage, int Shift, unsigned Bits>
struct width_family {
    static constexpr bool is_signed = integer_traits<Storage>::is_signed;
    static constexpr unsigned capacity = integer_traits<Storage>::width - (is_signed ? 1 : 0);
    static_assert(Bits <= capacity, "fxp capacity error: bits exceed the named storage width");
    using type = fixed<Shift, Bits, is_signed>;
};

template <int S, unsigned B> using fixed_u8 = typename width_family<std::uint8_t, S, B>::type;
template <int S, unsigned B> using fixed_i8 = typename width_family<std::int8_t, S, B>::type;
template <int S, unsigned B> using fixed_u16 = typename width_family<std::uint16_t, S, B>::type;
template <int S, unsigned B> using fixed_i16 = typename width_family<std::int16_t, S, B>::type;
template <int S, unsigned B> using fixed_u32 = typename width_family<std::uint32_t, S, B>::type;
template <int S, unsigned B> using fixed_i32 = typename width_family<std::int32_t, S, B>::type;
template <int S, unsigned B> using fixed_u64 = typename width_family<std::uint64_t, S, B>::type;
template <int S, unsigned B> using fixed_i64 = typename width_family<std::int64_t, S, B>::type;
template <int S, unsigned B> using fixed_u128 = typename width_family<uint128_t, S, B>::type;
template <int S, unsigned B> using fixed_i128 = typename width_family<int128_t, S, B>::type;

} // namespace fxp
