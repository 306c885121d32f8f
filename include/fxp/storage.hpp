/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <tuple>
#include <type_traits>

#include <fxp/descriptor.hpp>

namespace fxp {

// One row of the storage width table.
struct storage_info {
    unsigned width;
    bool is_signed;
    const char* name;

    // Magnitude bits the width can hold; signed widths reserve the sign bit.
    constexpr unsigned capacity() const { return is_signed ? width - 1 : width; }
};

// Ordered by width; unsigned entries sit at even indices, their signed twin
// right after. Per signedness the capacities are strictly increasing.
inline constexpr storage_info storage_table[] = {
    {8, false, "uint8"},     {8, true, "int8"},
    {16, false, "uint16"},   {16, true, "int16"},
    {32, false, "uint32"},   {32, true, "int32"},
    {64, false, "uint64"},   {64, true, "int64"},
    {128, false, "uint128"}, {128, true, "int128"},
};

inline constexpr std::size_t storage_count = sizeof(storage_table) / sizeof(storage_table[0]);

using storage_types = std::tuple<std::uint8_t, std::int8_t,
                                 std::uint16_t, std::int16_t,
                                 std::uint32_t, std::int32_t,
                                 std::uint64_t, std::int64_t,
                                 uint128_t, int128_t>;

static_assert(std::tuple_size<storage_types>::value == storage_count,
              "storage_types and storage_table must list the same widths");

// Index of the smallest entry that can hold `bits` magnitude bits with the
// requested signedness, or -1 when the table has none.
constexpr int resolve_index(unsigned bits, bool is_signed) {
    for (std::size_t i = 0; i < storage_count; ++i) {
        if (storage_table[i].is_signed == is_signed && storage_table[i].capacity() >= bits) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

constexpr unsigned max_bits(bool is_signed) {
    unsigned best = 0;
    for (std::size_t i = 0; i < storage_count; ++i) {
        if (storage_table[i].is_signed == is_signed && storage_table[i].capacity() > best) {
            best = storage_table[i].capacity();
        }
    }
    return best;
}

constexpr bool fits(unsigned bits, bool is_signed) {
    return resolve_index(bits, is_signed) >= 0;
}

constexpr bool fits(const descriptor& d) {
    return fits(d.bits, d.is_signed);
}

namespace detail {

template <class T, class Tuple>
struct index_of;

template <class T, class... Ts>
struct index_of<T, std::tuple<T, Ts...>> : std::integral_constant<std::size_t, 0> {};

template <class T, class U, class... Ts>
struct index_of<T, std::tuple<U, Ts...>>
    : std::integral_constant<std::size_t, 1 + index_of<T, std::tuple<Ts...>>::value> {};

} // namespace detail

/**
 * Type-level storage resolver.
 * Fails the build (capacity error) when no width can hold Bits.
 */
template <unsigned Bits, bool Signed>
struct resolve {
    static constexpr int index = resolve_index(Bits, Signed);
    static_assert(index >= 0,
                  "fxp capacity error: required bits exceed the widest storage in the table");

    static constexpr std::size_t safe_index = index < 0 ? 0 : static_cast<std::size_t>(index);
    using type = std::tuple_element_t<safe_index, storage_types>;
    static constexpr storage_info info = storage_table[safe_index];
};

template <unsigned Bits, bool Signed>
using storage_t = typename resolve<Bits, Signed>::type;

// Unsigned type of the same width as storage type T.
template <class T>
using unsigned_twin_t =
    std::tuple_element_t<detail::index_of<T, storage_types>::value & ~std::size_t(1), storage_types>;

// Largest stored magnitude 2^bits - 1 as a T (bits must fit T).
template <class T>
constexpr T magnitude_limit(unsigned bits) {
    using U = unsigned_twin_t<T>;
    constexpr unsigned width = sizeof(U) * 8;
    return bits == 0 ? T(0) : static_cast<T>(static_cast<U>(~U(0)) >> (width - bits));
}

/**
 * Width and signedness of a builtin integer, including the 128-bit
 * extension types that std::numeric_limits may not describe.
 */
template <class T, class Enable = void>
struct integer_traits {
    static constexpr bool is_integer = false;
};

template <class T>
struct integer_traits<T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value>> {
    static constexpr bool is_integer = true;
    static constexpr unsigned width = sizeof(T) * 8;
    static constexpr bool is_signed = std::numeric_limits<T>::is_signed;
};

template <>
struct integer_traits<int128_t> {
    static constexpr bool is_integer = true;
    static constexpr unsigned width = 128;
    static constexpr bool is_signed = true;
};

template <>
struct integer_traits<uint128_t> {
    static constexpr bool is_integer = true;
    static constexpr unsigned width = 128;
    static constexpr bool is_signed = false;
};

} // namespace fxp
