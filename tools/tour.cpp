/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

// Walk through the fxp algebra: construction, typed arithmetic, truncating division.

#include <algorithm>
#include <array>
#include <type_traits>

#include <fxp/format.hpp>
#include <fxp/fxp.hpp>
#include <fxp/log.hpp>

using namespace fxp::literals;

int main() {
    // Four ways to build the same value 3.125 = 100 * 2^-5
    using T = fxp::sfixed<-5, 10>;
    const std::array<T, 4> options = {
        T::from_double(3.125).value(),
        T::from_double(3.125f).value(),
        T::from_raw(100).value(),
        fxp::from_int(100).shr<5>().narrow<10>().value(),
    };
    const bool all_equal = std::all_of(options.begin(), options.end(), [&](const T& o) { return o == options[0]; });
    fxp::log::line("{}: 3.125 four ways, all equal: {}", fxp::describe<T>(), all_equal);

    // Exact literal, minimal bits
    const auto p = fxp::from_literal<-3>(2.375_fx);
    fxp::log::line("2.375 at shift -3 is {} raw {}", fxp::describe<decltype(p)>(), p.raw());

    // Result types follow the operands; addition is associative in value, not in type
    const auto a = fxp::from_int(12).narrow<5>().value();
    const auto b = fxp::from_int(-1).narrow<1>().value();
    const auto c = a + b;
    const auto d = a + (b + b);
    const auto e = (a + b) + b;
    static_assert(std::is_same<std::decay_t<decltype(c)>, fxp::sfixed<0, 6>>::value, "a + b");
    static_assert(std::is_same<std::decay_t<decltype(d)>, fxp::sfixed<0, 6>>::value, "a + (b + b)");
    static_assert(std::is_same<std::decay_t<decltype(e)>, fxp::sfixed<0, 7>>::value, "(a + b) + b");
    fxp::log::line("c = {} : {}", c.raw(), fxp::describe<std::decay_t<decltype(c)>>());
    fxp::log::line("d = {} : {}", d.raw(), fxp::describe<std::decay_t<decltype(d)>>());
    fxp::log::line("e = {} : {}", e.raw(), fxp::describe<std::decay_t<decltype(e)>>());

    // Truncating division is named as such; the rest stays exact
    const auto x = fxp::sfixed<-20, 21>::from_double(0.497).value();
    const auto y = x.div_const_trunc<12>();
    const auto z = x + (-y);
    fxp::log::line("x raw {} ~ {:.6f}", x.raw(), x);
    fxp::log::line("z raw {} ~ {:.6f} : {}", z.raw(), z, fxp::describe<std::decay_t<decltype(z)>>());
    return 0;
}
