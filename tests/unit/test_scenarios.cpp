/*
 * Worked scenarios and limit checks across operand types
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <type_traits>

#include <fxp/fxp.hpp>

using namespace fxp;
using namespace fxp::literals;

template <class A, class B>
constexpr bool same_v = std::is_same<std::decay_t<A>, B>::value;

namespace {

// Sums, differences and negations of the extreme values stay inside the
// derived type's range, and the stored result is the exact integer result.
template <class A>
void check_add_sub_limits() {
    using Add = decltype(A() + A());
    using Sub = decltype(A() - A());
    for (auto a0 : {A::min(), A::max()}) {
        for (auto a1 : {A::min(), A::max()}) {
            const auto s = a0 + a1;
            CHECK(s >= Add::min());
            CHECK(s <= Add::max());
            CHECK((static_cast<int128_t>(s.raw()) == static_cast<int128_t>(a0.raw()) + a1.raw()));
            const auto d = a0 - a1;
            CHECK(d >= Sub::min());
            CHECK(d <= Sub::max());
            CHECK((static_cast<int128_t>(d.raw()) ==
                   static_cast<int128_t>(a0.raw()) - static_cast<int128_t>(a1.raw())));
        }
        const auto n = -a0;
        CHECK((static_cast<int128_t>(n.raw()) == -static_cast<int128_t>(a0.raw())));
    }
}

template <class A, class B>
void check_mul_limits() {
    using Mul = decltype(A() * B());
    for (auto a : {A::min(), A::max()}) {
        for (auto b : {B::min(), B::max()}) {
            const auto p = a * b;
            CHECK(p >= Mul::min());
            CHECK(p <= Mul::max());
            CHECK((static_cast<int128_t>(p.raw()) == static_cast<int128_t>(a.raw()) * b.raw()));
        }
    }
}

} // namespace

TEST_SUITE("Scenarios") {
    TEST_CASE("2.375 + 1.5 over 8-bit unsigned storage") {
        const fixed_u8<-3, 5> a = from_literal<-3>(2.375_fx);
        CHECK(a.raw() == 19);
        CHECK(std::is_same<decltype(a)::storage_type, std::uint8_t>::value);

        const auto b = from_literal<-1>(1.5_fx);
        CHECK(same_v<decltype(b), ufixed<-1, 2>>);
        CHECK(b.raw() == 3);
        CHECK(b.rescale<-3>().raw() == 12);

        const auto c = a + b;
        CHECK(decltype(c)::shift == -3);
        CHECK(decltype(c)::bits == 6);
        CHECK(c.raw() == 31);
        CHECK(c == from_literal<-3>(3.875_fx));
        CHECK(c.to_double() == 3.875);
    }

    TEST_CASE("10-bit at shift -2 times 12-bit at shift -3") {
        const auto x = ufixed<-2, 10>::max();
        const auto y = ufixed<-3, 12>::max();
        const auto p = x * y;
        CHECK(decltype(p)::shift == -5);
        CHECK(decltype(p)::bits == 22);
        CHECK(std::is_same<decltype(p)::storage_type, std::uint32_t>::value);
        CHECK(p.raw() == 1023u * 4095u);

        const auto sx = sfixed<-2, 10>::min();
        const auto sp = sx * y;
        CHECK(decltype(sp)::shift == -5);
        CHECK(decltype(sp)::bits == 22);
        CHECK(sp.raw() == -1023 * 4095);
        CHECK(sp.to_double() == sx.to_double() * y.to_double());
    }

    TEST_CASE("addition is associative in value, not in type") {
        const auto a = from_int(12).narrow<5>().value();
        const auto b = from_int(-1).narrow<1>().value();
        const auto c = a + b;
        const auto d = a + (b + b);
        const auto e = (a + b) + b;
        CHECK(same_v<decltype(c), sfixed<0, 6>>);
        CHECK(same_v<decltype(d), sfixed<0, 6>>);
        CHECK(same_v<decltype(e), sfixed<0, 7>>);
        CHECK(d == e);
        CHECK(d.raw() == 10);
    }

    TEST_CASE("one value built four ways") {
        using T = sfixed<-5, 10>;
        const T options[] = {
            T::from_double(3.125).value(),
            T::from_double(3.125f).value(),
            T::from_raw(100).value(),
            from_int(100).shr<5>().narrow<10>().value(),
        };
        for (const auto& o : options) CHECK(o == options[0]);
        CHECK(options[0].raw() == 100);
    }

    TEST_CASE("exact sum with a truncated quotient") {
        const auto x = sfixed<-20, 21>::from_double(0.497).value();
        const auto y = x.div_const_trunc<12>();
        CHECK(same_v<decltype(y), sfixed<-20, 18>>);
        const auto z = x + (-y);
        CHECK(same_v<decltype(z), sfixed<-20, 22>>);
        CHECK(z.raw() == x.raw() - x.raw() / 12);
    }

    TEST_CASE("add/sub limits") {
        check_add_sub_limits<sfixed<3, 7>>();
        check_add_sub_limits<sfixed<0, 4>>();
        check_add_sub_limits<ufixed<0, 12>>();
        check_add_sub_limits<ufixed<-41, 126>>();
    }

    TEST_CASE("mul limits") {
        check_mul_limits<sfixed<0, 4>, sfixed<0, 5>>();
        check_mul_limits<sfixed<0, 4>, ufixed<0, 5>>();
        check_mul_limits<ufixed<0, 4>, sfixed<0, 5>>();
        check_mul_limits<ufixed<0, 4>, ufixed<0, 5>>();
        check_mul_limits<sfixed<-7, 31>, ufixed<3, 32>>();
    }

    TEST_CASE("mul_const limits") {
        const auto a = sfixed<0, 4>::from_raw(4).value();
        const auto b = a.mul_const<4>();
        CHECK(same_v<decltype(b), sfixed<0, 6>>);
        CHECK(b.raw() == 16);
        const auto c = a.mul_const<5>();
        CHECK(same_v<decltype(c), sfixed<0, 7>>);
        CHECK(c.raw() == 20);
    }
}
