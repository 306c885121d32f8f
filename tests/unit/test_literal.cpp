/*
 * Unit tests for decimal literals and exact representation
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstring>
#include <string>
#include <type_traits>

#include <fxp/literal.hpp>

using namespace fxp;
using namespace fxp::literals;

namespace {
parsed_decimal parse(const char* s) { return parse_decimal(s, std::strlen(s)); }
}

TEST_SUITE("Literals") {
    TEST_CASE("parse_decimal - exact reduced fractions") {
        auto p = parse("2.375");
        REQUIRE(p.ok);
        CHECK(p.num == 19);
        CHECK(p.den == 8);

        p = parse("-12.5");
        REQUIRE(p.ok);
        CHECK(p.num == -25);
        CHECK(p.den == 2);

        p = parse("1'000");
        REQUIRE(p.ok);
        CHECK(p.num == 1000);
        CHECK(p.den == 1);

        p = parse("0.1");
        REQUIRE(p.ok);
        CHECK(p.num == 1);
        CHECK(p.den == 10);

        p = parse("+0.000");
        REQUIRE(p.ok);
        CHECK(p.num == 0);
        CHECK(p.den == 1);

        CHECK(parse("123456789012345678").ok);
    }

    TEST_CASE("parse_decimal - malformed input") {
        CHECK_FALSE(parse("").ok);
        CHECK_FALSE(parse("-").ok);
        CHECK_FALSE(parse("1.2.3").ok);
        CHECK_FALSE(parse("abc").ok);
        CHECK_FALSE(parse("1e5").ok);
        auto p = parse("1234567890123456789");
        CHECK_FALSE(p.ok);
        CHECK(std::string(p.error).find("too many digits") != std::string::npos);
    }

    TEST_CASE("represent - minimal bits at a shift") {
        auto r = represent(19, 8, -3);
        CHECK(r.exact);
        CHECK(r.bits == 5);
        CHECK((r.magnitude == 19));
        CHECK_FALSE(r.negative);

        r = represent(3, 2, -1);
        CHECK(r.exact);
        CHECK(r.bits == 2);
        CHECK((r.magnitude == 3));

        r = represent(3, 2, -3);
        CHECK(r.bits == 4);
        CHECK((r.magnitude == 12));

        r = represent(-5, 4, -2);
        CHECK(r.exact);
        CHECK(r.negative);
        CHECK(r.bits == 3);
        CHECK((r.magnitude == 5));

        r = represent(4, 1, 2);
        CHECK(r.exact);
        CHECK(r.bits == 1);
        CHECK((r.magnitude == 1));

        r = represent(0, 1, 5);
        CHECK(r.exact);
        CHECK(r.bits == 0);
    }

    TEST_CASE("represent - values off the grid of the shift") {
        CHECK_FALSE(represent(1, 10, -1).exact);  // 0.1 in halves
        CHECK_FALSE(represent(1, 2, 0).exact);
        CHECK_FALSE(represent(6, 1, 2).exact);
        CHECK_FALSE(represent(1, 3, -60).exact);
        CHECK_FALSE(represent(1, 0, 0).exact);
    }

    TEST_CASE("represent - beyond 128 bits still reports the bit count") {
        auto r = represent(1, 1, -200);
        CHECK(r.exact);
        CHECK(r.bits == 201);
    }

    TEST_CASE("_fx - literal types carry the exact fraction") {
        CHECK(std::is_same<decltype(2.375_fx), lit<19, 8>>::value);
        CHECK(std::is_same<decltype(1.5_fx), lit<3, 2>>::value);
        CHECK(std::is_same<decltype(42_fx), lit<42, 1>>::value);
        CHECK(std::is_same<decltype(-1.5_fx), lit<-3, 2>>::value);
        CHECK(lit<-6, 4>::num == -3);
        CHECK(lit<-6, 4>::den == 2);
        CHECK(decltype(0.125_fx)::den == 8);
    }
}
