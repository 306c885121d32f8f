/*
 * Unit tests for fmt formatting of values and descriptors, and the logger
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include <fmt/format.h>

#include <fxp/format.hpp>
#include <fxp/fxp.hpp>
#include <fxp/log.hpp>
#include <fxp/logging/fmt_logger.hpp>

using namespace fxp;
using namespace fxp::literals;

TEST_SUITE("Formatting") {
    TEST_CASE("describe - descriptor with its storage") {
        CHECK(describe(descriptor{-3, 5, false}) == "fixed<shift=-3, bits=5, unsigned> as uint8");
        CHECK(describe(descriptor{0, 8, true}) == "fixed<shift=0, bits=8, signed> as int16");
        CHECK(describe(descriptor{0, 200, true}) == "fixed<shift=0, bits=200, signed> as <no storage>");
        CHECK(describe<sfixed<-5, 22>>() == "fixed<shift=-5, bits=22, signed> as int32");
        CHECK(describe<ufixed<-64, 128>>() == "fixed<shift=-64, bits=128, unsigned> as uint128");
    }

    TEST_CASE("fixed values format as their double approximation") {
        const auto a = from_literal<-3>(2.375_fx);
        CHECK(fmt::format("{}", a) == "2.375");
        CHECK(fmt::format("{:.3f}", a) == "2.375");
        CHECK(fmt::format("{:.2f}", from_literal<-1>(3.5_fx)) == "3.50");
        CHECK(fmt::format("{}", -a) == "-2.375");
        CHECK(fmt::format("{}", ufixed<4, 0>()) == "0");
    }

    TEST_CASE("descriptors format through describe") {
        CHECK(fmt::format("{}", descriptor{-1, 2, false}) == "fixed<shift=-1, bits=2, unsigned> as uint8");
        CHECK(fmt::format("[{}]", sfixed<2, 3>::desc) == "[fixed<shift=2, bits=3, signed> as int8]");
    }
}

TEST_SUITE("Logging") {
    TEST_CASE("now_hms - bracketed wall clock") {
        const std::string t = fxp::log::now_hms();
        REQUIRE(t.size() == 10);
        CHECK(t.front() == '[');
        CHECK(t.back() == ']');
        CHECK(t[3] == ':');
        CHECK(t[6] == ':');
    }

    TEST_CASE("FmtLogger - debug toggle") {
        logging::FmtLogger log;
        CHECK_FALSE(log.debug_enabled());
        log.set_debug(true);
        CHECK(log.debug_enabled());
        log.debug("visible debug line");
        log.set_debug(false);
        log.debug("dropped debug line");
        logging::FmtLogger verbose(true);
        CHECK(verbose.debug_enabled());
    }
}
