/*
 * Unit tests for plan loading (text and JSON), env overrides and final checks
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <fxp/config/loader.hpp>

using namespace fxp::config;
using fxp::plan::Op;
using fxp::plan::Plan;

namespace {

std::string write_temp(const std::string& name, const std::string& text) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << text;
    return path.string();
}

bool contains(const std::vector<std::string>& errs, const std::string& needle) {
    for (const auto& e : errs) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

const char* kTextPlan =
    "# 2.375 + 1.5\n"
    "a = literal 2.375 shift=-3\n"
    "b = literal 1.5 shift=-1   # trailing comment\n"
    "\n"
    "c = add a b\n"
    "h = shr c k=2\n"
    "q = div_trunc a b shift=-3 bits=6\n"
    "v = value shift=-2 bits=10 signed\n";

} // namespace

TEST_SUITE("Plan Loader") {
    TEST_CASE("parse_plan_text - steps, parameters and lines") {
        Plan p;
        auto errs = parse_plan_text(p, kTextPlan);
        REQUIRE(errs.empty());
        REQUIRE(p.steps.size() == 6);

        CHECK(p.steps[0].name == "a");
        CHECK(p.steps[0].op == Op::literal);
        CHECK(p.steps[0].literal == "2.375");
        CHECK(*p.steps[0].shift == -3);
        CHECK(p.steps[0].line == 2);

        CHECK(p.steps[2].op == Op::add);
        REQUIRE(p.steps[2].args.size() == 2);
        CHECK(p.steps[2].args[0] == "a");
        CHECK(p.steps[2].args[1] == "b");
        CHECK(p.steps[2].line == 5);

        CHECK(p.steps[3].op == Op::shr);
        CHECK(*p.steps[3].constant == 2);

        CHECK(p.steps[4].op == Op::div_trunc);
        CHECK(*p.steps[4].bits == 6);
        CHECK_FALSE(p.steps[4].is_signed.has_value());

        CHECK(p.steps[5].op == Op::value);
        CHECK(*p.steps[5].is_signed);
    }

    TEST_CASE("parse_plan_text - errors keep the previous plan") {
        Plan p;
        REQUIRE(parse_plan_text(p, "a = value shift=0 bits=3\n").empty());
        REQUIRE(p.steps.size() == 1);

        auto errs = parse_plan_text(p, "x = frobnicate a\n");
        CHECK(contains(errs, "line 1: unknown operation 'frobnicate'"));
        CHECK(p.steps.size() == 1);

        errs = parse_plan_text(p, "\njust words\n");
        CHECK(contains(errs, "line 2: expected 'name = op ...'"));

        errs = parse_plan_text(p, "x = value shift=abc bits=2\n");
        CHECK(contains(errs, "shift 'abc' is not an integer"));

        errs = parse_plan_text(p, "x = value shift=0 bits=2 color=red\n");
        CHECK(contains(errs, "unknown parameter 'color'"));

        errs = parse_plan_text(p, "c = add a b\n");
        CHECK(contains(errs, "uses 'a' before it is defined"));
        CHECK(p.steps.size() == 1);
    }

    TEST_CASE("parse_plan_json - steps") {
        Plan p;
        auto errs = parse_plan_json(p, R"({"steps": [
            {"name": "a", "op": "literal", "literal": "2.375", "shift": -3},
            {"name": "b", "op": "value", "shift": -1, "bits": 2, "signed": true},
            {"name": "c", "op": "add", "args": ["a", "b"]},
            {"name": "m", "op": "mul_const", "args": ["c"], "v": -5}
        ]})");
        REQUIRE(errs.empty());
        REQUIRE(p.steps.size() == 4);
        CHECK(p.steps[0].literal == "2.375");
        CHECK(*p.steps[1].is_signed);
        CHECK(p.steps[2].args.size() == 2);
        CHECK(*p.steps[3].constant == -5);
        CHECK(p.steps[3].line == 4);
    }

    TEST_CASE("parse_plan_json - errors") {
        Plan p;
        CHECK(contains(parse_plan_json(p, "{not json"), "Failed to read plan"));
        CHECK(contains(parse_plan_json(p, R"({"values": []})"), "'steps' must be an array"));
        CHECK(contains(parse_plan_json(p, R"({"steps": [{"name": "a", "op": "literal", "literal": 0.1, "shift": -1}]})"),
                       "step 1: 'literal' must be a string"));
        CHECK(contains(parse_plan_json(p, R"({"steps": [{"name": "a", "op": "sqrt"}]})"),
                       "step 1: unknown operation 'sqrt'"));
        CHECK(contains(parse_plan_json(p, R"({"steps": [{"op": "value"}]})"), "step 1:"));
        CHECK(p.steps.empty());
    }

    TEST_CASE("parse_plan_json - numbers must be in-range integers") {
        Plan p;
        CHECK(contains(parse_plan_json(p, R"({"steps": [{"name": "a", "op": "value", "shift": 4294967297, "bits": 2}]})"),
                       "step 1: 'shift' 4294967297 is out of range"));
        CHECK(contains(parse_plan_json(p, R"({"steps": [{"name": "a", "op": "value", "shift": 0, "bits": 5.7}]})"),
                       "step 1: 'bits' must be an integer"));
        CHECK(contains(parse_plan_json(p, R"({"steps": [{"name": "a", "op": "value", "shift": 0, "bits": -1}]})"),
                       "step 1: 'bits' -1 is out of range"));
        CHECK(contains(parse_plan_json(p, R"({"steps": [
            {"name": "a", "op": "value", "shift": 0, "bits": 4},
            {"name": "m", "op": "mul_const", "args": ["a"], "k": 2, "v": 3}
        ]})"), "step 2: give only one of 'k' and 'v'"));
        CHECK(p.steps.empty());

        CHECK(contains(parse_plan_text(p, "a = value shift=0 bits=4\nm = mul_const a k=2 v=3\n"),
                       "line 2: give only one of 'k' and 'v'"));
        CHECK(p.steps.empty());
    }

    TEST_CASE("load_plan - format detection and missing files") {
        Plan p;
        const auto text_path = write_temp("fxp_loader_test.plan", kTextPlan);
        CHECK(load_plan(p, text_path).empty());
        CHECK(p.steps.size() == 6);

        const auto json_path = write_temp("fxp_loader_test.json",
                                          "  {\"steps\": [{\"name\": \"z\", \"op\": \"value\", \"shift\": 0, \"bits\": 1}]}");
        CHECK(load_plan(p, json_path).empty());
        REQUIRE(p.steps.size() == 1);
        CHECK(p.steps[0].name == "z");

        CHECK(contains(load_plan(p, write_temp("fxp_loader_empty.plan", " \n\t\n")), "is empty"));
        CHECK(contains(load_plan(p, "/nonexistent/fxp/plan.txt"), "cannot open plan file"));
    }

    TEST_CASE("apply_env_overrides - FXP_PLAN fills a missing plan path") {
        ::setenv("FXP_PLAN", "from_env.plan", 1);
        ToolConfig cfg;
        apply_env_overrides(cfg);
        CHECK(cfg.plan_path == "from_env.plan");

        ToolConfig cli;
        cli.plan_path = "from_cli.plan";
        apply_env_overrides(cli);
        CHECK(cli.plan_path == "from_cli.plan");
        ::unsetenv("FXP_PLAN");

        ToolConfig none;
        apply_env_overrides(none);
        CHECK(none.plan_path.empty());
    }

    TEST_CASE("validate_final - plan or table required") {
        ToolConfig cfg;
        CHECK(validate_final(cfg).size() == 1);
        cfg.table = true;
        CHECK(validate_final(cfg).empty());
        cfg.table = false;
        cfg.plan_path = "x.plan";
        CHECK(validate_final(cfg).empty());
    }
}
