/*
 * fxp-plan: audit fixed-point type plans
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <string>

#include <fmt/core.h>

#include <fxp/cli/args.hpp>
#include <fxp/config/loader.hpp>
#include <fxp/logging/fmt_logger.hpp>
#include <fxp/plan/auditor.hpp>
#include <fxp/plan/report.hpp>

int main(int argc, char** argv) {
    fxp::logging::FmtLogger log;
    auto parsed = fxp::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.cfg.has_value()) {
        return 2;
    }
    log.set_debug(parsed.debug);
    auto cfg = *parsed.cfg;

    // CLI first, then FXP_PLAN when no plan was named
    fxp::config::apply_env_overrides(cfg);
    auto errs = fxp::config::validate_final(cfg);
    if (!errs.empty()) {
        for (const auto& e : errs) log.error(e);
        return 2;
    }

    if (cfg.table) {
        fmt::print("{}", fxp::plan::render_storage_table());
        if (cfg.plan_path.empty()) return 0;
    }

    fxp::plan::Plan plan;
    errs = fxp::config::load_plan(plan, cfg.plan_path);
    if (!errs.empty()) {
        for (const auto& e : errs) log.error(fmt::format("{}: {}", cfg.plan_path, e));
        return 2;
    }
    log.debug(fmt::format("loaded {} step(s) from {}", plan.steps.size(), cfg.plan_path));

    const auto report = fxp::plan::audit(plan, log);
    if (cfg.json) {
        fmt::print("{}\n", fxp::plan::to_json(report).dump(2));
    } else {
        fmt::print("{}", fxp::plan::render_text(report));
    }
    return report.ok() ? 0 : 1;
}
