#include <fxp/cli/args.hpp>

#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef FXP_VERSION
#define FXP_VERSION "0.0.0"
#endif

namespace fxp::cli {

fxp::config::ParseResult parse(int argc, char** argv, fxp::logging::Logger& log) {
    fxp::config::ParseResult pr;
    cxxopts::Options options("fxp-plan", "Audit fixed-point type plans against the fxp operation algebra");
    options.add_options()
        ("plan",   "Path to plan file (JSON or 'name = op ...' lines)", cxxopts::value<std::string>())
        ("json",   "Print the report as JSON")
        ("table",  "Print the storage width table")
        ("d,debug","Enable debug logging")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit");
    options.parse_positional({"plan"});
    options.positional_help("[plan]");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("fxp-plan v{}", FXP_VERSION));
            pr.show_only = true;
            return pr;
        }
        fxp::config::ToolConfig cfg;
        if (result.count("plan")) cfg.plan_path = result["plan"].as<std::string>();
        cfg.json = result.count("json") > 0;
        cfg.table = result.count("table") > 0;
        pr.debug = result.count("debug") > 0;
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace fxp::cli
