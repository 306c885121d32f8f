#pragma once

#include <string>
#include <optional>

namespace fxp::config {

struct ToolConfig {
    std::string plan_path;  // empty: no plan, only --table output
    bool json{false};       // emit the report as JSON instead of a table
    bool table{false};      // print the storage width table
};

struct ParseResult {
    std::optional<ToolConfig> cfg; // present when valid and ready to run
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
};

} // namespace fxp::config
