#pragma once

#include <string>
#include <vector>

#include <fxp/config/types.hpp>
#include <fxp/plan/types.hpp>

namespace fxp::config {

// Read a plan file (JSON when it starts with '{', otherwise one "name = op ..." per line).
// Returns list of errors (empty if ok); 'out' is only replaced on success.
std::vector<std::string> load_plan(plan::Plan& out, const std::string& path);

// Parse plan text in either format. Errors carry the line (text) or step index (JSON).
std::vector<std::string> parse_plan_json(plan::Plan& out, const std::string& text);
std::vector<std::string> parse_plan_text(plan::Plan& out, const std::string& text);

// Apply FXP_PLAN on top of current cfg when no plan was given on the command line.
void apply_env_overrides(ToolConfig& cfg);

// Validate final config (a plan or --table is required). Returns list of errors.
std::vector<std::string> validate_final(const ToolConfig& cfg);

} // namespace fxp::config
