#pragma once

#include <string>
#include <vector>

#include <fxp/plan/types.hpp>

namespace fxp::config {

// Validates a value name ([A-Za-z_][A-Za-z0-9_]*, at most 64 chars) and returns error in 'err' if invalid.
bool is_valid_name(const std::string& name, std::string& err);

// Checks operand count and the parameters a step's operation requires.
bool validate_step(const plan::Step& step, std::string& err);

// Whole plan: every step valid, names unique, operands defined before use. Returns list of errors.
std::vector<std::string> validate_plan(const plan::Plan& plan);

} // namespace fxp::config
