#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <fxp/plan/auditor.hpp>

namespace fxp::plan {

// One row per step: name, op, shift, bits, sign, storage, then the error if any.
std::string render_text(const Report& report);

// {"ok": bool, "failures": n, "steps": [...]}; 128-bit magnitudes are strings.
nlohmann::json to_json(const Report& report);

std::string render_storage_table();

} // namespace fxp::plan
