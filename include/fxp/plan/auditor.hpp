#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <fxp/descriptor.hpp>
#include <fxp/logging/logger.hpp>
#include <fxp/plan/types.hpp>

namespace fxp::plan {

// Mirrors the build-time diagnostics: a plan step fails for the same reason
// the equivalent template expression would not compile.
enum class ErrorKind {
    none,
    representation,  // literal not exact, rescale to a coarser shift, non power-of-two div_exact
    capacity,        // result needs more bits than the widest storage, or a shift leaves int
    plan,            // malformed step, or an operand failed earlier
};

const char* to_string(ErrorKind k);

struct Outcome {
    std::string name;
    Op op{Op::value};
    std::size_t line{0};
    std::optional<descriptor> desc;  // also set on capacity errors
    int storage_index{-1};           // into storage_table, -1 when nothing fits
    std::optional<uint128_t> magnitude;  // stored |raw| for literal steps
    bool negative{false};
    bool lossy{false};               // raw_shr, div_const_trunc, div_trunc
    ErrorKind error{ErrorKind::none};
    std::string message;

    bool ok() const { return error == ErrorKind::none; }
};

struct Report {
    std::vector<Outcome> outcomes;

    bool ok() const { return failures() == 0; }
    std::size_t failures() const;
    const Outcome* find(const std::string& name) const;
};

// Derive every step's descriptor and storage with fxp::rules. Steps are
// audited in order; a failure does not stop the remaining steps. Each step
// is checked with config::validate_step first, so an unvalidated plan fails
// the malformed steps instead of reading missing operands or parameters.
Report audit(const Plan& plan, logging::Logger& log);

} // namespace fxp::plan
