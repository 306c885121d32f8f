#include <fxp/config/validator.hpp>

#include <cctype>
#include <set>

#include <fmt/core.h>

namespace fxp::config {

namespace {

constexpr unsigned kMaxBits = 4096;
constexpr int kMaxShift = 1 << 20;
constexpr std::int64_t kMaxShiftAmount = 4096;

bool expect_args(const plan::Step& step, std::size_t n, std::string& err) {
    if (step.args.size() != n) {
        err = fmt::format("'{}' takes {} operand(s), got {}", plan::to_string(step.op), n, step.args.size());
        return false;
    }
    return true;
}

bool expect_shift(const plan::Step& step, std::string& err) {
    if (!step.shift) { err = fmt::format("'{}' requires shift", plan::to_string(step.op)); return false; }
    if (*step.shift < -kMaxShift || *step.shift > kMaxShift) { err = fmt::format("shift {} out of range", *step.shift); return false; }
    return true;
}

bool expect_bits(const plan::Step& step, bool required, std::string& err) {
    if (!step.bits) {
        if (required) { err = fmt::format("'{}' requires bits", plan::to_string(step.op)); return false; }
        return true;
    }
    if (*step.bits > kMaxBits) { err = fmt::format("bits {} out of range (max {})", *step.bits, kMaxBits); return false; }
    return true;
}

bool expect_constant(const plan::Step& step, std::string& err) {
    if (!step.constant) { err = fmt::format("'{}' requires a constant", plan::to_string(step.op)); return false; }
    return true;
}

bool expect_shift_amount(const plan::Step& step, std::string& err) {
    if (!expect_constant(step, err)) return false;
    if (*step.constant < 0 || *step.constant > kMaxShiftAmount) {
        err = fmt::format("shift amount {} out of range [0..{}]", *step.constant, kMaxShiftAmount);
        return false;
    }
    return true;
}

} // namespace

bool is_valid_name(const std::string& name, std::string& err) {
    if (name.empty()) { err = "empty value name"; return false; }
    if (name.size() > 64) { err = "value name too long (>64)"; return false; }
    if (std::isdigit(static_cast<unsigned char>(name[0]))) {
        err = fmt::format("value name '{}' cannot start with a digit", name); return false; }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
            err = fmt::format("value name '{}' contains invalid characters", name); return false; }
    }
    return true;
}

bool validate_step(const plan::Step& step, std::string& err) {
    using plan::Op;
    if (!is_valid_name(step.name, err)) return false;
    switch (step.op) {
        case Op::literal:
            if (step.literal.empty()) { err = "'literal' requires a decimal literal"; return false; }
            return expect_args(step, 0, err) && expect_shift(step, err) && expect_bits(step, false, err);
        case Op::value:
            return expect_args(step, 0, err) && expect_shift(step, err) && expect_bits(step, true, err);
        case Op::add:
        case Op::sub:
        case Op::mul:
        case Op::min:
        case Op::max:
            return expect_args(step, 2, err);
        case Op::neg:
        case Op::abs:
            return expect_args(step, 1, err);
        case Op::sum:
            if (step.args.empty()) { err = "'sum' needs at least one operand"; return false; }
            return true;
        case Op::shl:
        case Op::shr:
        case Op::raw_shl:
        case Op::raw_shr:
            return expect_args(step, 1, err) && expect_shift_amount(step, err);
        case Op::rescale:
            return expect_args(step, 1, err) && expect_shift(step, err);
        case Op::mul_const:
        case Op::div_exact:
        case Op::div_const_trunc:
            return expect_args(step, 1, err) && expect_constant(step, err);
        case Op::div_trunc:
            return expect_args(step, 2, err) && expect_shift(step, err) && expect_bits(step, true, err);
    }
    err = "unknown operation";
    return false;
}

std::vector<std::string> validate_plan(const plan::Plan& plan) {
    std::vector<std::string> errs;
    std::set<std::string> defined;
    for (const auto& step : plan.steps) {
        std::string e;
        if (!validate_step(step, e)) {
            errs.push_back(fmt::format("line {}: {}", step.line, e));
            continue;
        }
        for (const auto& arg : step.args) {
            if (!defined.count(arg)) {
                errs.push_back(fmt::format("line {}: '{}' uses '{}' before it is defined", step.line, step.name, arg));
            }
        }
        if (!defined.insert(step.name).second) {
            errs.push_back(fmt::format("line {}: '{}' is defined twice", step.line, step.name));
        }
    }
    return errs;
}

} // namespace fxp::config
