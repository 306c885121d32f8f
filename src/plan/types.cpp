#include <fxp/plan/types.hpp>

#include <array>
#include <utility>

namespace fxp::plan {

namespace {

constexpr std::array<std::pair<Op, const char*>, 19> kOpNames{{
    {Op::literal, "literal"},
    {Op::value, "value"},
    {Op::add, "add"},
    {Op::sub, "sub"},
    {Op::mul, "mul"},
    {Op::neg, "neg"},
    {Op::abs, "abs"},
    {Op::min, "min"},
    {Op::max, "max"},
    {Op::sum, "sum"},
    {Op::shl, "shl"},
    {Op::shr, "shr"},
    {Op::raw_shl, "raw_shl"},
    {Op::raw_shr, "raw_shr"},
    {Op::rescale, "rescale"},
    {Op::mul_const, "mul_const"},
    {Op::div_exact, "div_exact"},
    {Op::div_const_trunc, "div_const_trunc"},
    {Op::div_trunc, "div_trunc"},
}};

} // namespace

const char* to_string(Op op) {
    for (const auto& [o, name] : kOpNames) {
        if (o == op) return name;
    }
    return "?";
}

std::optional<Op> op_from_string(const std::string& s) {
    for (const auto& [o, name] : kOpNames) {
        if (s == name) return o;
    }
    return std::nullopt;
}

} // namespace fxp::plan
