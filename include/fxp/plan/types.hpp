#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fxp::plan {

// Operations a plan step may apply; each maps onto one fxp::rules function.
enum class Op {
    literal,          // decimal literal at a shift (optional explicit bits/signedness)
    value,            // explicit descriptor: shift, bits, signedness
    add,
    sub,
    mul,
    neg,
    abs,
    min,
    max,
    sum,              // balanced sum of 1..n operands
    shl,              // logical, k
    shr,              // logical, k
    raw_shl,          // k
    raw_shr,          // k, lossy
    rescale,          // to shift
    mul_const,        // v
    div_exact,        // v, power of two
    div_const_trunc,  // v, lossy
    div_trunc,        // target shift/bits/signedness, lossy
};

struct Step {
    std::string name;
    Op op{Op::value};
    std::vector<std::string> args;  // operand names
    std::string literal;            // Op::literal
    std::optional<int> shift;
    std::optional<unsigned> bits;
    std::optional<bool> is_signed;
    std::optional<std::int64_t> constant;  // k for shifts, v for mul_const/div_*
    std::size_t line{0};                   // 1-based source line or array index
};

struct Plan {
    std::vector<Step> steps;
};

const char* to_string(Op op);
std::optional<Op> op_from_string(const std::string& s);

} // namespace fxp::plan
