#include <fxp/plan/auditor.hpp>

#include <algorithm>
#include <map>

#include <fmt/core.h>

#include <fxp/config/validator.hpp>
#include <fxp/format.hpp>
#include <fxp/literal.hpp>
#include <fxp/rules.hpp>
#include <fxp/storage.hpp>

namespace fxp::plan {

namespace {

bool fail(Outcome& o, ErrorKind kind, std::string msg) {
    o.error = kind;
    o.message = std::move(msg);
    return false;
}

// Widens every shift the step's rule forms. A template would reject the
// same expression once one of them leaves int.
bool shifts_fit(Outcome& o, const Step& step, const std::vector<descriptor>& in) {
    std::vector<long long> formed;
    const long long k = step.constant.value_or(0);
    switch (step.op) {
        case Op::add:
        case Op::sub:
        case Op::min:
        case Op::max:
        case Op::sum: {
            // realignment distance between the nonzero operands
            bool any = false;
            long long lo = 0;
            long long hi = 0;
            for (const auto& d : in) {
                if (d.bits == 0) continue;
                lo = any ? std::min<long long>(lo, d.shift) : d.shift;
                hi = any ? std::max<long long>(hi, d.shift) : d.shift;
                any = true;
            }
            formed.push_back(hi - lo);
            break;
        }
        case Op::mul:
            formed.push_back(static_cast<long long>(in[0].shift) + in[1].shift);
            break;
        case Op::shl:
        case Op::raw_shr:
            formed.push_back(in[0].shift + k);
            break;
        case Op::shr:
        case Op::raw_shl:
            formed.push_back(in[0].shift - k);
            break;
        case Op::rescale:
            formed.push_back(static_cast<long long>(in[0].shift) - *step.shift);
            break;
        case Op::div_exact:
            if (k != 0) {
                const long long log2v = static_cast<long long>(detail::bit_length(detail::magnitude(k))) - 1;
                formed.push_back(in[0].shift - log2v);
            }
            break;
        case Op::div_trunc:
            formed.push_back(static_cast<long long>(in[0].shift) - in[1].shift);
            formed.push_back(static_cast<long long>(in[0].shift) - in[1].shift - *step.shift);
            break;
        default:
            break;
    }
    for (long long s : formed) {
        if (!rules::shift_fits(s)) {
            return fail(o, ErrorKind::capacity,
                        fmt::format("{} derives shift {}, outside the int range", to_string(step.op), s));
        }
    }
    return true;
}

bool eval_literal(Outcome& o, const Step& step) {
    const parsed_decimal p = parse_decimal(step.literal.data(), step.literal.size());
    if (!p.ok) return fail(o, ErrorKind::representation, fmt::format("literal '{}': {}", step.literal, p.error));
    const int shift = *step.shift;
    const representation r = represent(p.num, p.den, shift);
    if (!r.exact) {
        return fail(o, ErrorKind::representation,
                    fmt::format("literal {} is not a whole multiple of 2^{}", step.literal, shift));
    }
    if (step.bits && r.bits > *step.bits) {
        return fail(o, ErrorKind::representation,
                    fmt::format("literal {} needs {} bits, {} requested", step.literal, r.bits, *step.bits));
    }
    if (step.is_signed && !*step.is_signed && r.negative) {
        return fail(o, ErrorKind::representation,
                    fmt::format("negative literal {} needs a signed type", step.literal));
    }
    o.desc = descriptor{shift, step.bits ? *step.bits : r.bits, step.is_signed ? *step.is_signed : r.negative};
    if (r.bits <= 128) {
        o.magnitude = r.magnitude;
        o.negative = r.negative;
    }
    return true;
}

bool eval(Outcome& o, const Step& step, const std::vector<descriptor>& in) {
    switch (step.op) {
        case Op::literal:
            return eval_literal(o, step);
        case Op::value:
            o.desc = descriptor{*step.shift, *step.bits, step.is_signed.value_or(false)};
            return true;
        case Op::add: o.desc = rules::add(in[0], in[1]); return true;
        case Op::sub: o.desc = rules::sub(in[0], in[1]); return true;
        case Op::mul: o.desc = rules::mul(in[0], in[1]); return true;
        case Op::neg: o.desc = rules::neg(in[0]); return true;
        case Op::abs: o.desc = rules::abs(in[0]); return true;
        case Op::min:
        case Op::max:
            o.desc = rules::common(in[0], in[1]);
            return true;
        case Op::sum:
            o.desc = rules::sum(in.data(), in.size());
            return true;
        case Op::shl: o.desc = rules::shl(in[0], static_cast<unsigned>(*step.constant)); return true;
        case Op::shr: o.desc = rules::shr(in[0], static_cast<unsigned>(*step.constant)); return true;
        case Op::raw_shl: o.desc = rules::raw_shl(in[0], static_cast<unsigned>(*step.constant)); return true;
        case Op::raw_shr:
            o.lossy = true;
            o.desc = rules::raw_shr(in[0], static_cast<unsigned>(*step.constant));
            return true;
        case Op::rescale:
            if (!rules::can_rescale(in[0], *step.shift)) {
                return fail(o, ErrorKind::representation,
                            fmt::format("rescale from shift {} to coarser shift {} drops bits (use raw_shr)",
                                        in[0].shift, *step.shift));
            }
            o.desc = rules::rescale(in[0], *step.shift);
            return true;
        case Op::mul_const:
            o.desc = rules::mul_const(in[0], *step.constant);
            return true;
        case Op::div_exact:
            if (!rules::can_div_exact(*step.constant)) {
                return fail(o, ErrorKind::representation,
                            fmt::format("div_exact by {} is not exact (divisor must be a power of two)",
                                        *step.constant));
            }
            o.desc = rules::div_exact(in[0], *step.constant);
            return true;
        case Op::div_const_trunc:
            if (!rules::can_div_const_trunc(*step.constant)) {
                return fail(o, ErrorKind::representation, "div_const_trunc by zero");
            }
            o.lossy = true;
            o.desc = rules::div_const_trunc(in[0], *step.constant);
            return true;
        case Op::div_trunc: {
            o.lossy = true;
            const descriptor target{*step.shift, *step.bits, step.is_signed.value_or(false)};
            o.desc = target;
            if (!rules::can_div_trunc(in[0], in[1], target)) {
                return fail(o, ErrorKind::capacity,
                            fmt::format("div_trunc target {} cannot hold the worst-case quotient "
                                        "({} bits) or drops a sign",
                                        describe(target), rules::div_trunc_bound(in[0], in[1], target.shift)));
            }
            const descriptor w = rules::div_trunc_work(in[0], in[1], target.shift);
            if (!fits(w)) {
                return fail(o, ErrorKind::capacity,
                            fmt::format("div_trunc intermediate needs {} bits, widest storage holds {}",
                                        w.bits, max_bits(w.is_signed)));
            }
            return true;
        }
    }
    return fail(o, ErrorKind::plan, "unknown operation");
}

} // namespace

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::none: return "ok";
        case ErrorKind::representation: return "representation error";
        case ErrorKind::capacity: return "capacity error";
        case ErrorKind::plan: return "plan error";
    }
    return "?";
}

std::size_t Report::failures() const {
    std::size_t n = 0;
    for (const auto& o : outcomes) {
        if (!o.ok()) ++n;
    }
    return n;
}

const Outcome* Report::find(const std::string& name) const {
    for (const auto& o : outcomes) {
        if (o.name == name) return &o;
    }
    return nullptr;
}

Report audit(const Plan& plan, logging::Logger& log) {
    Report report;
    std::map<std::string, std::size_t> index;
    for (const auto& step : plan.steps) {
        Outcome o;
        o.name = step.name;
        o.op = step.op;
        o.line = step.line;

        std::vector<descriptor> in;
        std::string invalid;
        bool operands_ok = config::validate_step(step, invalid);
        if (!operands_ok) fail(o, ErrorKind::plan, invalid);
        for (const auto& arg : step.args) {
            if (!operands_ok) break;
            auto it = index.find(arg);
            if (it == index.end()) {
                fail(o, ErrorKind::plan, fmt::format("operand '{}' is not defined", arg));
                operands_ok = false;
                break;
            }
            const Outcome& src = report.outcomes[it->second];
            if (!src.ok()) {
                fail(o, ErrorKind::plan, fmt::format("operand '{}' failed", arg));
                operands_ok = false;
                break;
            }
            in.push_back(*src.desc);
        }

        if (operands_ok && shifts_fit(o, step, in) && eval(o, step, in)) {
            o.storage_index = resolve_index(o.desc->bits, o.desc->is_signed);
            if (o.storage_index < 0) {
                fail(o, ErrorKind::capacity,
                     fmt::format("{} needs {} {} bits, widest storage holds {}", to_string(step.op), o.desc->bits,
                                 o.desc->is_signed ? "signed" : "unsigned", max_bits(o.desc->is_signed)));
            }
        }

        if (o.ok()) {
            log.debug(fmt::format("{} = {} -> {}", o.name, to_string(o.op), describe(*o.desc)));
        } else {
            log.debug(fmt::format("{} = {} failed: {}", o.name, to_string(o.op), o.message));
        }
        index[o.name] = report.outcomes.size();
        report.outcomes.push_back(std::move(o));
    }
    return report;
}

} // namespace fxp::plan
