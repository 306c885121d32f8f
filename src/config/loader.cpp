#include <fxp/config/loader.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <fxp/config/validator.hpp>

namespace fxp::config {

namespace {

template <class I>
bool parse_int(const std::string& s, I& out) {
    const char* first = s.data();
    if (!s.empty() && s[0] == '+') ++first;
    const char* last = s.data() + s.size();
    auto [p, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && p == last && first != last;
}

std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// key=value parameter of a text step.
bool apply_param(plan::Step& step, const std::string& key, const std::string& val, std::string& err) {
    if (key == "shift") {
        int v = 0;
        if (!parse_int(val, v)) { err = fmt::format("shift '{}' is not an integer", val); return false; }
        step.shift = v;
    } else if (key == "bits") {
        unsigned v = 0;
        if (!parse_int(val, v)) { err = fmt::format("bits '{}' is not a non-negative integer", val); return false; }
        step.bits = v;
    } else if (key == "k" || key == "v") {
        if (step.constant) { err = "give only one of 'k' and 'v'"; return false; }
        std::int64_t v = 0;
        if (!parse_int(val, v)) { err = fmt::format("{} '{}' is not an integer", key, val); return false; }
        step.constant = v;
    } else {
        err = fmt::format("unknown parameter '{}'", key);
        return false;
    }
    return true;
}

bool parse_text_line(plan::Step& step, const std::string& line, std::string& err) {
    const auto eq = line.find('=');
    if (eq == std::string::npos) { err = "expected 'name = op ...'"; return false; }
    step.name = trim(line.substr(0, eq));
    auto toks = split_ws(line.substr(eq + 1));
    if (toks.empty()) { err = "missing operation"; return false; }
    auto op = plan::op_from_string(toks[0]);
    if (!op) { err = fmt::format("unknown operation '{}'", toks[0]); return false; }
    step.op = *op;
    for (std::size_t i = 1; i < toks.size(); ++i) {
        const std::string& t = toks[i];
        const auto p = t.find('=');
        if (p != std::string::npos) {
            if (!apply_param(step, t.substr(0, p), t.substr(p + 1), err)) return false;
        } else if (t == "signed") {
            step.is_signed = true;
        } else if (t == "unsigned") {
            step.is_signed = false;
        } else if (step.op == plan::Op::literal && step.literal.empty()) {
            step.literal = t;
        } else {
            step.args.push_back(t);
        }
    }
    return true;
}

// Integer-valued JSON field, rejecting fractions and values outside I.
template <class I>
I json_int(const nlohmann::json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number_integer()) throw std::runtime_error(fmt::format("'{}' must be an integer", key));
    bool in_range = false;
    if (v.is_number_unsigned()) {
        in_range = v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<I>::max());
    } else {
        const std::int64_t x = v.get<std::int64_t>();
        in_range = x >= static_cast<std::int64_t>(std::numeric_limits<I>::min()) &&
                   (x < 0 || static_cast<std::uint64_t>(x) <= static_cast<std::uint64_t>(std::numeric_limits<I>::max()));
    }
    if (!in_range) throw std::runtime_error(fmt::format("'{}' {} is out of range", key, v.dump()));
    return v.get<I>();
}

void parse_json_step(plan::Step& step, const nlohmann::json& j) {
    step.name = j.at("name").get<std::string>();
    const auto op_name = j.at("op").get<std::string>();
    auto op = plan::op_from_string(op_name);
    if (!op) throw std::runtime_error(fmt::format("unknown operation '{}'", op_name));
    step.op = *op;
    if (j.contains("args")) step.args = j.at("args").get<std::vector<std::string>>();
    if (j.contains("literal")) {
        if (!j.at("literal").is_string()) throw std::runtime_error("'literal' must be a string");
        step.literal = j.at("literal").get<std::string>();
    }
    if (j.contains("shift")) step.shift = json_int<int>(j, "shift");
    if (j.contains("bits")) step.bits = json_int<unsigned>(j, "bits");
    if (j.contains("signed")) step.is_signed = j.at("signed").get<bool>();
    if (j.contains("k") && j.contains("v")) throw std::runtime_error("give only one of 'k' and 'v'");
    if (j.contains("k")) step.constant = json_int<std::int64_t>(j, "k");
    if (j.contains("v")) step.constant = json_int<std::int64_t>(j, "v");
}

} // namespace

std::vector<std::string> parse_plan_text(plan::Plan& out, const std::string& text) {
    std::vector<std::string> errs;
    plan::Plan p;
    std::istringstream iss(text);
    std::string line;
    std::size_t n = 0;
    while (std::getline(iss, line)) {
        ++n;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        if (trim(line).empty()) continue;
        plan::Step step;
        step.line = n;
        std::string e;
        if (!parse_text_line(step, line, e)) {
            errs.push_back(fmt::format("line {}: {}", n, e));
            continue;
        }
        p.steps.push_back(std::move(step));
    }
    if (!errs.empty()) return errs;
    errs = validate_plan(p);
    if (errs.empty()) out = std::move(p);
    return errs;
}

std::vector<std::string> parse_plan_json(plan::Plan& out, const std::string& text) {
    std::vector<std::string> errs;
    plan::Plan p;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.contains("steps") || !j.at("steps").is_array()) {
            errs.push_back("'steps' must be an array");
            return errs;
        }
        std::size_t n = 0;
        for (const auto& js : j.at("steps")) {
            ++n;
            plan::Step step;
            step.line = n;
            try {
                parse_json_step(step, js);
            } catch (const std::exception& ex) {
                errs.push_back(fmt::format("step {}: {}", n, ex.what()));
                continue;
            }
            p.steps.push_back(std::move(step));
        }
    } catch (const std::exception& ex) {
        errs.push_back(fmt::format("Failed to read plan: {}", ex.what()));
    }
    if (!errs.empty()) return errs;
    errs = validate_plan(p);
    if (errs.empty()) out = std::move(p);
    return errs;
}

std::vector<std::string> load_plan(plan::Plan& out, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {fmt::format("cannot open plan file '{}'", path)};

    std::stringstream buffer; buffer << in.rdbuf();
    const std::string text = buffer.str();
    const auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return {fmt::format("plan file '{}' is empty", path)};

    if (text[first_non_space] == '{') return parse_plan_json(out, text);
    return parse_plan_text(out, text);
}

void apply_env_overrides(ToolConfig& cfg) {
    if (!cfg.plan_path.empty()) return;
    if (const char* v = std::getenv("FXP_PLAN")) cfg.plan_path = v;
}

std::vector<std::string> validate_final(const ToolConfig& cfg) {
    std::vector<std::string> errs;
    if (cfg.plan_path.empty() && !cfg.table) errs.push_back("a plan file (--plan or FXP_PLAN) or --table is required");
    return errs;
}

} // namespace fxp::config
