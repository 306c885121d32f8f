#include <fxp/plan/report.hpp>


#include <fmt/format.h>

#include <fxp/storage.hpp>

namespace fxp::plan {

namespace {

std::string stored_text(const Outcome& o) {
    if (!o.magnitude) return "-";
    return fmt::format("{}{}", o.negative ? "-" : "", *o.magnitude);
}

} // namespace

std::string render_text(const Report& report) {
    std::string out = fmt::format("{:<16} {:<16} {:>7} {:>5} {:<8} {:<8} {}\n",
                                  "name", "op", "shift", "bits", "sign", "storage", "stored");
    for (const auto& o : report.outcomes) {
        if (o.desc) {
            out += fmt::format("{:<16} {:<16} {:>7} {:>5} {:<8} {:<8} {}{}\n", o.name, to_string(o.op),
                               o.desc->shift, o.desc->bits, o.desc->is_signed ? "signed" : "unsigned",
                               o.storage_index < 0 ? "-" : storage_table[o.storage_index].name, stored_text(o),
                               o.lossy ? " (truncating)" : "");
        } else {
            out += fmt::format("{:<16} {:<16} {:>7} {:>5} {:<8} {:<8} -\n", o.name, to_string(o.op), "-", "-",
                               "-", "-");
        }
        if (!o.ok()) out += fmt::format("  line {}: fxp {}: {}\n", o.line, to_string(o.error), o.message);
    }
    out += fmt::format("{} step(s), {} failure(s)\n", report.outcomes.size(), report.failures());
    return out;
}

nlohmann::json to_json(const Report& report) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& o : report.outcomes) {
        nlohmann::json j;
        j["name"] = o.name;
        j["op"] = to_string(o.op);
        j["line"] = o.line;
        if (o.desc) {
            j["shift"] = o.desc->shift;
            j["bits"] = o.desc->bits;
            j["signed"] = o.desc->is_signed;
        }
        if (o.storage_index >= 0) j["storage"] = storage_table[o.storage_index].name;
        if (o.magnitude) j["stored"] = stored_text(o);
        if (o.lossy) j["truncating"] = true;
        if (!o.ok()) {
            j["error"] = to_string(o.error);
            j["message"] = o.message;
        }
        steps.push_back(std::move(j));
    }
    return {{"ok", report.ok()}, {"failures", report.failures()}, {"steps", std::move(steps)}};
}

std::string render_storage_table() {
    std::string out = fmt::format("{:<8} {:>5} {:<8} {:>8}\n", "storage", "width", "sign", "max bits");
    for (const auto& s : storage_table) {
        out += fmt::format("{:<8} {:>5} {:<8} {:>8}\n", s.name, s.width, s.is_signed ? "signed" : "unsigned",
                           s.capacity());
    }
    return out;
}

} // namespace fxp::plan
