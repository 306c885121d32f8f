/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>

#include <fmt/format.h>

#include <fxp/descriptor.hpp>
#include <fxp/fixed.hpp>
#include <fxp/storage.hpp>

namespace fxp {

// "fixed<shift=-3, bits=5, unsigned> as uint8"
inline std::string describe(const descriptor& d) {
    const int index = resolve_index(d.bits, d.is_signed);
    return fmt::format("fixed<shift={}, bits={}, {}> as {}", d.shift, d.bits,
                       d.is_signed ? "signed" : "unsigned",
                       index < 0 ? "<no storage>" : storage_table[index].name);
}

template <class T>
std::string describe() {
    return describe(T::desc);
}

} // namespace fxp

// Prints the double approximation; accepts any floating-point format spec.
template <int S, unsigned B, bool G>
struct fmt::formatter<fxp::fixed<S, B, G>> : fmt::formatter<double> {
    template <typename FormatContext>
    auto format(const fxp::fixed<S, B, G>& v, FormatContext& ctx) const {
        return fmt::formatter<double>::format(v.to_double(), ctx);
    }
};

template <>
struct fmt::formatter<fxp::descriptor> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const fxp::descriptor& d, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(fxp::describe(d), ctx);
    }
};
