#pragma once

#include <fxp/config/types.hpp>
#include <fxp/logging/logger.hpp>

namespace fxp::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
fxp::config::ParseResult parse(int argc, char** argv, fxp::logging::Logger& log);

} // namespace fxp::cli
