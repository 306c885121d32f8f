#pragma once

#include <fxp/logging/logger.hpp>

#include <atomic>

namespace fxp::logging {

// Info/warn go to stdout, errors to stderr. Debug lines carry a timestamp
// and are dropped unless enabled.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    bool debug_enabled() const { return enable_debug_.load(); }

private:
    std::atomic<bool> enable_debug_{false};
};

} // namespace fxp::logging
