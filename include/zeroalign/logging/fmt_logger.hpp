#pragma once

#include <zeroalign/logging/logger.hpp>

#include <atomic>
#include <string>

namespace zeroalign::logging {

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

// Stage trace line: tag right-aligned in a 12 column bracket, "[    COLLAPSE] ...".
std::string tagged(std::string_view tag, std::string_view msg);

} // namespace zeroalign::logging
