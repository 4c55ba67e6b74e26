// include/sessiondb/utils.hpp
// Purpose: Utility functions and helpers for the sessiondb library
// Provides string helpers, host identification and internal diagnostics

#pragma once

#include "types.hpp"
#include "config.hpp"
#include <string>
#include <chrono>
#include <functional>

namespace sessiondb {
namespace Utils {

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
bool is_blank(const std::string& str);

// SQL identifier check for configurable table/column names
bool is_valid_identifier(const std::string& identifier);

// Host utilities
std::string get_hostname();
NodeId default_node_id();

// Internal diagnostics, written to std::cerr when enabled
void set_log_level(SystemLogLevel level);
SystemLogLevel get_log_level();
bool is_log_enabled(SystemLogLevel level);
void log(SystemLogLevel level, const std::string& component, const std::string& message);
std::string log_level_to_string(SystemLogLevel level);

// RAII timer for performance measurement
class ScopedTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;

    explicit ScopedTimer(Duration& output);
    explicit ScopedTimer(std::function<void(Duration)> callback);
    ~ScopedTimer();

    Duration elapsed() const;

private:
    TimePoint start_time_;
    Duration* output_;
    std::function<void(Duration)> callback_;
};

} // namespace Utils
} // namespace sessiondb
