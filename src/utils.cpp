// src/utils.cpp
// Implementation of utility functions for common operations

#include "sessiondb/utils.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace sessiondb {
namespace Utils {

namespace {

std::atomic<SystemLogLevel> g_log_level{SystemLogLevel::ERROR};
std::mutex g_log_mutex;

} // namespace

// String utilities
std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

bool is_blank(const std::string& str) {
    return trim(str).empty();
}

bool is_valid_identifier(const std::string& identifier) {
    if (identifier.empty() || identifier.length() > 128) {
        return false;
    }
    static const std::regex identifier_regex(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
    return std::regex_match(identifier, identifier_regex);
}

std::string get_hostname() {
#ifdef _WIN32
    char hostname[256];
    DWORD size = sizeof(hostname);
    if (GetComputerNameA(hostname, &size)) {
        return std::string(hostname);
    }
    return "unknown-host";
#else
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[255] = '\0'; // Ensure null termination
        return std::string(hostname);
    }
    return "unknown-host";
#endif
}

NodeId default_node_id() {
    // Hostnames may carry dots and dashes; node ids are compared verbatim
    std::string host = to_lower(get_hostname());
    std::replace(host.begin(), host.end(), '.', '_');
    std::replace(host.begin(), host.end(), '-', '_');
    if (host.length() > 60) {
        host.resize(60);
    }
    return host.empty() ? "node0" : host;
}

// Logging
void set_log_level(SystemLogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

SystemLogLevel get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

bool is_log_enabled(SystemLogLevel level) {
    return level != SystemLogLevel::NONE &&
           static_cast<uint8_t>(level) <= static_cast<uint8_t>(get_log_level());
}

std::string log_level_to_string(SystemLogLevel level) {
    switch (level) {
        case SystemLogLevel::NONE: return "NONE";
        case SystemLogLevel::ERROR: return "ERROR";
        case SystemLogLevel::WARN: return "WARN";
        case SystemLogLevel::INFO: return "INFO";
        case SystemLogLevel::DEBUG: return "DEBUG";
        case SystemLogLevel::TRACE: return "TRACE";
        default: return "NONE";
    }
}

void log(SystemLogLevel level, const std::string& component, const std::string& message) {
    if (!is_log_enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = now_milliseconds() % 1000;

    std::ostringstream line;
    line << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms << "Z"
         << " [" << log_level_to_string(level) << "] "
         << component << ": " << message;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line.str() << std::endl;
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(Duration& output)
    : start_time_(Clock::now()), output_(&output), callback_(nullptr) {}

ScopedTimer::ScopedTimer(std::function<void(Duration)> callback)
    : start_time_(Clock::now()), output_(nullptr), callback_(std::move(callback)) {}

ScopedTimer::~ScopedTimer() {
    Duration elapsed_time = std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
    if (output_) {
        *output_ = elapsed_time;
    }
    if (callback_) {
        callback_(elapsed_time);
    }
}

ScopedTimer::Duration ScopedTimer::elapsed() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

} // namespace Utils
} // namespace sessiondb
