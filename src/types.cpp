// src/types.cpp
// Implementation of utility functions for types and constants

#include "sessiondb/types.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace sessiondb {

SessionData::SessionData(const SessionId& session_id, Timestamp created_ms,
                         Timestamp accessed_ms, Timestamp last_accessed_ms,
                         int64_t max_inactive_seconds)
    : id(session_id)
    , created(created_ms)
    , accessed(accessed_ms)
    , last_accessed(last_accessed_ms)
    , max_inactive_secs(max_inactive_seconds) {
    expiry = calc_expiry(created_ms);
}

Timestamp SessionData::calc_expiry(Timestamp time_ms) const {
    return max_inactive_secs <= 0 ? 0 : time_ms + max_inactive_secs * 1000;
}

bool SessionData::is_expired_at(Timestamp time_ms) const {
    if (max_inactive_secs <= 0 || expiry <= 0) {
        return false;
    }
    return expiry <= time_ms;
}

void SessionData::set_attribute(const std::string& name, const PropertyValue& value) {
    attributes[name] = value;
    dirty = true;
}

size_t SessionData::remove_attribute(const std::string& name) {
    size_t removed = attributes.erase(name);
    if (removed > 0) {
        dirty = true;
    }
    return removed;
}

namespace Utils {

std::string dialect_to_string(Dialect dialect) {
    switch (dialect) {
        case Dialect::GENERIC: return "GENERIC";
        case Dialect::SQLITE: return "SQLITE";
        case Dialect::POSTGRESQL: return "POSTGRESQL";
        case Dialect::MYSQL: return "MYSQL";
        case Dialect::ORACLE: return "ORACLE";
        default: return "GENERIC";
    }
}

Dialect string_to_dialect(const std::string& dialect_str) {
    std::string upper = dialect_str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "SQLITE" || upper == "SQLITE3") return Dialect::SQLITE;
    if (upper == "POSTGRESQL" || upper == "POSTGRES") return Dialect::POSTGRESQL;
    if (upper == "MYSQL" || upper == "MARIADB") return Dialect::MYSQL;
    if (upper == "ORACLE") return Dialect::ORACLE;
    return Dialect::GENERIC;
}

std::string save_result_to_string(SaveResult result) {
    switch (result) {
        case SaveResult::INSERTED: return "INSERTED";
        case SaveResult::UPDATED: return "UPDATED";
        case SaveResult::CONFLICT: return "CONFLICT";
        default: return "UNKNOWN";
    }
}

Timestamp now_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool is_valid_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id.length() > Constants::MAX_SESSION_ID_LENGTH) {
        return false;
    }
    return std::all_of(session_id.begin(), session_id.end(), [](unsigned char c) {
        return std::isprint(c) && !std::isspace(c);
    });
}

} // namespace Utils
} // namespace sessiondb
