// include/sessiondb/types.hpp
// Purpose: Core types, constants, and enums for the sessiondb library
// Shared by the statement builder, the data store and the attribute codec

#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <cstdint>
#include <memory>
#include <variant>

namespace sessiondb {

// Forward declarations
class Properties;
class Error;

// Type aliases for clarity
using SessionId = std::string;
using NodeId = std::string;
using ContextPath = std::string;
using VirtualHost = std::string;
using Timestamp = int64_t;       // epoch milliseconds
using Blob = std::vector<uint8_t>;

// Attribute values - the subset the default codec can round-trip
using PropertyValue = std::variant<
    std::string,
    int64_t,
    double,
    bool,
    std::nullptr_t
>;

// Session attribute map
class Properties {
public:
    using Container = std::unordered_map<std::string, PropertyValue>;
    using iterator = Container::iterator;
    using const_iterator = Container::const_iterator;

    Properties() = default;
    Properties(std::initializer_list<std::pair<const std::string, PropertyValue>> init)
        : data_(init) {}

    // Element access
    PropertyValue& operator[](const std::string& key) { return data_[key]; }
    const PropertyValue& at(const std::string& key) const { return data_.at(key); }

    // Iterators
    iterator begin() { return data_.begin(); }
    const_iterator begin() const { return data_.begin(); }
    iterator end() { return data_.end(); }
    const_iterator end() const { return data_.end(); }

    // Capacity
    bool empty() const { return data_.empty(); }
    size_t size() const { return data_.size(); }

    // Modifiers
    void clear() { data_.clear(); }
    size_t erase(const std::string& key) { return data_.erase(key); }
    std::pair<iterator, bool> insert(const std::pair<std::string, PropertyValue>& value) {
        return data_.insert(value);
    }

    bool contains(const std::string& key) const {
        return data_.find(key) != data_.end();
    }

    bool operator==(const Properties& other) const { return data_ == other.data_; }
    bool operator!=(const Properties& other) const { return !(*this == other); }

private:
    Container data_;
};

// SQL dialects the adaptor knows how to shape DDL and identifiers for
enum class Dialect : uint8_t {
    GENERIC = 0,
    SQLITE = 1,
    POSTGRESQL = 2,
    MYSQL = 3,
    ORACLE = 4
};

// How a save reacts when another node saved the same row in between
enum class SaveConflictPolicy : uint8_t {
    LAST_WRITER_WINS = 0,
    COMPARE_LAST_SAVED = 1
};

// Outcome of SessionDataStore::store
enum class SaveResult : uint8_t {
    INSERTED = 0,
    UPDATED = 1,
    CONFLICT = 2
};

// In-memory form of one persisted session row
struct SessionData {
    SessionId id;
    ContextPath context_path;         // canonical
    VirtualHost vhost;
    NodeId last_node;
    Timestamp created = 0;
    Timestamp accessed = 0;
    Timestamp last_accessed = 0;
    Timestamp cookie_set = 0;
    Timestamp last_saved = 0;
    Timestamp expiry = 0;             // <= 0 never expires
    int64_t max_inactive_secs = 0;    // <= 0 never expires
    Properties attributes;
    bool dirty = false;

    SessionData() = default;
    SessionData(const SessionId& session_id, Timestamp created_ms,
                Timestamp accessed_ms, Timestamp last_accessed_ms,
                int64_t max_inactive_seconds);

    // Expiry derived from access time and the inactivity interval
    Timestamp calc_expiry(Timestamp time_ms) const;
    bool is_expired_at(Timestamp time_ms) const;

    void set_attribute(const std::string& name, const PropertyValue& value);
    size_t remove_attribute(const std::string& name);
};

// Constants
namespace Constants {

// Stored in place of "" on dialects that turn empty strings into NULL.
// Canonical context paths never contain '/', so the token is unambiguous.
constexpr const char* NULL_CONTEXT_PATH = "/";
constexpr const char* DEFAULT_VHOST = "0.0.0.0";

constexpr const char* DEFAULT_TABLE_NAME = "ClusterSessions";
constexpr const char* DEFAULT_ID_COLUMN = "sessionId";
constexpr const char* DEFAULT_CONTEXT_PATH_COLUMN = "contextPath";
constexpr const char* DEFAULT_VIRTUAL_HOST_COLUMN = "virtualHost";
constexpr const char* DEFAULT_LAST_NODE_COLUMN = "lastNode";
constexpr const char* DEFAULT_ACCESS_TIME_COLUMN = "accessTime";
constexpr const char* DEFAULT_LAST_ACCESS_TIME_COLUMN = "lastAccessTime";
constexpr const char* DEFAULT_CREATE_TIME_COLUMN = "createTime";
constexpr const char* DEFAULT_COOKIE_TIME_COLUMN = "cookieTime";
constexpr const char* DEFAULT_LAST_SAVED_TIME_COLUMN = "lastSavedTime";
constexpr const char* DEFAULT_EXPIRY_TIME_COLUMN = "expiryTime";
constexpr const char* DEFAULT_MAX_INTERVAL_COLUMN = "maxInterval";
constexpr const char* DEFAULT_MAP_COLUMN = "map";

constexpr size_t MAX_SESSION_ID_LENGTH = 120;
constexpr size_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024; // 16MB
constexpr int64_t DEFAULT_GRACE_PERIOD_SEC = 3600;

} // namespace Constants

// Utility functions for types
namespace Utils {

std::string dialect_to_string(Dialect dialect);
Dialect string_to_dialect(const std::string& dialect_str);
std::string save_result_to_string(SaveResult result);

Timestamp now_milliseconds();
bool is_valid_session_id(const std::string& session_id);

} // namespace Utils

} // namespace sessiondb
