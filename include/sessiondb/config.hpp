// include/sessiondb/config.hpp
// Purpose: Configuration system for the sessiondb library
// Database, schema naming, store behavior and diagnostics, with sensible defaults

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace sessiondb {

// Connectivity and dialect configuration
struct DatabaseConfig {
    Dialect dialect = Dialect::SQLITE;
    std::string url = "sessions.db";                       // SQLite path, ':memory:' (pool-shared) or file: URI
    size_t pool_size = 8;
    std::chrono::milliseconds acquire_timeout{5000};       // wait for a free pooled connection
    std::chrono::milliseconds busy_timeout{2000};          // engine lock wait before STORAGE_TIMEOUT
    std::optional<bool> empty_string_null;                 // unset: derived from dialect
    std::string blob_type;                                 // empty: dialect default
    std::string long_type;
    std::string string_type;
};

// Table and column naming
struct SchemaConfig {
    std::string schema_name;                               // empty: unqualified
    std::string table_name = Constants::DEFAULT_TABLE_NAME;
    std::string id_column = Constants::DEFAULT_ID_COLUMN;
    std::string context_path_column = Constants::DEFAULT_CONTEXT_PATH_COLUMN;
    std::string virtual_host_column = Constants::DEFAULT_VIRTUAL_HOST_COLUMN;
    std::string last_node_column = Constants::DEFAULT_LAST_NODE_COLUMN;
    std::string access_time_column = Constants::DEFAULT_ACCESS_TIME_COLUMN;
    std::string last_access_time_column = Constants::DEFAULT_LAST_ACCESS_TIME_COLUMN;
    std::string create_time_column = Constants::DEFAULT_CREATE_TIME_COLUMN;
    std::string cookie_time_column = Constants::DEFAULT_COOKIE_TIME_COLUMN;
    std::string last_saved_time_column = Constants::DEFAULT_LAST_SAVED_TIME_COLUMN;
    std::string expiry_time_column = Constants::DEFAULT_EXPIRY_TIME_COLUMN;
    std::string max_interval_column = Constants::DEFAULT_MAX_INTERVAL_COLUMN;
    std::string map_column = Constants::DEFAULT_MAP_COLUMN;
};

// Data store behavior
struct StoreBehaviorConfig {
    NodeId node_id;                                        // empty: hostname-derived
    std::chrono::seconds grace_period{Constants::DEFAULT_GRACE_PERIOD_SEC};
    // LAST_WRITER_WINS lets a node holding a stale copy lower expiryTime
    SaveConflictPolicy conflict_policy = SaveConflictPolicy::COMPARE_LAST_SAVED;
    std::chrono::seconds sweep_interval{60};
};

// Logging configuration (library internal diagnostics)
enum class SystemLogLevel : uint8_t {
    NONE = 0,       // No library logging
    ERROR = 1,      // Only errors
    WARN = 2,       // Warnings and errors
    INFO = 3,       // Informational + above
    DEBUG = 4,      // Debug + above
    TRACE = 5       // Everything, including generated SQL
};

// The level is process-wide: a store applies it on initialize() only when set,
// and log_to_console = false silences every store in the process
struct LoggingConfig {
    std::optional<SystemLogLevel> level;                   // unset: keep the current process level
    bool log_to_console = true;
};

// Main configuration class
class StoreConfig {
public:
    StoreConfig();
    explicit StoreConfig(const std::string& url);

    StoreConfig(const StoreConfig& other) = default;
    StoreConfig& operator=(const StoreConfig& other) = default;
    StoreConfig(StoreConfig&& other) noexcept = default;
    StoreConfig& operator=(StoreConfig&& other) noexcept = default;

    // Getters
    const DatabaseConfig& database() const noexcept { return database_; }
    const SchemaConfig& schema() const noexcept { return schema_; }
    const StoreBehaviorConfig& behavior() const noexcept { return behavior_; }
    const LoggingConfig& logging() const noexcept { return logging_; }

    // Node id with the hostname fallback applied
    NodeId effective_node_id() const;

    // Setters (fluent interface)
    StoreConfig& set_url(const std::string& url);
    StoreConfig& set_dialect(Dialect dialect);
    StoreConfig& set_pool_size(size_t size);
    StoreConfig& set_acquire_timeout(std::chrono::milliseconds timeout);
    StoreConfig& set_busy_timeout(std::chrono::milliseconds timeout);
    StoreConfig& set_empty_string_null(bool empty_is_null);
    StoreConfig& set_blob_type(const std::string& type);
    StoreConfig& set_long_type(const std::string& type);
    StoreConfig& set_string_type(const std::string& type);
    StoreConfig& set_schema_name(const std::string& name);
    StoreConfig& set_table_name(const std::string& name);
    StoreConfig& set_node_id(const NodeId& node_id);
    StoreConfig& set_grace_period(std::chrono::seconds period);
    StoreConfig& set_conflict_policy(SaveConflictPolicy policy);
    StoreConfig& set_sweep_interval(std::chrono::seconds interval);
    StoreConfig& set_system_log_level(SystemLogLevel level);

    // Column naming is done through the mutable struct
    SchemaConfig& mutable_schema() noexcept { return schema_; }

    // Validation
    void validate() const;
    bool is_valid() const noexcept;
    std::vector<std::string> validation_errors() const;

    // Preset configurations
    static StoreConfig development(const std::string& url);
    static StoreConfig production(const std::string& url);
    static StoreConfig oracle_compatible(const std::string& url);

    friend class ConfigBuilder;

private:
    DatabaseConfig database_;
    SchemaConfig schema_;
    StoreBehaviorConfig behavior_;
    LoggingConfig logging_;

    void validate_database_config() const;
    void validate_schema_config() const;
    void validate_behavior_config() const;
};

// Configuration builder for advanced use cases
class ConfigBuilder {
public:
    ConfigBuilder();
    explicit ConfigBuilder(const std::string& url);

    ConfigBuilder& url(const std::string& url);
    ConfigBuilder& dialect(Dialect dialect);
    ConfigBuilder& pool(size_t pool_size, std::chrono::milliseconds acquire_timeout);
    ConfigBuilder& busy_timeout(std::chrono::milliseconds timeout);
    ConfigBuilder& empty_string_null(bool empty_is_null);
    ConfigBuilder& column_types(const std::string& blob_type, const std::string& long_type,
                                const std::string& string_type);
    ConfigBuilder& table(const std::string& table_name, const std::string& schema_name = "");
    ConfigBuilder& node(const NodeId& node_id);
    ConfigBuilder& expiry(std::chrono::seconds grace_period, std::chrono::seconds sweep_interval);
    ConfigBuilder& conflict_policy(SaveConflictPolicy policy);
    ConfigBuilder& system_logging(SystemLogLevel level, bool console = true);

    // Build final configuration
    StoreConfig build() const;

private:
    StoreConfig config_;
};

// Environment variable configuration loader
class EnvConfig {
public:
    // SDB_DATABASE_URL, SDB_DIALECT, SDB_NODE_ID, SDB_POOL_SIZE, SDB_TABLE_NAME,
    // SDB_LOG_LEVEL, SDB_GRACE_PERIOD_SEC
    static std::optional<StoreConfig> from_environment();

    static std::optional<std::string> get_database_url();
    static std::optional<Dialect> get_dialect();
    static std::optional<NodeId> get_node_id();
    static std::optional<size_t> get_pool_size();
    static std::optional<std::string> get_table_name();
    static std::optional<SystemLogLevel> get_log_level();
    static std::optional<std::chrono::seconds> get_grace_period();

private:
    static std::optional<std::string> get_env(const std::string& name);
    static std::optional<int> get_env_int(const std::string& name);
    static std::optional<size_t> get_env_size_t(const std::string& name);
};

// Configuration presets namespace
namespace Presets {

// Development configuration - verbose logging, small pool, short grace period
inline StoreConfig development(const std::string& url) {
    return ConfigBuilder(url)
        .dialect(Dialect::SQLITE)
        .pool(2, std::chrono::milliseconds(1000))
        .expiry(std::chrono::seconds(60), std::chrono::seconds(10))
        .system_logging(SystemLogLevel::DEBUG)
        .build();
}

// Production configuration - larger pool, CAS saves, quiet logs
inline StoreConfig production(const std::string& url) {
    return ConfigBuilder(url)
        .dialect(Dialect::SQLITE)
        .pool(16, std::chrono::milliseconds(5000))
        .busy_timeout(std::chrono::milliseconds(5000))
        .expiry(std::chrono::seconds(3600), std::chrono::seconds(60))
        .conflict_policy(SaveConflictPolicy::COMPARE_LAST_SAVED)
        .system_logging(SystemLogLevel::ERROR)
        .build();
}

// Empty strings are stored as NULL, as on Oracle
inline StoreConfig oracle_compatible(const std::string& url) {
    return ConfigBuilder(url)
        .dialect(Dialect::SQLITE)
        .empty_string_null(true)
        .system_logging(SystemLogLevel::WARN)
        .build();
}

} // namespace Presets

} // namespace sessiondb
