// include/sessiondb/database_adaptor.hpp
// Purpose: Per-database behavior the statement builder depends on
// Empty-string handling, DDL type names, identifier case and quoting,
// payload binding and pooled connection access

#pragma once

#include "config.hpp"
#include "connection.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sessiondb {

// Where "now" comes from in a statement
enum class TimestampSource : uint8_t {
    CLIENT_SUPPLIED = 0,     // caller binds a client-computed epoch-ms value
    SERVER_EXPRESSION = 1    // the dialect's now_expression() is inlined
};

// How the dialect stores unquoted identifiers
enum class IdentifierCase : uint8_t {
    AS_IS = 0,
    UPPER = 1,
    LOWER = 2
};

class DatabaseAdaptor {
public:
    explicit DatabaseAdaptor(const DatabaseConfig& config);

    // Use an externally managed provider instead of the built-in SQLite pool
    DatabaseAdaptor(const DatabaseConfig& config, std::shared_ptr<ConnectionProvider> provider);

    virtual ~DatabaseAdaptor() = default;

    DatabaseAdaptor(const DatabaseAdaptor&) = delete;
    DatabaseAdaptor& operator=(const DatabaseAdaptor&) = delete;

    // Create the pool if needed and verify a connection can be opened.
    // Throws StorageUnavailable.
    void initialize();
    bool is_initialized() const noexcept { return initialized_.load(); }

    // Scoped lease; the connection goes back to the provider on every exit path
    PooledConnection get_connection();

    Dialect dialect() const noexcept { return config_.dialect; }
    const DatabaseConfig& config() const noexcept { return config_; }

    // True when the database stores "" as NULL (Oracle)
    virtual bool is_empty_string_null() const;
    void set_empty_string_null(bool empty_is_null);

    // DDL column types
    std::string blob_type() const;
    std::string long_type() const;
    std::string string_type() const;

    // Identifier handling
    IdentifierCase identifier_case() const;
    std::string convert_identifier(const std::string& identifier) const;
    std::string quote_identifier(const std::string& identifier) const;

    // Statement construction never reads the clock; timestamps are parameters
    TimestampSource timestamp_source() const noexcept { return TimestampSource::CLIENT_SUPPLIED; }
    std::string now_expression() const;

    // Opaque payload transfer
    void bind_blob(Statement& statement, int index, const Blob& payload) const;
    Blob get_blob(const Statement& statement, int column) const;

    std::string to_string() const;

private:
    DatabaseConfig config_;
    std::shared_ptr<ConnectionProvider> provider_;
    std::mutex init_mutex_;
    std::atomic<bool> initialized_{false};
};

} // namespace sessiondb
