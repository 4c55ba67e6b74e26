// include/sessiondb/connection.hpp
// Purpose: Relational connectivity for the sessiondb library
// RAII wrappers over SQLite connections and prepared statements, a bounded
// connection pool and the scoped lease handed out to statement builders

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sessiondb {

//=============================================================================
// STATEMENT - prepared statement with positional binding and row access
//=============================================================================

// A Statement must not outlive the Connection that prepared it.
class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt, std::string sql, bool empty_string_null);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    const std::string& sql() const noexcept { return sql_; }
    int parameter_count() const;

    // Binding, 1-based like the SQL placeholders
    void bind(int index, const std::string& value);
    void bind(int index, const char* value);
    void bind(int index, int64_t value);
    void bind(int index, const Blob& value);
    void bind_null(int index);

    // Queries: advance to the next row, false when exhausted
    bool next();

    // Updates: run to completion and return the affected row count
    int execute_update();

    // Rewind so the statement can be executed again with new bindings
    void reset();

    // Row access, 0-based column indexes
    int column_count() const;
    std::string column_name(int column) const;
    int column_index(const std::string& name) const;
    bool is_null(int column) const;
    std::string get_string(int column) const;
    int64_t get_int64(int column) const;
    Blob get_blob(int column) const;

    std::string get_string(const std::string& column) const;
    int64_t get_int64(const std::string& column) const;
    Blob get_blob(const std::string& column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
    bool empty_string_null_;
    bool done_ = false;

    void check_index(int index) const;
    void check_bind(int rc, int index);
    void finalize() noexcept;
};

//=============================================================================
// CONNECTION - one open database handle
//=============================================================================

struct ConnectionOptions {
    std::chrono::milliseconds busy_timeout{2000};
    // Bind "" as NULL the way Oracle stores it; lets a SQLite database
    // reproduce the vendor behavior the statement builder compensates for
    bool emulate_empty_string_null = false;
};

class Connection {
public:
    static std::unique_ptr<Connection> open(const std::string& url,
                                            const ConnectionOptions& options = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& url() const noexcept { return url_; }
    const ConnectionOptions& options() const noexcept { return options_; }

    Statement prepare(const std::string& sql);

    // Run one or more statements that produce no rows (DDL, pragmas)
    void execute(const std::string& sql);

    // Catalog lookups; identifiers compared case-insensitively
    bool has_table(const std::string& schema, const std::string& table);
    bool has_column(const std::string& schema, const std::string& table, const std::string& column);
    bool has_index(const std::string& schema, const std::string& index);

    bool is_healthy();
    sqlite3* handle() noexcept { return db_; }

private:
    Connection(sqlite3* db, std::string url, ConnectionOptions options);

    sqlite3* db_;
    std::string url_;
    ConnectionOptions options_;
};

// Translate an engine result code into the library's exception taxonomy
[[noreturn]] void throw_sqlite_error(int rc, sqlite3* db, const std::string& operation);

//=============================================================================
// CONNECTION PROVIDER - where connections come from
//=============================================================================

class ConnectionProvider {
public:
    virtual ~ConnectionProvider() = default;

    // Throws StorageUnavailable when no connection can be produced
    virtual std::unique_ptr<Connection> acquire() = 0;
    virtual void release(std::unique_ptr<Connection> connection) = 0;

    virtual size_t available_count() const = 0;
    virtual size_t total_count() const = 0;
};

// Bounded pool of SQLite connections.
// ':memory:' is opened as a named shared-cache database so every pooled
// connection sees the same tables; the pool keeps one extra connection open
// for its lifetime so the database survives idle periods.
class SqliteConnectionPool : public ConnectionProvider {
public:
    SqliteConnectionPool(const std::string& url, const ConnectionOptions& options,
                         size_t max_connections,
                         std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(5000));
    ~SqliteConnectionPool() override;

    std::unique_ptr<Connection> acquire() override;
    void release(std::unique_ptr<Connection> connection) override;

    size_t available_count() const override;
    size_t total_count() const override;
    size_t max_connections() const noexcept { return max_connections_; }
    const std::string& url() const noexcept { return url_; }

    // Close idle connections; leased ones close when returned
    void close_idle();

private:
    std::string url_;
    ConnectionOptions options_;
    size_t max_connections_;
    std::chrono::milliseconds acquire_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable available_cv_;
    std::vector<std::unique_ptr<Connection>> idle_connections_;
    size_t total_connections_ = 0;

    std::unique_ptr<Connection> memory_anchor_;
};

// True for the SQLite private in-memory database name
bool is_private_memory_url(const std::string& url);

//=============================================================================
// POOLED CONNECTION - scoped lease, returned on every exit path
//=============================================================================

class PooledConnection {
public:
    PooledConnection(ConnectionProvider& provider, std::unique_ptr<Connection> connection);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) = delete;

    Connection& get() { return *connection_; }
    Connection& operator*() { return *connection_; }
    Connection* operator->() { return connection_.get(); }

private:
    ConnectionProvider* provider_;
    std::unique_ptr<Connection> connection_;
};

} // namespace sessiondb
