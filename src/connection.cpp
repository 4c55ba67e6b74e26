// src/connection.cpp
// SQLite connection, statement and pool implementation

#include "sessiondb/connection.hpp"
#include "sessiondb/utils.hpp"
#include <atomic>
#include <sstream>
#include <utility>

namespace sessiondb {

namespace {

std::atomic<uint64_t> g_memory_database_id{0};

std::string shared_memory_url() {
    return "file:sessiondb_memory_" + std::to_string(++g_memory_database_id) +
           "?mode=memory&cache=shared";
}

} // namespace

//=============================================================================
// Error translation
//=============================================================================

void throw_sqlite_error(int rc, sqlite3* db, const std::string& operation) {
    std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            throw StorageUnavailable(ErrorCode::STORAGE_TIMEOUT, operation, message, rc);
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
            throw StorageUnavailable(ErrorCode::CONNECTION_FAILED, operation, message, rc);
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_NOMEM:
            throw StorageUnavailable(ErrorCode::STORAGE_IO_ERROR, operation, message, rc);
        case SQLITE_READONLY:
            throw StorageUnavailable(ErrorCode::STORAGE_READONLY, operation, message, rc);
        case SQLITE_CONSTRAINT:
            throw StorageError(ErrorCode::CONSTRAINT_VIOLATION, operation, message, rc);
        case SQLITE_CORRUPT:
        case SQLITE_MISMATCH:
            throw StorageError(ErrorCode::CORRUPT_ROW, operation, message, rc);
        case SQLITE_RANGE:
            throw StatementError(ErrorCode::BIND_INDEX_OUT_OF_RANGE, operation + ": " + message);
        case SQLITE_MISUSE:
            throw StatementError(ErrorCode::BIND_FAILED, operation + ": " + message);
        default:
            throw StorageError(ErrorCode::EXECUTION_FAILED, operation, message, rc);
    }
}

//=============================================================================
// Statement Implementation
//=============================================================================

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt, std::string sql, bool empty_string_null)
    : db_(db), stmt_(stmt), sql_(std::move(sql)), empty_string_null_(empty_string_null) {}

Statement::~Statement() {
    finalize();
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)),
      empty_string_null_(other.empty_string_null_), done_(other.done_) {
    other.stmt_ = nullptr;
    other.db_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        finalize();
        db_ = other.db_;
        stmt_ = other.stmt_;
        sql_ = std::move(other.sql_);
        empty_string_null_ = other.empty_string_null_;
        done_ = other.done_;
        other.stmt_ = nullptr;
        other.db_ = nullptr;
    }
    return *this;
}

void Statement::finalize() noexcept {
    if (stmt_) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

int Statement::parameter_count() const {
    return sqlite3_bind_parameter_count(stmt_);
}

void Statement::check_index(int index) const {
    int count = parameter_count();
    if (index < 1 || index > count) {
        throw Errors::bind_out_of_range(index, count);
    }
}

void Statement::check_bind(int rc, int index) {
    if (rc != SQLITE_OK) {
        throw_sqlite_error(rc, db_, "bind parameter " + std::to_string(index));
    }
}

void Statement::bind(int index, const std::string& value) {
    check_index(index);
    if (empty_string_null_ && value.empty()) {
        check_bind(sqlite3_bind_null(stmt_, index), index);
        return;
    }
    check_bind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                 SQLITE_TRANSIENT), index);
}

void Statement::bind(int index, const char* value) {
    if (value == nullptr) {
        bind_null(index);
        return;
    }
    bind(index, std::string(value));
}

void Statement::bind(int index, int64_t value) {
    check_index(index);
    check_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), index);
}

void Statement::bind(int index, const Blob& value) {
    check_index(index);
    if (value.empty()) {
        // sqlite3_bind_blob with no data would store NULL, not an empty blob
        check_bind(sqlite3_bind_zeroblob(stmt_, index, 0), index);
        return;
    }
    check_bind(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()),
                                 SQLITE_TRANSIENT), index);
}

void Statement::bind_null(int index) {
    check_index(index);
    check_bind(sqlite3_bind_null(stmt_, index), index);
}

bool Statement::next() {
    if (done_) {
        return false;
    }

    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        done_ = true;
        return false;
    }
    throw_sqlite_error(rc, db_, "query");
}

int Statement::execute_update() {
    int rc;
    while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        throw_sqlite_error(rc, db_, "update");
    }
    done_ = true;
    return sqlite3_changes(db_);
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    done_ = false;
}

int Statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

std::string Statement::column_name(int column) const {
    const char* name = sqlite3_column_name(stmt_, column);
    return name ? std::string(name) : std::string();
}

int Statement::column_index(const std::string& name) const {
    std::string wanted = Utils::to_lower(name);
    int count = column_count();
    for (int i = 0; i < count; ++i) {
        if (Utils::to_lower(column_name(i)) == wanted) {
            return i;
        }
    }
    throw Errors::column_not_found(name);
}

bool Statement::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::string Statement::get_string(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return std::string();
    }
    int size = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

int64_t Statement::get_int64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

Blob Statement::get_blob(int column) const {
    const void* data = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!data || size <= 0) {
        return Blob();
    }
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    return Blob(bytes, bytes + size);
}

std::string Statement::get_string(const std::string& column) const {
    return get_string(column_index(column));
}

int64_t Statement::get_int64(const std::string& column) const {
    return get_int64(column_index(column));
}

Blob Statement::get_blob(const std::string& column) const {
    return get_blob(column_index(column));
}

//=============================================================================
// Connection Implementation
//=============================================================================

Connection::Connection(sqlite3* db, std::string url, ConnectionOptions options)
    : db_(db), url_(std::move(url)), options_(options) {}

std::unique_ptr<Connection> Connection::open(const std::string& url, const ConnectionOptions& options) {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(url.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        throw Errors::connection_failed(url, reason);
    }

    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, static_cast<int>(options.busy_timeout.count()));

    Utils::log(SystemLogLevel::TRACE, "Connection", "opened " + url);
    return std::unique_ptr<Connection>(new Connection(db, url, options));
}

Connection::~Connection() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Statement Connection::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        int primary = rc & 0xff;
        if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED || primary == SQLITE_IOERR ||
            primary == SQLITE_CANTOPEN || primary == SQLITE_NOMEM) {
            throw_sqlite_error(rc, db_, "prepare");
        }
        throw Errors::prepare_failed(sql, sqlite3_errmsg(db_));
    }

    Utils::log(SystemLogLevel::TRACE, "Connection", "prepared: " + sql);
    return Statement(db_, stmt, sql, options_.emulate_empty_string_null);
}

void Connection::execute(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        int primary = rc & 0xff;
        if (primary == SQLITE_ERROR) {
            throw StorageError(ErrorCode::EXECUTION_FAILED, "execute", error + " [" + sql + "]", rc);
        }
        throw_sqlite_error(rc, db_, "execute");
    }
}

bool Connection::has_table(const std::string& schema, const std::string& table) {
    std::string catalog = schema.empty() ? "main" : schema;
    Statement stmt = prepare("SELECT 1 FROM \"" + catalog + "\".sqlite_master "
                             "WHERE type = 'table' AND name = ?1 COLLATE NOCASE");
    stmt.bind(1, table);
    return stmt.next();
}

bool Connection::has_column(const std::string& schema, const std::string& table,
                            const std::string& column) {
    Statement stmt = prepare("SELECT 1 FROM pragma_table_info(?1, ?2) WHERE name = ?3 COLLATE NOCASE");
    stmt.bind(1, table);
    stmt.bind(2, schema.empty() ? std::string("main") : schema);
    stmt.bind(3, column);
    return stmt.next();
}

bool Connection::has_index(const std::string& schema, const std::string& index) {
    std::string catalog = schema.empty() ? "main" : schema;
    Statement stmt = prepare("SELECT 1 FROM \"" + catalog + "\".sqlite_master "
                             "WHERE type = 'index' AND name = ?1 COLLATE NOCASE");
    stmt.bind(1, index);
    return stmt.next();
}

bool Connection::is_healthy() {
    try {
        Statement stmt = prepare("SELECT 1");
        return stmt.next();
    } catch (const Error& e) {
        Utils::log(SystemLogLevel::WARN, "Connection", std::string("health check failed: ") + e.what());
        return false;
    }
}

//=============================================================================
// SqliteConnectionPool Implementation
//=============================================================================

bool is_private_memory_url(const std::string& url) {
    return url == ":memory:";
}

SqliteConnectionPool::SqliteConnectionPool(const std::string& url, const ConnectionOptions& options,
                                           size_t max_connections,
                                           std::chrono::milliseconds acquire_timeout)
    : url_(url), options_(options), max_connections_(max_connections),
      acquire_timeout_(acquire_timeout) {
    if (max_connections_ == 0) {
        throw Errors::invalid_pool_size(max_connections_);
    }

    if (is_private_memory_url(url_)) {
        url_ = shared_memory_url();
        memory_anchor_ = Connection::open(url_, options_);
        Utils::log(SystemLogLevel::DEBUG, "SqliteConnectionPool",
                   "in-memory database shared as " + url_);
    }
}

SqliteConnectionPool::~SqliteConnectionPool() {
    close_idle();
    memory_anchor_.reset();
}

std::unique_ptr<Connection> SqliteConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = available_cv_.wait_for(lock, acquire_timeout_, [this] {
        return !idle_connections_.empty() || total_connections_ < max_connections_;
    });
    if (!ready) {
        throw Errors::pool_exhausted(max_connections_, acquire_timeout_);
    }

    if (!idle_connections_.empty()) {
        auto connection = std::move(idle_connections_.back());
        idle_connections_.pop_back();
        return connection;
    }

    ++total_connections_;
    lock.unlock();

    try {
        return Connection::open(url_, options_);
    } catch (const Error&) {
        lock.lock();
        --total_connections_;
        lock.unlock();
        available_cv_.notify_one();
        throw;
    }
}

void SqliteConnectionPool::release(std::unique_ptr<Connection> connection) {
    if (!connection) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_connections_.push_back(std::move(connection));
    }
    available_cv_.notify_one();
}

size_t SqliteConnectionPool::available_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_connections_.size() + (max_connections_ - total_connections_);
}

size_t SqliteConnectionPool::total_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_connections_;
}

void SqliteConnectionPool::close_idle() {
    std::vector<std::unique_ptr<Connection>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.swap(idle_connections_);
        total_connections_ -= closing.size();
    }
    available_cv_.notify_all();
}

//=============================================================================
// PooledConnection Implementation
//=============================================================================

PooledConnection::PooledConnection(ConnectionProvider& provider, std::unique_ptr<Connection> connection)
    : provider_(&provider), connection_(std::move(connection)) {}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : provider_(other.provider_), connection_(std::move(other.connection_)) {
    other.provider_ = nullptr;
}

PooledConnection::~PooledConnection() {
    if (provider_ && connection_) {
        try {
            provider_->release(std::move(connection_));
        } catch (const std::exception& e) {
            Utils::log(SystemLogLevel::ERROR, "PooledConnection",
                       std::string("failed to return connection: ") + e.what());
        }
    }
}

} // namespace sessiondb
