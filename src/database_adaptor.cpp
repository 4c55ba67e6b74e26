// src/database_adaptor.cpp
// Dialect-specific behavior and pooled connection access

#include "sessiondb/database_adaptor.hpp"
#include "sessiondb/utils.hpp"
#include <sstream>

namespace sessiondb {

DatabaseAdaptor::DatabaseAdaptor(const DatabaseConfig& config)
    : config_(config) {}

DatabaseAdaptor::DatabaseAdaptor(const DatabaseConfig& config, std::shared_ptr<ConnectionProvider> provider)
    : config_(config), provider_(std::move(provider)) {}

void DatabaseAdaptor::initialize() {
    if (initialized_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_.load()) {
        return;
    }

    if (Utils::is_blank(config_.url) && !provider_) {
        throw Errors::invalid_database_url(config_.url);
    }

    if (!provider_) {
        ConnectionOptions options;
        options.busy_timeout = config_.busy_timeout;
        options.emulate_empty_string_null = is_empty_string_null();
        provider_ = std::make_shared<SqliteConnectionPool>(config_.url, options, config_.pool_size,
                                                           config_.acquire_timeout);
    }

    // Probe once
    {
        PooledConnection probe(*provider_, provider_->acquire());
        if (!probe->is_healthy()) {
            throw Errors::connection_failed(config_.url, "health check failed");
        }
    }

    initialized_.store(true);
    Utils::log(SystemLogLevel::INFO, "DatabaseAdaptor", "initialized " + to_string());
}

PooledConnection DatabaseAdaptor::get_connection() {
    if (!initialized_.load() || !provider_) {
        throw Errors::adaptor_not_initialized();
    }
    return PooledConnection(*provider_, provider_->acquire());
}

bool DatabaseAdaptor::is_empty_string_null() const {
    if (config_.empty_string_null.has_value()) {
        return *config_.empty_string_null;
    }
    return config_.dialect == Dialect::ORACLE;
}

void DatabaseAdaptor::set_empty_string_null(bool empty_is_null) {
    config_.empty_string_null = empty_is_null;
}

std::string DatabaseAdaptor::blob_type() const {
    if (!config_.blob_type.empty()) {
        return config_.blob_type;
    }
    return config_.dialect == Dialect::POSTGRESQL ? "BYTEA" : "BLOB";
}

std::string DatabaseAdaptor::long_type() const {
    if (!config_.long_type.empty()) {
        return config_.long_type;
    }
    return config_.dialect == Dialect::ORACLE ? "NUMBER(20)" : "BIGINT";
}

std::string DatabaseAdaptor::string_type() const {
    if (!config_.string_type.empty()) {
        return config_.string_type;
    }
    return config_.dialect == Dialect::ORACLE ? "VARCHAR2" : "VARCHAR";
}

IdentifierCase DatabaseAdaptor::identifier_case() const {
    switch (config_.dialect) {
        case Dialect::ORACLE:
            return IdentifierCase::UPPER;
        case Dialect::POSTGRESQL:
            return IdentifierCase::LOWER;
        default:
            return IdentifierCase::AS_IS;
    }
}

std::string DatabaseAdaptor::convert_identifier(const std::string& identifier) const {
    switch (identifier_case()) {
        case IdentifierCase::UPPER:
            return Utils::to_upper(identifier);
        case IdentifierCase::LOWER:
            return Utils::to_lower(identifier);
        default:
            return identifier;
    }
}

std::string DatabaseAdaptor::quote_identifier(const std::string& identifier) const {
    char quote = config_.dialect == Dialect::MYSQL ? '`' : '"';
    std::string quoted(1, quote);
    for (char c : identifier) {
        if (c == quote) {
            quoted.push_back(quote);
        }
        quoted.push_back(c);
    }
    quoted.push_back(quote);
    return quoted;
}

std::string DatabaseAdaptor::now_expression() const {
    switch (config_.dialect) {
        case Dialect::SQLITE:
            return "CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER)";
        case Dialect::POSTGRESQL:
            return "CAST(EXTRACT(EPOCH FROM CURRENT_TIMESTAMP) * 1000 AS BIGINT)";
        case Dialect::MYSQL:
            return "CAST(UNIX_TIMESTAMP(NOW(3)) * 1000 AS SIGNED)";
        case Dialect::ORACLE:
            return "ROUND((CAST(SYS_EXTRACT_UTC(SYSTIMESTAMP) AS DATE) - DATE '1970-01-01') * 86400000)";
        default:
            return "";
    }
}

void DatabaseAdaptor::bind_blob(Statement& statement, int index, const Blob& payload) const {
    statement.bind(index, payload);
}

Blob DatabaseAdaptor::get_blob(const Statement& statement, int column) const {
    if (statement.is_null(column)) {
        return Blob();
    }
    return statement.get_blob(column);
}

std::string DatabaseAdaptor::to_string() const {
    std::ostringstream oss;
    oss << "DatabaseAdaptor[dialect=" << Utils::dialect_to_string(config_.dialect)
        << ", url=" << config_.url
        << ", emptyStringNull=" << (is_empty_string_null() ? "true" : "false")
        << ", blobType=" << blob_type()
        << ", longType=" << long_type() << "]";
    return oss.str();
}

} // namespace sessiondb
