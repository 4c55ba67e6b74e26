// src/errors.cpp
// Implementation of error handling system with messages and factory functions

#include "sessiondb/errors.hpp"
#include <sstream>

namespace sessiondb {

// Error category implementation
std::string SessionDbErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS:
            return "Success";

        // Configuration errors (1-99)
        case ErrorCode::INVALID_CONFIG:
            return "Invalid configuration";
        case ErrorCode::INVALID_DATABASE_URL:
            return "Invalid database URL";
        case ErrorCode::INVALID_POOL_SIZE:
            return "Invalid connection pool size";
        case ErrorCode::INVALID_IDENTIFIER:
            return "Invalid SQL identifier";
        case ErrorCode::INVALID_NODE_ID:
            return "Invalid node id";

        // Schema errors (100-199)
        case ErrorCode::SCHEMA_CREATE_FAILED:
            return "Session table creation failed";
        case ErrorCode::SCHEMA_UPGRADE_FAILED:
            return "Session table upgrade failed";
        case ErrorCode::SCHEMA_INDEX_FAILED:
            return "Session index creation failed";
        case ErrorCode::SCHEMA_NOT_READY:
            return "Session table not prepared";

        // Storage availability errors (200-299)
        case ErrorCode::CONNECTION_FAILED:
            return "Connection failed";
        case ErrorCode::POOL_EXHAUSTED:
            return "Connection pool exhausted";
        case ErrorCode::STORAGE_TIMEOUT:
            return "Storage operation timed out";
        case ErrorCode::STORAGE_IO_ERROR:
            return "Storage I/O error";
        case ErrorCode::STORAGE_READONLY:
            return "Storage is read-only";

        // Storage execution errors (300-399)
        case ErrorCode::EXECUTION_FAILED:
            return "Statement execution failed";
        case ErrorCode::CONSTRAINT_VIOLATION:
            return "Constraint violation";
        case ErrorCode::CORRUPT_ROW:
            return "Corrupt session row";

        // Statement errors (400-499)
        case ErrorCode::PREPARE_FAILED:
            return "Statement preparation failed";
        case ErrorCode::BIND_FAILED:
            return "Parameter binding failed";
        case ErrorCode::BIND_INDEX_OUT_OF_RANGE:
            return "Parameter index out of range";
        case ErrorCode::COLUMN_NOT_FOUND:
            return "Column not found";
        case ErrorCode::ADAPTOR_NOT_INITIALIZED:
            return "Database adaptor not initialized";

        // Codec errors (500-599)
        case ErrorCode::SERIALIZATION_FAILED:
            return "Serialization failed";
        case ErrorCode::DESERIALIZATION_FAILED:
            return "Deserialization failed";
        case ErrorCode::PAYLOAD_TOO_LARGE:
            return "Payload too large";

        // Validation errors (600-699)
        case ErrorCode::INVALID_SESSION_ID:
            return "Invalid session id";

        case ErrorCode::UNKNOWN_ERROR:
            return "Unknown error";

        default:
            return "Unknown error code";
    }
}

const SessionDbErrorCategory& sessiondb_error_category() {
    static const SessionDbErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return std::error_code{static_cast<int>(ec), sessiondb_error_category()};
}

// Error factory functions implementation
namespace Errors {

// Configuration errors
ConfigError invalid_database_url(const std::string& url) {
    return ConfigError(ErrorCode::INVALID_DATABASE_URL, "url",
        "Database URL must be a file path, ':memory:' or a 'file:' URI, got: '" + url + "'");
}

ConfigError invalid_pool_size(size_t pool_size) {
    return ConfigError(ErrorCode::INVALID_POOL_SIZE, "pool_size",
        "Pool size must be between 1 and 256, got: " + std::to_string(pool_size));
}

ConfigError invalid_identifier(const std::string& field, const std::string& identifier) {
    return ConfigError(ErrorCode::INVALID_IDENTIFIER, field,
        "Identifier must match [A-Za-z_][A-Za-z0-9_]*, got: '" + identifier + "'");
}

ConfigError invalid_node_id(const std::string& node_id) {
    if (node_id.empty()) {
        return ConfigError(ErrorCode::INVALID_NODE_ID, "node_id", "Node id cannot be empty");
    }
    return ConfigError(ErrorCode::INVALID_NODE_ID, "node_id",
        "Node id too long (max 60 chars): '" + node_id.substr(0, 20) + "...'");
}

// Schema errors
SchemaError create_table_failed(const std::string& table, const std::string& reason) {
    return SchemaError(ErrorCode::SCHEMA_CREATE_FAILED, table, "create failed: " + reason);
}

SchemaError upgrade_failed(const std::string& table, const std::string& reason) {
    return SchemaError(ErrorCode::SCHEMA_UPGRADE_FAILED, table, "upgrade failed: " + reason);
}

SchemaError create_index_failed(const std::string& table, const std::string& index,
                                const std::string& reason) {
    return SchemaError(ErrorCode::SCHEMA_INDEX_FAILED, table,
        "index '" + index + "' failed: " + reason);
}

SchemaError schema_not_ready(const std::string& table) {
    return SchemaError(ErrorCode::SCHEMA_NOT_READY, table,
        "prepare_tables() must succeed before statements are built");
}

// Storage errors
StorageUnavailable connection_failed(const std::string& url, const std::string& reason) {
    return StorageUnavailable(ErrorCode::CONNECTION_FAILED, "connect",
        "Failed to open " + url + ": " + reason);
}

StorageUnavailable pool_exhausted(size_t pool_size, std::chrono::milliseconds waited) {
    std::ostringstream oss;
    oss << "All " << pool_size << " connections in use after waiting "
        << waited.count() << "ms";
    return StorageUnavailable(ErrorCode::POOL_EXHAUSTED, "acquire", oss.str());
}

StorageUnavailable adaptor_not_initialized() {
    return StorageUnavailable(ErrorCode::ADAPTOR_NOT_INITIALIZED, "acquire",
        "DatabaseAdaptor::initialize() has not been called");
}

// Statement errors
StatementError prepare_failed(const std::string& sql, const std::string& reason) {
    return StatementError(ErrorCode::PREPARE_FAILED, sql, reason);
}

StatementError bind_out_of_range(int index, int parameter_count) {
    std::ostringstream oss;
    oss << "Parameter index " << index << " outside 1.." << parameter_count;
    return StatementError(ErrorCode::BIND_INDEX_OUT_OF_RANGE, oss.str());
}

StatementError column_not_found(const std::string& column) {
    return StatementError(ErrorCode::COLUMN_NOT_FOUND, "No column named '" + column + "' in result");
}

// Codec errors
CodecError serialization_failed(const std::string& reason) {
    return CodecError(ErrorCode::SERIALIZATION_FAILED, "Failed to encode attributes: " + reason);
}

CodecError deserialization_failed(const std::string& reason) {
    return CodecError(ErrorCode::DESERIALIZATION_FAILED, "Failed to decode attributes: " + reason);
}

CodecError payload_too_large(size_t size, size_t max_size) {
    std::ostringstream oss;
    oss << "Payload size " << size << " bytes exceeds maximum " << max_size << " bytes";
    return CodecError(ErrorCode::PAYLOAD_TOO_LARGE, oss.str());
}

// Validation errors
ValidationError invalid_session_id(const std::string& session_id) {
    if (session_id.empty()) {
        return ValidationError(ErrorCode::INVALID_SESSION_ID, "session_id", "Session id cannot be empty");
    }
    return ValidationError(ErrorCode::INVALID_SESSION_ID, "session_id",
        "Session id must be 1-120 printable characters without whitespace");
}

} // namespace Errors
} // namespace sessiondb
