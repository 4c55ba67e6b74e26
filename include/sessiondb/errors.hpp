// include/sessiondb/errors.hpp
// Purpose: Error handling for the sessiondb library
// Provides hierarchical error types for schema, storage and statement failures

#pragma once

#include <stdexcept>
#include <string>
#include <chrono>
#include <system_error>

namespace sessiondb {

// Base error category for sessiondb errors
class SessionDbErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "sessiondb";
    }

    std::string message(int ev) const override;
};

// Global error category instance
const SessionDbErrorCategory& sessiondb_error_category();

// Error codes enum
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Configuration errors (1-99)
    INVALID_CONFIG = 1,
    INVALID_DATABASE_URL = 2,
    INVALID_POOL_SIZE = 3,
    INVALID_IDENTIFIER = 4,
    INVALID_NODE_ID = 5,

    // Schema errors (100-199)
    SCHEMA_CREATE_FAILED = 100,
    SCHEMA_UPGRADE_FAILED = 101,
    SCHEMA_INDEX_FAILED = 102,
    SCHEMA_NOT_READY = 103,

    // Storage availability errors (200-299)
    CONNECTION_FAILED = 200,
    POOL_EXHAUSTED = 201,
    STORAGE_TIMEOUT = 202,
    STORAGE_IO_ERROR = 203,
    STORAGE_READONLY = 204,

    // Storage execution errors (300-399)
    EXECUTION_FAILED = 300,
    CONSTRAINT_VIOLATION = 301,
    CORRUPT_ROW = 302,

    // Statement construction and binding errors (400-499)
    PREPARE_FAILED = 400,
    BIND_FAILED = 401,
    BIND_INDEX_OUT_OF_RANGE = 402,
    COLUMN_NOT_FOUND = 403,
    ADAPTOR_NOT_INITIALIZED = 404,

    // Attribute codec errors (500-599)
    SERIALIZATION_FAILED = 500,
    DESERIALIZATION_FAILED = 501,
    PAYLOAD_TOO_LARGE = 502,

    // Validation errors (600-699)
    INVALID_SESSION_ID = 600,

    // Unknown/Generic errors (800+)
    UNKNOWN_ERROR = 800
};

// Create error codes
std::error_code make_error_code(ErrorCode ec);

// Base exception class for all sessiondb errors
class Error : public std::exception {
public:
    explicit Error(const std::string& message)
        : message_(message)
        , error_code_(ErrorCode::UNKNOWN_ERROR)
        , timestamp_(std::chrono::system_clock::now()) {}

    Error(ErrorCode code, const std::string& message)
        : message_(message)
        , error_code_(code)
        , timestamp_(std::chrono::system_clock::now()) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCode code() const noexcept {
        return error_code_;
    }

    std::chrono::system_clock::time_point timestamp() const noexcept {
        return timestamp_;
    }

    virtual std::string category() const {
        return "sessiondb::Error";
    }

protected:
    std::string message_;
    ErrorCode error_code_;
    std::chrono::system_clock::time_point timestamp_;
};

// Configuration-related errors
class ConfigError : public Error {
public:
    ConfigError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Configuration error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "sessiondb::ConfigError";
    }

private:
    std::string field_;
};

// Table creation or verification failed; fatal at startup
class SchemaError : public Error {
public:
    SchemaError(ErrorCode code, const std::string& table, const std::string& message)
        : Error(code, "Schema error on '" + table + "': " + message)
        , table_(table) {}

    const std::string& table() const noexcept {
        return table_;
    }

    std::string category() const override {
        return "sessiondb::SchemaError";
    }

private:
    std::string table_;
};

// Statement execution failed; carries the native result code of the engine
class StorageError : public Error {
public:
    StorageError(ErrorCode code, const std::string& operation, const std::string& message,
                 int native_code = 0)
        : Error(code, "Storage error during '" + operation + "': " + message)
        , operation_(operation)
        , native_code_(native_code) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    int native_code() const noexcept {
        return native_code_;
    }

    std::string category() const override {
        return "sessiondb::StorageError";
    }

private:
    std::string operation_;
    int native_code_;
};

// The store could not be reached: pool exhausted, open failure, busy timeout, I/O.
// Callers own the retry policy.
class StorageUnavailable : public StorageError {
public:
    StorageUnavailable(ErrorCode code, const std::string& operation, const std::string& message,
                       int native_code = 0)
        : StorageError(code, operation, message, native_code) {}

    std::string category() const override {
        return "sessiondb::StorageUnavailable";
    }
};

// Programmer errors: bad SQL, wrong parameter index or type
class StatementError : public Error {
public:
    StatementError(ErrorCode code, const std::string& message)
        : Error(code, "Statement error: " + message) {}

    StatementError(ErrorCode code, const std::string& sql, const std::string& message)
        : Error(code, "Statement error in '" + sql + "': " + message)
        , sql_(sql) {}

    const std::string& sql() const noexcept {
        return sql_;
    }

    std::string category() const override {
        return "sessiondb::StatementError";
    }

private:
    std::string sql_;
};

// Attribute codec errors
class CodecError : public Error {
public:
    CodecError(ErrorCode code, const std::string& message)
        : Error(code, "Codec error: " + message) {}

    std::string category() const override {
        return "sessiondb::CodecError";
    }
};

// Validation errors on caller-supplied values
class ValidationError : public Error {
public:
    ValidationError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Validation error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "sessiondb::ValidationError";
    }

private:
    std::string field_;
};

// Error factory functions for common error scenarios
namespace Errors {

// Configuration errors
ConfigError invalid_database_url(const std::string& url);
ConfigError invalid_pool_size(size_t pool_size);
ConfigError invalid_identifier(const std::string& field, const std::string& identifier);
ConfigError invalid_node_id(const std::string& node_id);

// Schema errors
SchemaError create_table_failed(const std::string& table, const std::string& reason);
SchemaError upgrade_failed(const std::string& table, const std::string& reason);
SchemaError create_index_failed(const std::string& table, const std::string& index,
                                const std::string& reason);
SchemaError schema_not_ready(const std::string& table);

// Storage errors
StorageUnavailable connection_failed(const std::string& url, const std::string& reason);
StorageUnavailable pool_exhausted(size_t pool_size, std::chrono::milliseconds waited);
StorageUnavailable adaptor_not_initialized();

// Statement errors
StatementError prepare_failed(const std::string& sql, const std::string& reason);
StatementError bind_out_of_range(int index, int parameter_count);
StatementError column_not_found(const std::string& column);

// Codec errors
CodecError serialization_failed(const std::string& reason);
CodecError deserialization_failed(const std::string& reason);
CodecError payload_too_large(size_t size, size_t max_size);

// Validation errors
ValidationError invalid_session_id(const std::string& session_id);

} // namespace Errors

} // namespace sessiondb

// Enable std::error_code support
namespace std {
template <>
struct is_error_code_enum<sessiondb::ErrorCode> : true_type {};
}
