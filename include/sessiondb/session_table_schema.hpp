// include/sessiondb/session_table_schema.hpp
// Purpose: Session table definition and the statements every session operation runs
// Owns DDL generation, the schema initializer state machine and the
// scope-value strategy that keeps empty context paths readable on all dialects

#pragma once

#include "config.hpp"
#include "connection.hpp"
#include "database_adaptor.hpp"
#include "session_context.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace sessiondb {

//=============================================================================
// SCOPE VALUE MAPPER - how context path and vhost reach the database
//=============================================================================

// Chosen once per adaptor. Every statement that writes or filters on the
// scope columns goes through the same instance.
class ScopeValueMapper {
public:
    virtual ~ScopeValueMapper() = default;

    // Canonical value -> bound parameter
    virtual std::string to_stored_context_path(const ContextPath& canonical) const = 0;
    virtual std::string to_stored_vhost(const VirtualHost& vhost) const = 0;

    // Column value -> canonical value
    virtual ContextPath from_stored_context_path(const std::string& stored) const = 0;
    virtual VirtualHost from_stored_vhost(const std::string& stored) const = 0;

    virtual std::string name() const = 0;

    static std::unique_ptr<ScopeValueMapper> for_adaptor(const DatabaseAdaptor& adaptor);
};

// Binds values unchanged
class PassThroughScopeMapper : public ScopeValueMapper {
public:
    std::string to_stored_context_path(const ContextPath& canonical) const override { return canonical; }
    std::string to_stored_vhost(const VirtualHost& vhost) const override { return vhost; }
    ContextPath from_stored_context_path(const std::string& stored) const override { return stored; }
    VirtualHost from_stored_vhost(const std::string& stored) const override { return stored; }
    std::string name() const override { return "pass-through"; }
};

// Substitutes Constants::NULL_CONTEXT_PATH for empty values
class SentinelScopeMapper : public ScopeValueMapper {
public:
    std::string to_stored_context_path(const ContextPath& canonical) const override;
    std::string to_stored_vhost(const VirtualHost& vhost) const override;
    ContextPath from_stored_context_path(const std::string& stored) const override;
    VirtualHost from_stored_vhost(const std::string& stored) const override;
    std::string name() const override { return "sentinel"; }
};

//=============================================================================
// PARAMETER POSITIONS - the positional contract of each statement
//=============================================================================

namespace Params {

// get_check_session_exists_statement
constexpr int EXISTS_SESSION_ID = 1;

// get_update_statement, get_conditional_update_statement, get_update_access_statement
constexpr int UPDATE_LAST_NODE = 1;
constexpr int UPDATE_ACCESS_TIME = 2;
constexpr int UPDATE_LAST_ACCESS_TIME = 3;
constexpr int UPDATE_LAST_SAVED_TIME = 4;
constexpr int UPDATE_EXPIRY_TIME = 5;
constexpr int UPDATE_MAX_INTERVAL = 6;
constexpr int UPDATE_MAP = 7;
constexpr int UPDATE_SESSION_ID = 8;
constexpr int UPDATE_CONTEXT_PATH = 9;
constexpr int UPDATE_VHOST = 10;

// get_conditional_update_statement only; scope key follows at 9..11
constexpr int CONDITIONAL_EXPECTED_LAST_SAVED = 8;

// get_insert_statement, column order
constexpr int INSERT_SESSION_ID = 1;
constexpr int INSERT_CONTEXT_PATH = 2;
constexpr int INSERT_VHOST = 3;
constexpr int INSERT_LAST_NODE = 4;
constexpr int INSERT_ACCESS_TIME = 5;
constexpr int INSERT_LAST_ACCESS_TIME = 6;
constexpr int INSERT_CREATE_TIME = 7;
constexpr int INSERT_COOKIE_TIME = 8;
constexpr int INSERT_LAST_SAVED_TIME = 9;
constexpr int INSERT_EXPIRY_TIME = 10;
constexpr int INSERT_MAX_INTERVAL = 11;
constexpr int INSERT_MAP = 12;

} // namespace Params

// Values for one save, in the order the update statements take them
struct UpdateParameters {
    NodeId last_node;
    Timestamp access_time = 0;
    Timestamp last_access_time = 0;
    Timestamp last_saved_time = 0;
    Timestamp expiry_time = 0;
    int64_t max_interval = 0;
    Blob payload;

    static UpdateParameters from_session(const SessionData& data, const Blob& payload);
};

enum class SchemaState : uint8_t {
    UNINITIALIZED = 0,
    TABLE_VERIFIED = 1,
    READY = 2
};

std::string schema_state_to_string(SchemaState state);

//=============================================================================
// SESSION TABLE SCHEMA
//=============================================================================

class SessionTableSchema {
public:
    SessionTableSchema(std::shared_ptr<DatabaseAdaptor> adaptor, const SchemaConfig& config = {});

    SessionTableSchema(const SessionTableSchema&) = delete;
    SessionTableSchema& operator=(const SessionTableSchema&) = delete;

    // Create the table and indexes when absent, add columns missing from
    // older schemas. Safe to call repeatedly and from several nodes at once.
    // Throws SchemaError.
    void prepare_tables();

    SchemaState state() const noexcept { return state_.load(); }
    bool is_ready() const noexcept { return state() == SchemaState::READY; }

    // Statement getters. All throw SchemaError before prepare_tables() completed.

    // Full row for (id, scope); zero rows means not found
    Statement get_load_statement(Connection& connection, const SessionId& id,
                                 const SessionContext& context) const;

    // Selects id and expiry time; session id bound by the caller at Params::EXISTS_SESSION_ID
    Statement get_check_session_exists_statement(Connection& connection,
                                                 const SessionContext& context) const;

    // execute_update() returns 0 when the row was already gone
    Statement get_delete_statement(Connection& connection, const SessionId& id,
                                   const SessionContext& context) const;

    // Parameters 1..7 bound by the caller (see Params::UPDATE_*), key pre-bound
    Statement get_update_statement(Connection& connection, const SessionId& id,
                                   const SessionContext& context) const;

    // As get_update_statement without the payload column; key pre-bound at 7..9
    Statement get_update_access_statement(Connection& connection, const SessionId& id,
                                          const SessionContext& context) const;

    // As get_update_statement, only matching while lastSavedTime still equals
    // the value bound at Params::CONDITIONAL_EXPECTED_LAST_SAVED; key pre-bound at 9..11
    Statement get_conditional_update_statement(Connection& connection, const SessionId& id,
                                               const SessionContext& context) const;

    // Parameters 4..12 bound by bind_insert()
    Statement get_insert_statement(Connection& connection, const SessionId& id,
                                   const SessionContext& context) const;

    // Ids in the scope with 0 < expiry <= before, any owner
    Statement get_expired_sessions_statement(Connection& connection,
                                             const ContextPath& canonical_context_path,
                                             const VirtualHost& vhost,
                                             Timestamp before) const;

    // As above, restricted to rows last saved by context.node_id()
    Statement get_my_expired_sessions_statement(Connection& connection,
                                                const SessionContext& context,
                                                Timestamp before) const;

    // id, contextPath, virtualHost of rows in any scope with 0 < expiry <= before
    Statement get_all_ancient_expired_sessions_statement(Connection& connection,
                                                         Timestamp before) const;

    // Typed binders over the positional contract
    void bind_update(Statement& statement, const UpdateParameters& params) const;
    void bind_update_access(Statement& statement, const UpdateParameters& params) const;
    void bind_insert(Statement& statement, const SessionData& data, const Blob& payload) const;

    // Generated SQL text
    std::string create_table_as_string() const;
    std::string add_max_interval_column_as_string() const;
    std::string create_expiry_index_as_string() const;
    std::string create_session_index_as_string() const;
    std::string load_as_string() const;
    std::string exists_as_string() const;
    std::string delete_as_string() const;
    std::string update_as_string() const;
    std::string update_access_as_string() const;
    std::string conditional_update_as_string() const;
    std::string insert_as_string() const;
    std::string expired_as_string() const;
    std::string my_expired_as_string() const;
    std::string all_ancient_expired_as_string() const;

    // Table name, schema-qualified when a schema is configured
    std::string schema_table_name() const;
    std::string expiry_index_name() const;
    std::string session_index_name() const;

    const SchemaConfig& config() const noexcept { return config_; }
    const DatabaseAdaptor& adaptor() const noexcept { return *adaptor_; }
    const ScopeValueMapper& scope_mapper() const noexcept { return *scope_mapper_; }

private:
    std::shared_ptr<DatabaseAdaptor> adaptor_;
    SchemaConfig config_;
    std::unique_ptr<ScopeValueMapper> scope_mapper_;
    std::mutex prepare_mutex_;
    std::atomic<SchemaState> state_{SchemaState::UNINITIALIZED};

    std::string column(const std::string& name) const;
    std::string scope_predicate() const;

    void ensure_table(Connection& connection);
    void ensure_columns(Connection& connection);
    void ensure_index(Connection& connection, const std::string& index_name, const std::string& ddl);

    void check_ready() const;
    Statement prepare(Connection& connection, const std::string& kind, const std::string& sql) const;
    void bind_scope(Statement& statement, int first_index, const SessionId& id,
                    const SessionContext& context) const;
};

} // namespace sessiondb
