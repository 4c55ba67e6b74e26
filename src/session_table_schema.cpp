// src/session_table_schema.cpp
// Session table DDL, schema initializer and statement construction

#include "sessiondb/session_table_schema.hpp"
#include "sessiondb/errors.hpp"
#include "sessiondb/utils.hpp"
#include <sstream>

namespace sessiondb {

//=============================================================================
// Scope value mappers
//=============================================================================

std::unique_ptr<ScopeValueMapper> ScopeValueMapper::for_adaptor(const DatabaseAdaptor& adaptor) {
    if (adaptor.is_empty_string_null()) {
        return std::make_unique<SentinelScopeMapper>();
    }
    return std::make_unique<PassThroughScopeMapper>();
}

std::string SentinelScopeMapper::to_stored_context_path(const ContextPath& canonical) const {
    return canonical.empty() ? std::string(Constants::NULL_CONTEXT_PATH) : canonical;
}

std::string SentinelScopeMapper::to_stored_vhost(const VirtualHost& vhost) const {
    return vhost.empty() ? std::string(Constants::NULL_CONTEXT_PATH) : vhost;
}

ContextPath SentinelScopeMapper::from_stored_context_path(const std::string& stored) const {
    return stored == Constants::NULL_CONTEXT_PATH ? ContextPath() : stored;
}

VirtualHost SentinelScopeMapper::from_stored_vhost(const std::string& stored) const {
    return stored == Constants::NULL_CONTEXT_PATH ? VirtualHost() : stored;
}

//=============================================================================
// UpdateParameters
//=============================================================================

UpdateParameters UpdateParameters::from_session(const SessionData& data, const Blob& payload) {
    UpdateParameters params;
    params.last_node = data.last_node;
    params.access_time = data.accessed;
    params.last_access_time = data.last_accessed;
    params.last_saved_time = data.last_saved;
    params.expiry_time = data.expiry;
    params.max_interval = data.max_inactive_secs;
    params.payload = payload;
    return params;
}

std::string schema_state_to_string(SchemaState state) {
    switch (state) {
        case SchemaState::UNINITIALIZED: return "UNINITIALIZED";
        case SchemaState::TABLE_VERIFIED: return "TABLE_VERIFIED";
        case SchemaState::READY: return "READY";
        default: return "UNKNOWN";
    }
}

//=============================================================================
// SessionTableSchema
//=============================================================================

SessionTableSchema::SessionTableSchema(std::shared_ptr<DatabaseAdaptor> adaptor,
                                       const SchemaConfig& config)
    : adaptor_(std::move(adaptor))
    , config_(config) {
    if (!adaptor_) {
        throw Errors::adaptor_not_initialized();
    }
    scope_mapper_ = ScopeValueMapper::for_adaptor(*adaptor_);
}

void SessionTableSchema::prepare_tables() {
    std::lock_guard<std::mutex> lock(prepare_mutex_);
    if (state_.load() == SchemaState::READY) {
        return;
    }

    if (!adaptor_->is_initialized()) {
        adaptor_->initialize();
    }

    PooledConnection connection = adaptor_->get_connection();

    ensure_table(*connection);
    state_.store(SchemaState::TABLE_VERIFIED);

    ensure_columns(*connection);
    ensure_index(*connection, expiry_index_name(), create_expiry_index_as_string());
    ensure_index(*connection, session_index_name(), create_session_index_as_string());

    state_.store(SchemaState::READY);
    Utils::log(SystemLogLevel::INFO, "SessionTableSchema",
               schema_table_name() + " ready, scope values " + scope_mapper_->name());
}

void SessionTableSchema::ensure_table(Connection& connection) {
    const std::string schema = config_.schema_name.empty()
        ? std::string() : adaptor_->convert_identifier(config_.schema_name);
    const std::string table = adaptor_->convert_identifier(config_.table_name);

    if (connection.has_table(schema, table)) {
        Utils::log(SystemLogLevel::DEBUG, "SessionTableSchema", schema_table_name() + " exists");
        return;
    }

    try {
        connection.execute(create_table_as_string());
        Utils::log(SystemLogLevel::INFO, "SessionTableSchema", "created " + schema_table_name());
    } catch (const StorageUnavailable&) {
        throw;
    } catch (const StorageError& e) {
        // Another node may have created it between the lookup and the DDL
        if (connection.has_table(schema, table)) {
            Utils::log(SystemLogLevel::DEBUG, "SessionTableSchema",
                       schema_table_name() + " created concurrently");
            return;
        }
        throw Errors::create_table_failed(schema_table_name(), e.what());
    }
}

void SessionTableSchema::ensure_columns(Connection& connection) {
    const std::string schema = config_.schema_name.empty()
        ? std::string() : adaptor_->convert_identifier(config_.schema_name);
    const std::string table = adaptor_->convert_identifier(config_.table_name);
    const std::string max_interval = adaptor_->convert_identifier(config_.max_interval_column);

    if (connection.has_column(schema, table, max_interval)) {
        return;
    }

    try {
        connection.execute(add_max_interval_column_as_string());
        Utils::log(SystemLogLevel::INFO, "SessionTableSchema",
                   "added column " + max_interval + " to " + schema_table_name());
    } catch (const StorageUnavailable&) {
        throw;
    } catch (const StorageError& e) {
        if (connection.has_column(schema, table, max_interval)) {
            return;
        }
        throw Errors::upgrade_failed(schema_table_name(), e.what());
    }
}

void SessionTableSchema::ensure_index(Connection& connection, const std::string& index_name,
                                      const std::string& ddl) {
    const std::string schema = config_.schema_name.empty()
        ? std::string() : adaptor_->convert_identifier(config_.schema_name);

    if (connection.has_index(schema, index_name)) {
        return;
    }

    try {
        connection.execute(ddl);
        Utils::log(SystemLogLevel::INFO, "SessionTableSchema", "created index " + index_name);
    } catch (const StorageUnavailable&) {
        throw;
    } catch (const StorageError& e) {
        if (connection.has_index(schema, index_name)) {
            return;
        }
        throw Errors::create_index_failed(schema_table_name(), index_name, e.what());
    }
}

//=============================================================================
// Statement getters
//=============================================================================

void SessionTableSchema::check_ready() const {
    if (state_.load() != SchemaState::READY) {
        throw Errors::schema_not_ready(schema_table_name());
    }
}

Statement SessionTableSchema::prepare(Connection& connection, const std::string& kind,
                                      const std::string& sql) const {
    check_ready();
    if (Utils::is_log_enabled(SystemLogLevel::TRACE)) {
        Utils::log(SystemLogLevel::TRACE, "SessionTableSchema", kind + ": " + sql);
    }
    return connection.prepare(sql);
}

void SessionTableSchema::bind_scope(Statement& statement, int first_index, const SessionId& id,
                                    const SessionContext& context) const {
    statement.bind(first_index, id);
    statement.bind(first_index + 1,
                   scope_mapper_->to_stored_context_path(context.canonical_context_path()));
    statement.bind(first_index + 2, scope_mapper_->to_stored_vhost(context.vhost()));
}

Statement SessionTableSchema::get_load_statement(Connection& connection, const SessionId& id,
                                                 const SessionContext& context) const {
    Statement statement = prepare(connection, "load", load_as_string());
    bind_scope(statement, 1, id, context);
    return statement;
}

Statement SessionTableSchema::get_check_session_exists_statement(Connection& connection,
                                                                 const SessionContext& context) const {
    Statement statement = prepare(connection, "exists", exists_as_string());
    statement.bind(Params::EXISTS_SESSION_ID + 1,
                   scope_mapper_->to_stored_context_path(context.canonical_context_path()));
    statement.bind(Params::EXISTS_SESSION_ID + 2, scope_mapper_->to_stored_vhost(context.vhost()));
    return statement;
}

Statement SessionTableSchema::get_delete_statement(Connection& connection, const SessionId& id,
                                                   const SessionContext& context) const {
    Statement statement = prepare(connection, "delete", delete_as_string());
    bind_scope(statement, 1, id, context);
    return statement;
}

Statement SessionTableSchema::get_update_statement(Connection& connection, const SessionId& id,
                                                   const SessionContext& context) const {
    Statement statement = prepare(connection, "update", update_as_string());
    bind_scope(statement, Params::UPDATE_SESSION_ID, id, context);
    return statement;
}

Statement SessionTableSchema::get_update_access_statement(Connection& connection, const SessionId& id,
                                                          const SessionContext& context) const {
    Statement statement = prepare(connection, "update access", update_access_as_string());
    bind_scope(statement, Params::UPDATE_MAX_INTERVAL + 1, id, context);
    return statement;
}

Statement SessionTableSchema::get_conditional_update_statement(Connection& connection,
                                                               const SessionId& id,
                                                               const SessionContext& context) const {
    Statement statement = prepare(connection, "conditional update", conditional_update_as_string());
    bind_scope(statement, Params::CONDITIONAL_EXPECTED_LAST_SAVED + 1, id, context);
    return statement;
}

Statement SessionTableSchema::get_insert_statement(Connection& connection, const SessionId& id,
                                                   const SessionContext& context) const {
    Statement statement = prepare(connection, "insert", insert_as_string());
    bind_scope(statement, Params::INSERT_SESSION_ID, id, context);
    return statement;
}

Statement SessionTableSchema::get_expired_sessions_statement(Connection& connection,
                                                             const ContextPath& canonical_context_path,
                                                             const VirtualHost& vhost,
                                                             Timestamp before) const {
    Statement statement = prepare(connection, "expired", expired_as_string());
    statement.bind(1, scope_mapper_->to_stored_context_path(canonical_context_path));
    statement.bind(2, scope_mapper_->to_stored_vhost(vhost));
    statement.bind(3, before);
    return statement;
}

Statement SessionTableSchema::get_my_expired_sessions_statement(Connection& connection,
                                                                const SessionContext& context,
                                                                Timestamp before) const {
    Statement statement = prepare(connection, "my expired", my_expired_as_string());
    statement.bind(1, scope_mapper_->to_stored_context_path(context.canonical_context_path()));
    statement.bind(2, scope_mapper_->to_stored_vhost(context.vhost()));
    statement.bind(3, context.node_id());
    statement.bind(4, before);
    return statement;
}

Statement SessionTableSchema::get_all_ancient_expired_sessions_statement(Connection& connection,
                                                                         Timestamp before) const {
    Statement statement = prepare(connection, "ancient expired", all_ancient_expired_as_string());
    statement.bind(1, before);
    return statement;
}

//=============================================================================
// Typed binders
//=============================================================================

void SessionTableSchema::bind_update_access(Statement& statement, const UpdateParameters& params) const {
    statement.bind(Params::UPDATE_LAST_NODE, params.last_node);
    statement.bind(Params::UPDATE_ACCESS_TIME, params.access_time);
    statement.bind(Params::UPDATE_LAST_ACCESS_TIME, params.last_access_time);
    statement.bind(Params::UPDATE_LAST_SAVED_TIME, params.last_saved_time);
    statement.bind(Params::UPDATE_EXPIRY_TIME, params.expiry_time);
    statement.bind(Params::UPDATE_MAX_INTERVAL, params.max_interval);
}

void SessionTableSchema::bind_update(Statement& statement, const UpdateParameters& params) const {
    bind_update_access(statement, params);
    adaptor_->bind_blob(statement, Params::UPDATE_MAP, params.payload);
}

void SessionTableSchema::bind_insert(Statement& statement, const SessionData& data,
                                     const Blob& payload) const {
    statement.bind(Params::INSERT_LAST_NODE, data.last_node);
    statement.bind(Params::INSERT_ACCESS_TIME, data.accessed);
    statement.bind(Params::INSERT_LAST_ACCESS_TIME, data.last_accessed);
    statement.bind(Params::INSERT_CREATE_TIME, data.created);
    statement.bind(Params::INSERT_COOKIE_TIME, data.cookie_set);
    statement.bind(Params::INSERT_LAST_SAVED_TIME, data.last_saved);
    statement.bind(Params::INSERT_EXPIRY_TIME, data.expiry);
    statement.bind(Params::INSERT_MAX_INTERVAL, data.max_inactive_secs);
    adaptor_->bind_blob(statement, Params::INSERT_MAP, payload);
}

//=============================================================================
// SQL text
//=============================================================================

std::string SessionTableSchema::column(const std::string& name) const {
    return adaptor_->quote_identifier(adaptor_->convert_identifier(name));
}

std::string SessionTableSchema::schema_table_name() const {
    std::string table = column(config_.table_name);
    if (config_.schema_name.empty()) {
        return table;
    }
    return column(config_.schema_name) + "." + table;
}

std::string SessionTableSchema::expiry_index_name() const {
    return adaptor_->convert_identifier("idx_" + config_.table_name + "_expiry");
}

std::string SessionTableSchema::session_index_name() const {
    return adaptor_->convert_identifier("idx_" + config_.table_name + "_session");
}

std::string SessionTableSchema::scope_predicate() const {
    return column(config_.id_column) + " = ? AND " +
           column(config_.context_path_column) + " = ? AND " +
           column(config_.virtual_host_column) + " = ?";
}

std::string SessionTableSchema::create_table_as_string() const {
    const std::string str = adaptor_->string_type();
    const std::string lng = adaptor_->long_type();

    std::ostringstream sql;
    sql << "CREATE TABLE " << schema_table_name() << " ("
        << column(config_.id_column) << " " << str << "(120), "
        << column(config_.context_path_column) << " " << str << "(60), "
        << column(config_.virtual_host_column) << " " << str << "(60), "
        << column(config_.last_node_column) << " " << str << "(60), "
        << column(config_.access_time_column) << " " << lng << ", "
        << column(config_.last_access_time_column) << " " << lng << ", "
        << column(config_.create_time_column) << " " << lng << ", "
        << column(config_.cookie_time_column) << " " << lng << ", "
        << column(config_.last_saved_time_column) << " " << lng << ", "
        << column(config_.expiry_time_column) << " " << lng << ", "
        << column(config_.max_interval_column) << " " << lng << ", "
        << column(config_.map_column) << " " << adaptor_->blob_type() << ", "
        << "PRIMARY KEY (" << column(config_.id_column) << ", "
        << column(config_.context_path_column) << ", "
        << column(config_.virtual_host_column) << "))";
    return sql.str();
}

std::string SessionTableSchema::add_max_interval_column_as_string() const {
    const std::string definition = column(config_.max_interval_column) + " " + adaptor_->long_type();
    if (adaptor_->dialect() == Dialect::ORACLE) {
        return "ALTER TABLE " + schema_table_name() + " ADD (" + definition + ")";
    }
    return "ALTER TABLE " + schema_table_name() + " ADD COLUMN " + definition;
}

namespace {

// SQLite qualifies the index name, every other dialect the table
std::string create_index_sql(const DatabaseAdaptor& adaptor, const SchemaConfig& config,
                             const std::string& index_name, const std::string& columns) {
    auto quoted = [&adaptor](const std::string& name) {
        return adaptor.quote_identifier(adaptor.convert_identifier(name));
    };

    std::string index = adaptor.quote_identifier(index_name);
    std::string table = quoted(config.table_name);
    if (!config.schema_name.empty()) {
        if (adaptor.dialect() == Dialect::SQLITE) {
            index = quoted(config.schema_name) + "." + index;
        } else {
            table = quoted(config.schema_name) + "." + table;
        }
    }
    return "CREATE INDEX " + index + " ON " + table + " (" + columns + ")";
}

} // anonymous namespace

std::string SessionTableSchema::create_expiry_index_as_string() const {
    return create_index_sql(*adaptor_, config_, expiry_index_name(),
                            column(config_.expiry_time_column));
}

std::string SessionTableSchema::create_session_index_as_string() const {
    return create_index_sql(*adaptor_, config_, session_index_name(),
                            column(config_.id_column) + ", " + column(config_.context_path_column));
}

std::string SessionTableSchema::load_as_string() const {
    return "SELECT * FROM " + schema_table_name() + " WHERE " + scope_predicate();
}

std::string SessionTableSchema::exists_as_string() const {
    return "SELECT " + column(config_.id_column) + ", " + column(config_.expiry_time_column) +
           " FROM " + schema_table_name() + " WHERE " + scope_predicate();
}

std::string SessionTableSchema::delete_as_string() const {
    return "DELETE FROM " + schema_table_name() + " WHERE " + scope_predicate();
}

std::string SessionTableSchema::update_access_as_string() const {
    return "UPDATE " + schema_table_name() + " SET " +
           column(config_.last_node_column) + " = ?, " +
           column(config_.access_time_column) + " = ?, " +
           column(config_.last_access_time_column) + " = ?, " +
           column(config_.last_saved_time_column) + " = ?, " +
           column(config_.expiry_time_column) + " = ?, " +
           column(config_.max_interval_column) + " = ? WHERE " + scope_predicate();
}

std::string SessionTableSchema::update_as_string() const {
    return "UPDATE " + schema_table_name() + " SET " +
           column(config_.last_node_column) + " = ?, " +
           column(config_.access_time_column) + " = ?, " +
           column(config_.last_access_time_column) + " = ?, " +
           column(config_.last_saved_time_column) + " = ?, " +
           column(config_.expiry_time_column) + " = ?, " +
           column(config_.max_interval_column) + " = ?, " +
           column(config_.map_column) + " = ? WHERE " + scope_predicate();
}

std::string SessionTableSchema::conditional_update_as_string() const {
    return "UPDATE " + schema_table_name() + " SET " +
           column(config_.last_node_column) + " = ?, " +
           column(config_.access_time_column) + " = ?, " +
           column(config_.last_access_time_column) + " = ?, " +
           column(config_.last_saved_time_column) + " = ?, " +
           column(config_.expiry_time_column) + " = ?, " +
           column(config_.max_interval_column) + " = ?, " +
           column(config_.map_column) + " = ? WHERE " +
           column(config_.last_saved_time_column) + " = ? AND " + scope_predicate();
}

std::string SessionTableSchema::insert_as_string() const {
    return "INSERT INTO " + schema_table_name() + " (" +
           column(config_.id_column) + ", " +
           column(config_.context_path_column) + ", " +
           column(config_.virtual_host_column) + ", " +
           column(config_.last_node_column) + ", " +
           column(config_.access_time_column) + ", " +
           column(config_.last_access_time_column) + ", " +
           column(config_.create_time_column) + ", " +
           column(config_.cookie_time_column) + ", " +
           column(config_.last_saved_time_column) + ", " +
           column(config_.expiry_time_column) + ", " +
           column(config_.max_interval_column) + ", " +
           column(config_.map_column) +
           ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
}

std::string SessionTableSchema::expired_as_string() const {
    return "SELECT " + column(config_.id_column) + " FROM " + schema_table_name() + " WHERE " +
           column(config_.context_path_column) + " = ? AND " +
           column(config_.virtual_host_column) + " = ? AND " +
           column(config_.expiry_time_column) + " > 0 AND " +
           column(config_.expiry_time_column) + " <= ?";
}

std::string SessionTableSchema::my_expired_as_string() const {
    return "SELECT " + column(config_.id_column) + " FROM " + schema_table_name() + " WHERE " +
           column(config_.context_path_column) + " = ? AND " +
           column(config_.virtual_host_column) + " = ? AND " +
           column(config_.last_node_column) + " = ? AND " +
           column(config_.expiry_time_column) + " > 0 AND " +
           column(config_.expiry_time_column) + " <= ?";
}

std::string SessionTableSchema::all_ancient_expired_as_string() const {
    return "SELECT " + column(config_.id_column) + ", " +
           column(config_.context_path_column) + ", " +
           column(config_.virtual_host_column) + " FROM " + schema_table_name() + " WHERE " +
           column(config_.expiry_time_column) + " > 0 AND " +
           column(config_.expiry_time_column) + " <= ?";
}

} // namespace sessiondb
