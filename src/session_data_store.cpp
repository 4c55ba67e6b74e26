// src/session_data_store.cpp
// SQL-backed session persistence

#include "sessiondb/session_data_store.hpp"
#include "sessiondb/errors.hpp"
#include "sessiondb/utils.hpp"
#include <vector>

namespace sessiondb {

namespace {

const char* COMPONENT = "SqlSessionDataStore";

struct ScopedRow {
    SessionId id;
    ContextPath context_path;
    VirtualHost vhost;
};

} // anonymous namespace

SqlSessionDataStore::SqlSessionDataStore(const StoreConfig& config,
                                         std::shared_ptr<AttributeCodec> codec)
    : SqlSessionDataStore(config, std::make_shared<DatabaseAdaptor>(config.database()),
                          std::move(codec)) {}

SqlSessionDataStore::SqlSessionDataStore(const StoreConfig& config,
                                         std::shared_ptr<DatabaseAdaptor> adaptor,
                                         std::shared_ptr<AttributeCodec> codec)
    : config_(config)
    , adaptor_(std::move(adaptor))
    , codec_(codec ? std::move(codec) : make_default_codec()) {
    config_.validate();
    schema_ = std::make_unique<SessionTableSchema>(adaptor_, config_.schema());
}

void SqlSessionDataStore::initialize() {
    const LoggingConfig& logging = config_.logging();
    if (!logging.log_to_console) {
        Utils::set_log_level(SystemLogLevel::NONE);
    } else if (logging.level) {
        Utils::set_log_level(*logging.level);
    }
    adaptor_->initialize();
    schema_->prepare_tables();
    Utils::log(SystemLogLevel::INFO, COMPONENT,
               "initialized for node " + config_.effective_node_id() +
               " with " + codec_->name() + " codec");
}

SessionContext SqlSessionDataStore::make_context(const std::string& context_path,
                                                 const std::string& vhost) const {
    return SessionContext(config_.effective_node_id(), context_path, vhost);
}

Timestamp SqlSessionDataStore::grace_period_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        config_.behavior().grace_period).count();
}

void SqlSessionDataStore::check_session_id(const SessionId& id) const {
    if (!Utils::is_valid_session_id(id)) {
        throw Errors::invalid_session_id(id);
    }
}

//=============================================================================
// Load / exists / remove
//=============================================================================

std::optional<SessionData> SqlSessionDataStore::load(const SessionId& id,
                                                     const SessionContext& context) {
    check_session_id(id);
    const SchemaConfig& columns = config_.schema();

    PooledConnection connection = adaptor_->get_connection();
    Statement statement = schema_->get_load_statement(*connection, id, context);
    loads_++;

    if (!statement.next()) {
        Utils::log(SystemLogLevel::DEBUG, COMPONENT,
                   "no session " + id + " in " + context.to_string());
        return std::nullopt;
    }

    const ScopeValueMapper& mapper = schema_->scope_mapper();

    SessionData data;
    data.id = statement.get_string(columns.id_column);
    data.context_path = mapper.from_stored_context_path(statement.get_string(columns.context_path_column));
    data.vhost = mapper.from_stored_vhost(statement.get_string(columns.virtual_host_column));
    data.last_node = statement.get_string(columns.last_node_column);
    data.created = statement.get_int64(columns.create_time_column);
    data.accessed = statement.get_int64(columns.access_time_column);
    data.last_accessed = statement.get_int64(columns.last_access_time_column);
    data.cookie_set = statement.get_int64(columns.cookie_time_column);
    data.last_saved = statement.get_int64(columns.last_saved_time_column);
    data.expiry = statement.get_int64(columns.expiry_time_column);
    data.max_inactive_secs = statement.get_int64(columns.max_interval_column);

    Blob payload = adaptor_->get_blob(statement, statement.column_index(columns.map_column));
    data.attributes = codec_->decode(payload);
    data.dirty = false;
    return data;
}

bool SqlSessionDataStore::exists(const SessionId& id, const SessionContext& context, Timestamp now) {
    check_session_id(id);

    PooledConnection connection = adaptor_->get_connection();
    Statement statement = schema_->get_check_session_exists_statement(*connection, context);
    statement.bind(Params::EXISTS_SESSION_ID, id);

    if (!statement.next()) {
        return false;
    }
    Timestamp expiry = statement.get_int64(1);
    return expiry <= 0 || expiry > now;
}

bool SqlSessionDataStore::remove(const SessionId& id, const SessionContext& context) {
    check_session_id(id);

    PooledConnection connection = adaptor_->get_connection();
    Statement statement = schema_->get_delete_statement(*connection, id, context);
    int count = statement.execute_update();

    if (count == 0) {
        Utils::log(SystemLogLevel::DEBUG, COMPONENT,
                   "session " + id + " already removed from " + context.to_string());
        return false;
    }
    removes_++;
    return true;
}

//=============================================================================
// Store
//=============================================================================

SaveResult SqlSessionDataStore::store(SessionData& data, const SessionContext& context, Timestamp now) {
    check_session_id(data.id);

    const Timestamp previous_saved = data.last_saved;
    const NodeId previous_node = data.last_node;

    data.last_node = context.node_id();
    data.last_saved = now;
    data.context_path = context.canonical_context_path();
    data.vhost = context.vhost();

    SaveResult result;
    try {
        PooledConnection connection = adaptor_->get_connection();
        result = save_row(*connection, data, context, previous_saved);
    } catch (const Error&) {
        data.last_saved = previous_saved;
        data.last_node = previous_node;
        throw;
    }

    switch (result) {
        case SaveResult::INSERTED:
            inserts_++;
            data.dirty = false;
            break;
        case SaveResult::UPDATED:
            updates_++;
            data.dirty = false;
            break;
        case SaveResult::CONFLICT:
            conflicts_++;
            data.last_saved = previous_saved;
            data.last_node = previous_node;
            break;
    }
    return result;
}

SaveResult SqlSessionDataStore::save_row(Connection& connection, const SessionData& record,
                                         const SessionContext& context, Timestamp previous_saved) {
    if (previous_saved == 0) {
        if (insert_row(connection, record, context)) {
            return SaveResult::INSERTED;
        }
        Utils::log(SystemLogLevel::DEBUG, COMPONENT,
                   "session " + record.id + " already stored by another node, updating");
        return update_row(connection, record, context, true) > 0 ? SaveResult::UPDATED
                                                                  : SaveResult::CONFLICT;
    }

    if (config_.behavior().conflict_policy == SaveConflictPolicy::COMPARE_LAST_SAVED) {
        if (update_row_if_unchanged(connection, record, context, previous_saved) > 0) {
            return SaveResult::UPDATED;
        }
        // No match: either another node saved since, or the row is gone
        if (insert_row(connection, record, context)) {
            Utils::log(SystemLogLevel::DEBUG, COMPONENT,
                       "session " + record.id + " vanished before update, inserted");
            return SaveResult::INSERTED;
        }
        Utils::log(SystemLogLevel::DEBUG, COMPONENT,
                   "session " + record.id + " changed since last save at " +
                   std::to_string(previous_saved));
        return SaveResult::CONFLICT;
    }

    if (update_row(connection, record, context, record.dirty) > 0) {
        return SaveResult::UPDATED;
    }

    Utils::log(SystemLogLevel::DEBUG, COMPONENT,
               "session " + record.id + " vanished before update, inserting");
    if (insert_row(connection, record, context)) {
        return SaveResult::INSERTED;
    }
    return update_row(connection, record, context, true) > 0 ? SaveResult::UPDATED
                                                              : SaveResult::CONFLICT;
}

bool SqlSessionDataStore::insert_row(Connection& connection, const SessionData& record,
                                     const SessionContext& context) {
    Blob payload = codec_->encode(record.attributes);

    Statement statement = schema_->get_insert_statement(connection, record.id, context);
    schema_->bind_insert(statement, record, payload);
    try {
        statement.execute_update();
    } catch (const StorageError& e) {
        if (e.code() == ErrorCode::CONSTRAINT_VIOLATION) {
            return false;
        }
        throw;
    }
    return true;
}

int SqlSessionDataStore::update_row(Connection& connection, const SessionData& record,
                                    const SessionContext& context, bool include_payload) {
    if (!include_payload) {
        Statement statement = schema_->get_update_access_statement(connection, record.id, context);
        schema_->bind_update_access(statement, UpdateParameters::from_session(record, Blob()));
        return statement.execute_update();
    }

    Statement statement = schema_->get_update_statement(connection, record.id, context);
    schema_->bind_update(statement, UpdateParameters::from_session(record, codec_->encode(record.attributes)));
    return statement.execute_update();
}

int SqlSessionDataStore::update_row_if_unchanged(Connection& connection, const SessionData& record,
                                                 const SessionContext& context,
                                                 Timestamp expected_last_saved) {
    Statement statement = schema_->get_conditional_update_statement(connection, record.id, context);
    schema_->bind_update(statement, UpdateParameters::from_session(record, codec_->encode(record.attributes)));
    statement.bind(Params::CONDITIONAL_EXPECTED_LAST_SAVED, expected_last_saved);
    return statement.execute_update();
}

//=============================================================================
// Expiry
//=============================================================================

std::set<SessionId> SqlSessionDataStore::get_expired(const std::set<SessionId>& candidates,
                                                     const SessionContext& context, Timestamp now) {
    Utils::ScopedTimer timer([&context](Utils::ScopedTimer::Duration elapsed) {
        Utils::log(SystemLogLevel::TRACE, COMPONENT, "expiry scan of " + context.to_string() +
                   " took " + std::to_string(elapsed.count()) + "ms");
    });

    std::set<SessionId> expired;

    PooledConnection connection = adaptor_->get_connection();

    // Sessions this node saved last
    {
        Statement statement = schema_->get_my_expired_sessions_statement(*connection, context, now);
        while (statement.next()) {
            expired.insert(statement.get_string(0));
        }
    }

    // Candidates held in memory that expired, or were removed by another node
    for (const SessionId& id : candidates) {
        if (expired.count(id) > 0) {
            continue;
        }
        Statement statement = schema_->get_check_session_exists_statement(*connection, context);
        statement.bind(Params::EXISTS_SESSION_ID, id);
        if (!statement.next()) {
            expired.insert(id);
            continue;
        }
        Timestamp expiry = statement.get_int64(1);
        if (expiry > 0 && expiry <= now) {
            expired.insert(id);
        }
    }

    // Orphans: any node's sessions expired for longer than the grace period,
    // checked at most once per grace period
    const Timestamp grace = grace_period_ms();
    const Timestamp last_scan = last_orphan_scan_.load();
    if (last_scan == 0 || now - last_scan >= grace) {
        Statement statement = schema_->get_expired_sessions_statement(
            *connection, context.canonical_context_path(), context.vhost(), now - grace);
        while (statement.next()) {
            expired.insert(statement.get_string(0));
        }
        last_orphan_scan_.store(now);
    }

    expired_found_ += expired.size();
    if (!expired.empty()) {
        Utils::log(SystemLogLevel::DEBUG, COMPONENT,
                   std::to_string(expired.size()) + " expired sessions in " + context.to_string());
    }
    return expired;
}

size_t SqlSessionDataStore::purge_ancient(Timestamp now) {
    const Timestamp before = now - 3 * grace_period_ms();
    const ScopeValueMapper& mapper = schema_->scope_mapper();

    PooledConnection connection = adaptor_->get_connection();

    std::vector<ScopedRow> rows;
    {
        Statement statement = schema_->get_all_ancient_expired_sessions_statement(*connection, before);
        while (statement.next()) {
            rows.push_back(ScopedRow{statement.get_string(0),
                                     mapper.from_stored_context_path(statement.get_string(1)),
                                     mapper.from_stored_vhost(statement.get_string(2))});
        }
    }

    size_t purged = 0;
    for (const ScopedRow& row : rows) {
        SessionContext scope(config_.effective_node_id(), row.context_path, row.vhost);
        Statement statement = schema_->get_delete_statement(*connection, row.id, scope);
        purged += static_cast<size_t>(statement.execute_update());
    }

    ancient_purged_ += purged;
    if (purged > 0) {
        Utils::log(SystemLogLevel::INFO, COMPONENT,
                   "purged " + std::to_string(purged) + " sessions expired before " +
                   std::to_string(before));
    }
    return purged;
}

bool SqlSessionDataStore::is_healthy() {
    if (!adaptor_->is_initialized() || !schema_->is_ready()) {
        return false;
    }
    try {
        PooledConnection connection = adaptor_->get_connection();
        return connection->is_healthy();
    } catch (const StorageUnavailable& e) {
        Utils::log(SystemLogLevel::WARN, COMPONENT, std::string("health check failed: ") + e.what());
        return false;
    }
}

SqlSessionDataStore::Stats SqlSessionDataStore::get_stats() const {
    Stats stats;
    stats.loads = loads_.load();
    stats.inserts = inserts_.load();
    stats.updates = updates_.load();
    stats.conflicts = conflicts_.load();
    stats.removes = removes_.load();
    stats.expired_found = expired_found_.load();
    stats.ancient_purged = ancient_purged_.load();
    return stats;
}

} // namespace sessiondb
