// include/sessiondb/session_data_store.hpp
// Purpose: Session persistence built on the session table statements
// Load, save, existence, removal and the two-phase expiry scan

#pragma once

#include "attribute_codec.hpp"
#include "config.hpp"
#include "database_adaptor.hpp"
#include "session_context.hpp"
#include "session_table_schema.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace sessiondb {

//=============================================================================
// SESSION DATA STORE - interface
//=============================================================================

class SessionDataStore {
public:
    virtual ~SessionDataStore() = default;

    virtual void initialize() = 0;

    // std::nullopt when no row exists for (id, scope)
    virtual std::optional<SessionData> load(const SessionId& id, const SessionContext& context) = 0;

    // Stamps data.last_node and data.last_saved on success
    virtual SaveResult store(SessionData& data, const SessionContext& context, Timestamp now) = 0;

    // Row present and not expired at `now`
    virtual bool exists(const SessionId& id, const SessionContext& context, Timestamp now) = 0;

    // False when the row was already gone
    virtual bool remove(const SessionId& id, const SessionContext& context) = 0;

    // Ids that should be expired now: this node's expired sessions, candidates
    // that expired or vanished, and other nodes' sessions past the grace period
    virtual std::set<SessionId> get_expired(const std::set<SessionId>& candidates,
                                            const SessionContext& context, Timestamp now) = 0;

    // Delete rows of every scope expired long enough ago that no node will claim them
    virtual size_t purge_ancient(Timestamp now) = 0;

    virtual bool is_healthy() = 0;
};

//=============================================================================
// SQL SESSION DATA STORE
//=============================================================================

class SqlSessionDataStore : public SessionDataStore {
public:
    struct Stats {
        uint64_t loads = 0;
        uint64_t inserts = 0;
        uint64_t updates = 0;
        uint64_t conflicts = 0;
        uint64_t removes = 0;
        uint64_t expired_found = 0;
        uint64_t ancient_purged = 0;
    };

    explicit SqlSessionDataStore(const StoreConfig& config,
                                 std::shared_ptr<AttributeCodec> codec = nullptr);

    // Share an adaptor (and its pool) with other components
    SqlSessionDataStore(const StoreConfig& config, std::shared_ptr<DatabaseAdaptor> adaptor,
                        std::shared_ptr<AttributeCodec> codec = nullptr);

    ~SqlSessionDataStore() override = default;

    SqlSessionDataStore(const SqlSessionDataStore&) = delete;
    SqlSessionDataStore& operator=(const SqlSessionDataStore&) = delete;

    // Adaptor initialization plus prepare_tables(); throws SchemaError, StorageUnavailable
    void initialize() override;
    bool is_initialized() const noexcept { return schema_->is_ready(); }

    std::optional<SessionData> load(const SessionId& id, const SessionContext& context) override;
    SaveResult store(SessionData& data, const SessionContext& context, Timestamp now) override;
    bool exists(const SessionId& id, const SessionContext& context, Timestamp now) override;
    bool remove(const SessionId& id, const SessionContext& context) override;
    std::set<SessionId> get_expired(const std::set<SessionId>& candidates,
                                    const SessionContext& context, Timestamp now) override;
    size_t purge_ancient(Timestamp now) override;
    bool is_healthy() override;

    // Scope descriptor for this node
    SessionContext make_context(const std::string& context_path, const std::string& vhost = "") const;

    const StoreConfig& config() const noexcept { return config_; }
    DatabaseAdaptor& adaptor() noexcept { return *adaptor_; }
    SessionTableSchema& schema() noexcept { return *schema_; }
    const AttributeCodec& codec() const noexcept { return *codec_; }

    Stats get_stats() const;

private:
    StoreConfig config_;
    std::shared_ptr<DatabaseAdaptor> adaptor_;
    std::shared_ptr<AttributeCodec> codec_;
    std::unique_ptr<SessionTableSchema> schema_;

    std::atomic<Timestamp> last_orphan_scan_{0};

    std::atomic<uint64_t> loads_{0};
    std::atomic<uint64_t> inserts_{0};
    std::atomic<uint64_t> updates_{0};
    std::atomic<uint64_t> conflicts_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> expired_found_{0};
    std::atomic<uint64_t> ancient_purged_{0};

    Timestamp grace_period_ms() const;
    void check_session_id(const SessionId& id) const;

    SaveResult save_row(Connection& connection, const SessionData& record,
                        const SessionContext& context, Timestamp previous_saved);
    bool insert_row(Connection& connection, const SessionData& record, const SessionContext& context);
    int update_row(Connection& connection, const SessionData& record, const SessionContext& context,
                   bool include_payload);
    int update_row_if_unchanged(Connection& connection, const SessionData& record,
                                const SessionContext& context, Timestamp expected_last_saved);
};

} // namespace sessiondb
