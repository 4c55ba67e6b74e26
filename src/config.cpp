// src/config.cpp
// Implementation of configuration system with validation and presets

#include "sessiondb/config.hpp"
#include "sessiondb/utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace sessiondb {

// StoreConfig implementation
StoreConfig::StoreConfig() {
    // Database defaults - local SQLite file, modest pool
    database_.dialect = Dialect::SQLITE;
    database_.url = "sessions.db";
    database_.pool_size = 8;
    database_.acquire_timeout = std::chrono::milliseconds(5000);
    database_.busy_timeout = std::chrono::milliseconds(2000);

    // Behavior defaults - one hour grace for orphaned sessions
    behavior_.grace_period = std::chrono::seconds(Constants::DEFAULT_GRACE_PERIOD_SEC);
    behavior_.conflict_policy = SaveConflictPolicy::COMPARE_LAST_SAVED;
    behavior_.sweep_interval = std::chrono::seconds(60);

    logging_.level.reset();
    logging_.log_to_console = true;
}

StoreConfig::StoreConfig(const std::string& url) : StoreConfig() {
    database_.url = url;
}

NodeId StoreConfig::effective_node_id() const {
    if (!behavior_.node_id.empty()) {
        return behavior_.node_id;
    }
    return Utils::default_node_id();
}

StoreConfig& StoreConfig::set_url(const std::string& url) {
    database_.url = url;
    return *this;
}

StoreConfig& StoreConfig::set_dialect(Dialect dialect) {
    database_.dialect = dialect;
    return *this;
}

StoreConfig& StoreConfig::set_pool_size(size_t size) {
    database_.pool_size = size;
    return *this;
}

StoreConfig& StoreConfig::set_acquire_timeout(std::chrono::milliseconds timeout) {
    database_.acquire_timeout = timeout;
    return *this;
}

StoreConfig& StoreConfig::set_busy_timeout(std::chrono::milliseconds timeout) {
    database_.busy_timeout = timeout;
    return *this;
}

StoreConfig& StoreConfig::set_empty_string_null(bool empty_is_null) {
    database_.empty_string_null = empty_is_null;
    return *this;
}

StoreConfig& StoreConfig::set_blob_type(const std::string& type) {
    database_.blob_type = type;
    return *this;
}

StoreConfig& StoreConfig::set_long_type(const std::string& type) {
    database_.long_type = type;
    return *this;
}

StoreConfig& StoreConfig::set_string_type(const std::string& type) {
    database_.string_type = type;
    return *this;
}

StoreConfig& StoreConfig::set_schema_name(const std::string& name) {
    schema_.schema_name = name;
    return *this;
}

StoreConfig& StoreConfig::set_table_name(const std::string& name) {
    schema_.table_name = name;
    return *this;
}

StoreConfig& StoreConfig::set_node_id(const NodeId& node_id) {
    behavior_.node_id = node_id;
    return *this;
}

StoreConfig& StoreConfig::set_grace_period(std::chrono::seconds period) {
    behavior_.grace_period = period;
    return *this;
}

StoreConfig& StoreConfig::set_conflict_policy(SaveConflictPolicy policy) {
    behavior_.conflict_policy = policy;
    return *this;
}

StoreConfig& StoreConfig::set_sweep_interval(std::chrono::seconds interval) {
    behavior_.sweep_interval = interval;
    return *this;
}

StoreConfig& StoreConfig::set_system_log_level(SystemLogLevel level) {
    logging_.level = level;
    return *this;
}

void StoreConfig::validate() const {
    std::vector<std::string> errors = validation_errors();
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Configuration validation failed:\n";
        for (const auto& error : errors) {
            oss << "  - " << error << "\n";
        }
        throw ConfigError(ErrorCode::INVALID_CONFIG, "config", oss.str());
    }
}

bool StoreConfig::is_valid() const noexcept {
    try {
        return validation_errors().empty();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> StoreConfig::validation_errors() const {
    std::vector<std::string> errors;

    try {
        validate_database_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_schema_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_behavior_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    return errors;
}

void StoreConfig::validate_database_config() const {
    if (Utils::is_blank(database_.url)) {
        throw Errors::invalid_database_url(database_.url);
    }

    if (database_.pool_size == 0 || database_.pool_size > 256) {
        throw Errors::invalid_pool_size(database_.pool_size);
    }

    if (database_.acquire_timeout.count() < 0 || database_.acquire_timeout.count() > 300000) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "acquire_timeout",
            "Acquire timeout must be between 0 and 300s");
    }
    if (database_.busy_timeout.count() < 0 || database_.busy_timeout.count() > 300000) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "busy_timeout",
            "Busy timeout must be between 0 and 300s");
    }
}

void StoreConfig::validate_schema_config() const {
    if (!schema_.schema_name.empty() && !Utils::is_valid_identifier(schema_.schema_name)) {
        throw Errors::invalid_identifier("schema_name", schema_.schema_name);
    }

    const std::vector<std::pair<const char*, const std::string*>> names = {
        {"table_name", &schema_.table_name},
        {"id_column", &schema_.id_column},
        {"context_path_column", &schema_.context_path_column},
        {"virtual_host_column", &schema_.virtual_host_column},
        {"last_node_column", &schema_.last_node_column},
        {"access_time_column", &schema_.access_time_column},
        {"last_access_time_column", &schema_.last_access_time_column},
        {"create_time_column", &schema_.create_time_column},
        {"cookie_time_column", &schema_.cookie_time_column},
        {"last_saved_time_column", &schema_.last_saved_time_column},
        {"expiry_time_column", &schema_.expiry_time_column},
        {"max_interval_column", &schema_.max_interval_column},
        {"map_column", &schema_.map_column},
    };

    for (const auto& entry : names) {
        if (!Utils::is_valid_identifier(*entry.second)) {
            throw Errors::invalid_identifier(entry.first, *entry.second);
        }
    }
}

void StoreConfig::validate_behavior_config() const {
    if (!behavior_.node_id.empty() && behavior_.node_id.length() > 60) {
        throw Errors::invalid_node_id(behavior_.node_id);
    }

    if (behavior_.grace_period.count() < 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "grace_period",
            "Grace period cannot be negative");
    }

    if (behavior_.sweep_interval.count() < 1 || behavior_.sweep_interval.count() > 86400) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "sweep_interval",
            "Sweep interval must be between 1s and 24h");
    }
}

StoreConfig StoreConfig::development(const std::string& url) {
    return Presets::development(url);
}

StoreConfig StoreConfig::production(const std::string& url) {
    return Presets::production(url);
}

StoreConfig StoreConfig::oracle_compatible(const std::string& url) {
    return Presets::oracle_compatible(url);
}

// ConfigBuilder implementation
ConfigBuilder::ConfigBuilder() = default;

ConfigBuilder::ConfigBuilder(const std::string& url) : config_(url) {}

ConfigBuilder& ConfigBuilder::url(const std::string& url) {
    config_.database_.url = url;
    return *this;
}

ConfigBuilder& ConfigBuilder::dialect(Dialect dialect) {
    config_.database_.dialect = dialect;
    return *this;
}

ConfigBuilder& ConfigBuilder::pool(size_t pool_size, std::chrono::milliseconds acquire_timeout) {
    config_.database_.pool_size = pool_size;
    config_.database_.acquire_timeout = acquire_timeout;
    return *this;
}

ConfigBuilder& ConfigBuilder::busy_timeout(std::chrono::milliseconds timeout) {
    config_.database_.busy_timeout = timeout;
    return *this;
}

ConfigBuilder& ConfigBuilder::empty_string_null(bool empty_is_null) {
    config_.database_.empty_string_null = empty_is_null;
    return *this;
}

ConfigBuilder& ConfigBuilder::column_types(const std::string& blob_type, const std::string& long_type,
                                           const std::string& string_type) {
    config_.database_.blob_type = blob_type;
    config_.database_.long_type = long_type;
    config_.database_.string_type = string_type;
    return *this;
}

ConfigBuilder& ConfigBuilder::table(const std::string& table_name, const std::string& schema_name) {
    config_.schema_.table_name = table_name;
    config_.schema_.schema_name = schema_name;
    return *this;
}

ConfigBuilder& ConfigBuilder::node(const NodeId& node_id) {
    config_.behavior_.node_id = node_id;
    return *this;
}

ConfigBuilder& ConfigBuilder::expiry(std::chrono::seconds grace_period, std::chrono::seconds sweep_interval) {
    config_.behavior_.grace_period = grace_period;
    config_.behavior_.sweep_interval = sweep_interval;
    return *this;
}

ConfigBuilder& ConfigBuilder::conflict_policy(SaveConflictPolicy policy) {
    config_.behavior_.conflict_policy = policy;
    return *this;
}

ConfigBuilder& ConfigBuilder::system_logging(SystemLogLevel level, bool console) {
    config_.logging_.level = level;
    config_.logging_.log_to_console = console;
    return *this;
}

StoreConfig ConfigBuilder::build() const {
    StoreConfig config = config_;
    config.validate(); // Ensure the built config is valid
    return config;
}

// EnvConfig implementation
std::optional<StoreConfig> EnvConfig::from_environment() {
    auto url = get_database_url();
    if (!url) {
        return std::nullopt;
    }

    ConfigBuilder builder(*url);

    if (auto dialect = get_dialect()) {
        builder.dialect(*dialect);
    }

    if (auto node_id = get_node_id()) {
        builder.node(*node_id);
    }

    if (auto pool_size = get_pool_size()) {
        builder.pool(*pool_size, std::chrono::milliseconds(5000));
    }

    if (auto table_name = get_table_name()) {
        builder.table(*table_name);
    }

    if (auto grace = get_grace_period()) {
        builder.expiry(*grace, std::chrono::seconds(60));
    }

    if (auto log_level = get_log_level()) {
        builder.system_logging(*log_level);
    }

    try {
        return builder.build();
    } catch (const ConfigError& e) {
        Utils::log(SystemLogLevel::WARN, "EnvConfig", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> EnvConfig::get_database_url() {
    return get_env("SDB_DATABASE_URL");
}

std::optional<Dialect> EnvConfig::get_dialect() {
    if (auto dialect = get_env("SDB_DIALECT")) {
        return Utils::string_to_dialect(*dialect);
    }
    return std::nullopt;
}

std::optional<NodeId> EnvConfig::get_node_id() {
    return get_env("SDB_NODE_ID");
}

std::optional<size_t> EnvConfig::get_pool_size() {
    return get_env_size_t("SDB_POOL_SIZE");
}

std::optional<std::string> EnvConfig::get_table_name() {
    return get_env("SDB_TABLE_NAME");
}

std::optional<std::chrono::seconds> EnvConfig::get_grace_period() {
    if (auto secs = get_env_int("SDB_GRACE_PERIOD_SEC")) {
        return std::chrono::seconds(*secs);
    }
    return std::nullopt;
}

std::optional<SystemLogLevel> EnvConfig::get_log_level() {
    if (auto level_str = get_env("SDB_LOG_LEVEL")) {
        std::string upper = Utils::to_upper(*level_str);

        if (upper == "NONE") return SystemLogLevel::NONE;
        if (upper == "ERROR") return SystemLogLevel::ERROR;
        if (upper == "WARN" || upper == "WARNING") return SystemLogLevel::WARN;
        if (upper == "INFO") return SystemLogLevel::INFO;
        if (upper == "DEBUG") return SystemLogLevel::DEBUG;
        if (upper == "TRACE") return SystemLogLevel::TRACE;
    }
    return std::nullopt;
}

std::optional<std::string> EnvConfig::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && strlen(value) > 0) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<int> EnvConfig::get_env_int(const std::string& name) {
    if (auto str = get_env(name)) {
        try {
            return std::stoi(*str);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<size_t> EnvConfig::get_env_size_t(const std::string& name) {
    if (auto str = get_env(name)) {
        try {
            return std::stoull(*str);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace sessiondb
