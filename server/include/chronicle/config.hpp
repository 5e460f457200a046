#pragma once

#include <string>
#include <cstdlib>
#include <cstring>

namespace chronicle {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";
    std::string schema = "chronicle";

    bool use_ssl = false;

    // Pool configuration
    int pool_size = 10;
    int idle_timeout = 30000;             // 30 seconds
    int connection_timeout = 2000;        // 2 seconds
    int statement_timeout = 30000;        // 30 seconds
    int lock_timeout = 10000;             // 10 seconds
    int pool_acquisition_timeout = 10000; // 10 seconds

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");
        config.schema = get_env_string("PG_SCHEMA", "chronicle");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);

        config.pool_size = get_env_int("DB_POOL_SIZE", 10);
        config.idle_timeout = get_env_int("DB_IDLE_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        conn_str += use_ssl ? " sslmode=require" : " sslmode=disable";

        // connect_timeout is in seconds. Session timeouts are applied with SET
        // after connecting, see DatabaseConnection.
        conn_str += " connect_timeout=" + std::to_string(connection_timeout / 1000);

        return conn_str;
    }
};

struct AggregationConfig {
    int max_groups = 5000;

    static AggregationConfig from_env() {
        AggregationConfig config;
        config.max_groups = get_env_int("AGGREGATION_MAX_GROUPS", 5000);
        return config;
    }
};

struct ChangeLogConfig {
    int retention_days = 30;
    int retention_interval_ms = 3600000;  // 1 hour
    bool retention_enabled = true;

    static ChangeLogConfig from_env() {
        ChangeLogConfig config;
        config.retention_days = get_env_int("CHANGE_LOG_RETENTION_DAYS", 30);
        config.retention_interval_ms = get_env_int("CHANGE_LOG_RETENTION_INTERVAL_MS", 3600000);
        config.retention_enabled = get_env_bool("CHANGE_LOG_RETENTION_ENABLED", true);
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        config.log_pattern = get_env_string("LOG_PATTERN", "[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    AggregationConfig aggregation;
    ChangeLogConfig change_log;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.aggregation = AggregationConfig::from_env();
        config.change_log = ChangeLogConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace chronicle
