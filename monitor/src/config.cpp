#include "config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }
}

void Config::load_from_env() {
    service_name = get_env("SERVICE_NAME", service_name);
    log_level = get_env("LOG_LEVEL", log_level);

    store_backend = get_env("STORE_BACKEND", store_backend);
    pg_dsn = get_env("PG_DSN", pg_dsn);
    monitors_file = get_env("MONITORS_FILE", monitors_file);

    redis_url = get_env("REDIS_URL", redis_url);
    notification_stream = get_env("NOTIFICATION_STREAM", notification_stream);

    listen_addr = get_env("LISTEN_ADDR", listen_addr);
    listen_port = get_env_int("LISTEN_PORT", listen_port);

    max_concurrent_checks = get_env_int("MAX_CONCURRENT_CHECKS", max_concurrent_checks);
    default_timeout_seconds = get_env_int("DEFAULT_TIMEOUT_SECONDS", default_timeout_seconds);

    history_retention_days = get_env_int("HISTORY_RETENTION_DAYS", history_retention_days);
    prune_interval_minutes = get_env_int("PRUNE_INTERVAL_MINUTES", prune_interval_minutes);
}

void Config::validate() const {
    if (store_backend != "postgres" && store_backend != "memory") {
        throw std::invalid_argument("STORE_BACKEND must be 'postgres' or 'memory', got '" + store_backend + "'");
    }
    if (store_backend == "postgres" && pg_dsn.empty()) {
        throw std::invalid_argument("PG_DSN is required for the postgres store backend");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::invalid_argument("LISTEN_PORT out of range: " + std::to_string(listen_port));
    }
    if (max_concurrent_checks < 1) {
        throw std::invalid_argument("MAX_CONCURRENT_CHECKS must be at least 1");
    }
    if (default_timeout_seconds < 1) {
        throw std::invalid_argument("DEFAULT_TIMEOUT_SECONDS must be at least 1");
    }
    if (history_retention_days < 1) {
        throw std::invalid_argument("HISTORY_RETENTION_DAYS must be at least 1");
    }
    if (prune_interval_minutes < 1) {
        throw std::invalid_argument("PRUNE_INTERVAL_MINUTES must be at least 1");
    }
}
