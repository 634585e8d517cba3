#pragma once

#include <string>

struct Config {
    // Service
    std::string service_name = "monitor";
    std::string log_level = "info";

    // Storage ("postgres" or "memory")
    std::string store_backend = "postgres";
    std::string pg_dsn;
    std::string monitors_file; // JSON seed file of monitor definitions

    // Notifications (empty redis_url keeps notifications in the log only)
    std::string redis_url;
    std::string notification_stream = "pulsewatch.notifications";

    // HTTP API (health, push heartbeats, schedule/stop)
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8085;

    // Scheduling
    int max_concurrent_checks = 16;
    int default_timeout_seconds = 10;

    // History maintenance
    int history_retention_days = 30;
    int prune_interval_minutes = 60;

    // Load from environment variables
    void load_from_env();

    // Throws std::invalid_argument on inconsistent settings
    void validate() const;
};
