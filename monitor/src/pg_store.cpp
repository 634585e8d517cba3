#include "pg_store.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>

namespace {
    const char* kMonitorColumns =
        "id, name, type, config::text AS config, interval, retries, retry_interval, "
        "resend_interval, upside_down, active, last_status, "
        "EXTRACT(EPOCH FROM last_check_at)::double precision AS last_check_epoch";

    Monitor monitor_from_row(const pqxx::row& row) {
        Monitor monitor;
        monitor.id = row["id"].as<std::string>();
        monitor.name = row["name"].as<std::string>();

        auto type_name = row["type"].as<std::string>();
        auto type = monitor_type_from_string(type_name);
        if (!type) {
            throw std::runtime_error("Monitor " + monitor.id + " has unknown type '" + type_name + "'");
        }
        monitor.type = *type;

        if (!row["config"].is_null()) {
            monitor.config = MonitorConfig::from_json(nlohmann::json::parse(row["config"].as<std::string>()));
        }

        monitor.interval = row["interval"].as<int>();
        monitor.retries = row["retries"].as<int>();
        monitor.retry_interval = row["retry_interval"].as<int>();
        monitor.resend_interval = row["resend_interval"].as<int>();
        monitor.upside_down = row["upside_down"].as<bool>();
        monitor.active = row["active"].as<bool>();

        if (!row["last_status"].is_null()) {
            monitor.last_status = monitor_status_from_int(row["last_status"].as<int>());
        }
        if (!row["last_check_epoch"].is_null()) {
            monitor.last_check_at = util::from_epoch_seconds(row["last_check_epoch"].as<double>());
        }
        return monitor;
    }

    StatusRecord record_from_row(const pqxx::row& row) {
        StatusRecord record;
        record.id = row["id"].as<std::string>();
        record.monitor_id = row["monitor_id"].as<std::string>();
        record.status = monitor_status_from_int(row["status"].as<int>()).value_or(MonitorStatus::Pending);
        record.message = row["message"].is_null() ? std::string() : row["message"].as<std::string>();
        if (!row["ping"].is_null()) {
            record.ping_ms = row["ping"].as<double>();
        }
        record.timestamp = util::from_epoch_seconds(row["ts_epoch"].as<double>());
        return record;
    }
}

class PgMonitorStore::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config), backoff_ms_(1000), retry_count_(0) {
        connect();
    }

    ~Impl() {
        disconnect();
    }

    bool connect() {
        try {
            conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
            if (conn_->is_open()) {
                spdlog::info("Connected to PostgreSQL database");
                backoff_ms_ = 1000;  // Reset backoff on successful connection
                retry_count_ = 0;
                return true;
            }
            spdlog::error("PostgreSQL connection is not open");
            return false;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            conn_.reset();
            return false;
        }
    }

    void disconnect() {
        if (conn_ && conn_->is_open()) {
            conn_->close();
            spdlog::info("Disconnected from PostgreSQL database");
        }
        conn_.reset();
    }

    bool is_connected() const {
        return conn_ && conn_->is_open();
    }

    bool initialize_schema() {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            pqxx::work txn(connection());

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS monitors (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL,
                    type TEXT NOT NULL,
                    config JSONB NOT NULL DEFAULT '{}'::jsonb,
                    interval INTEGER NOT NULL DEFAULT 60 CHECK (interval >= 1),
                    retries INTEGER NOT NULL DEFAULT 0 CHECK (retries >= 0),
                    retry_interval INTEGER NOT NULL DEFAULT 60,
                    resend_interval INTEGER NOT NULL DEFAULT 0,
                    upside_down BOOLEAN NOT NULL DEFAULT FALSE,
                    active BOOLEAN NOT NULL DEFAULT TRUE,
                    last_status INTEGER,
                    last_check_at TIMESTAMP WITH TIME ZONE
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS monitor_status (
                    id TEXT PRIMARY KEY,
                    monitor_id TEXT NOT NULL REFERENCES monitors(id) ON DELETE CASCADE,
                    status INTEGER NOT NULL,
                    message TEXT,
                    ping DOUBLE PRECISION,
                    timestamp TIMESTAMP WITH TIME ZONE NOT NULL
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_monitor_status_monitor_ts ON monitor_status(monitor_id, timestamp DESC)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_monitor_status_ts ON monitor_status(timestamp)");

            txn.commit();
            spdlog::info("Monitor schema initialized");
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to initialize monitor schema: {}", e.what());
            return false;
        }
    }

    void save_monitor(const Monitor& monitor) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        txn.exec_params(
            "INSERT INTO monitors (id, name, type, config, interval, retries, retry_interval, "
            "resend_interval, upside_down, active) "
            "VALUES ($1, $2, $3, $4::jsonb, $5, $6, $7, $8, $9, $10) "
            "ON CONFLICT (id) DO UPDATE SET "
            "name = EXCLUDED.name, "
            "type = EXCLUDED.type, "
            "config = EXCLUDED.config, "
            "interval = EXCLUDED.interval, "
            "retries = EXCLUDED.retries, "
            "retry_interval = EXCLUDED.retry_interval, "
            "resend_interval = EXCLUDED.resend_interval, "
            "upside_down = EXCLUDED.upside_down, "
            "active = EXCLUDED.active",
            monitor.id,
            monitor.name,
            to_string(monitor.type),
            monitor.config.to_json().dump(),
            monitor.interval,
            monitor.retries,
            monitor.retry_interval,
            monitor.resend_interval,
            monitor.upside_down,
            monitor.active
        );
        txn.commit();
    }

    std::optional<Monitor> get_monitor(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        auto result = txn.exec_params(
            std::string("SELECT ") + kMonitorColumns + " FROM monitors WHERE id = $1", id);
        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }
        return monitor_from_row(result[0]);
    }

    std::vector<Monitor> list_active_monitors() {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        auto result = txn.exec(std::string("SELECT ") + kMonitorColumns + " FROM monitors WHERE active ORDER BY id");
        txn.commit();

        std::vector<Monitor> monitors;
        monitors.reserve(result.size());
        for (const auto& row : result) {
            try {
                monitors.push_back(monitor_from_row(row));
            } catch (const std::exception& e) {
                spdlog::error("Skipping unreadable monitor row: {}", e.what());
            }
        }
        return monitors;
    }

    std::optional<Monitor> find_push_monitor(const std::string& token) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        // An empty pushToken falls back to the monitor id
        auto result = txn.exec_params(
            std::string("SELECT ") + kMonitorColumns + " FROM monitors "
            "WHERE type = 'push' AND COALESCE(NULLIF(config->>'pushToken', ''), id) = $1 "
            "ORDER BY id LIMIT 1",
            token);
        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }
        return monitor_from_row(result[0]);
    }

    void update_cached_status(const std::string& id,
                              MonitorStatus status,
                              std::chrono::system_clock::time_point checked_at) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        update_status(txn, id, status, checked_at);
        txn.commit();
    }

    StatusRecord append_record(const CheckOutcome& outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        auto record = insert_record(txn, outcome);
        txn.commit();
        return record;
    }

    StatusRecord record_status(const CheckOutcome& outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        try {
            auto record = insert_record(txn, outcome);
            update_status(txn, outcome.monitor_id, outcome.status, outcome.timestamp);
            txn.commit();
            return record;
        } catch (const pqxx::foreign_key_violation&) {
            // Monitor row deleted between the check and this write
            throw MonitorNotFound(outcome.monitor_id);
        }
    }

    std::size_t prune_older_than(std::chrono::system_clock::time_point cutoff) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        auto result = txn.exec_params(
            "DELETE FROM monitor_status WHERE timestamp < to_timestamp($1)",
            util::to_epoch_seconds(cutoff));
        txn.commit();
        return static_cast<std::size_t>(result.affected_rows());
    }

    std::vector<StatusRecord> recent_records(const std::string& monitor_id, std::size_t limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(connection());
        auto result = txn.exec_params(
            "SELECT id, monitor_id, status, message, ping, "
            "EXTRACT(EPOCH FROM timestamp)::double precision AS ts_epoch "
            "FROM monitor_status WHERE monitor_id = $1 "
            "ORDER BY timestamp DESC LIMIT $2",
            monitor_id,
            static_cast<long long>(limit));
        txn.commit();

        std::vector<StatusRecord> records;
        records.reserve(result.size());
        for (const auto& row : result) {
            records.push_back(record_from_row(row));
        }
        return records;
    }

private:
    // Caller holds mutex_
    pqxx::connection& connection() {
        if (!ensure_connection()) {
            throw std::runtime_error("PostgreSQL connection unavailable");
        }
        return *conn_;
    }

    bool ensure_connection() {
        if (is_connected()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;
        if (connect()) {
            spdlog::info("PostgreSQL connection restored");
            return true;
        }

        spdlog::warn("PostgreSQL reconnection failed (attempt {})", ++retry_count_);
        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    StatusRecord insert_record(pqxx::work& txn, const CheckOutcome& outcome) {
        StatusRecord record;
        record.id = util::generate_uuid();
        record.monitor_id = outcome.monitor_id;
        record.status = outcome.status;
        record.message = outcome.message;
        record.ping_ms = outcome.ping_ms;
        record.timestamp = outcome.timestamp;

        txn.exec_params(
            "INSERT INTO monitor_status (id, monitor_id, status, message, ping, timestamp) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6))",
            record.id,
            record.monitor_id,
            static_cast<int>(record.status),
            record.message,
            record.ping_ms,
            util::to_epoch_seconds(record.timestamp)
        );
        return record;
    }

    void update_status(pqxx::work& txn,
                       const std::string& id,
                       MonitorStatus status,
                       std::chrono::system_clock::time_point checked_at) {
        auto result = txn.exec_params(
            "UPDATE monitors SET last_status = $2, last_check_at = to_timestamp($3) WHERE id = $1",
            id,
            static_cast<int>(status),
            util::to_epoch_seconds(checked_at));
        if (result.affected_rows() == 0) {
            throw MonitorNotFound(id);
        }
    }

    const Config& config_;
    std::mutex mutex_;
    std::unique_ptr<pqxx::connection> conn_;
    std::chrono::steady_clock::time_point last_connection_attempt_{};
    int backoff_ms_;
    int retry_count_;
};

PgMonitorStore::PgMonitorStore(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

PgMonitorStore::~PgMonitorStore() = default;

bool PgMonitorStore::is_connected() const {
    return impl_->is_connected();
}

bool PgMonitorStore::initialize_schema() {
    return impl_->initialize_schema();
}

void PgMonitorStore::save_monitor(const Monitor& monitor) {
    impl_->save_monitor(monitor);
}

std::optional<Monitor> PgMonitorStore::get_monitor(const std::string& id) {
    return impl_->get_monitor(id);
}

std::vector<Monitor> PgMonitorStore::list_active_monitors() {
    return impl_->list_active_monitors();
}

std::optional<Monitor> PgMonitorStore::find_push_monitor(const std::string& token) {
    return impl_->find_push_monitor(token);
}

void PgMonitorStore::update_cached_status(const std::string& id,
                                          MonitorStatus status,
                                          std::chrono::system_clock::time_point checked_at) {
    impl_->update_cached_status(id, status, checked_at);
}

StatusRecord PgMonitorStore::append_record(const CheckOutcome& outcome) {
    return impl_->append_record(outcome);
}

StatusRecord PgMonitorStore::record_status(const CheckOutcome& outcome) {
    return impl_->record_status(outcome);
}

std::size_t PgMonitorStore::prune_older_than(std::chrono::system_clock::time_point cutoff) {
    return impl_->prune_older_than(cutoff);
}

std::vector<StatusRecord> PgMonitorStore::recent_records(const std::string& monitor_id, std::size_t limit) {
    return impl_->recent_records(monitor_id, limit);
}
