#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

enum class MonitorType {
    Http,
    Keyword,
    HttpsCert,
    Port,
    Mysql,
    Redis,
    Icmp,
    Push
};

std::string to_string(MonitorType type);
std::optional<MonitorType> monitor_type_from_string(const std::string& name);

// Ordinals match the values persisted in history
enum class MonitorStatus : int {
    Down = 0,
    Up = 1,
    Pending = 2
};

std::string to_string(MonitorStatus status);
std::optional<MonitorStatus> monitor_status_from_int(int value);

enum class TransitionKind {
    WentDown,
    Recovered,
    StillDown
};

std::string to_string(TransitionKind kind);

// Type-specific settings; only the fields relevant to a monitor's type are read
struct MonitorConfig {
    // http / keyword / https-cert
    std::string url;
    std::string http_method = "GET";
    std::string status_codes = "200-299";
    int max_redirects = 10;
    bool ignore_tls = false;
    bool notify_cert_expiry = false;
    int cert_expiry_days = 7;
    std::string keyword;
    std::string request_body;
    std::string request_headers; // JSON object as text

    // port / mysql / redis / icmp
    std::string hostname;
    int port = 0;
    std::string username;
    std::string password;
    std::string database;
    std::string query;
    int packet_count = 4;
    int max_packet_loss = 0; // percent

    // push
    std::string push_token;
    int grace_seconds = 10;

    // Shared request/connect timeout in seconds, 0 means the service default
    int connect_timeout = 0;

    static MonitorConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct Monitor {
    std::string id;
    std::string name;
    MonitorType type = MonitorType::Http;
    MonitorConfig config;
    int interval = 60;
    int retries = 0;
    int retry_interval = 60;
    int resend_interval = 0;
    bool upside_down = false;
    bool active = true;
    std::optional<MonitorStatus> last_status;
    std::optional<std::chrono::system_clock::time_point> last_check_at;

    // Token a push monitor is reached by; the monitor id unless configured
    std::string push_token() const;

    static Monitor from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Result of one check; built once by the check cycle and passed by const reference after that
struct CheckOutcome {
    std::string monitor_id;
    MonitorStatus status = MonitorStatus::Pending;
    std::string message;
    std::optional<double> ping_ms;
    nlohmann::json details;
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json to_json() const;
};

struct StatusRecord {
    std::string id;
    std::string monitor_id;
    MonitorStatus status = MonitorStatus::Pending;
    std::string message;
    std::optional<double> ping_ms;
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json to_json() const;
};
