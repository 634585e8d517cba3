#include "types.hpp"
#include "util.hpp"
#include <stdexcept>

namespace {
    struct TypeName {
        MonitorType type;
        const char* name;
    };

    const TypeName kTypeNames[] = {
        {MonitorType::Http, "http"},
        {MonitorType::Keyword, "keyword"},
        {MonitorType::HttpsCert, "https-cert"},
        {MonitorType::Port, "port"},
        {MonitorType::Mysql, "mysql"},
        {MonitorType::Redis, "redis"},
        {MonitorType::Icmp, "icmp"},
        {MonitorType::Push, "push"},
    };
}

std::string to_string(MonitorType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

std::optional<MonitorType> monitor_type_from_string(const std::string& name) {
    auto normalized = util::to_lower(util::trim(name));
    for (const auto& entry : kTypeNames) {
        if (normalized == entry.name) return entry.type;
    }
    return std::nullopt;
}

std::string to_string(MonitorStatus status) {
    switch (status) {
        case MonitorStatus::Down: return "down";
        case MonitorStatus::Up: return "up";
        case MonitorStatus::Pending: return "pending";
    }
    return "unknown";
}

std::optional<MonitorStatus> monitor_status_from_int(int value) {
    switch (value) {
        case 0: return MonitorStatus::Down;
        case 1: return MonitorStatus::Up;
        case 2: return MonitorStatus::Pending;
        default: return std::nullopt;
    }
}

std::string to_string(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::WentDown: return "down";
        case TransitionKind::Recovered: return "up";
        case TransitionKind::StillDown: return "still_down";
    }
    return "unknown";
}

MonitorConfig MonitorConfig::from_json(const nlohmann::json& j) {
    MonitorConfig config;
    if (!j.is_object()) {
        return config;
    }

    config.url = j.value("url", config.url);
    config.http_method = j.value("httpMethod", config.http_method);
    config.status_codes = j.value("statusCodes", config.status_codes);
    config.max_redirects = j.value("maxRedirects", config.max_redirects);
    config.ignore_tls = j.value("ignoreTls", config.ignore_tls);
    config.notify_cert_expiry = j.value("notifyCertExpiry", config.notify_cert_expiry);
    config.cert_expiry_days = j.value("certExpiryDays", config.cert_expiry_days);
    config.keyword = j.value("keyword", config.keyword);
    config.request_body = j.value("requestBody", config.request_body);

    // Headers arrive either as an object or as JSON text
    if (j.contains("requestHeaders")) {
        const auto& headers = j.at("requestHeaders");
        config.request_headers = headers.is_string() ? headers.get<std::string>() : headers.dump();
    }

    config.hostname = j.value("hostname", config.hostname);
    config.port = j.value("port", config.port);
    config.username = j.value("username", config.username);
    config.password = j.value("password", config.password);
    config.query = j.value("query", config.query);
    if (j.contains("database")) {
        const auto& database = j.at("database");
        config.database = database.is_string() ? database.get<std::string>() : database.dump();
    }
    config.packet_count = j.value("packetCount", config.packet_count);
    config.max_packet_loss = j.value("maxPacketLoss", config.max_packet_loss);

    config.push_token = j.value("pushToken", config.push_token);
    config.grace_seconds = j.value("graceSeconds", config.grace_seconds);

    config.connect_timeout = j.value("connectTimeout", config.connect_timeout);
    return config;
}

nlohmann::json MonitorConfig::to_json() const {
    return {
        {"url", url},
        {"httpMethod", http_method},
        {"statusCodes", status_codes},
        {"maxRedirects", max_redirects},
        {"ignoreTls", ignore_tls},
        {"notifyCertExpiry", notify_cert_expiry},
        {"certExpiryDays", cert_expiry_days},
        {"keyword", keyword},
        {"requestBody", request_body},
        {"requestHeaders", request_headers},
        {"hostname", hostname},
        {"port", port},
        {"username", username},
        {"password", password},
        {"database", database},
        {"query", query},
        {"packetCount", packet_count},
        {"maxPacketLoss", max_packet_loss},
        {"pushToken", push_token},
        {"graceSeconds", grace_seconds},
        {"connectTimeout", connect_timeout}
    };
}

std::string Monitor::push_token() const {
    return config.push_token.empty() ? id : config.push_token;
}

Monitor Monitor::from_json(const nlohmann::json& j) {
    Monitor monitor;
    monitor.id = j.value("id", std::string());
    if (monitor.id.empty()) {
        monitor.id = util::generate_uuid();
    }
    monitor.name = j.value("name", std::string());

    auto type_name = j.at("type").get<std::string>();
    auto type = monitor_type_from_string(type_name);
    if (!type) {
        throw std::invalid_argument("Unknown monitor type: " + type_name);
    }
    monitor.type = *type;

    if (j.contains("config")) {
        monitor.config = MonitorConfig::from_json(j.at("config"));
    }

    monitor.interval = j.value("interval", monitor.interval);
    monitor.retries = j.value("retries", monitor.retries);
    monitor.retry_interval = j.value("retryInterval", monitor.retry_interval);
    monitor.resend_interval = j.value("resendInterval", monitor.resend_interval);
    monitor.upside_down = j.value("upsideDown", monitor.upside_down);
    monitor.active = j.value("active", monitor.active);

    if (j.contains("lastStatus") && j.at("lastStatus").is_number_integer()) {
        monitor.last_status = monitor_status_from_int(j.at("lastStatus").get<int>());
    }
    if (j.contains("lastCheckAt") && j.at("lastCheckAt").is_string()) {
        monitor.last_check_at = util::parse_iso8601(j.at("lastCheckAt").get<std::string>());
    }
    return monitor;
}

nlohmann::json Monitor::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"name", name},
        {"type", to_string(type)},
        {"config", config.to_json()},
        {"interval", interval},
        {"retries", retries},
        {"retryInterval", retry_interval},
        {"resendInterval", resend_interval},
        {"upsideDown", upside_down},
        {"active", active}
    };
    j["lastStatus"] = last_status ? nlohmann::json(static_cast<int>(*last_status)) : nlohmann::json(nullptr);
    j["lastCheckAt"] = last_check_at ? nlohmann::json(util::format_iso8601(*last_check_at)) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json CheckOutcome::to_json() const {
    nlohmann::json j = {
        {"monitorId", monitor_id},
        {"status", static_cast<int>(status)},
        {"statusText", to_string(status)},
        {"message", message},
        {"ts", util::format_iso8601(timestamp)}
    };
    j["ping"] = ping_ms ? nlohmann::json(*ping_ms) : nlohmann::json(nullptr);
    if (!details.is_null()) {
        j["details"] = details;
    }
    return j;
}

nlohmann::json StatusRecord::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"monitorId", monitor_id},
        {"status", static_cast<int>(status)},
        {"message", message},
        {"ts", util::format_iso8601(timestamp)}
    };
    j["ping"] = ping_ms ? nlohmann::json(*ping_ms) : nlohmann::json(nullptr);
    return j;
}
