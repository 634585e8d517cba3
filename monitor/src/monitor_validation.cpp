#include "monitor_validation.hpp"
#include "status_codes.hpp"
#include "util.hpp"
#include <cctype>

bool is_safe_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname.size() > 253 || hostname.front() == '-') {
        return false;
    }
    for (char c : hostname) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != ':') {
            return false;
        }
    }
    return true;
}

std::vector<std::string> validate_monitor(const Monitor& monitor) {
    std::vector<std::string> errors;
    const auto& config = monitor.config;
    const auto type_name = to_string(monitor.type);

    if (util::trim(monitor.name).empty()) {
        errors.push_back("monitor name is required");
    }
    if (monitor.interval < 1) {
        errors.push_back("interval must be at least 1 second");
    }
    if (monitor.retries < 0) {
        errors.push_back("retries must not be negative");
    }
    if (monitor.retry_interval < 1) {
        errors.push_back("retryInterval must be at least 1 second");
    }
    if (monitor.resend_interval < 0) {
        errors.push_back("resendInterval must not be negative");
    }
    if (config.connect_timeout < 0) {
        errors.push_back("connectTimeout must not be negative");
    }

    switch (monitor.type) {
        case MonitorType::Http:
        case MonitorType::Keyword:
        case MonitorType::HttpsCert:
            if (util::trim(config.url).empty()) {
                errors.push_back(type_name + " monitor requires a url");
            } else if (monitor.type == MonitorType::HttpsCert && !util::starts_with(config.url, "https://")) {
                errors.push_back("https-cert monitor requires an https:// url");
            } else if (!util::starts_with(config.url, "http://") && !util::starts_with(config.url, "https://")) {
                errors.push_back("url must start with http:// or https://");
            }
            if (monitor.type == MonitorType::Keyword && config.keyword.empty()) {
                errors.push_back("keyword monitor requires a keyword");
            }
            if (!StatusCodeMatcher::parse(config.status_codes)) {
                errors.push_back("invalid statusCodes: '" + config.status_codes + "'");
            }
            if (config.max_redirects < 0) {
                errors.push_back("maxRedirects must not be negative");
            }
            if (!config.request_headers.empty()) {
                auto headers = nlohmann::json::parse(config.request_headers, nullptr, false);
                if (headers.is_discarded() || !headers.is_object()) {
                    errors.push_back("requestHeaders must be a JSON object");
                }
            }
            break;

        case MonitorType::Port:
        case MonitorType::Mysql:
        case MonitorType::Redis:
            if (util::trim(config.hostname).empty()) {
                errors.push_back(type_name + " monitor requires a hostname");
            }
            if (config.port < 1 || config.port > 65535) {
                errors.push_back(type_name + " monitor requires a valid port");
            }
            break;

        case MonitorType::Icmp:
            if (util::trim(config.hostname).empty()) {
                errors.push_back("icmp monitor requires a hostname");
            } else if (!is_safe_hostname(config.hostname)) {
                errors.push_back("icmp hostname contains invalid characters");
            }
            if (config.packet_count < 1) {
                errors.push_back("packetCount must be at least 1");
            }
            if (config.max_packet_loss < 0 || config.max_packet_loss > 100) {
                errors.push_back("maxPacketLoss must be between 0 and 100");
            }
            break;

        case MonitorType::Push:
            if (config.grace_seconds < 0) {
                errors.push_back("graceSeconds must not be negative");
            }
            break;
    }

    return errors;
}
