#include "http_probe.hpp"
#include "status_codes.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
    const char* kDefaultStatusCodes = "200-299";

    // curl reports "Expire date:Mar 10 12:00:00 2030 GMT" with OpenSSL and
    // "Expire date:2030-03-10 12:00:00 GMT" with some other TLS backends
    std::optional<std::chrono::system_clock::time_point> parse_cert_date(const std::string& value) {
        const char* formats[] = {"%b %d %H:%M:%S %Y", "%Y-%m-%d %H:%M:%S"};
        for (const char* format : formats) {
            std::tm tm = {};
            std::istringstream ss(util::trim(value));
            ss >> std::get_time(&tm, format);
            if (!ss.fail()) {
                return std::chrono::system_clock::from_time_t(timegm(&tm));
            }
        }
        return std::nullopt;
    }

    std::optional<CertificateInfo> extract_certificate(cpr::Response& response) {
        auto chain = response.GetCertInfos();
        if (chain.empty()) {
            return std::nullopt;
        }

        // First entry is the leaf certificate
        CertificateInfo info;
        bool has_expiry = false;
        for (const auto& line : chain.front()) {
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;

            auto key = line.substr(0, colon);
            auto value = line.substr(colon + 1);
            if (key == "Subject") {
                info.subject = util::trim(value);
            } else if (key == "Issuer") {
                info.issuer = util::trim(value);
            } else if (key == "Expire date") {
                auto expires = parse_cert_date(value);
                if (expires) {
                    info.valid_to = *expires;
                    has_expiry = true;
                }
            }
        }

        if (!has_expiry) {
            spdlog::debug("Peer certificate has no parseable expiry date");
            return std::nullopt;
        }
        return info;
    }

    std::optional<std::map<std::string, std::string>> parse_headers(const std::string& text) {
        std::map<std::string, std::string> headers;
        if (util::trim(text).empty()) {
            return headers;
        }

        try {
            auto j = nlohmann::json::parse(text);
            if (!j.is_object()) {
                return std::nullopt;
            }
            for (auto it = j.begin(); it != j.end(); ++it) {
                headers[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            }
            return headers;
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }
}

HttpResponse CprHttpTransport::perform(const HttpRequest& request) {
    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetTimeout(cpr::Timeout{request.timeout});
    session.SetConnectTimeout(cpr::ConnectTimeout{request.timeout});
    session.SetRedirect(cpr::Redirect{request.max_redirects, request.max_redirects > 0, false,
                                      cpr::PostRedirectFlags::POST_ALL});
    session.SetVerifySsl(cpr::VerifySsl{request.verify_tls});
    session.SetUserAgent(cpr::UserAgent{"Pulsewatch-Monitor/1.0"});

    cpr::Header header;
    for (const auto& [name, value] : request.headers) {
        header[name] = value;
    }
    session.SetHeader(header);

    if (!request.body.empty()) {
        session.SetBody(cpr::Body{request.body});
    }

    if (request.capture_certificate) {
        curl_easy_setopt(session.GetCurlHolder()->handle, CURLOPT_CERTINFO, 1L);
    }

    auto method = util::to_lower(request.method);
    cpr::Response response;
    if (method == "get") {
        response = session.Get();
    } else if (method == "post") {
        response = session.Post();
    } else if (method == "put") {
        response = session.Put();
    } else if (method == "delete") {
        response = session.Delete();
    } else if (method == "head") {
        response = session.Head();
    } else if (method == "patch") {
        response = session.Patch();
    } else if (method == "options") {
        response = session.Options();
    } else {
        HttpResponse result;
        result.error = "Unsupported HTTP method " + request.method;
        return result;
    }

    HttpResponse result;
    result.status_code = static_cast<int>(response.status_code);
    result.body = std::move(response.text);
    result.elapsed_ms = response.elapsed * 1000.0;

    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty() ? "HTTP request failed" : response.error.message;
        return result;
    }

    if (request.capture_certificate) {
        result.certificate = extract_certificate(response);
    }
    return result;
}

HttpProbe::HttpProbe(std::shared_ptr<HttpTransport> transport, std::chrono::seconds default_timeout)
    : transport_(std::move(transport)), default_timeout_(default_timeout) {}

ProbeResult HttpProbe::run(const Monitor& monitor) {
    const auto& config = monitor.config;

    auto headers = parse_headers(config.request_headers);
    if (!headers) {
        return ProbeResult::failure("Request headers are not a valid JSON object");
    }

    bool is_https = util::starts_with(util::to_lower(config.url), "https://");

    HttpRequest request;
    request.method = config.http_method.empty() ? "GET" : config.http_method;
    request.url = config.url;
    request.body = config.request_body;
    request.headers = std::move(*headers);
    request.max_redirects = config.max_redirects;
    request.timeout = probe_timeout(monitor, default_timeout_);
    request.verify_tls = !config.ignore_tls;
    request.capture_certificate = is_https &&
        (monitor.type == MonitorType::HttpsCert || config.notify_cert_expiry);

    auto response = transport_->perform(request);
    std::optional<double> ping = response.elapsed_ms > 0.0 ? std::optional<double>(response.elapsed_ms) : std::nullopt;

    if (!response.error.empty()) {
        return ProbeResult::failure(response.error, ping);
    }

    auto matcher = StatusCodeMatcher::parse(config.status_codes);
    if (!matcher) {
        spdlog::warn("Monitor {} has invalid statusCodes '{}', using {}",
                     monitor.id, config.status_codes, kDefaultStatusCodes);
        matcher = StatusCodeMatcher::parse(kDefaultStatusCodes);
    }

    if (!matcher->matches(response.status_code)) {
        return ProbeResult::failure(
            fmt::format("HTTP {} - status code not in accepted range {}", response.status_code, matcher->pattern()),
            ping);
    }

    if (monitor.type == MonitorType::Keyword && response.body.find(config.keyword) == std::string::npos) {
        return ProbeResult::failure(
            fmt::format("HTTP {} - keyword '{}' not found", response.status_code, config.keyword),
            ping);
    }

    nlohmann::json details = nlohmann::json::object();
    if (request.capture_certificate) {
        auto cert_error = check_certificate(monitor, response, details);
        if (cert_error) {
            auto result = ProbeResult::failure(fmt::format("HTTP {} - {}", response.status_code, *cert_error), ping);
            result.details = std::move(details);
            return result;
        }
    }

    auto result = ProbeResult::success(
        monitor.type == MonitorType::Keyword
            ? fmt::format("HTTP {} - keyword '{}' found", response.status_code, config.keyword)
            : fmt::format("HTTP {} - OK", response.status_code),
        ping);
    result.details = std::move(details);
    return result;
}

std::optional<std::string> HttpProbe::check_certificate(const Monitor& monitor,
                                                        const HttpResponse& response,
                                                        nlohmann::json& details) const {
    if (!response.certificate) {
        if (monitor.type == MonitorType::HttpsCert) {
            return std::string("no peer certificate presented");
        }
        spdlog::debug("Monitor {}: no certificate information available", monitor.id);
        return std::nullopt;
    }

    const auto& cert = *response.certificate;
    auto remaining = cert.valid_to - std::chrono::system_clock::now();
    auto days_remaining = static_cast<long>(std::floor(
        std::chrono::duration<double>(remaining).count() / 86400.0));

    details["certExpiresAt"] = util::format_iso8601(cert.valid_to);
    details["certDaysRemaining"] = days_remaining;
    details["certSubject"] = cert.subject;
    details["certIssuer"] = cert.issuer;

    if (days_remaining < 0) {
        return fmt::format("certificate expired {} days ago", -days_remaining);
    }

    int threshold = monitor.config.cert_expiry_days;
    if (threshold > 0 && days_remaining < threshold) {
        return fmt::format("certificate expires in {} days (threshold {} days)", days_remaining, threshold);
    }
    return std::nullopt;
}
