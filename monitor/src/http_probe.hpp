#pragma once

#include "probe.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

struct CertificateInfo {
    std::string subject;
    std::string issuer;
    std::chrono::system_clock::time_point valid_to;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
    int max_redirects = 10;
    std::chrono::milliseconds timeout{10000};
    bool verify_tls = true;
    bool capture_certificate = false;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::string error; // Transport-level failure, empty on a completed exchange
    double elapsed_ms = 0.0;
    std::optional<CertificateInfo> certificate;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

// libcurl through cpr; reads the peer certificate via CURLOPT_CERTINFO
class CprHttpTransport : public HttpTransport {
public:
    HttpResponse perform(const HttpRequest& request) override;
};

// Serves http, keyword and https-cert monitors
class HttpProbe : public Probe {
public:
    HttpProbe(std::shared_ptr<HttpTransport> transport, std::chrono::seconds default_timeout);

    ProbeResult run(const Monitor& monitor) override;

private:
    std::optional<std::string> check_certificate(const Monitor& monitor,
                                                 const HttpResponse& response,
                                                 nlohmann::json& details) const;

    std::shared_ptr<HttpTransport> transport_;
    std::chrono::seconds default_timeout_;
};
