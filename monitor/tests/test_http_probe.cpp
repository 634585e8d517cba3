#include <gtest/gtest.h>
#include "http_probe.hpp"
#include "test_fakes.hpp"

using namespace std::chrono;

namespace {
    class FakeHttpTransport : public HttpTransport {
    public:
        HttpResponse response;
        HttpRequest last_request;
        int calls = 0;

        HttpResponse perform(const HttpRequest& request) override {
            ++calls;
            last_request = request;
            return response;
        }
    };

    CertificateInfo cert_expiring_in(hours remaining) {
        CertificateInfo cert;
        cert.subject = "CN=example.com";
        cert.issuer = "CN=Example CA";
        cert.valid_to = system_clock::now() + remaining;
        return cert;
    }
}

class HttpProbeTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHttpTransport> transport = std::make_shared<FakeHttpTransport>();
    HttpProbe probe{transport, seconds(10)};

    void SetUp() override {
        transport->response.status_code = 200;
        transport->response.body = "<html>service healthy</html>";
        transport->response.elapsed_ms = 42.0;
    }
};

TEST_F(HttpProbeTest, Accepts2xxByDefault) {
    auto monitor = make_monitor("h1", MonitorType::Http);
    auto result = probe.run(monitor);
    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(result.ping_ms.has_value());
    EXPECT_DOUBLE_EQ(*result.ping_ms, 42.0);
}

TEST_F(HttpProbeTest, NotFoundIsDownWithStatusInMessage) {
    transport->response.status_code = 404;
    auto monitor = make_monitor("h1", MonitorType::Http);
    monitor.config.status_codes = "200-299";

    auto result = probe.run(monitor);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.message.find("404"), std::string::npos);
}

TEST_F(HttpProbeTest, CustomStatusCodeList) {
    transport->response.status_code = 301;
    auto monitor = make_monitor("h1", MonitorType::Http);
    monitor.config.status_codes = "200-299,301";
    EXPECT_TRUE(probe.run(monitor).ok);

    transport->response.status_code = 302;
    EXPECT_FALSE(probe.run(monitor).ok);
}

TEST_F(HttpProbeTest, RequestCarriesMonitorSettings) {
    auto monitor = make_monitor("h1", MonitorType::Http);
    monitor.config.http_method = "POST";
    monitor.config.request_body = R"({"ping":true})";
    monitor.config.request_headers = R"({"Authorization":"Bearer abc","X-Trace":"1"})";
    monitor.config.max_redirects = 3;
    monitor.config.ignore_tls = true;
    monitor.config.connect_timeout = 5;

    probe.run(monitor);

    const auto& request = transport->last_request;
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.body, R"({"ping":true})");
    EXPECT_EQ(request.headers.at("Authorization"), "Bearer abc");
    EXPECT_EQ(request.max_redirects, 3);
    EXPECT_FALSE(request.verify_tls);
    EXPECT_EQ(request.timeout, milliseconds(5000));
    EXPECT_FALSE(request.capture_certificate);
}

TEST_F(HttpProbeTest, InvalidHeadersFailWithoutRequest) {
    auto monitor = make_monitor("h1", MonitorType::Http);
    monitor.config.request_headers = "[1,2,3]";
    auto result = probe.run(monitor);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(transport->calls, 0);
}

TEST_F(HttpProbeTest, TransportErrorIsFailure) {
    transport->response.status_code = 0;
    transport->response.error = "Timeout was reached";
    auto result = probe.run(make_monitor("h1", MonitorType::Http));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "Timeout was reached");
}

TEST_F(HttpProbeTest, KeywordIsCaseSensitive) {
    auto monitor = make_monitor("k1", MonitorType::Keyword);
    monitor.config.keyword = "healthy";
    EXPECT_TRUE(probe.run(monitor).ok);

    monitor.config.keyword = "HEALTHY";
    auto result = probe.run(monitor);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.message.find("200"), std::string::npos);
}

TEST_F(HttpProbeTest, KeywordStillRequiresAcceptedStatus) {
    transport->response.status_code = 500;
    auto monitor = make_monitor("k1", MonitorType::Keyword);
    auto result = probe.run(monitor);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.message.find("500"), std::string::npos);
}

TEST_F(HttpProbeTest, CertCheckRequiresCertificate) {
    auto monitor = make_monitor("c1", MonitorType::HttpsCert);
    auto result = probe.run(monitor);
    EXPECT_TRUE(transport->last_request.capture_certificate);
    EXPECT_FALSE(result.ok);
}

TEST_F(HttpProbeTest, CertCheckReportsDetails) {
    transport->response.certificate = cert_expiring_in(hours(24 * 30 + 1));
    auto monitor = make_monitor("c1", MonitorType::HttpsCert);
    monitor.config.cert_expiry_days = 7;

    auto result = probe.run(monitor);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.details.at("certDaysRemaining").get<long>(), 30);
    EXPECT_EQ(result.details.at("certSubject").get<std::string>(), "CN=example.com");
    EXPECT_EQ(result.details.at("certIssuer").get<std::string>(), "CN=Example CA");
    EXPECT_TRUE(result.details.contains("certExpiresAt"));
}

TEST_F(HttpProbeTest, CertExpiringSoonIsDown) {
    transport->response.certificate = cert_expiring_in(hours(24 * 3 + 1));
    auto monitor = make_monitor("c1", MonitorType::HttpsCert);
    monitor.config.cert_expiry_days = 7;

    auto result = probe.run(monitor);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.details.at("certDaysRemaining").get<long>(), 3);
}

TEST_F(HttpProbeTest, ZeroThresholdDisablesExpiryWindow) {
    transport->response.certificate = cert_expiring_in(hours(24 * 3 + 1));
    auto monitor = make_monitor("c1", MonitorType::HttpsCert);
    monitor.config.cert_expiry_days = 0;
    EXPECT_TRUE(probe.run(monitor).ok);
}

TEST_F(HttpProbeTest, ExpiredCertificateIsAlwaysDown) {
    transport->response.certificate = cert_expiring_in(-hours(48));
    auto monitor = make_monitor("c1", MonitorType::HttpsCert);
    monitor.config.cert_expiry_days = 0;
    EXPECT_FALSE(probe.run(monitor).ok);
}

TEST_F(HttpProbeTest, HttpMonitorChecksExpiryOnlyWhenAsked) {
    transport->response.certificate = cert_expiring_in(hours(24 * 2 + 1));
    auto monitor = make_monitor("h1", MonitorType::Http);

    EXPECT_TRUE(probe.run(monitor).ok);
    EXPECT_FALSE(transport->last_request.capture_certificate);

    monitor.config.notify_cert_expiry = true;
    EXPECT_FALSE(probe.run(monitor).ok);
    EXPECT_TRUE(transport->last_request.capture_certificate);
}
