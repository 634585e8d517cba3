#include <gtest/gtest.h>
#include "port_probe.hpp"
#include "test_fakes.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono;

namespace {
    // Listening socket on an ephemeral loopback port
    class LoopbackListener {
    public:
        LoopbackListener() {
            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
            ::listen(fd_, 4);

            socklen_t len = sizeof(addr);
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
            port_ = ntohs(addr.sin_port);
        }

        ~LoopbackListener() { close(); }

        void close() {
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }

        int port() const { return port_; }

    private:
        int fd_ = -1;
        int port_ = 0;
    };

    class FakeConnector : public TcpConnector {
    public:
        ConnectResult result;
        std::string host;
        int port = 0;
        milliseconds timeout{0};

        ConnectResult connect(const std::string& h, int p, milliseconds t) override {
            host = h;
            port = p;
            timeout = t;
            return result;
        }
    };
}

TEST(PortProbeTest, ConnectsToListeningPort) {
    LoopbackListener listener;
    PortProbe probe(std::make_shared<PosixTcpConnector>(), seconds(10));

    auto monitor = make_monitor("p1", MonitorType::Port);
    monitor.config.port = listener.port();
    monitor.config.connect_timeout = 2;

    auto result = probe.run(monitor);
    EXPECT_TRUE(result.ok) << result.message;
    EXPECT_TRUE(result.ping_ms.has_value());
}

TEST(PortProbeTest, ClosedPortIsFailure) {
    LoopbackListener listener;
    int port = listener.port();
    listener.close();

    PortProbe probe(std::make_shared<PosixTcpConnector>(), seconds(10));
    auto monitor = make_monitor("p1", MonitorType::Port);
    monitor.config.port = port;
    monitor.config.connect_timeout = 2;

    auto result = probe.run(monitor);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.message.find(std::to_string(port)), std::string::npos);
}

TEST(PortProbeTest, UnresolvableHostIsFailure) {
    PortProbe probe(std::make_shared<PosixTcpConnector>(), seconds(10));
    auto monitor = make_monitor("p1", MonitorType::Port);
    monitor.config.hostname = "no-such-host.invalid";
    monitor.config.port = 80;
    monitor.config.connect_timeout = 2;

    EXPECT_FALSE(probe.run(monitor).ok);
}

TEST(PortProbeTest, UsesServiceDefaultWhenTimeoutUnset) {
    auto connector = std::make_shared<FakeConnector>();
    connector->result.connected = true;
    connector->result.elapsed_ms = 3.5;
    PortProbe probe(connector, seconds(7));

    auto monitor = make_monitor("p1", MonitorType::Port);
    monitor.config.connect_timeout = 0;
    auto result = probe.run(monitor);

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(connector->timeout, milliseconds(7000));
    EXPECT_EQ(connector->host, "127.0.0.1");
    EXPECT_EQ(connector->port, 5432);
}
