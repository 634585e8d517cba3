#pragma once

#include "probe.hpp"
#include <chrono>
#include <memory>
#include <string>

struct ConnectResult {
    bool connected = false;
    std::string error;
    double elapsed_ms = 0.0;
};

class TcpConnector {
public:
    virtual ~TcpConnector() = default;
    virtual ConnectResult connect(const std::string& host, int port, std::chrono::milliseconds timeout) = 0;
};

// Non-blocking connect + poll over every resolved address
class PosixTcpConnector : public TcpConnector {
public:
    ConnectResult connect(const std::string& host, int port, std::chrono::milliseconds timeout) override;
};

class PortProbe : public Probe {
public:
    PortProbe(std::shared_ptr<TcpConnector> connector, std::chrono::seconds default_timeout);

    ProbeResult run(const Monitor& monitor) override;

private:
    std::shared_ptr<TcpConnector> connector_;
    std::chrono::seconds default_timeout_;
};
