#pragma once

#include "probe.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

struct PingStats {
    int transmitted = 0;
    int received = 0;
    double loss_pct = 100.0;
    std::optional<double> avg_rtt_ms;
};

class Pinger {
public:
    virtual ~Pinger() = default;

    // Throws std::runtime_error when the ping could not be run at all
    virtual PingStats ping(const std::string& host, int count, std::chrono::seconds deadline) = 0;
};

// Runs the system ping utility, which avoids needing CAP_NET_RAW in this process
class SystemPinger : public Pinger {
public:
    PingStats ping(const std::string& host, int count, std::chrono::seconds deadline) override;

    // Parses the summary lines of iputils/busybox ping output
    static std::optional<PingStats> parse_output(const std::string& output);
};

class IcmpProbe : public Probe {
public:
    IcmpProbe(std::shared_ptr<Pinger> pinger, std::chrono::seconds default_timeout);

    ProbeResult run(const Monitor& monitor) override;

private:
    std::shared_ptr<Pinger> pinger_;
    std::chrono::seconds default_timeout_;
};
