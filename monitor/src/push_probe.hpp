#pragma once

#include "heartbeat_registry.hpp"
#include "probe.hpp"

// Passive check: up while heartbeats keep arriving within interval + grace
class PushProbe : public Probe {
public:
    explicit PushProbe(const HeartbeatRegistry& registry);

    ProbeResult run(const Monitor& monitor) override;

private:
    const HeartbeatRegistry& registry_;
};
