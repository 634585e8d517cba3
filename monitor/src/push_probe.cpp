#include "push_probe.hpp"
#include <fmt/format.h>
#include <algorithm>

PushProbe::PushProbe(const HeartbeatRegistry& registry) : registry_(registry) {}

ProbeResult PushProbe::run(const Monitor& monitor) {
    auto heartbeat = registry_.last(monitor.push_token());
    if (!heartbeat) {
        return ProbeResult::failure("No heartbeat received");
    }

    auto window = std::chrono::seconds(monitor.interval + std::max(0, monitor.config.grace_seconds));
    auto age = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - heartbeat->received_at);
    if (age > window) {
        return ProbeResult::failure(fmt::format("No heartbeat in the last {}s (last one {}s ago)",
                                                window.count(), age.count()));
    }

    if (!heartbeat->ok) {
        return ProbeResult::failure(heartbeat->message.empty() ? "Heartbeat reported down" : heartbeat->message,
                                    heartbeat->ping_ms);
    }

    return ProbeResult::success(heartbeat->message.empty() ? "Heartbeat received" : heartbeat->message,
                                heartbeat->ping_ms);
}
