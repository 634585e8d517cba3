#pragma once

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

// Raw determination of a single probe, before upside-down and retry handling
struct ProbeResult {
    bool ok = false;
    std::string message;
    std::optional<double> ping_ms;
    nlohmann::json details = nlohmann::json::object();

    static ProbeResult success(std::string message, std::optional<double> ping_ms = std::nullopt) {
        ProbeResult result;
        result.ok = true;
        result.message = std::move(message);
        result.ping_ms = ping_ms;
        return result;
    }

    static ProbeResult failure(std::string message, std::optional<double> ping_ms = std::nullopt) {
        ProbeResult result;
        result.ok = false;
        result.message = std::move(message);
        result.ping_ms = ping_ms;
        return result;
    }
};

// One strategy per monitor type. Runners report timeouts and connection
// errors as failures; anything they throw is turned into a failure by the dispatcher.
class Probe {
public:
    virtual ~Probe() = default;
    virtual ProbeResult run(const Monitor& monitor) = 0;
};

// connectTimeout of the monitor, or the service default when unset
inline std::chrono::seconds probe_timeout(const Monitor& monitor, std::chrono::seconds fallback) {
    if (monitor.config.connect_timeout > 0) {
        return std::chrono::seconds(monitor.config.connect_timeout);
    }
    return fallback;
}

inline double elapsed_ms(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}
