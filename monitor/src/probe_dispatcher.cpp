#include "probe_dispatcher.hpp"
#include <spdlog/spdlog.h>

void ProbeDispatcher::register_probe(MonitorType type, std::shared_ptr<Probe> probe) {
    probes_[type] = std::move(probe);
}

bool ProbeDispatcher::has_probe(MonitorType type) const {
    return probes_.count(type) > 0;
}

ProbeResult ProbeDispatcher::run(const Monitor& monitor) const {
    ProbeResult result;

    auto it = probes_.find(monitor.type);
    if (it == probes_.end() || !it->second) {
        spdlog::error("No probe registered for monitor type {}", to_string(monitor.type));
        result = ProbeResult::failure("No probe available for type " + to_string(monitor.type));
    } else {
        try {
            result = it->second->run(monitor);
        } catch (const std::exception& e) {
            spdlog::debug("Probe for monitor {} threw: {}", monitor.id, e.what());
            result = ProbeResult::failure(e.what());
        }
    }

    if (monitor.upside_down) {
        result.ok = !result.ok;
    }
    return result;
}
