#pragma once

#include "probe.hpp"
#include <memory>
#include <unordered_map>

// Maps each monitor type to its runner and applies upside-down inversion
class ProbeDispatcher {
public:
    void register_probe(MonitorType type, std::shared_ptr<Probe> probe);
    bool has_probe(MonitorType type) const;

    // Never throws; runner exceptions become failures
    ProbeResult run(const Monitor& monitor) const;

private:
    std::unordered_map<MonitorType, std::shared_ptr<Probe>> probes_;
};
