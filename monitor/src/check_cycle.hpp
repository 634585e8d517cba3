#pragma once

#include "monitor_store.hpp"
#include "notification_gate.hpp"
#include "probe_dispatcher.hpp"
#include "status_recorder.hpp"
#include "task_state.hpp"
#include <chrono>
#include <string>

struct CycleReport {
    bool terminate = false;
    MonitorStatus status = MonitorStatus::Pending;
    std::chrono::seconds next_delay{60};
};

// One run for one monitor: fetch, probe, retry policy, record, notify
class CheckCycle {
public:
    CheckCycle(MonitorStore& store,
               const ProbeDispatcher& dispatcher,
               StatusRecorder& recorder,
               NotificationGate& gate,
               std::chrono::seconds fallback_delay = std::chrono::seconds(60));

    // Never throws
    CycleReport run(const std::string& monitor_id, TaskState& state);

private:
    CycleReport execute(const std::string& monitor_id, TaskState& state);

    MonitorStore& store_;
    const ProbeDispatcher& dispatcher_;
    StatusRecorder& recorder_;
    NotificationGate& gate_;
    std::chrono::seconds fallback_delay_;
};
