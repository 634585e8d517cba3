#pragma once

#include "api_server.hpp"
#include "check_cycle.hpp"
#include "config.hpp"
#include "heartbeat_registry.hpp"
#include "history_pruner.hpp"
#include "monitor_store.hpp"
#include "notification_channel.hpp"
#include "notification_gate.hpp"
#include "probe_dispatcher.hpp"
#include "scheduler.hpp"
#include "status_recorder.hpp"

#include <atomic>
#include <memory>

class MonitorService {
public:
    explicit MonitorService(const Config& config);
    ~MonitorService();

    void run();
    void stop();

private:
    std::unique_ptr<MonitorStore> create_store();
    std::shared_ptr<NotificationChannel> create_channel();
    void register_probes();

    Config config_;

    // Service components, in construction order
    std::unique_ptr<MonitorStore> store_;
    HeartbeatRegistry heartbeats_;
    ProbeDispatcher dispatcher_;
    std::unique_ptr<AsyncNotificationQueue> notifications_;
    std::unique_ptr<StatusRecorder> recorder_;
    std::unique_ptr<NotificationGate> gate_;
    std::unique_ptr<CheckCycle> cycle_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<HistoryPruner> pruner_;
    std::unique_ptr<ApiServer> api_server_;

    std::atomic<bool> running_{false};
};
