#pragma once

#include "config.hpp"
#include "heartbeat_registry.hpp"
#include "monitor_store.hpp"
#include "scheduler.hpp"
#include "status_recorder.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

// Health, push heartbeats and the schedule/stop/history/prune control endpoints
class ApiServer {
public:
    ApiServer(const Config& config,
              Scheduler& scheduler,
              HeartbeatRegistry& heartbeats,
              MonitorStore& store,
              StatusRecorder& recorder);
    ~ApiServer();

    // Binds synchronously; listen_port 0 picks an ephemeral port. False when the bind failed.
    bool start();
    void stop();
    bool is_running() const;
    int port() const { return bound_port_; }

private:
    void setup_routes();

    void handle_push(const httplib::Request& req, httplib::Response& res);
    void handle_history(const httplib::Request& req, httplib::Response& res);
    // Keeps heartbeats only for the token of a live push monitor
    void sync_heartbeats(const std::string& monitor_id);

    const Config& config_;
    Scheduler& scheduler_;
    HeartbeatRegistry& heartbeats_;
    MonitorStore& store_;
    StatusRecorder& recorder_;

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    int bound_port_ = -1;
};
