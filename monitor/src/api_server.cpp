#include "api_server.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace {
    const std::size_t kDefaultHistoryLimit = 100;
    const std::size_t kMaxHistoryLimit = 1000;

    void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

    void send_error(httplib::Response& res, int status, const std::string& message) {
        send_json(res, status, {{"ok", false}, {"error", message}});
    }
}

ApiServer::ApiServer(const Config& config,
                     Scheduler& scheduler,
                     HeartbeatRegistry& heartbeats,
                     MonitorStore& store,
                     StatusRecorder& recorder)
    : config_(config),
      scheduler_(scheduler),
      heartbeats_(heartbeats),
      store_(store),
      recorder_(recorder),
      running_(false) {
    server_ = std::make_unique<httplib::Server>();
}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start() {
    if (running_) return true;
    setup_routes();

    if (config_.listen_port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.listen_addr.c_str());
    } else if (server_->bind_to_port(config_.listen_addr.c_str(), config_.listen_port)) {
        bound_port_ = config_.listen_port;
    } else {
        bound_port_ = -1;
    }
    if (bound_port_ <= 0) {
        spdlog::error("API server could not bind {}:{}", config_.listen_addr, config_.listen_port);
        return false;
    }

    running_ = true;
    server_thread_ = std::thread([this]() {
        spdlog::info("Starting API server on {}:{}", config_.listen_addr, bound_port_);
        if (!server_->listen_after_bind()) {
            spdlog::error("API server stopped listening on {}:{}", config_.listen_addr, bound_port_);
        }
    });

    // stop() is only effective once the accept loop runs
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!server_->is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

void ApiServer::stop() {
    if (running_) {
        running_ = false;
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }
}

bool ApiServer::is_running() const {
    return running_;
}

void ApiServer::setup_routes() {
    // Health endpoint
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        bool ok = scheduler_.is_running();
        nlohmann::json health = {
            {"ok", ok},
            {"service", config_.service_name},
            {"scheduled", scheduler_.task_count()}
        };
        send_json(res, ok ? 200 : 503, health);
    });

    // Push heartbeats
    server_->Get(R"(/api/push/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_push(req, res);
    });
    server_->Post(R"(/api/push/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_push(req, res);
    });

    // Called by the CRUD layer after a monitor was created, edited, resumed or paused
    server_->Post(R"(/api/monitors/([^/]+)/schedule)", [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        bool scheduled = scheduler_.schedule(id);
        sync_heartbeats(id);
        send_json(res, 202, {{"ok", true}, {"monitorId", id}, {"scheduled", scheduled}});
    });

    server_->Post(R"(/api/monitors/([^/]+)/stop)", [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        bool stopped = scheduler_.stop(id);
        heartbeats_.forget(id);
        send_json(res, 202, {{"ok", true}, {"monitorId", id}, {"stopped", stopped}});
    });

    server_->Get(R"(/api/monitors/([^/]+)/history)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_history(req, res);
    });

    server_->Post("/api/maintenance/prune", [this](const httplib::Request&, httplib::Response& res) {
        auto deleted = recorder_.prune(std::chrono::hours(24 * config_.history_retention_days));
        if (!deleted) {
            send_error(res, 500, "prune failed");
            return;
        }
        send_json(res, 200, {{"ok", true}, {"deleted", *deleted}});
    });

    // Set error handler
    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404 && res.body.empty()) {
            res.set_content(R"({"ok":false,"error":"not found"})", "application/json");
        }
    });
}

void ApiServer::handle_push(const httplib::Request& req, httplib::Response& res) {
    std::string token = req.matches[1];

    std::optional<Monitor> monitor;
    try {
        monitor = store_.find_push_monitor(token);
    } catch (const std::exception& e) {
        spdlog::error("Failed to resolve push token {}: {}", token, e.what());
        send_error(res, 503, "monitor store unavailable");
        return;
    }
    if (!monitor) {
        send_error(res, 404, "unknown push token");
        return;
    }

    Heartbeat heartbeat;
    heartbeat.monitor_id = monitor->id;
    heartbeat.received_at = std::chrono::system_clock::now();

    auto status = util::to_lower(req.has_param("status") ? req.get_param_value("status") : "up");
    if (status != "up" && status != "down") {
        send_error(res, 400, "status must be 'up' or 'down'");
        return;
    }
    heartbeat.ok = status == "up";
    heartbeat.message = req.has_param("msg") ? req.get_param_value("msg") : "";

    if (req.has_param("ping")) {
        try {
            heartbeat.ping_ms = std::stod(req.get_param_value("ping"));
        } catch (const std::exception&) {
            send_error(res, 400, "ping must be a number");
            return;
        }
    }

    heartbeats_.record(token, std::move(heartbeat));
    spdlog::debug("Heartbeat '{}' received for push monitor {}", status, monitor->id);
    send_json(res, 200, {{"ok", true}});
}

void ApiServer::handle_history(const httplib::Request& req, httplib::Response& res) {
    std::string id = req.matches[1];

    std::size_t limit = kDefaultHistoryLimit;
    if (req.has_param("limit")) {
        try {
            auto requested = std::stol(req.get_param_value("limit"));
            if (requested < 1) {
                send_error(res, 400, "limit must be positive");
                return;
            }
            limit = std::min(static_cast<std::size_t>(requested), kMaxHistoryLimit);
        } catch (const std::exception&) {
            send_error(res, 400, "limit must be a number");
            return;
        }
    }

    try {
        auto records = store_.recent_records(id, limit);
        nlohmann::json items = nlohmann::json::array();
        for (const auto& record : records) {
            items.push_back(record.to_json());
        }
        send_json(res, 200, {{"ok", true}, {"monitorId", id}, {"records", items}});
    } catch (const std::exception& e) {
        spdlog::error("Failed to read history for monitor {}: {}", id, e.what());
        send_error(res, 500, "history unavailable");
    }
}

void ApiServer::sync_heartbeats(const std::string& monitor_id) {
    std::optional<Monitor> monitor;
    try {
        monitor = store_.get_monitor(monitor_id);
    } catch (const std::exception& e) {
        spdlog::warn("Could not reload monitor {} to sync heartbeats: {}", monitor_id, e.what());
        return;
    }

    if (monitor && monitor->type == MonitorType::Push) {
        // An edited token leaves the old entry behind
        heartbeats_.forget(monitor_id, monitor->push_token());
    } else {
        heartbeats_.forget(monitor_id);
    }
}
