#include "monitor_service.hpp"
#include "http_probe.hpp"
#include "icmp_probe.hpp"
#include "memory_store.hpp"
#include "mysql_probe.hpp"
#include "pg_store.hpp"
#include "port_probe.hpp"
#include "push_probe.hpp"
#include "redis_notifier.hpp"
#include "redis_probe.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

MonitorService::MonitorService(const Config& config) : config_(config) {
    store_ = create_store();
    register_probes();

    notifications_ = std::make_unique<AsyncNotificationQueue>(create_channel());
    recorder_ = std::make_unique<StatusRecorder>(*store_);
    gate_ = std::make_unique<NotificationGate>(*notifications_);
    cycle_ = std::make_unique<CheckCycle>(*store_, dispatcher_, *recorder_, *gate_);

    SchedulerOptions options;
    options.max_concurrent_checks = static_cast<std::size_t>(config_.max_concurrent_checks);
    scheduler_ = std::make_unique<Scheduler>(*store_, *cycle_, options);

    pruner_ = std::make_unique<HistoryPruner>(*recorder_,
                                              std::chrono::hours(24 * config_.history_retention_days),
                                              std::chrono::minutes(config_.prune_interval_minutes));
    api_server_ = std::make_unique<ApiServer>(config_, *scheduler_, heartbeats_, *store_, *recorder_);
}

MonitorService::~MonitorService() {
    stop();
}

void MonitorService::run() {
    if (running_) return;
    running_ = true;

    notifications_->start();
    if (!scheduler_->start()) {
        throw std::runtime_error("Scheduler cannot be restarted after shutdown");
    }
    pruner_->start();
    if (!api_server_->start()) {
        throw std::runtime_error("API server could not bind its listen address");
    }
    spdlog::info("MonitorService started.");
}

void MonitorService::stop() {
    if (!running_) return;
    running_ = false;

    api_server_->stop();
    scheduler_->shutdown();
    pruner_->stop();
    notifications_->stop();
    spdlog::info("MonitorService stopped.");
}

std::unique_ptr<MonitorStore> MonitorService::create_store() {
    if (config_.store_backend == "memory") {
        auto store = std::make_unique<MemoryMonitorStore>();
        if (!config_.monitors_file.empty()) {
            store->load_from_file(config_.monitors_file);
        }
        return store;
    }

    auto store = std::make_unique<PgMonitorStore>(config_);
    if (!store->is_connected()) {
        throw std::runtime_error("PostgreSQL is not reachable");
    }
    if (!store->initialize_schema()) {
        throw std::runtime_error("Failed to initialize the PostgreSQL schema");
    }

    // Optional seed: definitions are upserted, cached status is kept
    if (!config_.monitors_file.empty()) {
        std::size_t saved = 0;
        for (const auto& monitor : read_monitors_file(config_.monitors_file)) {
            try {
                store->save_monitor(monitor);
                ++saved;
            } catch (const std::exception& e) {
                spdlog::error("Failed to save monitor {}: {}", monitor.id, e.what());
            }
        }
        spdlog::info("Seeded {} monitors from {}", saved, config_.monitors_file);
    }
    return store;
}

std::shared_ptr<NotificationChannel> MonitorService::create_channel() {
    if (config_.redis_url.empty()) {
        spdlog::info("REDIS_URL not set, notifications go to the log only");
        return std::make_shared<LogNotificationChannel>();
    }
    return std::make_shared<RedisNotificationChannel>(config_);
}

void MonitorService::register_probes() {
    auto timeout = std::chrono::seconds(config_.default_timeout_seconds);

    auto http = std::make_shared<HttpProbe>(std::make_shared<CprHttpTransport>(), timeout);
    dispatcher_.register_probe(MonitorType::Http, http);
    dispatcher_.register_probe(MonitorType::Keyword, http);
    dispatcher_.register_probe(MonitorType::HttpsCert, http);

    dispatcher_.register_probe(MonitorType::Port,
        std::make_shared<PortProbe>(std::make_shared<PosixTcpConnector>(), timeout));
    dispatcher_.register_probe(MonitorType::Icmp,
        std::make_shared<IcmpProbe>(std::make_shared<SystemPinger>(), timeout));
    dispatcher_.register_probe(MonitorType::Mysql,
        std::make_shared<MysqlProbe>(std::make_shared<NativeMysqlClient>(), timeout));
    dispatcher_.register_probe(MonitorType::Redis,
        std::make_shared<RedisProbe>(std::make_shared<RedisPlusPlusClient>(), timeout));
    dispatcher_.register_probe(MonitorType::Push, std::make_shared<PushProbe>(heartbeats_));
}
