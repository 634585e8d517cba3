#include <gtest/gtest.h>
#include "api_server.hpp"
#include "test_fakes.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace std::chrono;

class ApiServerTest : public ::testing::Test {
protected:
    MemoryMonitorStore store;
    ProbeDispatcher dispatcher;
    StatusRecorder recorder{store};
    RecordingChannel channel;
    NotificationGate gate{channel};
    CheckCycle cycle{store, dispatcher, recorder, gate};
    HeartbeatRegistry heartbeats;
    Config config;

    std::unique_ptr<Scheduler> scheduler;
    std::unique_ptr<ApiServer> server;
    std::unique_ptr<httplib::Client> client;

    void SetUp() override {
        dispatcher.register_probe(MonitorType::Port, std::make_shared<ScriptedProbe>());
        dispatcher.register_probe(MonitorType::Push, std::make_shared<ScriptedProbe>());

        SchedulerOptions options;
        options.max_concurrent_checks = 2;
        options.time_unit = milliseconds(10);
        scheduler = std::make_unique<Scheduler>(store, cycle, options);
        scheduler->start();

        config.listen_addr = "127.0.0.1";
        config.listen_port = 0;
        server = std::make_unique<ApiServer>(config, *scheduler, heartbeats, store, recorder);
        ASSERT_TRUE(server->start());
        client = std::make_unique<httplib::Client>("127.0.0.1", server->port());
    }

    void TearDown() override {
        server->stop();
        scheduler->shutdown();
    }

    Monitor add_push_monitor(const std::string& id, const std::string& token = "") {
        auto monitor = make_monitor(id, MonitorType::Push);
        monitor.interval = 3600;
        monitor.config.push_token = token;
        store.upsert_monitor(monitor);
        return monitor;
    }

    static nlohmann::json body(const httplib::Result& res) {
        return nlohmann::json::parse(res->body);
    }
};

TEST_F(ApiServerTest, HealthReportsSchedulerState) {
    auto res = client->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(body(res)["ok"].get<bool>());
    EXPECT_EQ(body(res)["service"], "monitor");
    EXPECT_EQ(body(res)["scheduled"], 0);
}

TEST_F(ApiServerTest, DownHeartbeatCarriesMessageAndPing) {
    add_push_monitor("nightly-backup", "tok-1");

    auto res = client->Get("/api/push/tok-1?status=down&msg=disk%20full&ping=12.5");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto heartbeat = heartbeats.last("tok-1");
    ASSERT_TRUE(heartbeat.has_value());
    EXPECT_EQ(heartbeat->monitor_id, "nightly-backup");
    EXPECT_FALSE(heartbeat->ok);
    EXPECT_EQ(heartbeat->message, "disk full");
    ASSERT_TRUE(heartbeat->ping_ms.has_value());
    EXPECT_DOUBLE_EQ(*heartbeat->ping_ms, 12.5);
}

TEST_F(ApiServerTest, PostWithoutParamsIsAnUpHeartbeat) {
    // No explicit token: the monitor id is the token
    add_push_monitor("cron-job");

    auto res = client->Post("/api/push/cron-job", "", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto heartbeat = heartbeats.last("cron-job");
    ASSERT_TRUE(heartbeat.has_value());
    EXPECT_TRUE(heartbeat->ok);
    EXPECT_FALSE(heartbeat->ping_ms.has_value());
}

TEST_F(ApiServerTest, UnknownTokensAreRejectedWithoutStoringAnything) {
    store.upsert_monitor(make_monitor("db-port", MonitorType::Port));

    for (const std::string token : {"random-1", "random-2", "db-port"}) {
        auto res = client->Get("/api/push/" + token);
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 404) << token;
    }
    EXPECT_EQ(heartbeats.size(), 0u);
}

TEST_F(ApiServerTest, MalformedHeartbeatIsRejected) {
    add_push_monitor("cron-job");

    auto bad_status = client->Get("/api/push/cron-job?status=maybe");
    ASSERT_TRUE(bad_status);
    EXPECT_EQ(bad_status->status, 400);

    auto bad_ping = client->Get("/api/push/cron-job?ping=fast");
    ASSERT_TRUE(bad_ping);
    EXPECT_EQ(bad_ping->status, 400);

    EXPECT_EQ(heartbeats.size(), 0u);
}

TEST_F(ApiServerTest, StopDropsTheMonitorsHeartbeats) {
    add_push_monitor("cron-job");
    ASSERT_EQ(client->Get("/api/push/cron-job")->status, 200);
    ASSERT_EQ(heartbeats.size(), 1u);

    auto res = client->Post("/api/monitors/cron-job/stop", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_EQ(heartbeats.size(), 0u);
}

TEST_F(ApiServerTest, RescheduleKeepsOnlyTheCurrentToken) {
    auto monitor = add_push_monitor("cron-job", "old-token");
    ASSERT_EQ(client->Get("/api/push/old-token")->status, 200);

    monitor.config.push_token = "new-token";
    store.upsert_monitor(monitor);
    ASSERT_EQ(client->Get("/api/push/new-token")->status, 200);

    auto res = client->Post("/api/monitors/cron-job/schedule", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(body(res)["scheduled"].get<bool>());

    EXPECT_FALSE(heartbeats.last("old-token").has_value());
    EXPECT_TRUE(heartbeats.last("new-token").has_value());
}

TEST_F(ApiServerTest, HistoryHonoursLimit) {
    store.upsert_monitor(make_monitor("db-port", MonitorType::Port));
    auto start = system_clock::now() - hours(1);
    for (int i = 0; i < 1005; ++i) {
        store.record_status(make_outcome("db-port", MonitorStatus::Up, start + seconds(i)));
    }

    auto two = client->Get("/api/monitors/db-port/history?limit=2");
    ASSERT_TRUE(two);
    EXPECT_EQ(two->status, 200);
    auto records = body(two)["records"];
    ASSERT_EQ(records.size(), 2u);
    EXPECT_GT(records[0]["ts"].get<std::string>(), records[1]["ts"].get<std::string>());

    EXPECT_EQ(body(client->Get("/api/monitors/db-port/history"))["records"].size(), 100u);
    EXPECT_EQ(body(client->Get("/api/monitors/db-port/history?limit=5000"))["records"].size(), 1000u);

    EXPECT_EQ(client->Get("/api/monitors/db-port/history?limit=0")->status, 400);
    EXPECT_EQ(client->Get("/api/monitors/db-port/history?limit=lots")->status, 400);
}

TEST_F(ApiServerTest, PruneReportsDeletedCount) {
    store.upsert_monitor(make_monitor("db-port", MonitorType::Port));
    auto now = system_clock::now();
    store.record_status(make_outcome("db-port", MonitorStatus::Up, now - hours(24 * 45)));
    store.record_status(make_outcome("db-port", MonitorStatus::Up, now - hours(24 * 31)));
    store.record_status(make_outcome("db-port", MonitorStatus::Up, now));

    auto res = client->Post("/api/maintenance/prune", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(body(res)["deleted"], 2);
    EXPECT_EQ(store.record_count(), 1u);
}

TEST_F(ApiServerTest, UnknownRouteIsJson404) {
    auto res = client->Get("/api/nothing-here");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_FALSE(body(res)["ok"].get<bool>());
}
