#include <gtest/gtest.h>
#include "scheduler.hpp"
#include "test_fakes.hpp"

#include <thread>

using namespace std::chrono;

// One configured second is 10ms here
class SchedulerTest : public ::testing::Test {
protected:
    MemoryMonitorStore store;
    ProbeDispatcher dispatcher;
    std::shared_ptr<ScriptedProbe> probe = std::make_shared<ScriptedProbe>(std::vector<bool>{true});
    StatusRecorder recorder{store};
    RecordingChannel channel;
    NotificationGate gate{channel};
    CheckCycle cycle{store, dispatcher, recorder, gate};
    std::unique_ptr<Scheduler> scheduler;

    void SetUp() override {
        dispatcher.register_probe(MonitorType::Port, probe);
    }

    void TearDown() override {
        probe->release();
        if (scheduler) scheduler->shutdown();
    }

    void start(std::size_t workers = 4) {
        SchedulerOptions options;
        options.max_concurrent_checks = workers;
        options.time_unit = milliseconds(10);
        scheduler = std::make_unique<Scheduler>(store, cycle, options);
        scheduler->start();
    }

    Monitor add_monitor(const std::string& id, int interval = 100) {
        auto monitor = make_monitor(id, MonitorType::Port);
        monitor.interval = interval;
        store.upsert_monitor(monitor);
        return monitor;
    }
};

TEST_F(SchedulerTest, StartArmsEveryActiveMonitor) {
    add_monitor("a");
    add_monitor("b");
    auto paused = make_monitor("c", MonitorType::Port);
    paused.active = false;
    store.upsert_monitor(paused);

    start();
    EXPECT_EQ(scheduler->task_count(), 2u);
    EXPECT_TRUE(scheduler->is_scheduled("a"));
    EXPECT_FALSE(scheduler->is_scheduled("c"));
    EXPECT_TRUE(probe->wait_for_calls(2));
}

TEST_F(SchedulerTest, FirstRunIsImmediate) {
    start();
    add_monitor("a", 3600);
    ASSERT_TRUE(scheduler->schedule("a"));
    EXPECT_TRUE(probe->wait_for_calls(1, milliseconds(500)));
}

TEST_F(SchedulerTest, RearmsAtInterval) {
    start();
    add_monitor("a", 2);
    scheduler->schedule("a");
    EXPECT_TRUE(probe->wait_for_calls(4, seconds(2)));
}

TEST_F(SchedulerTest, DoubleScheduleLeavesOneTask) {
    start();
    add_monitor("a", 5);
    scheduler->schedule("a");
    scheduler->schedule("a");
    EXPECT_EQ(scheduler->task_count(), 1u);

    std::this_thread::sleep_for(milliseconds(520));
    // A single live task runs about twelve times in this window; two would run over twenty
    EXPECT_LE(probe->calls(), 16);
    EXPECT_EQ(probe->max_in_flight(), 1);
}

TEST_F(SchedulerTest, StopDuringInFlightRunPreventsFurtherRuns) {
    start();
    add_monitor("a", 1);
    probe->block();
    scheduler->schedule("a");
    ASSERT_TRUE(probe->wait_for_calls(1));

    EXPECT_TRUE(scheduler->stop("a"));
    EXPECT_FALSE(scheduler->is_scheduled("a"));
    probe->release();

    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_EQ(probe->calls(), 1);
    // The in-flight run still completed and was recorded
    EXPECT_EQ(store.recent_records("a", 10).size(), 1u);
}

TEST_F(SchedulerTest, StopIsIdempotent) {
    start();
    EXPECT_FALSE(scheduler->stop("never-scheduled"));
    add_monitor("a");
    scheduler->schedule("a");
    EXPECT_TRUE(scheduler->stop("a"));
    EXPECT_FALSE(scheduler->stop("a"));
}

TEST_F(SchedulerTest, RescheduleWaitsForInFlightRun) {
    start();
    add_monitor("a", 3600);
    probe->block();
    scheduler->schedule("a");
    ASSERT_TRUE(probe->wait_for_calls(1));

    // The replacement task is due immediately but must not overlap the running check
    scheduler->schedule("a");
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(probe->calls(), 1);

    probe->release();
    EXPECT_TRUE(probe->wait_for_calls(2));
    EXPECT_EQ(probe->max_in_flight(), 1);
    EXPECT_EQ(scheduler->task_count(), 1u);
}

TEST_F(SchedulerTest, InactiveOrInvalidMonitorIsNotScheduled) {
    start();
    auto paused = make_monitor("paused", MonitorType::Port);
    paused.active = false;
    store.upsert_monitor(paused);
    EXPECT_FALSE(scheduler->schedule("paused"));

    auto broken = make_monitor("broken", MonitorType::Port);
    broken.config.port = 70000;
    store.upsert_monitor(broken);
    EXPECT_FALSE(scheduler->schedule("broken"));

    EXPECT_FALSE(scheduler->schedule("missing"));
    EXPECT_EQ(scheduler->task_count(), 0u);
}

TEST_F(SchedulerTest, DeactivatedMonitorLosesTaskOnReschedule) {
    start();
    auto monitor = add_monitor("a");
    ASSERT_TRUE(scheduler->schedule("a"));

    monitor.active = false;
    store.upsert_monitor(monitor);
    EXPECT_FALSE(scheduler->schedule("a"));
    EXPECT_FALSE(scheduler->is_scheduled("a"));
}

TEST_F(SchedulerTest, DeletedMonitorTaskRemovesItself) {
    start();
    add_monitor("a", 2);
    scheduler->schedule("a");
    ASSERT_TRUE(probe->wait_for_calls(1));

    store.remove_monitor("a");
    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_FALSE(scheduler->is_scheduled("a"));
    EXPECT_EQ(scheduler->run_mutex_count(), 0u);
}

TEST_F(SchedulerTest, StoppedMonitorReleasesRunMutex) {
    start();
    add_monitor("a", 1);
    scheduler->schedule("a");
    ASSERT_TRUE(probe->wait_for_calls(1));
    EXPECT_EQ(scheduler->run_mutex_count(), 1u);

    scheduler->stop("a");
    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_EQ(scheduler->run_mutex_count(), 0u);
}

TEST_F(SchedulerTest, EditsDuringSlowCheckDoNotStallOtherMonitors) {
    auto fast = std::make_shared<ScriptedProbe>(std::vector<bool>{true});
    dispatcher.register_probe(MonitorType::Icmp, fast);

    start(2);
    add_monitor("slow", 3600);
    probe->block();
    ASSERT_TRUE(scheduler->schedule("slow"));
    ASSERT_TRUE(probe->wait_for_calls(1));

    // Each edit replaces the task while the first check is still running
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(scheduler->schedule("slow"));
        std::this_thread::sleep_for(milliseconds(20));
    }

    auto other = make_monitor("other", MonitorType::Icmp);
    other.interval = 3600;
    store.upsert_monitor(other);
    ASSERT_TRUE(scheduler->schedule("other"));
    EXPECT_TRUE(fast->wait_for_calls(1, milliseconds(500)));

    probe->release();
    EXPECT_TRUE(probe->wait_for_calls(2));
    EXPECT_EQ(probe->max_in_flight(), 1);
}

TEST_F(SchedulerTest, NewTaskInheritsCachedStatus) {
    add_monitor("a", 3600);
    dispatcher.register_probe(MonitorType::Port, std::make_shared<ScriptedProbe>(std::vector<bool>{false}));
    store.record_status(make_outcome("a", MonitorStatus::Down));

    start();
    std::this_thread::sleep_for(milliseconds(150));
    EXPECT_EQ(store.recent_records("a", 10).size(), 2u);
    // Still down after an edit: no second "down" notification
    EXPECT_TRUE(channel.sent().empty());
}

TEST_F(SchedulerTest, GlobalCapLimitsParallelChecks) {
    for (int i = 0; i < 5; ++i) {
        add_monitor("m" + std::to_string(i), 3600);
    }
    probe->block();
    start(2);

    ASSERT_TRUE(probe->wait_for_calls(2));
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(probe->calls(), 2);
    EXPECT_EQ(probe->max_in_flight(), 2);

    probe->release();
    EXPECT_TRUE(probe->wait_for_calls(5));
    EXPECT_LE(probe->max_in_flight(), 2);
}

TEST_F(SchedulerTest, ShutdownClearsRegistry) {
    add_monitor("a");
    add_monitor("b");
    start();
    scheduler->shutdown();
    EXPECT_EQ(scheduler->task_count(), 0u);
    EXPECT_FALSE(scheduler->schedule("a"));
}

TEST_F(SchedulerTest, RestartAfterShutdownIsRejected) {
    start();
    scheduler->shutdown();
    EXPECT_FALSE(scheduler->start());
    EXPECT_FALSE(scheduler->is_running());
}
