#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstdint>
#include <fstream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "common.hpp"
#include "config.hpp"
#include "dbus_bus.hpp"
#include "event_loop.hpp"
#include "fakes.hpp"
#include "focus_request.hpp"
#include "json.hpp"
#include "lock_file.hpp"
#include "manual_scheduler.hpp"
#include "message_bus.hpp"
#include "sqlite.hpp"

// ═══════════════════════════════════════════════════════════════════════════════
// Lock file
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LockFileTest, WrittenFileIsReadBack) {
    TempDir dir;
    const auto path = dir.path() / ".app-instance.lock";

    LockRecord record;
    record.pid = 4242;
    record.start_time = "2024-01-01T00:00:00Z";
    record.version = "1.0.0";
    record.timestamp = 1000;
    ASSERT_TRUE(WriteLockFile(path, record));

    auto read = ReadLockFile(path);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->pid, 4242);
    EXPECT_EQ(read->start_time, "2024-01-01T00:00:00Z");
    EXPECT_EQ(read->version, "1.0.0");
    EXPECT_EQ(read->timestamp, 1000);
}

TEST(LockFileTest, UsesCamelCaseFieldNames) {
    LockRecord record;
    record.pid = 7;
    record.timestamp = 99;
    const auto j = ToJson(record);
    EXPECT_TRUE(j.contains("pid"));
    EXPECT_TRUE(j.contains("timestamp"));
    EXPECT_TRUE(j.contains("startTime"));
    EXPECT_TRUE(j.contains("version"));
}

TEST(LockFileTest, RequiresNumericPidAndTimestamp) {
    EXPECT_FALSE(LockRecordFromJson(nlohmann::json::parse(R"({"timestamp":1})")).has_value());
    EXPECT_FALSE(LockRecordFromJson(nlohmann::json::parse(R"({"pid":1})")).has_value());
    EXPECT_FALSE(
        LockRecordFromJson(nlohmann::json::parse(R"({"pid":"1","timestamp":1})")).has_value());
    EXPECT_FALSE(LockRecordFromJson(nlohmann::json::array()).has_value());

    auto minimal = LockRecordFromJson(nlohmann::json::parse(R"({"pid":1,"timestamp":2.0})"));
    ASSERT_TRUE(minimal.has_value());
    EXPECT_EQ(minimal->timestamp, 2);
    EXPECT_EQ(minimal->version, "unknown");
}

TEST(LockFileTest, PidOutsideProcessIdRangeIsRejected) {
    // 2^32 + 1 would wrap to pid 1 if narrowed.
    EXPECT_FALSE(LockRecordFromJson(nlohmann::json::parse(R"({"pid":4294967297,"timestamp":1})"))
                     .has_value());
    EXPECT_FALSE(LockRecordFromJson(nlohmann::json::parse(R"({"pid":2147483648,"timestamp":1})"))
                     .has_value());
    EXPECT_FALSE(
        LockRecordFromJson(nlohmann::json::parse(R"({"pid":18446744073709551615,"timestamp":1})"))
            .has_value());
    EXPECT_FALSE(LockRecordFromJson(nlohmann::json::parse(R"({"pid":0,"timestamp":1})")).has_value());
    EXPECT_FALSE(LockRecordFromJson(nlohmann::json::parse(R"({"pid":-1,"timestamp":1})")).has_value());

    auto largest = LockRecordFromJson(nlohmann::json::parse(R"({"pid":2147483647,"timestamp":1})"));
    ASSERT_TRUE(largest.has_value());
    EXPECT_EQ(largest->pid, 2147483647);
}

TEST(LockFileTest, HugeOrFractionalDoublePidIsRejected) {
    EXPECT_FALSE(
        LockRecordFromJson(nlohmann::json::parse(R"({"pid":1e300,"timestamp":1})")).has_value());
    EXPECT_FALSE(
        LockRecordFromJson(nlohmann::json::parse(R"({"pid":-1e300,"timestamp":1})")).has_value());
    EXPECT_FALSE(
        LockRecordFromJson(nlohmann::json::parse(R"({"pid":12.5,"timestamp":1})")).has_value());
    EXPECT_FALSE(
        LockRecordFromJson(nlohmann::json::parse(R"({"pid":1,"timestamp":1e300})")).has_value());

    auto whole = LockRecordFromJson(nlohmann::json::parse(R"({"pid":42.0,"timestamp":1})"));
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->pid, 42);
}

TEST(LockFileTest, OutOfRangePidInFileReadsAsAbsent) {
    TempDir dir;
    const auto path = dir.path() / ".app-instance.lock";
    std::ofstream(path) << R"({"pid":4294967297,"timestamp":1000,"startTime":"x","version":"1"})";
    EXPECT_FALSE(ReadLockFile(path).has_value());
}

TEST(JsonParseTest, GetInt64RejectsValuesOutsideRange) {
    JsonParse parse;
    const auto j = nlohmann::json::parse(
        R"({"big":1e300,"max":9223372036854775807,"over":9223372036854775808,"neg":-5})");
    EXPECT_FALSE(parse.GetInt64(j, "big").has_value());
    EXPECT_FALSE(parse.GetInt64(j, "over").has_value());
    EXPECT_EQ(parse.GetInt64(j, "max"), std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(parse.GetInt64(j, "neg"), -5);
    EXPECT_EQ(parse.GetInt64(j, "big", 7), 7);
}

TEST(LockFileTest, MissingAndCorruptFilesReadAsAbsent) {
    TempDir dir;
    EXPECT_FALSE(ReadLockFile(dir.path() / "missing.lock").has_value());

    const auto path = dir.path() / "corrupt.lock";
    std::ofstream(path) << "{\"pid\":";
    EXPECT_FALSE(ReadLockFile(path).has_value());
}

TEST(LockFileTest, RemoveIsIdempotent) {
    TempDir dir;
    const auto path = dir.path() / "x";
    std::ofstream(path) << "x";

    bool removed = false;
    EXPECT_TRUE(RemoveFileIfExists(path, &removed));
    EXPECT_TRUE(removed);
    EXPECT_TRUE(RemoveFileIfExists(path, &removed));
    EXPECT_FALSE(removed);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Coordination messages
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CoordinationMessageTest, WireNames) {
    EXPECT_EQ(MessageTypeName(MessageType::InstanceActivated), "instance-activated");
    EXPECT_EQ(MessageTypeName(MessageType::Ping), "ping");
    EXPECT_EQ(MessageTypeName(MessageType::Pong), "pong");
    EXPECT_EQ(MessageTypeName(MessageType::RequestFocus), "request-focus");
    EXPECT_FALSE(MessageTypeFromName("shutdown").has_value());
}

TEST(CoordinationMessageTest, ParsesPeerPayload) {
    auto msg = CoordinationMessageFromJson(nlohmann::json::parse(
        R"({"type":"instance-activated","instanceId":"task-tracker-1-ab","timestamp":1700000000000})"));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->type, MessageType::InstanceActivated);
    EXPECT_EQ(msg->instance_id, "task-tracker-1-ab");
    EXPECT_EQ(msg->timestamp, 1700000000000);

    const auto j = ToJson(*msg);
    EXPECT_EQ(j["type"], "instance-activated");
    EXPECT_EQ(j["instanceId"], "task-tracker-1-ab");
}

TEST(CoordinationMessageTest, UnknownTypeIsDropped) {
    EXPECT_FALSE(CoordinationMessageFromJson(
                     nlohmann::json::parse(R"({"type":"reload","instanceId":"x","timestamp":1})"))
                     .has_value());
    EXPECT_FALSE(CoordinationMessageFromJson(nlohmann::json::parse(R"("ping")")).has_value());
}

TEST(FocusRequestTest, WireFormat) {
    FocusRequest request;
    request.timestamp = 123;
    const auto j = ToJson(request);
    EXPECT_EQ(j["action"], "focus");
    EXPECT_EQ(j["timestamp"], 123);

    EXPECT_FALSE(FocusRequestFromJson(nlohmann::json::parse(R"({"timestamp":1})")).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// ManualScheduler
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ManualSchedulerTest, RepeatingTimerFiresAtEachInterval) {
    ManualScheduler scheduler(1000);
    std::vector<std::int64_t> fired;
    scheduler.ScheduleRepeating(std::chrono::milliseconds(100),
                                [&]() { fired.push_back(scheduler.NowMs()); });

    scheduler.AdvanceBy(std::chrono::milliseconds(99));
    EXPECT_TRUE(fired.empty());
    scheduler.AdvanceBy(std::chrono::milliseconds(251));
    EXPECT_EQ(fired, (std::vector<std::int64_t>{1100, 1200, 1300}));
    EXPECT_EQ(scheduler.NowMs(), 1350);
}

TEST(ManualSchedulerTest, CancelledTimerNeverFires) {
    ManualScheduler scheduler;
    int count = 0;
    auto handle = scheduler.ScheduleRepeating(std::chrono::milliseconds(10), [&]() { ++count; });
    EXPECT_TRUE(handle.IsPending());

    scheduler.AdvanceBy(std::chrono::milliseconds(25));
    EXPECT_EQ(count, 2);
    handle.Cancel();
    EXPECT_FALSE(handle.IsPending());
    scheduler.AdvanceBy(std::chrono::milliseconds(100));
    EXPECT_EQ(count, 2);
    EXPECT_EQ(scheduler.PendingTimers(), 0u);
}

TEST(ManualSchedulerTest, OneShotAndOrdering) {
    ManualScheduler scheduler;
    std::vector<std::string> order;
    scheduler.ScheduleOnce(std::chrono::milliseconds(20), [&]() { order.push_back("late"); });
    scheduler.ScheduleOnce(std::chrono::milliseconds(10), [&]() {
        order.push_back("early");
        scheduler.Post([&]() { order.push_back("posted"); });
    });

    scheduler.AdvanceBy(std::chrono::milliseconds(30));
    EXPECT_EQ(order, (std::vector<std::string>{"early", "posted", "late"}));
    EXPECT_EQ(scheduler.PendingTimers(), 0u);
}

TEST(ManualSchedulerTest, RejectsNonPositiveInterval) {
    ManualScheduler scheduler;
    EXPECT_THROW(scheduler.ScheduleRepeating(std::chrono::milliseconds(0), []() {}),
                 std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════════
// EventLoop
// ═══════════════════════════════════════════════════════════════════════════════

TEST(EventLoopTest, RunsPostedTasksAndTimersOnOneThread) {
    EventLoop loop;
    loop.Start();
    ASSERT_TRUE(loop.IsRunning());

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::thread::id> threads;
    int ticks = 0;

    loop.Post([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        threads.push_back(std::this_thread::get_id());
        cv.notify_all();
    });
    auto handle = loop.ScheduleRepeating(std::chrono::milliseconds(10), [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        threads.push_back(std::this_thread::get_id());
        ++ticks;
        cv.notify_all();
    });

    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&]() { return ticks >= 3; }));
    }
    handle.Cancel();
    loop.Stop();
    EXPECT_FALSE(loop.IsRunning());

    for (const auto &id : threads) {
        EXPECT_EQ(id, threads.front());
        EXPECT_NE(id, std::this_thread::get_id());
    }
}

TEST(EventLoopTest, ThrowingTaskDoesNotStopLoop) {
    EventLoop loop;
    loop.Start();

    std::atomic<bool> ran{false};
    loop.Post([]() { throw std::runtime_error("boom"); });
    loop.Post([&]() { ran = true; });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!ran && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    loop.Stop();
    EXPECT_TRUE(ran);
}

TEST(EventLoopTest, ClockIsWallTime) {
    EventLoop loop;
    const std::int64_t before = NowEpochMs();
    EXPECT_GE(loop.NowMs(), before);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Buses
// ═══════════════════════════════════════════════════════════════════════════════

TEST(LocalMessageBusTest, DeliversToOthersButNotSender) {
    auto hub = std::make_shared<LocalBusHub>();
    LocalMessageBus a(hub, "chan");
    LocalMessageBus b(hub, "chan");
    LocalMessageBus other(hub, "other-chan");

    std::vector<std::string> gotA, gotB, gotOther;
    a.SetHandler([&](const CoordinationMessage &m) { gotA.push_back(m.instance_id); });
    b.SetHandler([&](const CoordinationMessage &m) { gotB.push_back(m.instance_id); });
    other.SetHandler([&](const CoordinationMessage &m) { gotOther.push_back(m.instance_id); });

    CoordinationMessage msg;
    msg.type = MessageType::Ping;
    msg.instance_id = "one";
    ASSERT_TRUE(a.Publish(msg));
    msg.instance_id = "two";
    ASSERT_TRUE(a.Publish(msg));

    EXPECT_TRUE(gotA.empty());
    EXPECT_EQ(gotB, (std::vector<std::string>{"one", "two"}));
    EXPECT_TRUE(gotOther.empty());
}

TEST(LocalMessageBusTest, ClosedBusNeitherSendsNorReceives) {
    auto hub = std::make_shared<LocalBusHub>();
    LocalMessageBus a(hub, "chan");
    LocalMessageBus b(hub, "chan");

    int received = 0;
    b.SetHandler([&](const CoordinationMessage &) { ++received; });
    b.Close();

    CoordinationMessage msg;
    EXPECT_TRUE(a.Publish(msg));
    EXPECT_EQ(received, 0);
    EXPECT_FALSE(b.Publish(msg));
}

TEST(DBusMessageBusTest, ObjectPathIsSanitized) {
    EXPECT_EQ(DBusMessageBus::ObjectPathForChannel("task-tracker-instances"),
              "/org/instanceguard/channel/task_tracker_instances");
    EXPECT_EQ(DBusMessageBus::ObjectPathForChannel(""), "/org/instanceguard/channel/default");
}

// ═══════════════════════════════════════════════════════════════════════════════
// SQLiteStore
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SQLiteStoreTest, KeysAreSharedBetweenConnections) {
    TempDir dir;
    const std::string path = (dir.path() / "instances.sqlite").string();

    SQLiteStore first(path);
    SQLiteStore second(path);

    EXPECT_FALSE(first.Get("task-tracker-active-instance").has_value());
    ASSERT_TRUE(first.Set("task-tracker-active-instance", "tab-a"));
    ASSERT_TRUE(first.Set("task-tracker-active-instance", "tab-b"));
    EXPECT_EQ(second.Get("task-tracker-active-instance"), std::optional<std::string>("tab-b"));

    ASSERT_TRUE(second.Remove("task-tracker-active-instance"));
    EXPECT_FALSE(first.Get("task-tracker-active-instance").has_value());
    EXPECT_TRUE(second.Remove("never-written"));
}

TEST(SQLiteStoreTest, UnopenablePathThrows) {
    TempDir dir;
    const std::string path = (dir.path() / "no" / "such" / "dir" / "db.sqlite").string();
    EXPECT_THROW(SQLiteStore store(path), std::runtime_error);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Config and helpers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    ::setenv("INSTANCEGUARD_LOCK_FILE", "/tmp/custom.lock", 1);
    ::setenv("INSTANCEGUARD_PORT", "60001", 1);
    ::setenv("INSTANCEGUARD_STORE", "/tmp/custom.sqlite", 1);
    ::setenv("INSTANCEGUARD_LOG", "debug", 1);

    Config config = LoadConfig();
    EXPECT_EQ(config.lock_file, std::filesystem::path("/tmp/custom.lock"));
    EXPECT_EQ(config.coordination_port, 60001u);
    EXPECT_EQ(config.store_path, std::filesystem::path("/tmp/custom.sqlite"));
    EXPECT_EQ(config.log_level, LOG_DEBUG);
    EXPECT_EQ(config.port_config.filename(), "port-config.json");

    ::setenv("INSTANCEGUARD_PORT", "not-a-port", 1);
    EXPECT_EQ(LoadConfig().coordination_port, kCoordinationPort);

    ::unsetenv("INSTANCEGUARD_LOCK_FILE");
    ::unsetenv("INSTANCEGUARD_PORT");
    ::unsetenv("INSTANCEGUARD_STORE");
    ::unsetenv("INSTANCEGUARD_LOG");

    Config defaults = LoadConfig();
    EXPECT_EQ(defaults.lock_file.filename(), ".app-instance.lock");
    EXPECT_EQ(defaults.coordination_port, 58765u);
    EXPECT_EQ(defaults.channel_name, "task-tracker-instances");
    EXPECT_EQ(defaults.grace_period, std::chrono::milliseconds(5000));
}

TEST(ConfigTest, CommandLineFlags) {
    Config config;
    const char *argv[] = {"instances", "--debug", "status"};
    auto rest = ApplyCommandLine(config, 3, const_cast<char **>(argv));
    EXPECT_EQ(config.log_level, LOG_DEBUG);
    EXPECT_EQ(rest, (std::vector<std::string>{"status"}));

    const char *quiet[] = {"instances", "--quiet"};
    rest = ApplyCommandLine(config, 2, const_cast<char **>(quiet));
    EXPECT_EQ(config.log_level, LOG_OFF);
    EXPECT_TRUE(rest.empty());
}

TEST(CommonTest, Iso8601IsUtcWithMillis) {
    EXPECT_EQ(ToIso8601(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(ToIso8601(1704067200123), "2024-01-01T00:00:00.123Z");
    EXPECT_EQ(StateName(ACTIVE), "ACTIVE");
    EXPECT_EQ(StateName(STANDBY), "STANDBY");
}
