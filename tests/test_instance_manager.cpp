#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "config.hpp"
#include "fakes.hpp"
#include "focus_request.hpp"
#include "instance_lock.hpp"
#include "instance_manager.hpp"
#include "lock_file.hpp"

namespace {
// Collects requests delivered by a FocusRequestListener on its own thread.
class RequestSink {
  public:
    void Push(const FocusRequest &request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        cv_.notify_all();
    }

    bool WaitFor(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return requests_.size() >= count; });
    }

    std::vector<FocusRequest> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<FocusRequest> requests_;
};

bool SendRaw(unsigned port, const std::string &payload) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return false;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bool ok = ::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
    ok = ok && ::send(fd, payload.data(), payload.size(), MSG_NOSIGNAL) ==
                   static_cast<ssize_t>(payload.size());
    ::close(fd);
    return ok;
}
} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Fixture: lock file and port config in a scratch directory
// ═══════════════════════════════════════════════════════════════════════════════

class InstanceManagerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_.lock_file = dir_.path() / ".app-instance.lock";
        config_.port_config = dir_.path() / "port-config.json";
        config_.grace_period = std::chrono::milliseconds(300);
    }

    void WriteRecord(int pid, std::int64_t timestamp) {
        LockRecord record;
        record.pid = pid;
        record.start_time = "2024-01-01T00:00:00Z";
        record.version = "1.0.0";
        record.timestamp = timestamp;
        ASSERT_TRUE(WriteLockFile(config_.lock_file, record));
    }

    void WriteRaw(const std::filesystem::path &path, const std::string &text) {
        std::ofstream file(path);
        file << text;
    }

    bool Exists(const std::filesystem::path &path) { return std::filesystem::exists(path); }

    TempDir dir_;
    Config config_;
    FakeProcessProbe probe_;
    std::ostringstream out_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// GetCurrentInstance / ShowStatus
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(InstanceManagerTest, NoLockFileMeansNoInstance) {
    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.GetCurrentInstance().has_value());

    EXPECT_EQ(manager.Run("status"), 0);
    EXPECT_NE(out_.str().find("No instances currently running"), std::string::npos);
}

TEST_F(InstanceManagerTest, LiveInstanceIsReported) {
    probe_.alive.insert(4242);
    WriteRecord(4242, 1000);

    ProcessInstanceManager manager(config_, probe_, out_);
    auto info = manager.GetCurrentInstance();
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->is_running);
    EXPECT_EQ(info->record.pid, 4242);
    EXPECT_EQ(info->record.version, "1.0.0");
    EXPECT_EQ(info->record.start_time, "2024-01-01T00:00:00Z");
    EXPECT_GT(info->lock_age_ms, 0);

    manager.ShowStatus();
    const std::string text = out_.str();
    EXPECT_NE(text.find("PID: 4242"), std::string::npos);
    EXPECT_NE(text.find("Started: 2024-01-01T00:00:00Z"), std::string::npos);
    EXPECT_NE(text.find("Version: 1.0.0"), std::string::npos);
    EXPECT_NE(text.find("Uptime: "), std::string::npos);
    EXPECT_NE(text.find("Status: Running"), std::string::npos);
    EXPECT_EQ(text.find("stale"), std::string::npos);
}

TEST_F(InstanceManagerTest, DeadPidIsNeverRunningEvenIfRecent) {
    WriteRecord(4242, NowEpochMs());

    ProcessInstanceManager manager(config_, probe_, out_);
    auto info = manager.GetCurrentInstance();
    ASSERT_TRUE(info.has_value());
    EXPECT_FALSE(info->is_running);

    manager.ShowStatus();
    EXPECT_NE(out_.str().find("Not running (stale)"), std::string::npos);
    EXPECT_NE(out_.str().find("cleanup"), std::string::npos);
}

TEST_F(InstanceManagerTest, CorruptLockFileIsTreatedAsAbsent) {
    WriteRaw(config_.lock_file, "{ this is not json");
    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.GetCurrentInstance().has_value());

    WriteRaw(config_.lock_file, R"({"startTime":"x","version":"1.0.0"})");
    EXPECT_FALSE(manager.GetCurrentInstance().has_value());
}

TEST_F(InstanceManagerTest, OutOfRangePidIsTreatedAsAbsent) {
    // Narrowed to int, 4294967297 would name pid 1.
    probe_.alive.insert(1);
    WriteRaw(config_.lock_file, R"({"pid":4294967297,"timestamp":1000,"version":"1.0.0"})");
    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.GetCurrentInstance().has_value());

    WriteRaw(config_.lock_file, R"({"pid":1e300,"timestamp":1000,"version":"1.0.0"})");
    EXPECT_FALSE(manager.GetCurrentInstance().has_value());

    EXPECT_FALSE(manager.KillAllInstances());
    EXPECT_TRUE(probe_.graceful.empty());
    EXPECT_TRUE(probe_.forceful.empty());
}

TEST_F(InstanceManagerTest, UnknownCommandShowsStatusAndHint) {
    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_EQ(manager.Run(""), 0);
    EXPECT_NE(out_.str().find("No instances currently running"), std::string::npos);
    EXPECT_NE(out_.str().find("help"), std::string::npos);

    std::ostringstream help;
    ProcessInstanceManager helper(config_, probe_, help);
    EXPECT_EQ(helper.Run("--help"), 0);
    EXPECT_NE(help.str().find("cleanup"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// KillAllInstances
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(InstanceManagerTest, KillEscalatesWhenGracefulSignalIsIgnored) {
    probe_.alive.insert(4242);
    WriteRecord(4242, 1000);

    ProcessInstanceManager manager(config_, probe_, out_);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(manager.KillAllInstances());
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(probe_.graceful, std::vector<int>{4242});
    EXPECT_EQ(probe_.forceful, std::vector<int>{4242});
    EXPECT_GE(waited, config_.grace_period);
    EXPECT_FALSE(Exists(config_.lock_file));
}

TEST_F(InstanceManagerTest, KillSkipsForcefulWhenProcessExits) {
    probe_.alive.insert(4242);
    probe_.exit_on_graceful = true;
    WriteRecord(4242, 1000);
    WriteRaw(config_.port_config, R"({"port":3001})");

    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_TRUE(manager.KillAllInstances());
    EXPECT_EQ(probe_.graceful, std::vector<int>{4242});
    EXPECT_TRUE(probe_.forceful.empty());
    EXPECT_FALSE(Exists(config_.lock_file));
    EXPECT_FALSE(Exists(config_.port_config));
}

TEST_F(InstanceManagerTest, KillWithoutGracefulTerminationIsImmediate) {
    probe_.alive.insert(4242);
    probe_.graceful_supported = false;
    WriteRecord(4242, 1000);

    ProcessInstanceManager manager(config_, probe_, out_);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(manager.KillAllInstances());
    EXPECT_LT(std::chrono::steady_clock::now() - start, config_.grace_period);
    EXPECT_TRUE(probe_.graceful.empty());
    EXPECT_EQ(probe_.forceful, std::vector<int>{4242});
    EXPECT_FALSE(Exists(config_.lock_file));
}

TEST_F(InstanceManagerTest, KillOfStaleInstanceCleansUpWithoutSignals) {
    WriteRecord(4242, 1000);
    WriteRaw(config_.port_config, R"({"port":3001})");

    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.KillAllInstances());
    EXPECT_TRUE(probe_.graceful.empty());
    EXPECT_TRUE(probe_.forceful.empty());
    EXPECT_FALSE(Exists(config_.lock_file));
    EXPECT_FALSE(Exists(config_.port_config));
    EXPECT_NE(out_.str().find("stale lock file"), std::string::npos);
}

TEST_F(InstanceManagerTest, KillWithNothingRunning) {
    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.KillAllInstances());
    EXPECT_NE(out_.str().find("No running instances found"), std::string::npos);
}

TEST_F(InstanceManagerTest, KillSucceedsWhenProcessExitsBeforeForcefulSignal) {
    probe_.alive.insert(4242);
    probe_.exit_before_forceful = true;
    WriteRecord(4242, 1000);

    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_TRUE(manager.KillAllInstances());
    EXPECT_EQ(probe_.forceful, std::vector<int>{4242});
    EXPECT_FALSE(Exists(config_.lock_file));
    EXPECT_NE(out_.str().find("Instance terminated successfully"), std::string::npos);
    EXPECT_EQ(out_.str().find("Failed to terminate"), std::string::npos);
}

TEST_F(InstanceManagerTest, KillReportsSignalFailure) {
    probe_.alive.insert(4242);
    probe_.fail_signals = true;
    WriteRecord(4242, 1000);

    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.KillAllInstances());
    EXPECT_TRUE(Exists(config_.lock_file));
    EXPECT_NE(out_.str().find("Failed to terminate"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// CleanupStaleFiles
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(InstanceManagerTest, CleanupIsIdempotent) {
    WriteRecord(4242, 1000);
    WriteRaw(config_.port_config, R"({"port":3001})");

    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_TRUE(manager.CleanupStaleFiles());
    EXPECT_FALSE(Exists(config_.lock_file));
    EXPECT_FALSE(Exists(config_.port_config));

    EXPECT_NO_THROW({
        EXPECT_TRUE(manager.CleanupStaleFiles());
        EXPECT_TRUE(manager.CleanupStaleFiles());
    });
    EXPECT_EQ(manager.Run("cleanup"), 0);
    EXPECT_NE(out_.str().find("Cleanup completed"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// FocusInstance
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(InstanceManagerTest, FocusWithoutInstanceNeverConnects) {
    RequestSink sink;
    FocusRequestListener listener(0);
    ASSERT_EQ(listener.Bind(), FocusRequestListener::BindResult::Bound);
    listener.Start([&sink](const FocusRequest &request) { sink.Push(request); });
    config_.coordination_port = listener.Port();

    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.FocusInstance());
    EXPECT_NE(out_.str().find("No running instance to focus"), std::string::npos);
    EXPECT_FALSE(sink.WaitFor(1, std::chrono::milliseconds(300)));
}

TEST_F(InstanceManagerTest, FocusSendsRequestToRunningInstance) {
    RequestSink sink;
    FocusRequestListener listener(0);
    ASSERT_EQ(listener.Bind(), FocusRequestListener::BindResult::Bound);
    listener.Start([&sink](const FocusRequest &request) { sink.Push(request); });
    config_.coordination_port = listener.Port();

    probe_.alive.insert(4242);
    WriteRecord(4242, 1000);

    ProcessInstanceManager manager(config_, probe_, out_);
    const std::int64_t before = NowEpochMs();
    EXPECT_TRUE(manager.FocusInstance());
    ASSERT_TRUE(sink.WaitFor(1, std::chrono::seconds(2)));

    auto requests = sink.Requests();
    EXPECT_EQ(requests.front().action, "focus");
    EXPECT_GE(requests.front().timestamp, before);
}

TEST_F(InstanceManagerTest, FocusReportsConnectFailure) {
    // Find a port nobody listens on by binding and releasing it.
    unsigned port = 0;
    {
        FocusRequestListener probe(0);
        ASSERT_EQ(probe.Bind(), FocusRequestListener::BindResult::Bound);
        port = probe.Port();
    }
    config_.coordination_port = port;
    probe_.alive.insert(4242);
    WriteRecord(4242, 1000);

    ProcessInstanceManager manager(config_, probe_, out_);
    EXPECT_FALSE(manager.FocusInstance());
    EXPECT_NE(out_.str().find("Failed to communicate"), std::string::npos);
}

TEST_F(InstanceManagerTest, ListenerSurvivesMalformedPayload) {
    RequestSink sink;
    FocusRequestListener listener(0);
    ASSERT_EQ(listener.Bind(), FocusRequestListener::BindResult::Bound);
    listener.Start([&sink](const FocusRequest &request) { sink.Push(request); });

    ASSERT_TRUE(SendRaw(listener.Port(), "{ not json"));
    ASSERT_TRUE(SendRaw(listener.Port(), R"({"timestamp":5})"));

    FocusRequest request;
    request.timestamp = 42;
    ASSERT_TRUE(SendFocusRequest("127.0.0.1", listener.Port(), request));
    ASSERT_TRUE(sink.WaitFor(1, std::chrono::seconds(2)));

    auto requests = sink.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests.front().timestamp, 42);
}

// ═══════════════════════════════════════════════════════════════════════════════
// InstanceLock
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(InstanceManagerTest, LockWritesRecordForThisProcess) {
    config_.coordination_port = 0;
    config_.version = "2.3.4";
    InstanceLock lock(config_, probe_, out_);
    ASSERT_TRUE(lock.Acquire());
    EXPECT_TRUE(lock.IsLocked());

    auto record = ReadLockFile(config_.lock_file);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->pid, static_cast<int>(::getpid()));
    EXPECT_EQ(record->version, "2.3.4");
    EXPECT_FALSE(record->start_time.empty());

    lock.Release();
    EXPECT_FALSE(lock.IsLocked());
    EXPECT_FALSE(Exists(config_.lock_file));
}

TEST_F(InstanceManagerTest, LockRefusedWhilePortIsHeld) {
    FocusRequestListener holder(0);
    ASSERT_EQ(holder.Bind(), FocusRequestListener::BindResult::Bound);
    config_.coordination_port = holder.Port();

    InstanceLock lock(config_, probe_, out_);
    EXPECT_FALSE(lock.Acquire());
    EXPECT_FALSE(lock.IsLocked());
    EXPECT_NE(out_.str().find("DUPLICATE INSTANCE"), std::string::npos);
}

TEST_F(InstanceManagerTest, LockRefusedWhileFreshLockFileNamesLivePid) {
    config_.coordination_port = 0;
    probe_.alive.insert(4242);
    WriteRecord(4242, NowEpochMs());

    InstanceLock lock(config_, probe_, out_);
    EXPECT_FALSE(lock.Acquire());
    EXPECT_NE(out_.str().find("PID: 4242"), std::string::npos);
    EXPECT_TRUE(Exists(config_.lock_file));
}

TEST_F(InstanceManagerTest, LockReplacesStaleLockFiles) {
    config_.coordination_port = 0;

    // Dead pid.
    WriteRecord(4242, NowEpochMs());
    {
        InstanceLock lock(config_, probe_, out_);
        ASSERT_TRUE(lock.Acquire());
        EXPECT_EQ(ReadLockFile(config_.lock_file)->pid, static_cast<int>(::getpid()));
    }
    EXPECT_FALSE(Exists(config_.lock_file));

    // Live pid, but older than the maximum lock age.
    probe_.alive.insert(4242);
    WriteRecord(4242, NowEpochMs() - InstanceLock::kMaxLockAgeMs - 1);
    {
        InstanceLock lock(config_, probe_, out_);
        EXPECT_TRUE(lock.Acquire());
    }

    // Unreadable.
    WriteRaw(config_.lock_file, "garbage");
    {
        InstanceLock lock(config_, probe_, out_);
        EXPECT_TRUE(lock.Acquire());
    }
}

TEST_F(InstanceManagerTest, SecondServerNotifiesTheFirst) {
    RequestSink sink;
    FocusRequestListener holder(0);
    ASSERT_EQ(holder.Bind(), FocusRequestListener::BindResult::Bound);
    holder.Start([&sink](const FocusRequest &request) { sink.Push(request); });
    config_.coordination_port = holder.Port();

    InstanceLock second(config_, probe_, out_);
    ASSERT_FALSE(second.Acquire());
    EXPECT_TRUE(second.NotifyExistingInstance());
    ASSERT_TRUE(sink.WaitFor(1, std::chrono::seconds(2)));
    EXPECT_EQ(sink.Requests().front().action, "focus");
}

TEST_F(InstanceManagerTest, LockHolderServesFocusRequests) {
    config_.coordination_port = 0;
    RequestSink sink;
    InstanceLock lock(config_, probe_, out_);
    EXPECT_FALSE(lock.OnMessage([&sink](const FocusRequest &request) { sink.Push(request); }));

    ASSERT_TRUE(lock.Acquire());
    EXPECT_TRUE(lock.OnMessage([&sink](const FocusRequest &request) { sink.Push(request); }));

    FocusRequest request;
    request.timestamp = NowEpochMs();
    ASSERT_TRUE(SendFocusRequest("127.0.0.1", lock.Port(), request));
    ASSERT_TRUE(sink.WaitFor(1, std::chrono::seconds(2)));
}
