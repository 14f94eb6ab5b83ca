#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common.hpp"
#include "kv_store.hpp"
#include "message_bus.hpp"
#include "scheduler.hpp"
#include "window.hpp"

static constexpr const char *kActiveInstanceKey = "task-tracker-active-instance";
static constexpr const char *kLastHeartbeatKey = "task-tracker-last-heartbeat";

// Decides which of several UI peers is the active instance. Peers share a KeyValueStore holding
// the active id and its last heartbeat, and announce themselves over a MessageBus.
//
// All message handling and heartbeats run on the Scheduler; public methods may be called from
// any thread. Destruction waits for a scheduler task of this coordinator that is already running.
class TabCoordinator {
  public:
    using ActivationGuard = std::function<bool()>;
    using StateCallback = std::function<void(CoordinatorState state)>;

    struct ActiveRecord {
        std::string active_instance_id;
        std::int64_t last_heartbeat = 0;
    };

    TabCoordinator(KeyValueStore &store, MessageBus &bus, Scheduler &scheduler,
                   FocusTarget &focus_target, const std::string &app_prefix = "task-tracker");
    ~TabCoordinator();

    TabCoordinator(const TabCoordinator &) = delete;
    TabCoordinator &operator=(const TabCoordinator &) = delete;

    void Start();
    void Stop();

    // False when a live peer holds the record: the caller must show the "already running"
    // surface instead of the application.
    bool CheckAndActivate();
    // False when the activation guard refused; nothing is written or announced then.
    bool BecomeActiveInstance();

    // Consulted before every activation. A host uses it to take resources that only one active
    // instance may hold.
    void SetActivationGuard(ActivationGuard guard);
    // Called after the coordinator becomes active or steps down to standby. Runs on the thread
    // that caused the change, without internal locks held.
    void SetStateCallback(StateCallback callback);

    void HandleMessage(const CoordinationMessage &msg);

    void OnVisibilityChanged(bool visible);
    void OnUnload();

    // Standby side of the "already running" surface.
    bool RequestFocus();
    bool Ping();
    void SetPongCallback(std::function<void(const std::string &instance_id)> callback);
    std::string LastPongFrom() const;

    bool IsActiveInstance() const;
    // False after CheckAndActivate() had to fail open for lack of a broadcast channel.
    bool IsCoordinated() const;
    CoordinatorState State() const;
    const std::string &InstanceId() const;

    std::optional<ActiveRecord> ReadActiveRecord();

  private:
    static std::string GenerateInstanceId(const std::string &app_prefix, std::int64_t now_ms);

    void WriteRecordLocked(std::int64_t now_ms);
    void WriteHeartbeatLocked(std::int64_t now_ms);
    void StopHeartbeatLocked();
    bool ClaimWins(const CoordinationMessage &msg) const;
    CoordinationMessage MakeMessage(MessageType type) const;
    void NotifyStateChanged(CoordinatorState state);

    KeyValueStore &m_Store;
    MessageBus &m_Bus;
    Scheduler &m_Scheduler;
    FocusTarget &m_FocusTarget;

    const std::string m_InstanceId;

    mutable std::mutex m_Mutex;
    CoordinatorState m_State = UNDECIDED;
    TimerHandle m_Heartbeat;
    std::int64_t m_ActivatedAt = 0;
    bool m_Started = false;
    bool m_Uncoordinated = false;
    std::string m_LastPongFrom;
    std::function<void(const std::string &)> m_PongCallback;
    ActivationGuard m_ActivationGuard;
    StateCallback m_StateCallback;

    // Shared with tasks queued on the scheduler. A task runs under the mutex and only while
    // alive is set; the destructor clears it under the same mutex.
    struct Lifetime {
        std::mutex mutex;
        bool alive = true;
    };
    std::shared_ptr<Lifetime> m_Lifetime = std::make_shared<Lifetime>();
};
