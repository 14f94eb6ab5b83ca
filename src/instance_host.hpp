#pragma once

#include <functional>
#include <mutex>

#include "instance_lock.hpp"
#include "scheduler.hpp"
#include "tab_coordinator.hpp"

// Ties a peer's coordinator to the server lock of its process: the lock is taken before the peer
// announces itself and given back when the peer steps down.
class InstanceHost {
  public:
    enum Outcome { HOST_ACTIVE = 0, HOST_STANDBY = 1, HOST_LOCK_REFUSED = 2 };

    // wake is called from whatever thread changed the coordinator state. When empty, Reconcile()
    // runs there directly; otherwise the owner is expected to call it from its own thread.
    InstanceHost(TabCoordinator &coordinator, InstanceLock &lock, Scheduler &scheduler,
                 std::function<void()> wake = nullptr);
    ~InstanceHost();

    InstanceHost(const InstanceHost &) = delete;
    InstanceHost &operator=(const InstanceHost &) = delete;

    Outcome Start();

    // Releases the lock once the coordinator is no longer active. Returns true when it did.
    bool Reconcile();

    // Called once, when this host ends up in standby.
    void SetStandbyCallback(std::function<void()> callback);

    bool IsServing() const;

  private:
    bool AcquireLock();
    void ServeFocusRequests();
    void EnterStandby();

    TabCoordinator &m_Coordinator;
    InstanceLock &m_Lock;
    Scheduler &m_Scheduler;
    std::function<void()> m_Wake;
    std::function<void()> m_StandbyCallback;

    mutable std::mutex m_Mutex;
    bool m_LockRefused = false;
    bool m_Standby = false;
};
