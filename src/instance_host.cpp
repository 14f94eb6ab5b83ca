#include "instance_host.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
InstanceHost::InstanceHost(TabCoordinator &coordinator, InstanceLock &lock, Scheduler &scheduler,
                           std::function<void()> wake)
    : m_Coordinator(coordinator), m_Lock(lock), m_Scheduler(scheduler), m_Wake(std::move(wake)) {}

// ─────────────────────────────────────
InstanceHost::~InstanceHost() {
    m_Coordinator.SetActivationGuard(nullptr);
    m_Coordinator.SetStateCallback(nullptr);
}

// ─────────────────────────────────────
InstanceHost::Outcome InstanceHost::Start() {
    m_Coordinator.SetActivationGuard([this]() { return AcquireLock(); });
    m_Coordinator.SetStateCallback([this](CoordinatorState state) {
        if (state != STANDBY) {
            return;
        }
        if (m_Wake) {
            m_Wake();
        } else {
            Reconcile();
        }
    });

    if (!m_Coordinator.CheckAndActivate()) {
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_LockRefused) {
                return HOST_LOCK_REFUSED;
            }
        }
        EnterStandby();
        return HOST_STANDBY;
    }

    // Without a broadcast channel the coordinator fails open and never consults the guard.
    if (!AcquireLock()) {
        return HOST_LOCK_REFUSED;
    }
    ServeFocusRequests();
    return HOST_ACTIVE;
}

// ─────────────────────────────────────
bool InstanceHost::AcquireLock() {
    if (m_Lock.Acquire()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_LockRefused = true;
    return false;
}

// ─────────────────────────────────────
void InstanceHost::ServeFocusRequests() {
    TabCoordinator &coordinator = m_Coordinator;
    Scheduler &scheduler = m_Scheduler;
    const bool listening = m_Lock.OnMessage([&coordinator, &scheduler](const FocusRequest &request) {
        if (request.action != "focus") {
            spdlog::warn("Unsupported instance action '{}'", request.action);
            return;
        }
        CoordinationMessage msg;
        msg.type = MessageType::RequestFocus;
        msg.instance_id = "coordination-port";
        msg.timestamp = request.timestamp;
        scheduler.Post([&coordinator, msg]() { coordinator.HandleMessage(msg); });
    });
    if (!listening) {
        spdlog::warn("Focus requests from the command line will not be served");
    }
}

// ─────────────────────────────────────
bool InstanceHost::Reconcile() {
    if (m_Coordinator.State() != STANDBY) {
        return false;
    }
    const bool wasServing = m_Lock.IsLocked();
    if (wasServing) {
        spdlog::info("{} stepped down, releasing the server lock", m_Coordinator.InstanceId());
        m_Lock.Release();
    }
    EnterStandby();
    return wasServing;
}

// ─────────────────────────────────────
void InstanceHost::SetStandbyCallback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_StandbyCallback = std::move(callback);
}

// ─────────────────────────────────────
bool InstanceHost::IsServing() const {
    return m_Lock.IsLocked();
}

// ─────────────────────────────────────
void InstanceHost::EnterStandby() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_Standby) {
            return;
        }
        m_Standby = true;
        callback = m_StandbyCallback;
    }
    if (callback) {
        callback();
    }
}
