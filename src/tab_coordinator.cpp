#include "tab_coordinator.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdio>
#include <random>

// ─────────────────────────────────────
TabCoordinator::TabCoordinator(KeyValueStore &store, MessageBus &bus, Scheduler &scheduler,
                               FocusTarget &focus_target, const std::string &app_prefix)
    : m_Store(store), m_Bus(bus), m_Scheduler(scheduler), m_FocusTarget(focus_target),
      m_InstanceId(GenerateInstanceId(app_prefix, scheduler.NowMs())) {
    spdlog::debug("TabCoordinator created: {}", m_InstanceId);
}

// ─────────────────────────────────────
TabCoordinator::~TabCoordinator() {
    {
        std::lock_guard<std::mutex> guard(m_Lifetime->mutex);
        m_Lifetime->alive = false;
    }
    Stop();
}

// ─────────────────────────────────────
std::string TabCoordinator::GenerateInstanceId(const std::string &app_prefix,
                                               std::int64_t now_ms) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    char salt[17];
    std::snprintf(salt, sizeof(salt), "%016llx", static_cast<unsigned long long>(rng()));
    return app_prefix + "-" + std::to_string(now_ms) + "-" + salt;
}

// ─────────────────────────────────────
void TabCoordinator::Start() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_Started) {
            return;
        }
        m_Started = true;
    }

    auto lifetime = m_Lifetime;
    m_Bus.SetHandler([this, lifetime](const CoordinationMessage &msg) {
        m_Scheduler.Post([this, lifetime, msg]() {
            std::lock_guard<std::mutex> guard(lifetime->mutex);
            if (!lifetime->alive) {
                return;
            }
            HandleMessage(msg);
        });
    });
}

// ─────────────────────────────────────
void TabCoordinator::Stop() {
    bool wasStarted = false;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        StopHeartbeatLocked();
        wasStarted = m_Started;
        m_Started = false;
    }
    if (wasStarted) {
        m_Bus.SetHandler(nullptr);
    }
}

// ─────────────────────────────────────
bool TabCoordinator::CheckAndActivate() {
    if (!m_Bus.IsAvailable()) {
        spdlog::warn("Broadcast channel unavailable, running without instance coordination");
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Uncoordinated = true;
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State == ACTIVE) {
            return true;
        }
    }

    auto record = ReadActiveRecord();
    if (record && record->active_instance_id != m_InstanceId) {
        const std::int64_t age = m_Scheduler.NowMs() - record->last_heartbeat;
        if (age < STALE_THRESHOLD_MS) {
            spdlog::info("Another instance is already running ({}, heartbeat {} ms ago)",
                         record->active_instance_id, age);
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_State = STANDBY;
            return false;
        }
        spdlog::warn("Stale active record from {} (heartbeat {} ms ago), taking over",
                     record->active_instance_id, age);
    }

    return BecomeActiveInstance();
}

// ─────────────────────────────────────
bool TabCoordinator::BecomeActiveInstance() {
    ActivationGuard activationGuard;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        activationGuard = m_ActivationGuard;
    }
    if (activationGuard && !activationGuard()) {
        spdlog::warn("Activation of {} refused, staying in standby", m_InstanceId);
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_State = STANDBY;
        return false;
    }

    CoordinationMessage announce;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        const std::int64_t now = m_Scheduler.NowMs();

        StopHeartbeatLocked();
        m_State = ACTIVE;
        m_ActivatedAt = now;
        m_Uncoordinated = false;
        WriteRecordLocked(now);

        auto lifetime = m_Lifetime;
        m_Heartbeat = m_Scheduler.ScheduleRepeating(
            std::chrono::milliseconds(HEARTBEAT_INTERVAL_MS), [this, lifetime]() {
                std::lock_guard<std::mutex> guard(lifetime->mutex);
                if (!lifetime->alive) {
                    return;
                }
                std::lock_guard<std::mutex> lock(m_Mutex);
                if (m_State == ACTIVE) {
                    // Rewrites the id too, in case a peer that lost a race wrote last.
                    WriteRecordLocked(m_Scheduler.NowMs());
                }
            });

        announce.type = MessageType::InstanceActivated;
        announce.instance_id = m_InstanceId;
        announce.timestamp = now;
    }

    if (!m_Bus.Publish(announce)) {
        spdlog::warn("Failed to announce activation of {}", m_InstanceId);
    }
    spdlog::info("This instance is now active: {}", m_InstanceId);
    NotifyStateChanged(ACTIVE);
    return true;
}

// ─────────────────────────────────────
bool TabCoordinator::ClaimWins(const CoordinationMessage &msg) const {
    // The later activation wins; equal timestamps fall back to the larger id.
    if (msg.timestamp != m_ActivatedAt) {
        return msg.timestamp > m_ActivatedAt;
    }
    return msg.instance_id > m_InstanceId;
}

// ─────────────────────────────────────
void TabCoordinator::HandleMessage(const CoordinationMessage &msg) {
    spdlog::debug("{} received {} from {}", m_InstanceId, MessageTypeName(msg.type),
                  msg.instance_id);

    switch (msg.type) {
    case MessageType::InstanceActivated: {
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (msg.instance_id == m_InstanceId || m_State != ACTIVE) {
                return;
            }
            if (!ClaimWins(msg)) {
                // The competing peer steps down when it sees our announcement; make sure the
                // record names the survivor whichever write landed last.
                spdlog::info("Ignoring older activation from {}, keeping {}", msg.instance_id,
                             m_InstanceId);
                WriteRecordLocked(m_Scheduler.NowMs());
                return;
            }
            StopHeartbeatLocked();
            m_State = STANDBY;
            spdlog::info("Instance {} took over, {} is no longer active", msg.instance_id,
                         m_InstanceId);
        }
        NotifyStateChanged(STANDBY);
        return;
    }

    case MessageType::Ping: {
        if (!IsActiveInstance()) {
            return;
        }
        if (!m_Bus.Publish(MakeMessage(MessageType::Pong))) {
            spdlog::warn("Failed to answer ping from {}", msg.instance_id);
        }
        return;
    }

    case MessageType::Pong: {
        std::function<void(const std::string &)> callback;
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_LastPongFrom = msg.instance_id;
            callback = m_PongCallback;
        }
        if (callback) {
            callback(msg.instance_id);
        }
        return;
    }

    case MessageType::RequestFocus: {
        if (!IsActiveInstance()) {
            return;
        }
        spdlog::info("Focus requested by {}", msg.instance_id);
        if (!m_FocusTarget.BringToFront()) {
            spdlog::debug("Could not raise window, notifying only");
        }
        m_FocusTarget.NotifyAlreadyRunning();
        return;
    }
    }
}

// ─────────────────────────────────────
void TabCoordinator::OnVisibilityChanged(bool visible) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (visible && m_State == ACTIVE) {
        WriteHeartbeatLocked(m_Scheduler.NowMs());
    }
}

// ─────────────────────────────────────
void TabCoordinator::OnUnload() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_State == ACTIVE) {
            const bool removedId = m_Store.Remove(kActiveInstanceKey);
            const bool removedHeartbeat = m_Store.Remove(kLastHeartbeatKey);
            if (removedId && removedHeartbeat) {
                spdlog::info("Released active record of {}", m_InstanceId);
            } else {
                spdlog::error("Failed to release active record of {}", m_InstanceId);
            }
        }
        StopHeartbeatLocked();
        m_State = UNDECIDED;
    }
    Stop();
}

// ─────────────────────────────────────
void TabCoordinator::SetActivationGuard(ActivationGuard guard) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_ActivationGuard = std::move(guard);
}

// ─────────────────────────────────────
void TabCoordinator::SetStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_StateCallback = std::move(callback);
}

// ─────────────────────────────────────
void TabCoordinator::NotifyStateChanged(CoordinatorState state) {
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        callback = m_StateCallback;
    }
    if (callback) {
        callback(state);
    }
}

// ─────────────────────────────────────
bool TabCoordinator::RequestFocus() {
    return m_Bus.Publish(MakeMessage(MessageType::RequestFocus));
}

// ─────────────────────────────────────
bool TabCoordinator::Ping() {
    return m_Bus.Publish(MakeMessage(MessageType::Ping));
}

// ─────────────────────────────────────
void TabCoordinator::SetPongCallback(std::function<void(const std::string &)> callback) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_PongCallback = std::move(callback);
}

// ─────────────────────────────────────
std::string TabCoordinator::LastPongFrom() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_LastPongFrom;
}

// ─────────────────────────────────────
bool TabCoordinator::IsActiveInstance() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_State == ACTIVE;
}

// ─────────────────────────────────────
bool TabCoordinator::IsCoordinated() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return !m_Uncoordinated;
}

// ─────────────────────────────────────
CoordinatorState TabCoordinator::State() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_State;
}

// ─────────────────────────────────────
const std::string &TabCoordinator::InstanceId() const {
    return m_InstanceId;
}

// ─────────────────────────────────────
std::optional<TabCoordinator::ActiveRecord> TabCoordinator::ReadActiveRecord() {
    auto activeId = m_Store.Get(kActiveInstanceKey);
    auto heartbeat = m_Store.Get(kLastHeartbeatKey);
    if (!activeId || !heartbeat || activeId->empty() || heartbeat->empty()) {
        return std::nullopt;
    }

    std::int64_t value = 0;
    const char *begin = heartbeat->data();
    const char *end = begin + heartbeat->size();
    auto [ptr, err] = std::from_chars(begin, end, value);
    if (err != std::errc() || ptr != end) {
        spdlog::warn("Ignoring malformed heartbeat value '{}'", *heartbeat);
        return std::nullopt;
    }

    spdlog::debug("Active record: {} at {}", *activeId, value);
    return ActiveRecord{*activeId, value};
}

// ─────────────────────────────────────
void TabCoordinator::WriteRecordLocked(std::int64_t now_ms) {
    if (!m_Store.Set(kActiveInstanceKey, m_InstanceId)) {
        spdlog::error("Failed to store active instance id");
    }
    WriteHeartbeatLocked(now_ms);
}

// ─────────────────────────────────────
void TabCoordinator::WriteHeartbeatLocked(std::int64_t now_ms) {
    if (!m_Store.Set(kLastHeartbeatKey, std::to_string(now_ms))) {
        spdlog::error("Failed to store heartbeat");
        return;
    }
    spdlog::debug("Heartbeat {} at {}", m_InstanceId, now_ms);
}

// ─────────────────────────────────────
void TabCoordinator::StopHeartbeatLocked() {
    if (m_Heartbeat.IsPending()) {
        m_Heartbeat.Cancel();
    }
    m_Heartbeat = TimerHandle();
}

// ─────────────────────────────────────
CoordinationMessage TabCoordinator::MakeMessage(MessageType type) const {
    CoordinationMessage msg;
    msg.type = type;
    msg.instance_id = m_InstanceId;
    msg.timestamp = m_Scheduler.NowMs();
    return msg;
}
