#include "instance_lock.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

// ─────────────────────────────────────
InstanceLock::InstanceLock(const Config &config, ProcessProbe &probe, std::ostream &out)
    : m_Config(config), m_Probe(probe), m_Out(out) {}

// ─────────────────────────────────────
InstanceLock::~InstanceLock() {
    Release();
}

// ─────────────────────────────────────
bool InstanceLock::Acquire() {
    if (m_Locked) {
        return true;
    }

    auto listener = std::make_unique<FocusRequestListener>(m_Config.coordination_port);
    const auto bind = listener->Bind();
    if (bind != FocusRequestListener::BindResult::Bound) {
        if (bind == FocusRequestListener::BindResult::AddressInUse) {
            spdlog::info("Another instance detected via port {}", m_Config.coordination_port);
        } else {
            spdlog::error("Could not bind coordination port {}", m_Config.coordination_port);
        }
        PrintDuplicateInstanceWarning(m_Out);
        return false;
    }

    if (IsLockFileActive()) {
        spdlog::info("Another instance detected via lock file {}", m_Config.lock_file.string());
        PrintDuplicateInstanceWarning(m_Out);
        return false;
    }

    LockRecord record;
    record.pid = static_cast<int>(::getpid());
    record.timestamp = NowEpochMs();
    record.start_time = ToIso8601(record.timestamp);
    record.version = m_Config.version;
    if (!WriteLockFile(m_Config.lock_file, record)) {
        return false;
    }

    m_Listener = std::move(listener);
    m_Locked = true;
    spdlog::info("Single instance lock acquired (pid {})", record.pid);
    return true;
}

// ─────────────────────────────────────
bool InstanceLock::IsLockFileActive() {
    std::error_code ec;
    if (!std::filesystem::exists(m_Config.lock_file, ec)) {
        return false;
    }

    auto record = ReadLockFile(m_Config.lock_file);
    if (record && m_Probe.IsAlive(record->pid)) {
        const std::int64_t age = NowEpochMs() - record->timestamp;
        if (age < kMaxLockAgeMs) {
            return true;
        }
        spdlog::warn("Stale lock file detected (age: {} ms), removing", age);
    } else if (record) {
        spdlog::info("Lock file exists but pid {} is not running, removing", record->pid);
    }

    // Unreadable files are stale as well.
    return !RemoveFileIfExists(m_Config.lock_file);
}

// ─────────────────────────────────────
void InstanceLock::Release() {
    if (!m_Locked) {
        return;
    }
    m_Listener.reset();

    bool removed = false;
    if (RemoveFileIfExists(m_Config.lock_file, &removed) && removed) {
        spdlog::debug("Lock file removed");
    }
    m_Locked = false;
    spdlog::info("Single instance lock released");
}

// ─────────────────────────────────────
bool InstanceLock::IsLocked() const {
    return m_Locked;
}

// ─────────────────────────────────────
unsigned InstanceLock::Port() const {
    return m_Listener ? m_Listener->Port() : m_Config.coordination_port;
}

// ─────────────────────────────────────
bool InstanceLock::OnMessage(FocusRequestListener::Callback callback) {
    if (!m_Locked || !m_Listener) {
        spdlog::error("Cannot listen for instance messages without holding the lock");
        return false;
    }
    m_Listener->Start(std::move(callback));
    return true;
}

// ─────────────────────────────────────
bool InstanceLock::NotifyExistingInstance(const std::string &action) {
    FocusRequest request;
    request.action = action;
    request.timestamp = NowEpochMs();
    if (!SendFocusRequest("127.0.0.1", m_Config.coordination_port, request)) {
        return false;
    }
    spdlog::info("Notified existing instance");
    return true;
}

// ─────────────────────────────────────
void InstanceLock::PrintDuplicateInstanceWarning(std::ostream &out) const {
    out << "+--------------------------------------------------------------+\n";
    out << "|                 DUPLICATE INSTANCE DETECTED                  |\n";
    out << "+--------------------------------------------------------------+\n";
    out << "  Another instance of " << kAppName << " is already running!\n";

    if (auto record = ReadLockFile(m_Config.lock_file)) {
        const std::int64_t uptime = (NowEpochMs() - record->timestamp) / 1000;
        out << "  - PID: " << record->pid << "\n";
        out << "  - Started: " << ToIso8601(record->timestamp) << "\n";
        out << "  - Uptime: " << uptime << "s\n";
    }

    out << "\n";
    out << "  To manage instances, use these commands:\n";
    out << "    instances status   - Check running instances\n";
    out << "    instances kill     - Terminate all instances\n";
    out << "    instances cleanup  - Clean up stale files\n";
    out << "    instances focus    - Focus existing instance\n";
    out << "+--------------------------------------------------------------+\n";
}
