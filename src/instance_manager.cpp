#include "instance_manager.hpp"

#include "focus_request.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace {
constexpr std::chrono::milliseconds kExitPollInterval{100};
}

// ─────────────────────────────────────
ProcessInstanceManager::ProcessInstanceManager(const Config &config, ProcessProbe &probe,
                                               std::ostream &out)
    : m_Config(config), m_Probe(probe), m_Out(out) {}

// ─────────────────────────────────────
std::optional<InstanceInfo> ProcessInstanceManager::GetCurrentInstance() {
    auto record = ReadLockFile(m_Config.lock_file);
    if (!record) {
        return std::nullopt;
    }

    InstanceInfo info;
    info.record = *record;
    info.is_running = m_Probe.IsAlive(record->pid);
    info.lock_age_ms = NowEpochMs() - record->timestamp;
    spdlog::debug("Lock file names pid {} ({}), age {} ms", record->pid,
                  info.is_running ? "alive" : "gone", info.lock_age_ms);
    return info;
}

// ─────────────────────────────────────
bool ProcessInstanceManager::WaitForExit(int pid) {
    const auto deadline = std::chrono::steady_clock::now() + m_Config.grace_period;
    while (m_Probe.IsAlive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }
    return true;
}

// ─────────────────────────────────────
bool ProcessInstanceManager::KillAllInstances() {
    auto instance = GetCurrentInstance();
    if (!instance) {
        m_Out << "No running instances found\n";
        return false;
    }

    const int pid = instance->record.pid;
    if (!instance->is_running) {
        m_Out << "No active instances found (stale lock file detected)\n";
        CleanupStaleFiles();
        return false;
    }

    m_Out << "Terminating instance (PID: " << pid << ")...\n";

    if (m_Probe.SupportsGracefulTermination()) {
        if (!m_Probe.TerminateGracefully(pid)) {
            m_Out << "Failed to terminate instance " << pid << "\n";
            return false;
        }
        if (!WaitForExit(pid)) {
            spdlog::warn("Instance {} still alive after {} ms, forcing termination", pid,
                         m_Config.grace_period.count());
            // kill() fails with ESRCH when the process exited after the last poll.
            if (!m_Probe.TerminateForcefully(pid) && m_Probe.IsAlive(pid)) {
                m_Out << "Failed to terminate instance " << pid << "\n";
                return false;
            }
        }
    } else if (!m_Probe.TerminateForcefully(pid) && m_Probe.IsAlive(pid)) {
        m_Out << "Failed to terminate instance " << pid << "\n";
        return false;
    }

    m_Out << "Instance terminated successfully\n";
    spdlog::info("Terminated instance {}", pid);
    CleanupStaleFiles();
    return true;
}

// ─────────────────────────────────────
bool ProcessInstanceManager::CleanupStaleFiles() {
    bool removed = false;
    bool ok = RemoveFileIfExists(m_Config.lock_file, &removed);
    if (removed) {
        m_Out << "Cleaned up lock file\n";
        spdlog::info("Removed {}", m_Config.lock_file.string());
    }

    removed = false;
    ok = RemoveFileIfExists(m_Config.port_config, &removed) && ok;
    if (removed) {
        m_Out << "Cleaned up port config\n";
        spdlog::info("Removed {}", m_Config.port_config.string());
    }

    if (!ok) {
        m_Out << "Failed to cleanup files\n";
    }
    return ok;
}

// ─────────────────────────────────────
void ProcessInstanceManager::ShowStatus() {
    m_Out << kAppName << " Instance Status\n";
    m_Out << "=====================================\n";

    auto instance = GetCurrentInstance();
    if (!instance) {
        m_Out << "No instances currently running\n";
        m_Out << "You can safely start a new instance\n";
        return;
    }

    const LockRecord &record = instance->record;
    m_Out << "Instance found:\n";
    m_Out << "   PID: " << record.pid << "\n";
    m_Out << "   Started: " << record.start_time << "\n";
    m_Out << "   Version: " << record.version << "\n";
    m_Out << "   Uptime: " << instance->lock_age_ms / 1000 << "s\n";
    m_Out << "   Status: " << (instance->is_running ? "Running" : "Not running (stale)") << "\n";

    if (!instance->is_running) {
        m_Out << "Stale lock file detected - run \"cleanup\" to remove it\n";
    }
}

// ─────────────────────────────────────
bool ProcessInstanceManager::FocusInstance() {
    auto instance = GetCurrentInstance();
    if (!instance || !instance->is_running) {
        m_Out << "No running instance to focus\n";
        return false;
    }

    FocusRequest request;
    request.timestamp = NowEpochMs();
    if (!SendFocusRequest("127.0.0.1", m_Config.coordination_port, request)) {
        m_Out << "Failed to communicate with existing instance\n";
        return false;
    }
    m_Out << "Sent focus command to existing instance\n";
    return true;
}

// ─────────────────────────────────────
void ProcessInstanceManager::ShowHelp() {
    m_Out << kAppName << " Instance Manager\n";
    m_Out << "Usage: instances <command>\n\n";
    m_Out << "Commands:\n";
    m_Out << "  status    - Show current instance status\n";
    m_Out << "  kill      - Terminate all running instances\n";
    m_Out << "  cleanup   - Clean up stale lock files\n";
    m_Out << "  focus     - Send focus command to existing instance\n";
    m_Out << "  help      - Show this help message\n";
}

// ─────────────────────────────────────
int ProcessInstanceManager::Run(const std::string &command) {
    if (command == "status" || command == "check") {
        ShowStatus();
    } else if (command == "kill" || command == "terminate") {
        KillAllInstances();
    } else if (command == "cleanup") {
        if (CleanupStaleFiles()) {
            m_Out << "Cleanup completed\n";
        }
    } else if (command == "focus") {
        FocusInstance();
    } else if (command == "help" || command == "--help" || command == "-h") {
        ShowHelp();
    } else {
        m_Out << "Checking instance status...\n\n";
        ShowStatus();
        m_Out << "\nUse \"instances help\" for more options\n";
    }
    return 0;
}
