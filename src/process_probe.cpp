#include "process_probe.hpp"

#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <signal.h>
#include <sys/types.h>
#endif

#ifdef _WIN32
// ─────────────────────────────────────
bool WindowsProcessProbe::IsAlive(int pid) const {
    if (pid <= 0) {
        return false;
    }
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == nullptr) {
        // Access denied still means the process is there.
        return GetLastError() == ERROR_ACCESS_DENIED;
    }
    DWORD exitCode = 0;
    const BOOL ok = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);
    return ok && exitCode == STILL_ACTIVE;
}

// ─────────────────────────────────────
bool WindowsProcessProbe::TerminateGracefully(int pid) {
    return TerminateForcefully(pid);
}

// ─────────────────────────────────────
bool WindowsProcessProbe::TerminateForcefully(int pid) {
    if (pid <= 0) {
        return false;
    }
    HANDLE process = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
    if (process == nullptr) {
        spdlog::error("Cannot open process {}: error {}", pid, GetLastError());
        return false;
    }
    const BOOL ok = TerminateProcess(process, 1);
    if (!ok) {
        spdlog::error("TerminateProcess({}) failed: error {}", pid, GetLastError());
    }
    CloseHandle(process);
    return ok != FALSE;
}

// ─────────────────────────────────────
bool WindowsProcessProbe::SupportsGracefulTermination() const {
    return false;
}

// ─────────────────────────────────────
std::unique_ptr<ProcessProbe> MakeProcessProbe() {
    return std::make_unique<WindowsProcessProbe>();
}

#else
// ─────────────────────────────────────
bool PosixProcessProbe::IsAlive(int pid) const {
    // pid 0 and negative pids address process groups, never a single instance.
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    // EPERM: the process exists but belongs to someone else.
    return errno == EPERM;
}

// ─────────────────────────────────────
bool PosixProcessProbe::TerminateGracefully(int pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), SIGTERM) != 0) {
        spdlog::error("SIGTERM to {} failed: {}", pid, std::strerror(errno));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool PosixProcessProbe::TerminateForcefully(int pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
        spdlog::error("SIGKILL to {} failed: {}", pid, std::strerror(errno));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool PosixProcessProbe::SupportsGracefulTermination() const {
    return true;
}

// ─────────────────────────────────────
std::unique_ptr<ProcessProbe> MakeProcessProbe() {
    return std::make_unique<PosixProcessProbe>();
}
#endif
