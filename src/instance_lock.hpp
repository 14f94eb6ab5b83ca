#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "focus_request.hpp"
#include "lock_file.hpp"
#include "process_probe.hpp"

// Server-side single instance lock: the coordination port plus the lock file. Holding the port
// is the primary signal; the lock file names the holder for the operator CLI.
class InstanceLock {
  public:
    // A lock file older than this is replaced even when its pid is alive (pid reuse).
    static constexpr std::int64_t kMaxLockAgeMs = 5 * 60 * 1000;

    InstanceLock(const Config &config, ProcessProbe &probe, std::ostream &out = std::cerr);
    ~InstanceLock();

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;

    // False when another live instance holds the port or a fresh lock file. Prints the duplicate
    // instance banner in that case.
    bool Acquire();
    void Release();
    bool IsLocked() const;
    unsigned Port() const;

    // Serves focus requests arriving on the coordination port. Requires a held lock.
    bool OnMessage(FocusRequestListener::Callback callback);

    // Asks the current holder to come forward.
    bool NotifyExistingInstance(const std::string &action = "focus");

    void PrintDuplicateInstanceWarning(std::ostream &out) const;

  private:
    bool IsLockFileActive();

    const Config &m_Config;
    ProcessProbe &m_Probe;
    std::ostream &m_Out;
    std::unique_ptr<FocusRequestListener> m_Listener;
    bool m_Locked = false;
};
