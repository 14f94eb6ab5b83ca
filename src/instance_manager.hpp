#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "config.hpp"
#include "lock_file.hpp"
#include "process_probe.hpp"

struct InstanceInfo {
    LockRecord record;
    bool is_running = false;
    std::int64_t lock_age_ms = 0;
};

// Operator side: inspects, terminates and focuses the server instance named by the lock file.
// Everything a person should read goes to the output stream; diagnostics go to spdlog.
class ProcessInstanceManager {
  public:
    ProcessInstanceManager(const Config &config, ProcessProbe &probe, std::ostream &out = std::cout);

    std::optional<InstanceInfo> GetCurrentInstance();

    // True only when a running instance was terminated.
    bool KillAllInstances();
    bool CleanupStaleFiles();
    void ShowStatus();
    bool FocusInstance();
    void ShowHelp();

    // status | check | kill | terminate | cleanup | focus | help. Always returns 0.
    int Run(const std::string &command);

  private:
    bool WaitForExit(int pid);

    const Config &m_Config;
    ProcessProbe &m_Probe;
    std::ostream &m_Out;
};
