#pragma once

#include <memory>

class ProcessProbe {
  public:
    virtual ~ProcessProbe() = default;

    virtual bool IsAlive(int pid) const = 0;
    virtual bool TerminateGracefully(int pid) = 0;
    virtual bool TerminateForcefully(int pid) = 0;

    // Platforms without a polite termination request only offer TerminateForcefully().
    virtual bool SupportsGracefulTermination() const = 0;
};

#ifdef _WIN32
// OpenProcess / TerminateProcess. There is no graceful request, only a forceful one.
class WindowsProcessProbe : public ProcessProbe {
  public:
    bool IsAlive(int pid) const override;
    bool TerminateGracefully(int pid) override;
    bool TerminateForcefully(int pid) override;
    bool SupportsGracefulTermination() const override;
};
#else
// SIGTERM / SIGKILL, liveness through kill(pid, 0).
class PosixProcessProbe : public ProcessProbe {
  public:
    bool IsAlive(int pid) const override;
    bool TerminateGracefully(int pid) override;
    bool TerminateForcefully(int pid) override;
    bool SupportsGracefulTermination() const override;
};
#endif

std::unique_ptr<ProcessProbe> MakeProcessProbe();
