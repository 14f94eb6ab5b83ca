#pragma once

#include <optional>
#include <string>

#include "niri.hpp"
#include "notification.hpp"

// What an active peer does when another peer asks it to come forward.
class FocusTarget {
  public:
    virtual ~FocusTarget() = default;

    virtual bool BringToFront() = 0;
    virtual void NotifyAlreadyRunning() = 0;
};

// Remembers the window that hosted this process at startup and raises it through the
// compositor; the "already running" notice goes through desktop notifications.
class Window : public FocusTarget {
  public:
    Window();

    bool BringToFront() override;
    void NotifyAlreadyRunning() override;
    bool IsAvailable() const;

  private:
    NiriIPC m_Niri;
    Notification m_Notification;
    std::optional<int> m_WindowId;
};
