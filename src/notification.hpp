#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <cstdint>
#include <string>

// freedesktop Notifications client. Consecutive notices replace each other instead of stacking,
// and a notice arriving within kMinInterval of the previous one is dropped.
class Notification {
  public:
    static constexpr std::chrono::milliseconds kMinInterval{3000};

    Notification();
    ~Notification();

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    bool IsAvailable() const;
    bool SendNotification(const std::string &icon, const std::string &summary,
                          const std::string &body);

  private:
    DBusMessage *BuildNotify(const std::string &icon, const std::string &summary,
                             const std::string &body);

    DBusConnection *m_Conn = nullptr;
    std::uint32_t m_LastId = 0;
    std::chrono::steady_clock::time_point m_LastSent{};
    bool m_Sent = false;
};
