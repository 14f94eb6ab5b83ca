#pragma once

#include <dbus/dbus.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "json.hpp"
#include "message_bus.hpp"

// MessageBus over DBus session-bus signals. Each message travels as one JSON string argument of
// the org.instanceguard.Coordination.Message signal, emitted on an object path derived from the
// channel name. DBus keeps per-connection ordering, which gives FIFO delivery per sender.
class DBusMessageBus : public MessageBus {
  public:
    explicit DBusMessageBus(const std::string &channel);
    ~DBusMessageBus() override;

    DBusMessageBus(const DBusMessageBus &) = delete;
    DBusMessageBus &operator=(const DBusMessageBus &) = delete;

    bool IsAvailable() const override;
    bool Publish(const CoordinationMessage &msg) override;
    void SetHandler(Handler handler) override;
    void Close() override;

    static std::string ObjectPathForChannel(const std::string &channel);

  private:
    bool Connect();
    void DispatchLoop();
    void HandleSignal(DBusMessage *msg);

    std::string m_Channel;
    std::string m_ObjectPath;
    std::string m_MatchRule;
    std::string m_UniqueName;

    DBusConnection *m_Conn = nullptr;
    mutable std::mutex m_ConnMutex;

    std::mutex m_HandlerMutex;
    Handler m_Handler;

    std::atomic<bool> m_StopDispatch{false};
    std::thread m_DispatchThread;
    JsonParse m_JsonParse;
};
