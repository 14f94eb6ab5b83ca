#include "dbus_bus.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstring>

namespace {
static constexpr const char *kIface = "org.instanceguard.Coordination";
static constexpr const char *kMember = "Message";
static constexpr const char *kPathPrefix = "/org/instanceguard/channel/";
} // namespace

// ─────────────────────────────────────
DBusMessageBus::DBusMessageBus(const std::string &channel)
    : m_Channel(channel), m_ObjectPath(ObjectPathForChannel(channel)) {
    m_MatchRule = std::string("type='signal',interface='") + kIface + "',member='" + kMember +
                  "',path='" + m_ObjectPath + "'";

    if (!Connect()) {
        return;
    }

    m_DispatchThread = std::thread([this]() { DispatchLoop(); });
}

// ─────────────────────────────────────
DBusMessageBus::~DBusMessageBus() {
    Close();
}

// ─────────────────────────────────────
std::string DBusMessageBus::ObjectPathForChannel(const std::string &channel) {
    // Object path elements only allow [A-Za-z0-9_].
    std::string element;
    for (char c : channel) {
        const auto uc = static_cast<unsigned char>(c);
        element += std::isalnum(uc) ? c : '_';
    }
    if (element.empty()) {
        element = "default";
    }
    return kPathPrefix + element;
}

// ─────────────────────────────────────
bool DBusMessageBus::Connect() {
    dbus_threads_init_default();

    DBusError err;
    dbus_error_init(&err);

    DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SESSION, &err);
    if (!conn) {
        if (dbus_error_is_set(&err)) {
            spdlog::warn("Coordination bus: DBus session connection failed: {}", err.message);
            dbus_error_free(&err);
        } else {
            spdlog::warn("Coordination bus: DBus session connection failed");
        }
        return false;
    }
    dbus_connection_set_exit_on_disconnect(conn, FALSE);

    dbus_bus_add_match(conn, m_MatchRule.c_str(), &err);
    if (dbus_error_is_set(&err)) {
        spdlog::warn("Coordination bus: add match failed: {}", err.message);
        dbus_error_free(&err);
        dbus_connection_close(conn);
        dbus_connection_unref(conn);
        return false;
    }
    dbus_connection_flush(conn);

    const char *unique = dbus_bus_get_unique_name(conn);
    m_UniqueName = unique ? unique : "";

    std::lock_guard<std::mutex> lock(m_ConnMutex);
    m_Conn = conn;
    spdlog::debug("Coordination bus connected as {} on {}", m_UniqueName, m_ObjectPath);
    return true;
}

// ─────────────────────────────────────
bool DBusMessageBus::IsAvailable() const {
    std::lock_guard<std::mutex> lock(m_ConnMutex);
    return m_Conn != nullptr && dbus_connection_get_is_connected(m_Conn);
}

// ─────────────────────────────────────
bool DBusMessageBus::Publish(const CoordinationMessage &msg) {
    std::lock_guard<std::mutex> lock(m_ConnMutex);
    if (!m_Conn) {
        return false;
    }

    DBusMessage *sig = dbus_message_new_signal(m_ObjectPath.c_str(), kIface, kMember);
    if (!sig) {
        spdlog::error("Coordination bus: failed to create DBus signal");
        return false;
    }

    const std::string payload = ToJson(msg).dump();
    const char *payload_c = payload.c_str();
    if (!dbus_message_append_args(sig, DBUS_TYPE_STRING, &payload_c, DBUS_TYPE_INVALID)) {
        spdlog::error("Coordination bus: out of memory building signal");
        dbus_message_unref(sig);
        return false;
    }

    const bool sent = dbus_connection_send(m_Conn, sig, nullptr);
    dbus_message_unref(sig);
    if (!sent) {
        spdlog::error("Coordination bus: failed to send DBus signal");
        return false;
    }
    dbus_connection_flush(m_Conn);
    spdlog::debug("Coordination bus: published {}", payload);
    return true;
}

// ─────────────────────────────────────
void DBusMessageBus::SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(m_HandlerMutex);
    m_Handler = std::move(handler);
}

// ─────────────────────────────────────
void DBusMessageBus::Close() {
    m_StopDispatch.store(true);
    if (m_DispatchThread.joinable()) {
        m_DispatchThread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_HandlerMutex);
        m_Handler = nullptr;
    }

    std::lock_guard<std::mutex> lock(m_ConnMutex);
    if (m_Conn) {
        dbus_bus_remove_match(m_Conn, m_MatchRule.c_str(), nullptr);
        dbus_connection_close(m_Conn);
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }
}

// ─────────────────────────────────────
void DBusMessageBus::DispatchLoop() {
    while (!m_StopDispatch.load()) {
        DBusConnection *conn = nullptr;
        {
            std::lock_guard<std::mutex> lock(m_ConnMutex);
            if (m_Conn) {
                conn = dbus_connection_ref(m_Conn);
            }
        }
        if (!conn) {
            return;
        }

        // Blocks for at most 200 ms so Close() is observed promptly.
        if (!dbus_connection_read_write(conn, 200)) {
            spdlog::warn("Coordination bus: DBus connection lost");
            dbus_connection_unref(conn);
            return;
        }

        DBusMessage *msg;
        while ((msg = dbus_connection_pop_message(conn)) != nullptr) {
            if (dbus_message_is_signal(msg, kIface, kMember)) {
                HandleSignal(msg);
            }
            dbus_message_unref(msg);
        }
        dbus_connection_unref(conn);
    }
}

// ─────────────────────────────────────
void DBusMessageBus::HandleSignal(DBusMessage *msg) {
    const char *sender = dbus_message_get_sender(msg);
    if (sender && m_UniqueName == sender) {
        return;
    }

    const char *path = dbus_message_get_path(msg);
    if (!path || m_ObjectPath != path) {
        return;
    }

    const char *payload = nullptr;
    DBusError err;
    dbus_error_init(&err);
    if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &payload, DBUS_TYPE_INVALID)) {
        spdlog::debug("Coordination bus: malformed signal: {}", err.message);
        dbus_error_free(&err);
        return;
    }

    auto parsed = m_JsonParse.TryParse(payload);
    if (!parsed) {
        return;
    }
    auto message = CoordinationMessageFromJson(*parsed);
    if (!message) {
        return;
    }

    Handler handler;
    {
        std::lock_guard<std::mutex> lock(m_HandlerMutex);
        handler = m_Handler;
    }
    if (handler) {
        handler(*message);
    }
}
