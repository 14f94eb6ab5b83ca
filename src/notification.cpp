#include "notification.hpp"

#include "common.hpp"

#include <spdlog/spdlog.h>

namespace {
constexpr int kReplyTimeoutMs = 500;
constexpr std::int32_t kExpireTimeoutMs = 3000;
constexpr unsigned char kUrgencyNormal = 1;
} // namespace

// ─────────────────────────────────────
Notification::Notification() {
    DBusError err;
    dbus_error_init(&err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err) || !m_Conn) {
        spdlog::warn("Notifications unavailable, no session bus: {}",
                     err.message ? err.message : "unknown error");
        dbus_error_free(&err);
        m_Conn = nullptr;
        return;
    }
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }
}

// ─────────────────────────────────────
bool Notification::IsAvailable() const {
    return m_Conn != nullptr;
}

// ─────────────────────────────────────
DBusMessage *Notification::BuildNotify(const std::string &icon, const std::string &summary,
                                       const std::string &body) {
    DBusMessage *msg = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                    "/org/freedesktop/Notifications",
                                                    "org.freedesktop.Notifications", "Notify");
    if (!msg) {
        return nullptr;
    }

    const char *appName = kAppName;
    const char *iconC = icon.c_str();
    const char *summaryC = summary.c_str();
    const char *bodyC = body.c_str();
    std::uint32_t replacesId = m_LastId;
    std::int32_t expire = kExpireTimeoutMs;

    DBusMessageIter args;
    dbus_message_iter_init_append(msg, &args);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &appName);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replacesId);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &iconC);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summaryC);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &bodyC);

    // No actions.
    DBusMessageIter actions;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &actions);
    dbus_message_iter_close_container(&args, &actions);

    // hints: {"urgency": byte}
    DBusMessageIter hints;
    DBusMessageIter entry;
    DBusMessageIter variant;
    const char *urgencyKey = "urgency";
    unsigned char urgency = kUrgencyNormal;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &hints);
    dbus_message_iter_open_container(&hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &urgencyKey);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "y", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BYTE, &urgency);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(&hints, &entry);
    dbus_message_iter_close_container(&args, &hints);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &expire);
    return msg;
}

// ─────────────────────────────────────
bool Notification::SendNotification(const std::string &icon, const std::string &summary,
                                    const std::string &body) {
    if (!m_Conn) {
        return false;
    }

    const auto now = std::chrono::steady_clock::now();
    if (m_Sent && now - m_LastSent < kMinInterval) {
        spdlog::debug("Notification skipped: rate limit exceeded");
        return false;
    }

    DBusMessage *msg = BuildNotify(icon, summary, body);
    if (!msg) {
        spdlog::error("Failed to create DBus message");
        return false;
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage *reply =
        dbus_connection_send_with_reply_and_block(m_Conn, msg, kReplyTimeoutMs, &err);
    dbus_message_unref(msg);
    if (!reply) {
        spdlog::warn("Notification not delivered: {}", err.message ? err.message : "no reply");
        dbus_error_free(&err);
        return false;
    }

    std::uint32_t id = 0;
    if (dbus_message_get_args(reply, &err, DBUS_TYPE_UINT32, &id, DBUS_TYPE_INVALID)) {
        m_LastId = id;
    } else {
        spdlog::debug("Notify reply without id: {}", err.message ? err.message : "");
        dbus_error_free(&err);
    }
    dbus_message_unref(reply);

    m_LastSent = now;
    m_Sent = true;
    spdlog::debug("Notification {} shown: {}", m_LastId, summary);
    return true;
}
