#include "window.hpp"

#include "common.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Window::Window() {
    if (!m_Niri.IsAvailable()) {
        spdlog::info("No supported compositor (NIRI_SOCKET unset), focus requests only notify");
        return;
    }

    m_WindowId = m_Niri.FocusedWindowId();
    if (m_WindowId) {
        spdlog::info("Window manager detected: NIRI, host window id {}", *m_WindowId);
    } else {
        spdlog::warn("NIRI detected but no focused window to remember");
    }
}

// ─────────────────────────────────────
bool Window::IsAvailable() const {
    return m_WindowId.has_value();
}

// ─────────────────────────────────────
bool Window::BringToFront() {
    if (!m_WindowId) {
        spdlog::debug("BringToFront: no host window known");
        return false;
    }
    if (!m_Niri.FocusWindow(*m_WindowId)) {
        spdlog::warn("Failed to focus host window {}", *m_WindowId);
        return false;
    }
    spdlog::info("Focused host window {}", *m_WindowId);
    return true;
}

// ─────────────────────────────────────
void Window::NotifyAlreadyRunning() {
    if (!m_Notification.SendNotification("dialog-information", kAppName,
                                         "Application is already running in this window.")) {
        spdlog::debug("Already-running notice not shown");
    }
}
