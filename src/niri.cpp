#include "niri.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// ─────────────────────────────────────
NiriIPC::NiriIPC() : m_SocketPath(GetEnvSocketPath()) {}

// ─────────────────────────────────────
NiriIPC::~NiriIPC() {
    Disconnect();
}

// ─────────────────────────────────────
std::string NiriIPC::GetEnvSocketPath() {
    const char *env = std::getenv("NIRI_SOCKET");
    if (env == nullptr) {
        return {};
    }
    return std::string(env);
}

// ─────────────────────────────────────
bool NiriIPC::IsAvailable() const {
    return !m_SocketPath.empty();
}

// ─────────────────────────────────────
bool NiriIPC::Connect() {
    if (!IsAvailable()) {
        return false;
    }

    if (m_Fd >= 0) {
        return true;
    }

    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        spdlog::error("Failed to create Niri socket: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (m_SocketPath.size() >= sizeof(addr.sun_path)) {
        spdlog::error("NIRI_SOCKET path too long");
        ::close(fd);
        return false;
    }

    std::strncpy(addr.sun_path, m_SocketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        if (err != ENOENT && err != ECONNREFUSED) {
            spdlog::warn("Failed to connect to niri socket: {}", std::strerror(err));
        }
        ::close(fd);
        return false;
    }

    m_Fd = fd;
    m_Buffer.clear();
    return true;
}

// ─────────────────────────────────────
void NiriIPC::Disconnect() {
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
    }
    m_Buffer.clear();
}

// ─────────────────────────────────────
bool NiriIPC::SendAll(const void *data, std::size_t size) {
    const char *ptr = static_cast<const char *>(data);
    std::size_t remaining = size;

    while (remaining > 0) {
        const ssize_t sent = ::send(m_Fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (sent == 0) {
            return false;
        }
        ptr += static_cast<std::size_t>(sent);
        remaining -= static_cast<std::size_t>(sent);
    }

    return true;
}

// ─────────────────────────────────────
bool NiriIPC::ReadLine(std::string &out_line, std::chrono::milliseconds timeout) {
    out_line.clear();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (auto pos = m_Buffer.find('\n'); pos != std::string::npos) {
            out_line = m_Buffer.substr(0, pos);
            m_Buffer.erase(0, pos + 1);
            return true;
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return false;
        }

        pollfd pfd;
        pfd.fd = m_Fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc <= 0) {
            return false;
        }
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
            return false;
        }

        char tmp[4096];
        const ssize_t n = ::recv(m_Fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            return false;
        }
        m_Buffer.append(tmp, static_cast<std::size_t>(n));
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json> NiriIPC::SendRequest(const nlohmann::json &request,
                                                   std::chrono::milliseconds timeout) {
    if (!Connect()) {
        return std::nullopt;
    }

    const std::string line = request.dump() + "\n";
    if (!SendAll(line.data(), line.size())) {
        spdlog::warn("Failed to send niri IPC request");
        Disconnect();
        return std::nullopt;
    }

    std::string reply;
    if (!ReadLine(reply, timeout)) {
        spdlog::debug("No response from niri IPC (timeout/disconnect)");
        Disconnect();
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(reply);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::warn("Failed to parse niri IPC response JSON: {}", e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
std::optional<int> NiriIPC::FocusedWindowId() {
    auto root = SendRequest("FocusedWindow");
    if (!root) {
        return std::nullopt;
    }

    // Expected: { "Ok": { "FocusedWindow": { "id": ... } } }, FocusedWindow may be null.
    if (!root->contains("Ok") || !(*root)["Ok"].is_object() ||
        !(*root)["Ok"].contains("FocusedWindow")) {
        spdlog::debug("Unexpected IPC response format");
        return std::nullopt;
    }

    const auto &fw = (*root)["Ok"]["FocusedWindow"];
    if (!fw.is_object() || !fw.contains("id") || !fw["id"].is_number_integer()) {
        return std::nullopt;
    }
    return fw["id"].get<int>();
}

// ─────────────────────────────────────
bool NiriIPC::FocusWindow(int window_id) {
    nlohmann::json request = {{"Action", {{"FocusWindow", {{"id", window_id}}}}}};
    auto reply = SendRequest(request);
    if (!reply) {
        return false;
    }
    if (reply->contains("Err")) {
        spdlog::warn("niri refused to focus window {}: {}", window_id, (*reply)["Err"].dump());
        return false;
    }
    return true;
}
