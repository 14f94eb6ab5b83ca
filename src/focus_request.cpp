#include "focus_request.hpp"

#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {
constexpr int kPollIntervalMs = 200;
constexpr int kReadTimeoutMs = 1000;
constexpr std::size_t kMaxPayload = 64 * 1024;

static bool send_all(int fd, const std::string &data) {
    const char *ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
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
} // namespace

// ─────────────────────────────────────
nlohmann::json ToJson(const FocusRequest &request) {
    return nlohmann::json{{"action", request.action}, {"timestamp", request.timestamp}};
}

// ─────────────────────────────────────
std::optional<FocusRequest> FocusRequestFromJson(const nlohmann::json &j) {
    if (!j.is_object() || !j.contains("action") || !j["action"].is_string()) {
        return std::nullopt;
    }
    JsonParse parse;
    FocusRequest request;
    request.action = j["action"].get<std::string>();
    request.timestamp = parse.GetInt64(j, "timestamp", 0);
    return request;
}

// ─────────────────────────────────────
bool SendFocusRequest(const std::string &host, unsigned port, const FocusRequest &request) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("Invalid coordination host '{}'", host);
        return false;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        spdlog::error("Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        spdlog::warn("Could not connect to {}:{}: {}", host, port, std::strerror(errno));
        ::close(fd);
        return false;
    }

    const bool sent = send_all(fd, ToJson(request).dump());
    if (!sent) {
        spdlog::warn("Failed to send focus request: {}", std::strerror(errno));
    }
    ::shutdown(fd, SHUT_WR);
    ::close(fd);
    return sent;
}

// ─────────────────────────────────────
FocusRequestListener::FocusRequestListener(unsigned port) : m_Port(port) {}

// ─────────────────────────────────────
FocusRequestListener::~FocusRequestListener() {
    Stop();
    CloseSocket();
}

// ─────────────────────────────────────
FocusRequestListener::BindResult FocusRequestListener::Bind() {
    if (m_Fd >= 0) {
        return BindResult::Bound;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        spdlog::error("Failed to create listener socket: {}", std::strerror(errno));
        return BindResult::Failed;
    }

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(m_Port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        ::close(fd);
        if (err == EADDRINUSE) {
            spdlog::debug("Port {} already in use", m_Port);
            return BindResult::AddressInUse;
        }
        spdlog::error("Failed to bind port {}: {}", m_Port, std::strerror(err));
        return BindResult::Failed;
    }

    if (::listen(fd, 8) < 0) {
        spdlog::error("Failed to listen on port {}: {}", m_Port, std::strerror(errno));
        ::close(fd);
        return BindResult::Failed;
    }

    m_Fd = fd;
    return BindResult::Bound;
}

// ─────────────────────────────────────
bool FocusRequestListener::IsBound() const {
    return m_Fd >= 0;
}

// ─────────────────────────────────────
unsigned FocusRequestListener::Port() const {
    if (m_Fd < 0) {
        return m_Port;
    }
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (::getsockname(m_Fd, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
        return m_Port;
    }
    return ntohs(addr.sin_port);
}

// ─────────────────────────────────────
void FocusRequestListener::Start(Callback callback) {
    if (m_Fd < 0) {
        throw std::runtime_error("Focus listener started without a bound socket");
    }
    if (m_Running.exchange(true)) {
        return;
    }
    m_Callback = std::move(callback);
    m_Thread = std::thread([this]() { Run(); });
    spdlog::info("Listening for focus requests on 127.0.0.1:{}", Port());
}

// ─────────────────────────────────────
void FocusRequestListener::Stop() {
    m_Running = false;
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
void FocusRequestListener::CloseSocket() {
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
    }
}

// ─────────────────────────────────────
void FocusRequestListener::Run() {
    while (m_Running) {
        pollfd pfd;
        pfd.fd = m_Fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Focus listener poll failed: {}", std::strerror(errno));
            return;
        }
        if (rc == 0 || (pfd.revents & POLLIN) == 0) {
            continue;
        }

        const int client = ::accept(m_Fd, nullptr, nullptr);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                spdlog::warn("accept failed: {}", std::strerror(errno));
            }
            continue;
        }
        ServeConnection(client);
        ::close(client);
    }
}

// ─────────────────────────────────────
void FocusRequestListener::ServeConnection(int client_fd) {
    std::string payload;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kReadTimeoutMs);

    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            spdlog::warn("Focus request timed out after {} bytes", payload.size());
            return;
        }

        pollfd pfd;
        pfd.fd = client_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc <= 0) {
            spdlog::warn("Focus request connection dropped");
            return;
        }

        char tmp[4096];
        const ssize_t n = ::recv(client_fd, tmp, sizeof(tmp), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("Error reading focus request: {}", std::strerror(errno));
            return;
        }
        if (n == 0) {
            break;
        }
        payload.append(tmp, static_cast<std::size_t>(n));
        if (payload.size() > kMaxPayload) {
            spdlog::warn("Focus request larger than {} bytes, dropped", kMaxPayload);
            return;
        }
    }

    JsonParse parse;
    auto j = parse.TryParse(payload);
    if (!j) {
        spdlog::warn("Ignoring malformed focus request");
        return;
    }
    auto request = FocusRequestFromJson(*j);
    if (!request) {
        spdlog::warn("Ignoring focus request without action: {}", j->dump());
        return;
    }

    spdlog::debug("Received '{}' request", request->action);
    if (!m_Callback) {
        return;
    }
    try {
        m_Callback(*request);
    } catch (const std::exception &e) {
        spdlog::error("Focus request handler failed: {}", e.what());
    }
}
