#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>

// One-shot message sent to the coordination port: {"action":"focus","timestamp":<ms>}.
struct FocusRequest {
    std::string action = "focus";
    std::int64_t timestamp = 0;
};

nlohmann::json ToJson(const FocusRequest &request);
std::optional<FocusRequest> FocusRequestFromJson(const nlohmann::json &j);

// Connects to host:port, writes one request and closes. Uses the system connect timeout and
// never retries.
bool SendFocusRequest(const std::string &host, unsigned port, const FocusRequest &request);

// Listening side of the coordination port. Connections are served one at a time on a background
// thread; a bad connection is logged and dropped without stopping the listener.
class FocusRequestListener {
  public:
    enum class BindResult { Bound, AddressInUse, Failed };
    using Callback = std::function<void(const FocusRequest &)>;

    explicit FocusRequestListener(unsigned port);
    ~FocusRequestListener();

    FocusRequestListener(const FocusRequestListener &) = delete;
    FocusRequestListener &operator=(const FocusRequestListener &) = delete;

    BindResult Bind();
    bool IsBound() const;

    // Throws std::runtime_error when the socket is not bound.
    void Start(Callback callback);
    void Stop();

    // Actual port, useful after binding port 0.
    unsigned Port() const;

  private:
    void Run();
    void ServeConnection(int client_fd);
    void CloseSocket();

    unsigned m_Port;
    int m_Fd = -1;
    Callback m_Callback;
    std::atomic<bool> m_Running{false};
    std::thread m_Thread;
};
