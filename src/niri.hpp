#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

class NiriIPC {
  public:
    NiriIPC();
    ~NiriIPC();

    NiriIPC(const NiriIPC &) = delete;
    NiriIPC &operator=(const NiriIPC &) = delete;

    bool IsAvailable() const;

    // One JSON request per line, one JSON reply per line. Returns the parsed reply.
    std::optional<nlohmann::json> SendRequest(const nlohmann::json &request,
                                              std::chrono::milliseconds timeout =
                                                  std::chrono::milliseconds(1000));

    // Id of the window focused right now, if any.
    std::optional<int> FocusedWindowId();
    bool FocusWindow(int window_id);

  private:
    static std::string GetEnvSocketPath();
    bool Connect();
    void Disconnect();
    bool SendAll(const void *data, std::size_t size);
    bool ReadLine(std::string &out_line, std::chrono::milliseconds timeout);

  private:
    std::string m_SocketPath;
    int m_Fd = -1;
    std::string m_Buffer;
};
