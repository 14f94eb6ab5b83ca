#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class MessageType { InstanceActivated, Ping, Pong, RequestFocus };

struct CoordinationMessage {
    MessageType type = MessageType::Ping;
    std::string instance_id;
    std::int64_t timestamp = 0;
};

std::string MessageTypeName(MessageType type);
std::optional<MessageType> MessageTypeFromName(const std::string &name);

nlohmann::json ToJson(const CoordinationMessage &msg);
// Unknown types and malformed payloads yield nullopt.
std::optional<CoordinationMessage> CoordinationMessageFromJson(const nlohmann::json &j);

// Named same-origin broadcast channel. A publisher never receives its own messages, and messages
// from one publisher are delivered in the order they were sent.
class MessageBus {
  public:
    using Handler = std::function<void(const CoordinationMessage &)>;

    virtual ~MessageBus() = default;

    virtual bool IsAvailable() const = 0;
    virtual bool Publish(const CoordinationMessage &msg) = 0;
    virtual void SetHandler(Handler handler) = 0;
    virtual void Close() = 0;
};

class LocalMessageBus;

// Routes messages between LocalMessageBus endpoints living in one process.
class LocalBusHub {
  public:
    void Attach(const std::string &channel, LocalMessageBus *endpoint);
    void Detach(const std::string &channel, LocalMessageBus *endpoint);
    void Broadcast(const std::string &channel, const LocalMessageBus *sender,
                   const CoordinationMessage &msg);

  private:
    std::mutex m_Mutex;
    std::map<std::string, std::vector<LocalMessageBus *>> m_Channels;
};

class LocalMessageBus : public MessageBus {
  public:
    LocalMessageBus(std::shared_ptr<LocalBusHub> hub, std::string channel);
    ~LocalMessageBus() override;

    LocalMessageBus(const LocalMessageBus &) = delete;
    LocalMessageBus &operator=(const LocalMessageBus &) = delete;

    bool IsAvailable() const override;
    bool Publish(const CoordinationMessage &msg) override;
    void SetHandler(Handler handler) override;
    void Close() override;

  private:
    friend class LocalBusHub;
    Handler CurrentHandler();

    std::shared_ptr<LocalBusHub> m_Hub;
    std::string m_Channel;
    std::mutex m_Mutex;
    Handler m_Handler;
    bool m_Open = true;
};
