#include "message_bus.hpp"

#include "json.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

// ─────────────────────────────────────
std::string MessageTypeName(MessageType type) {
    switch (type) {
    case MessageType::InstanceActivated:
        return "instance-activated";
    case MessageType::Ping:
        return "ping";
    case MessageType::Pong:
        return "pong";
    case MessageType::RequestFocus:
        return "request-focus";
    }
    return "ping";
}

// ─────────────────────────────────────
std::optional<MessageType> MessageTypeFromName(const std::string &name) {
    if (name == "instance-activated") {
        return MessageType::InstanceActivated;
    }
    if (name == "ping") {
        return MessageType::Ping;
    }
    if (name == "pong") {
        return MessageType::Pong;
    }
    if (name == "request-focus") {
        return MessageType::RequestFocus;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
nlohmann::json ToJson(const CoordinationMessage &msg) {
    return nlohmann::json{{"type", MessageTypeName(msg.type)},
                          {"instanceId", msg.instance_id},
                          {"timestamp", msg.timestamp}};
}

// ─────────────────────────────────────
std::optional<CoordinationMessage> CoordinationMessageFromJson(const nlohmann::json &j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    JsonParse parse;
    auto type = MessageTypeFromName(parse.GetString(j, "type", ""));
    if (!type) {
        spdlog::debug("Ignoring coordination message with unknown type");
        return std::nullopt;
    }

    CoordinationMessage msg;
    msg.type = *type;
    msg.instance_id = parse.GetString(j, "instanceId", "");
    msg.timestamp = parse.GetInt64(j, "timestamp", 0);
    return msg;
}

// ─────────────────────────────────────
void LocalBusHub::Attach(const std::string &channel, LocalMessageBus *endpoint) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Channels[channel].push_back(endpoint);
}

// ─────────────────────────────────────
void LocalBusHub::Detach(const std::string &channel, LocalMessageBus *endpoint) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto it = m_Channels.find(channel);
    if (it == m_Channels.end()) {
        return;
    }
    auto &endpoints = it->second;
    endpoints.erase(std::remove(endpoints.begin(), endpoints.end(), endpoint), endpoints.end());
}

// ─────────────────────────────────────
void LocalBusHub::Broadcast(const std::string &channel, const LocalMessageBus *sender,
                            const CoordinationMessage &msg) {
    std::vector<MessageBus::Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto it = m_Channels.find(channel);
        if (it == m_Channels.end()) {
            return;
        }
        for (auto *endpoint : it->second) {
            if (endpoint == sender) {
                continue;
            }
            auto handler = endpoint->CurrentHandler();
            if (handler) {
                handlers.push_back(std::move(handler));
            }
        }
    }

    for (const auto &handler : handlers) {
        handler(msg);
    }
}

// ─────────────────────────────────────
LocalMessageBus::LocalMessageBus(std::shared_ptr<LocalBusHub> hub, std::string channel)
    : m_Hub(std::move(hub)), m_Channel(std::move(channel)) {
    m_Hub->Attach(m_Channel, this);
}

// ─────────────────────────────────────
LocalMessageBus::~LocalMessageBus() {
    Close();
}

// ─────────────────────────────────────
bool LocalMessageBus::IsAvailable() const {
    return m_Hub != nullptr;
}

// ─────────────────────────────────────
bool LocalMessageBus::Publish(const CoordinationMessage &msg) {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (!m_Open) {
            return false;
        }
    }
    m_Hub->Broadcast(m_Channel, this, msg);
    return true;
}

// ─────────────────────────────────────
void LocalMessageBus::SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Handler = std::move(handler);
}

// ─────────────────────────────────────
void LocalMessageBus::Close() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (!m_Open) {
            return;
        }
        m_Open = false;
        m_Handler = nullptr;
    }
    m_Hub->Detach(m_Channel, this);
}

// ─────────────────────────────────────
MessageBus::Handler LocalMessageBus::CurrentHandler() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Handler;
}
