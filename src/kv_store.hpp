#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

// String key-value storage shared by every peer of one application.
class KeyValueStore {
  public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> Get(const std::string &key) = 0;
    virtual bool Set(const std::string &key, const std::string &value) = 0;
    virtual bool Remove(const std::string &key) = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
  public:
    std::optional<std::string> Get(const std::string &key) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto it = m_Values.find(key);
        if (it == m_Values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool Set(const std::string &key, const std::string &value) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Values[key] = value;
        return true;
    }

    bool Remove(const std::string &key) override {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Values.erase(key);
        return true;
    }

  private:
    std::mutex m_Mutex;
    std::map<std::string, std::string> m_Values;
};
