#pragma once

#include <sqlite3.h>

#include <array>
#include <mutex>
#include <string>

#include "kv_store.hpp"

// KeyValueStore over a sqlite database, so peers in different processes see the same keys.
class SQLiteStore : public KeyValueStore {
  public:
    SQLiteStore(const std::string &db_path);
    ~SQLiteStore() override;

    SQLiteStore(const SQLiteStore &) = delete;
    SQLiteStore &operator=(const SQLiteStore &) = delete;

    std::optional<std::string> Get(const std::string &key) override;
    bool Set(const std::string &key, const std::string &value) override;
    bool Remove(const std::string &key) override;

  private:
    void Init();
    void Close();
    void PrepareStatements();
    void ExecIgnoringErrors(const std::string &sql);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;
    std::mutex m_Mutex;

    sqlite3_stmt *m_GetStmt = nullptr;
    sqlite3_stmt *m_SetStmt = nullptr;
    sqlite3_stmt *m_RemoveStmt = nullptr;

    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 64; // 8 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
