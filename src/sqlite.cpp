#include "sqlite.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

// ─────────────────────────────────────
SQLiteStore::SQLiteStore(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open store: {}", m_DbPath);
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw std::runtime_error("unable to open store");
    }

    spdlog::debug("SQLite store opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    // Several processes read and write the same keys.
    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -256;");

    Init();
    PrepareStatements();

    if (!m_GetStmt || !m_SetStmt || !m_RemoveStmt) {
        Close();
        throw std::runtime_error("unable to prepare store statements");
    }
}

// ─────────────────────────────────────
SQLiteStore::~SQLiteStore() {
    Close();
}

// ─────────────────────────────────────
void SQLiteStore::Close() {
    if (m_GetStmt) {
        sqlite3_finalize(m_GetStmt);
        m_GetStmt = nullptr;
    }
    if (m_SetStmt) {
        sqlite3_finalize(m_SetStmt);
        m_SetStmt = nullptr;
    }
    if (m_RemoveStmt) {
        sqlite3_finalize(m_RemoveStmt);
        m_RemoveStmt = nullptr;
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void SQLiteStore::Init() {
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS kv ("
                       "key TEXT PRIMARY KEY,"
                       "value TEXT NOT NULL,"
                       "updated_at REAL"
                       ")");
}

// ─────────────────────────────────────
void SQLiteStore::PrepareStatements() {
    {
        const char *sql = "SELECT value FROM kv WHERE key = ?";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_GetStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for Get stmt: {}", sqlite3_errmsg(m_Db));
            m_GetStmt = nullptr;
        }
    }

    {
        const char *sql = R"(
            INSERT INTO kv (key, value, updated_at)
            VALUES (?, ?, strftime('%s','now'))
            ON CONFLICT(key) DO UPDATE SET
                value = excluded.value,
                updated_at = excluded.updated_at
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_SetStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for Set stmt: {}", sqlite3_errmsg(m_Db));
            m_SetStmt = nullptr;
        }
    }

    {
        const char *sql = "DELETE FROM kv WHERE key = ?";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_RemoveStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for Remove stmt: {}", sqlite3_errmsg(m_Db));
            m_RemoveStmt = nullptr;
        }
    }
}

// ─────────────────────────────────────
std::optional<std::string> SQLiteStore::Get(const std::string &key) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    sqlite3_reset(m_GetStmt);
    sqlite3_clear_bindings(m_GetStmt);
    sqlite3_bind_text(m_GetStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    const int rc = sqlite3_step(m_GetStmt);
    if (rc == SQLITE_ROW) {
        const char *txt = reinterpret_cast<const char *>(sqlite3_column_text(m_GetStmt, 0));
        value = txt ? txt : "";
    } else if (rc != SQLITE_DONE) {
        spdlog::error("db step failed in Get({}): {}", key, sqlite3_errmsg(m_Db));
    }

    sqlite3_reset(m_GetStmt);
    return value;
}

// ─────────────────────────────────────
bool SQLiteStore::Set(const std::string &key, const std::string &value) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    sqlite3_reset(m_SetStmt);
    sqlite3_clear_bindings(m_SetStmt);
    sqlite3_bind_text(m_SetStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(m_SetStmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

    const bool ok = sqlite3_step(m_SetStmt) == SQLITE_DONE;
    if (!ok) {
        spdlog::error("db step failed in Set({}): {}", key, sqlite3_errmsg(m_Db));
    }
    sqlite3_reset(m_SetStmt);
    return ok;
}

// ─────────────────────────────────────
bool SQLiteStore::Remove(const std::string &key) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    sqlite3_reset(m_RemoveStmt);
    sqlite3_clear_bindings(m_RemoveStmt);
    sqlite3_bind_text(m_RemoveStmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    const bool ok = sqlite3_step(m_RemoveStmt) == SQLITE_DONE;
    if (!ok) {
        spdlog::error("db step failed in Remove({}): {}", key, sqlite3_errmsg(m_Db));
    }
    sqlite3_reset(m_RemoveStmt);
    return ok;
}

// ─────────────────────────────────────
void SQLiteStore::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
