// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/db.h"

#include "logging.h"
#include "util/system.h"

#include <stdint.h>
#include <string.h>

//
// SQLiteDatabase
//

SQLiteDatabase::SQLiteDatabase(const fs::path& db_path, bool mock)
    : m_mock(mock)
{
    if (mock) {
        // In-memory database for testing
        int rc = sqlite3_open(":memory:", &m_db);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("SQLiteDatabase: Failed to open in-memory database");
        }
        if (!SetupSchema()) {
            throw std::runtime_error("SQLiteDatabase: Failed to set up schema");
        }
        return;
    }

    m_path = db_path;
    TryCreateDirectories(m_path.parent_path());

    int rc = sqlite3_open(m_path.string().c_str(), &m_db);
    if (rc != SQLITE_OK) {
        std::string strErr = strprintf("SQLiteDatabase: Failed to open database %s: %s", m_path.string(), sqlite3_errmsg(m_db));
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(strErr);
    }

    LogPrintf("Using SQLite state database: %s\n", m_path.string());

    if (!SetupPragmas()) {
        throw std::runtime_error("SQLiteDatabase: Failed to set up pragmas");
    }

    if (!SetupSchema()) {
        throw std::runtime_error("SQLiteDatabase: Failed to set up schema");
    }
}

SQLiteDatabase::~SQLiteDatabase()
{
    if (m_db) {
        Flush(true);
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

bool SQLiteDatabase::SetupPragmas()
{
    if (!m_db) return false;

    // WAL mode for concurrent reads + crash recovery
    const char* pragmas =
        "PRAGMA journal_mode = WAL;"
        "PRAGMA synchronous = FULL;"  // Every committed operation must survive a crash
        "PRAGMA busy_timeout = 5000;";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, pragmas, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase: pragma error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLiteDatabase::SetupSchema()
{
    if (!m_db) return false;

    // Key-value store holding every serialized record
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS main (
            key BLOB PRIMARY KEY,
            value BLOB NOT NULL
        ) WITHOUT ROWID;
    )";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, schema, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase: schema error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }

    return true;
}

bool SQLiteDatabase::Backup(const std::string& strDest)
{
    if (m_mock || !m_db) {
        return false;
    }

    // Flush before backup
    Flush(false);

    fs::path pathDest(strDest);
    if (fs::is_directory(pathDest)) {
        pathDest /= m_path.filename();
    }

    sqlite3* pBackup = nullptr;
    int rc = sqlite3_open(pathDest.string().c_str(), &pBackup);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase::Backup: Cannot create backup file %s\n", pathDest.string());
        sqlite3_close(pBackup);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(pBackup, "main", m_db, "main");
    if (!backup) {
        LogPrintf("SQLiteDatabase::Backup: sqlite3_backup_init failed\n");
        sqlite3_close(pBackup);
        return false;
    }

    rc = sqlite3_backup_step(backup, -1);  // Copy all pages
    sqlite3_backup_finish(backup);
    sqlite3_close(pBackup);

    if (rc != SQLITE_DONE) {
        LogPrintf("SQLiteDatabase::Backup: sqlite3_backup_step failed: %d\n", rc);
        return false;
    }

    LogPrintf("SQLiteDatabase::Backup: copied %s to %s\n", m_path.string(), pathDest.string());
    return true;
}

void SQLiteDatabase::Flush(bool shutdown)
{
    if (!m_db || m_mock) return;

    // SQLite with WAL mode auto-checkpoints, but we can force it
    if (shutdown) {
        sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    } else {
        sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
    }
}

bool SQLiteDatabase::VerifyDatabaseFile(const fs::path& file_path, std::string& warningStr, std::string& errorStr)
{
    if (!fs::exists(file_path)) {
        // File doesn't exist yet, that's fine
        return true;
    }

    // Try to open and verify
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(file_path.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        errorStr = strprintf("Cannot open state database %s: %s", file_path.string(), sqlite3_errmsg(db));
        sqlite3_close(db);
        return false;
    }

    // Run integrity check
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, "PRAGMA integrity_check", -1, &stmt, nullptr);
    if (rc == SQLITE_OK) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            const char* result = (const char*)sqlite3_column_text(stmt, 0);
            if (result && strcmp(result, "ok") != 0) {
                warningStr = strprintf("State database integrity check warning: %s", result);
            }
        }
        sqlite3_finalize(stmt);
    }

    sqlite3_close(db);
    return true;
}

//
// SQLiteBatch
//

SQLiteBatch::SQLiteBatch(SQLiteDatabase& database)
    : m_db(database.GetDb()), m_database(&database)
{
    if (!SetupStatements()) {
        FinalizeStatements();
        throw std::runtime_error(strprintf("SQLiteBatch: Failed to prepare statements: %s", sqlite3_errmsg(m_db)));
    }
}

bool SQLiteBatch::SetupStatements()
{
    if (!m_db) return false;

    // Read statement
    if (sqlite3_prepare_v2(m_db, "SELECT value FROM main WHERE key = ?", -1, &m_read_stmt, nullptr) != SQLITE_OK)
        return false;

    // Overwrite statement (INSERT OR REPLACE)
    if (sqlite3_prepare_v2(m_db, "INSERT OR REPLACE INTO main (key, value) VALUES (?, ?)", -1, &m_overwrite_stmt, nullptr) != SQLITE_OK)
        return false;

    // Delete statement
    if (sqlite3_prepare_v2(m_db, "DELETE FROM main WHERE key = ?", -1, &m_delete_stmt, nullptr) != SQLITE_OK)
        return false;

    // Exists statement
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM main WHERE key = ?", -1, &m_exists_stmt, nullptr) != SQLITE_OK)
        return false;

    // Cursor statement (ordered seek)
    if (sqlite3_prepare_v2(m_db, "SELECT key, value FROM main WHERE key >= ? ORDER BY key", -1, &m_cursor_stmt, nullptr) != SQLITE_OK)
        return false;

    return true;
}

void SQLiteBatch::FinalizeStatements()
{
    if (m_read_stmt) { sqlite3_finalize(m_read_stmt); m_read_stmt = nullptr; }
    if (m_overwrite_stmt) { sqlite3_finalize(m_overwrite_stmt); m_overwrite_stmt = nullptr; }
    if (m_delete_stmt) { sqlite3_finalize(m_delete_stmt); m_delete_stmt = nullptr; }
    if (m_exists_stmt) { sqlite3_finalize(m_exists_stmt); m_exists_stmt = nullptr; }
    if (m_cursor_stmt) { sqlite3_finalize(m_cursor_stmt); m_cursor_stmt = nullptr; }
}

void SQLiteBatch::Close()
{
    FinalizeStatements();
    m_db = nullptr;
}

bool SQLiteBatch::ReadRaw(const CDataStream& ssKey, CDataStream& ssValue)
{
    if (!m_db) return false;

    sqlite3_reset(m_read_stmt);
    sqlite3_bind_blob(m_read_stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);

    int res = sqlite3_step(m_read_stmt);
    if (res != SQLITE_ROW) {
        if (res != SQLITE_DONE) {
            LogPrintf("SQLiteBatch: read failed: %s\n", sqlite3_errmsg(m_db));
        }
        sqlite3_reset(m_read_stmt);
        return false;
    }

    // Get value
    const void* data = sqlite3_column_blob(m_read_stmt, 0);
    int size = sqlite3_column_bytes(m_read_stmt, 0);
    if (!data || size == 0) {
        sqlite3_reset(m_read_stmt);
        return false;
    }

    ssValue.clear();
    ssValue.write((const char*)data, size);
    sqlite3_reset(m_read_stmt);
    return true;
}

bool SQLiteBatch::WriteRaw(const CDataStream& ssKey, const CDataStream& ssValue)
{
    if (!m_db) return false;

    sqlite3_reset(m_overwrite_stmt);
    sqlite3_bind_blob(m_overwrite_stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);
    sqlite3_bind_blob(m_overwrite_stmt, 2, ssValue.data(), ssValue.size(), SQLITE_STATIC);

    int res = sqlite3_step(m_overwrite_stmt);
    sqlite3_reset(m_overwrite_stmt);
    if (res != SQLITE_DONE) {
        LogPrintf("SQLiteBatch: write failed: %s\n", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool SQLiteBatch::EraseRaw(const CDataStream& ssKey)
{
    if (!m_db) return false;

    sqlite3_reset(m_delete_stmt);
    sqlite3_bind_blob(m_delete_stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);

    int res = sqlite3_step(m_delete_stmt);
    sqlite3_reset(m_delete_stmt);
    if (res != SQLITE_DONE) {
        LogPrintf("SQLiteBatch: erase failed: %s\n", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool SQLiteBatch::ExistsRaw(const CDataStream& ssKey)
{
    if (!m_db) return false;

    sqlite3_reset(m_exists_stmt);
    sqlite3_bind_blob(m_exists_stmt, 1, ssKey.data(), ssKey.size(), SQLITE_STATIC);

    int res = sqlite3_step(m_exists_stmt);
    bool fExists = (res == SQLITE_ROW) && sqlite3_column_int(m_exists_stmt, 0) > 0;
    sqlite3_reset(m_exists_stmt);
    return fExists;
}

bool SQLiteBatch::StartCursorRaw(const CDataStream& ssStart)
{
    if (!m_cursor_stmt) return false;
    sqlite3_reset(m_cursor_stmt);
    // SQLITE_TRANSIENT: the start key stream does not outlive this call
    sqlite3_bind_blob(m_cursor_stmt, 1, ssStart.data(), ssStart.size(), SQLITE_TRANSIENT);
    m_cursor_init = true;
    return true;
}

bool SQLiteBatch::ReadAtCursor(CDataStream& ssKey, CDataStream& ssValue, bool& complete)
{
    if (!m_cursor_stmt || !m_cursor_init) {
        complete = true;
        return false;
    }

    complete = false;
    int res = sqlite3_step(m_cursor_stmt);
    if (res == SQLITE_DONE) {
        complete = true;
        return true;
    }
    if (res != SQLITE_ROW) {
        LogPrintf("SQLiteBatch: cursor step failed: %s\n", sqlite3_errmsg(m_db));
        return false;
    }

    // Get key
    const void* keyData = sqlite3_column_blob(m_cursor_stmt, 0);
    int keySize = sqlite3_column_bytes(m_cursor_stmt, 0);

    // Get value
    const void* valueData = sqlite3_column_blob(m_cursor_stmt, 1);
    int valueSize = sqlite3_column_bytes(m_cursor_stmt, 1);

    if (!keyData || !valueData) {
        LogPrintf("SQLiteBatch: cursor returned an empty key or value\n");
        return false;
    }

    ssKey.clear();
    ssKey.write((const char*)keyData, keySize);

    ssValue.clear();
    ssValue.write((const char*)valueData, valueSize);
    return true;
}

void SQLiteBatch::CloseCursor()
{
    if (m_cursor_stmt) {
        sqlite3_reset(m_cursor_stmt);
        sqlite3_clear_bindings(m_cursor_stmt);
    }
    m_cursor_init = false;
}

// Transactions nest: each level is a named SAVEPOINT, so an inner
// operation can be rolled back alone while the outer one carries on, and an
// outer rollback discards everything the inner levels released.

bool SQLiteBatch::TxnBegin()
{
    if (!m_db) return false;
    std::string strSql = strprintf("SAVEPOINT sp%u", m_database->m_txn_depth + 1);
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, strSql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteBatch::TxnBegin: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    m_database->m_txn_depth++;
    LogPrint(BCLog::DB, "SQLiteBatch::TxnBegin: depth=%u\n", m_database->m_txn_depth);
    return true;
}

bool SQLiteBatch::TxnCommit()
{
    if (!m_db || m_database->m_txn_depth == 0) return false;
    std::string strSql = strprintf("RELEASE SAVEPOINT sp%u", m_database->m_txn_depth);
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, strSql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteBatch::TxnCommit: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    LogPrint(BCLog::DB, "SQLiteBatch::TxnCommit: depth=%u\n", m_database->m_txn_depth);
    m_database->m_txn_depth--;
    return true;
}

bool SQLiteBatch::TxnAbort()
{
    if (!m_db || m_database->m_txn_depth == 0) return false;
    unsigned int nDepth = m_database->m_txn_depth;
    std::string strSql = strprintf("ROLLBACK TO SAVEPOINT sp%u; RELEASE SAVEPOINT sp%u", nDepth, nDepth);
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, strSql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteBatch::TxnAbort: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    LogPrint(BCLog::DB, "SQLiteBatch::TxnAbort: depth=%u\n", nDepth);
    m_database->m_txn_depth--;
    return true;
}
