// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_STATE_DB_H
#define PAIRMINT_STATE_DB_H

#include "fs.h"
#include "serialize.h"
#include "streams.h"
#include "version.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

class SQLiteBatch;

/**
 * An instance of this class represents one SQLite database holding the
 * key/value table of a deployment.
 */
class SQLiteDatabase
{
    friend class SQLiteBatch;
public:
    /** Open (or create) the database file at db_path, or an in-memory database if mock */
    explicit SQLiteDatabase(const fs::path& db_path, bool mock = false);

    ~SQLiteDatabase();

    SQLiteDatabase(const SQLiteDatabase&) = delete;
    SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

    /** Return object for accessing temporary in-memory database. */
    static std::unique_ptr<SQLiteDatabase> CreateMock()
    {
        return std::make_unique<SQLiteDatabase>("", true /* mock */);
    }

    /** Back up the entire database to a file. */
    bool Backup(const std::string& strDest);

    /** Make sure all changes are flushed to disk. */
    void Flush(bool shutdown);

    const fs::path& GetPathToFile() const { return m_path; }
    bool IsMock() const { return m_mock; }

    sqlite3* GetDb() { return m_db; }

    /* verifies the database file */
    static bool VerifyDatabaseFile(const fs::path& file_path, std::string& warningStr, std::string& errorStr);

private:
    // Note: Declaration order matters for initialization
    sqlite3* m_db{nullptr};
    fs::path m_path;
    bool m_mock{false};

    //! Open savepoints; nested transactions map to nested SAVEPOINTs
    unsigned int m_txn_depth{0};

    bool SetupSchema();
    bool SetupPragmas();
};

/** RAII class that provides access to a SQLite database */
class SQLiteBatch
{
protected:
    sqlite3* m_db;
    SQLiteDatabase* m_database;

    // Prepared statements for key-value operations
    sqlite3_stmt* m_read_stmt{nullptr};
    sqlite3_stmt* m_overwrite_stmt{nullptr};
    sqlite3_stmt* m_delete_stmt{nullptr};
    sqlite3_stmt* m_exists_stmt{nullptr};
    sqlite3_stmt* m_cursor_stmt{nullptr};

    bool SetupStatements();
    void FinalizeStatements();

    bool ReadRaw(const CDataStream& ssKey, CDataStream& ssValue);
    bool WriteRaw(const CDataStream& ssKey, const CDataStream& ssValue);
    bool EraseRaw(const CDataStream& ssKey);
    bool ExistsRaw(const CDataStream& ssKey);

public:
    explicit SQLiteBatch(SQLiteDatabase& database);
    ~SQLiteBatch() { Close(); }

    SQLiteBatch(const SQLiteBatch&) = delete;
    SQLiteBatch& operator=(const SQLiteBatch&) = delete;

    void Close();

    template <typename K, typename T>
    bool Read(const K& key, T& value)
    {
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(64);
        ssKey << key;

        CDataStream ssValue(SER_DISK, CLIENT_VERSION);
        if (!ReadRaw(ssKey, ssValue)) {
            return false;
        }

        try {
            ssValue >> value;
        } catch (const std::exception&) {
            return false;
        }
        return true;
    }

    template <typename K, typename T>
    bool Write(const K& key, const T& value)
    {
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(64);
        ssKey << key;

        CDataStream ssValue(SER_DISK, CLIENT_VERSION);
        ssValue.reserve(256);
        ssValue << value;

        return WriteRaw(ssKey, ssValue);
    }

    template <typename K>
    bool Erase(const K& key)
    {
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(64);
        ssKey << key;

        return EraseRaw(ssKey);
    }

    template <typename K>
    bool Exists(const K& key)
    {
        CDataStream ssKey(SER_DISK, CLIENT_VERSION);
        ssKey.reserve(64);
        ssKey << key;

        return ExistsRaw(ssKey);
    }

    /**
     * Cursor over all keys >= the serialized start key, in key order.
     * Callers stop reading once the key leaves their prefix.
     */
    template <typename K>
    bool StartCursor(const K& start)
    {
        CDataStream ssStart(SER_DISK, CLIENT_VERSION);
        ssStart << start;
        return StartCursorRaw(ssStart);
    }
    bool StartCursorRaw(const CDataStream& ssStart);
    /** false on a read fault; complete is set once the cursor is past the last row */
    bool ReadAtCursor(CDataStream& ssKey, CDataStream& ssValue, bool& complete);
    void CloseCursor();

    bool TxnBegin();
    bool TxnCommit();
    bool TxnAbort();

    bool ReadVersion(int& nVersion)
    {
        nVersion = 0;
        return Read(std::string("version"), nVersion);
    }

    bool WriteVersion(int nVersion)
    {
        return Write(std::string("version"), nVersion);
    }

private:
    bool m_cursor_init{false};
};

#endif // PAIRMINT_STATE_DB_H
