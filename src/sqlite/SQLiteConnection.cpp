/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include "SQLiteResultSet.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace blobfs {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath, bool readOnly)
    : m_path(dbPath) {
    int flags = readOnly ? SQLITE_OPEN_READONLY
                         : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath,
                      m_db ? sqlite3_errmsg(m_db) : ErrorHandler::sqliteErrorMessage(rc));
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        return;
    }
    // Report SQLITE_CONSTRAINT_* etc. rather than the primary code only
    sqlite3_extended_result_codes(m_db, 1);
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db), m_path(std::move(other.m_path)) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

bool SQLiteConnection::execute(const std::string& sql) {
    if (!m_db) return false;

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        spdlog::error("SQLite exec failed: {}", errMsg ? errMsg : "unknown");
        if (errMsg) sqlite3_free(errMsg);
        return false;
    }
    return true;
}

sqlite3_stmt* SQLiteConnection::prepare(const std::string& sql) {
    if (!m_db) {
        throw StoreException(SQLITE_MISUSE, "No open database connection");
    }

    spdlog::debug("Query: {}", sql);

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = sqlite3_errmsg(m_db);
        spdlog::error("SQLite prepare failed: {}", message);
        throw StoreException(rc, message);
    }
    return stmt;
}

bool SQLiteConnection::healthCheck() {
    if (!m_db) return false;

    try {
        SQLiteResultSet rs(prepare("SELECT count(*) FROM sqlite_master"));
        return rs.step();
    } catch (const StoreException& e) {
        spdlog::error("SQLite health check failed for '{}': {}", m_path, e.what());
        return false;
    }
}

void SQLiteConnection::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (m_db) {
        sqlite3_busy_timeout(m_db, static_cast<int>(timeout.count()));
    }
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
}

}  // namespace blobfs
