/**
 * @file SQLiteResultSet.cpp
 * @brief Implementation of RAII SQLite result set wrapper.
 */

#include "SQLiteResultSet.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace blobfs {

namespace {

std::string statementError(sqlite3_stmt* stmt, int rc) {
    sqlite3* db = stmt ? sqlite3_db_handle(stmt) : nullptr;
    return db ? sqlite3_errmsg(db) : ErrorHandler::sqliteErrorMessage(rc);
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteResultSet::SQLiteResultSet(sqlite3_stmt* stmt) : m_stmt(stmt) {}

SQLiteResultSet::~SQLiteResultSet() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteResultSet::SQLiteResultSet(SQLiteResultSet&& other) noexcept
    : m_stmt(other.m_stmt) {
    other.m_stmt = nullptr;
}

SQLiteResultSet& SQLiteResultSet::operator=(SQLiteResultSet&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Parameter Binding
// ============================================================================

void SQLiteResultSet::bindText(int index, const std::string& value) {
    if (!m_stmt) {
        throw StoreException(SQLITE_MISUSE, "bind on a finalized statement");
    }

    spdlog::debug("Arg {}: '{}'", index, value);

    int rc = sqlite3_bind_text(m_stmt, index, value.data(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw StoreException(rc, statementError(m_stmt, rc));
    }
}

// ============================================================================
// Row Iteration
// ============================================================================

bool SQLiteResultSet::step() {
    if (!m_stmt) return false;

    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StoreException(rc, statementError(m_stmt, rc));
}

// ============================================================================
// Column Access
// ============================================================================

int SQLiteResultSet::columnType(int index) const {
    return m_stmt ? sqlite3_column_type(m_stmt, index) : SQLITE_NULL;
}

std::string SQLiteResultSet::getString(int index) const {
    if (!m_stmt || isNull(index)) return "";
    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::string SQLiteResultSet::getBytes(int index) const {
    if (!m_stmt || isNull(index)) return "";

    // Fetch the pointer before the length; see sqlite3_column_bytes docs
    const void* data = (columnType(index) == SQLITE_BLOB)
                           ? sqlite3_column_blob(m_stmt, index)
                           : static_cast<const void*>(sqlite3_column_text(m_stmt, index));
    int size = sqlite3_column_bytes(m_stmt, index);
    if (!data || size <= 0) return "";
    return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

int64_t SQLiteResultSet::getInt64(int index) const {
    if (!m_stmt) return 0;
    return sqlite3_column_int64(m_stmt, index);
}

double SQLiteResultSet::getDouble(int index) const {
    if (!m_stmt) return 0.0;
    return sqlite3_column_double(m_stmt, index);
}

bool SQLiteResultSet::isNull(int index) const {
    if (!m_stmt) return true;
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteResultSet::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace blobfs
